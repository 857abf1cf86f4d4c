// xbridge - RelayWrapper and AcrossV4Wrapper tests

#include <functional>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "support.hpp"

using namespace xbridge;
using namespace xbridge::test;

namespace {

constexpr uint32_t ONE_PERCENT = 1000;
constexpr uint32_t TWO_PERCENT = 2000;

AcrossDeposit across_params(const Address& token, U128 amount) {
    AcrossDeposit p{};
    p.depositor = ALICE;
    p.recipient = BOB;
    p.input_token = token;
    p.output_token = token;
    p.input_amount = amount;
    p.output_amount = amount;
    p.destination_chain_id = 10;
    p.exclusive_relayer = ZERO_ADDRESS;
    p.quote_timestamp = 1700000000;
    p.fill_deadline = 1700003600;
    p.exclusivity_parameter = 0;
    return p;
}

} // namespace

TEST_CASE("RelayWrapper deposits net of the fee", "[deposit]") {
    Chain chain(1);
    auto& token = chain.deploy<ERC20>("Underlying", "UND", std::vector<Allocation>{{ALICE, ether(100)}});
    auto& depository = chain.deploy<mocks::RelayDepository>();
    auto& wrapper = chain.deploy<RelayWrapper>(depository.address(), ADMIN, TREASURY, ONE_PERCENT);

    REQUIRE(chain.last_event("FeeRateSet")->args["newRate"] == ONE_PERCENT);
    REQUIRE(chain.last_event("TreasurySet")->args["newTreasury"] == addresses::to_hex(TREASURY));
    REQUIRE(wrapper.quote(ether(100)).fee == ether(1));

    const Bytes32 id = bytes32_from_u64(42);

    SECTION("ERC20 deposit") {
        chain.transact(ALICE, token.address(), [&] { token.approve(wrapper.address(), ether(100)); });
        chain.transact(ALICE, wrapper.address(), [&] {
            wrapper.deposit_erc20(token.address(), ether(100), id, bytes_from_hex("0x01"));
        });

        REQUIRE(token.balance_of(TREASURY) == ether(1));
        REQUIRE(token.balance_of(depository.address()) == ether(99));
        REQUIRE(token.balance_of(wrapper.address()) == 0);
        REQUIRE(depository.last_depositor == ALICE);
        REQUIRE(depository.last_id == id);

        const auto sent = chain.last_event("TransferSent");
        REQUIRE(sent->args["id"] == to_hex(id));
        REQUIRE(sent->args["net"] == u128_to_string(ether(99)));
    }

    SECTION("Native deposit") {
        chain.transact(ADMIN, wrapper.address(), [&] { wrapper.set_fee_rate(TWO_PERCENT); });
        chain.set_balance(ALICE, ether(10));
        chain.transact(ALICE, wrapper.address(), ether(10), [&] { wrapper.deposit_native(id, {}); });

        REQUIRE(chain.balance_of(TREASURY) == tenths(2));
        REQUIRE(chain.balance_of(depository.address()) == ether(10) - tenths(2));
        REQUIRE(depository.last_amount == ether(10) - tenths(2));
        REQUIRE(chain.last_event("TransferSent")->args["token"] == addresses::to_hex(ZERO_ADDRESS));
    }

    SECTION("Input checks") {
        chain.set_balance(ALICE, 5);
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), 5, [&] { wrapper.deposit_erc20(token.address(), 1, id, {}); });
        }) == errors::MSG_VALUE_NOT_ZERO);
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), [&] { wrapper.deposit_erc20(token.address(), 0, id, {}); });
        }) == errors::AMOUNT_ZERO);
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), [&] { wrapper.deposit_native(id, {}); });
        }) == errors::AMOUNT_ZERO);

        chain.transact(ADMIN, wrapper.address(), [&] { wrapper.pause(); });
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), 5, [&] { wrapper.deposit_native(id, {}); });
        }) == errors::PAUSED);
        REQUIRE(chain.balance_of(ALICE) == 5);
    }

    SECTION("Fee-on-transfer tokens are refused") {
        auto& skim = chain.deploy<mocks::FeeOnTransferToken>("Skim", "SKM",
                                                              std::vector<Allocation>{{ALICE, ether(10)}});
        chain.transact(ALICE, skim.address(), [&] { skim.approve(wrapper.address(), ether(10)); });
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), [&] { wrapper.deposit_erc20(skim.address(), ether(10), id, {}); });
        }) == errors::FEE_ON_TRANSFER_TOKEN_NOT_SUPPORTED);
    }

    SECTION("Owner-only configuration") {
        for (auto fn : std::vector<std::function<void()>>{
                 [&] { wrapper.set_fee_rate(1); },
                 [&] { wrapper.set_treasury(BOB); },
                 [&] { wrapper.pause(); },
                 [&] { wrapper.rescue_eth(BOB, 0); },
             }) {
            REQUIRE(revert_code([&] { chain.transact(MALLORY, wrapper.address(), fn); }) ==
                    errors::OWNABLE_UNAUTHORIZED);
        }
        REQUIRE(revert_code([&] {
            chain.transact(ADMIN, wrapper.address(), [&] { wrapper.set_fee_rate(fees::MAX_FEE_RATE + 1); });
        }) == errors::INVALID_FEE_RATE);
        REQUIRE(revert_code([&] {
            chain.transact(ADMIN, wrapper.address(), [&] { wrapper.set_treasury(ZERO_ADDRESS); });
        }) == errors::ZERO_ADDRESS);
    }

    SECTION("Constructor validation") {
        REQUIRE(revert_code([&] {
            chain.deploy<RelayWrapper>(ZERO_ADDRESS, ADMIN, TREASURY, 0);
        }) == errors::RELAY_DEPOSITORY_ZERO_ADDRESS);
        REQUIRE(revert_code([&] {
            chain.deploy<RelayWrapper>(depository.address(), ADMIN, ZERO_ADDRESS, ONE_PERCENT);
        }) == errors::TREASURY_ZERO_ADDRESS);
    }
}

TEST_CASE("AcrossV4Wrapper deposits net of the fee", "[deposit]") {
    Chain chain(1);
    auto& token = chain.deploy<ERC20>("Underlying", "UND", std::vector<Allocation>{{ALICE, ether(100)}});
    auto& pool = chain.deploy<mocks::SpokePool>();
    auto& wrapper = chain.deploy<AcrossV4Wrapper>(pool.address(), ADMIN, TREASURY, ONE_PERCENT);

    SECTION("ERC20 deposit rewrites the input amount") {
        chain.transact(ALICE, token.address(), [&] { token.approve(wrapper.address(), ether(100)); });
        chain.transact(ALICE, wrapper.address(), [&] {
            wrapper.deposit_erc20(across_params(token.address(), ether(100)), {});
        });

        REQUIRE(pool.deposits.back().input_amount == ether(99));
        REQUIRE(pool.deposits.back().output_amount == ether(100));
        REQUIRE(token.balance_of(pool.address()) == ether(99));
        REQUIRE(token.balance_of(TREASURY) == ether(1));
        REQUIRE(chain.last_event("TransferSent")->args["destChainId"] == 10);
    }

    SECTION("Native deposit uses msg.value") {
        chain.set_balance(ALICE, ether(10));
        chain.transact(ALICE, wrapper.address(), ether(10), [&] {
            wrapper.deposit_native(across_params(ZERO_ADDRESS, 1), {});
        });
        REQUIRE(pool.deposits.back().input_amount == tenths(99));
        REQUIRE(pool.values.back() == tenths(99));
        REQUIRE(chain.balance_of(TREASURY) == tenths(1));
    }

    SECTION("Treasury that rejects value fails the deposit") {
        auto& rejecting = chain.deploy<mocks::RejectingReceiver>();
        chain.transact(ADMIN, wrapper.address(), [&] { wrapper.set_treasury(rejecting.address()); });
        chain.set_balance(ALICE, ether(1));
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, wrapper.address(), ether(1), [&] {
                wrapper.deposit_native(across_params(ZERO_ADDRESS, 1), {});
            });
        }) == errors::TRANSFER_FAILED);
        REQUIRE(chain.balance_of(ALICE) == ether(1));
    }

    SECTION("Zero spoke pool") {
        REQUIRE(revert_code([&] {
            chain.deploy<AcrossV4Wrapper>(ZERO_ADDRESS, ADMIN, TREASURY, 0);
        }) == errors::SPOKE_POOL_ZERO_ADDRESS);
    }
}
