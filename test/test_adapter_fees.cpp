// xbridge - Adapter fee model and access tests

#include <catch2/catch_test_macros.hpp>

#include "support.hpp"

using namespace xbridge;
using namespace xbridge::test;

namespace {

constexpr uint64_t SELECTOR_10 = 3734403246176062136ULL;

// Protocol fee of 10% in FEE_DECIMALS units
constexpr uint32_t TEN_PERCENT = 10000;

} // namespace

TEST_CASE("Quoted model charges the transport quote plus protocol fee", "[adapter][fee]") {
    Chain chain(1);
    auto& router = chain.deploy<mocks::CcipRouter>(1000);
    auto& adapter = chain.deploy<CCIPAdapter>(router.address(),
                                              adapter_config("CCIPAdapter", {10}, {SELECTOR_10}, 0, TEN_PERCENT));
    chain.transact(ADMIN, adapter.address(), [&] { adapter.set_trusted_adapter(10, MALLORY); });
    chain.set_balance(ALICE, 10000);

    const Bytes opts = refund_options(ALICE);
    const Bytes message = bytes_from_hex("0x01");

    REQUIRE(adapter.quote_message(10, BOB, opts, message, false) == 1000);
    REQUIRE(adapter.quote_message(10, BOB, opts, message, true) == 1100);

    SECTION("Excess is refunded exactly") {
        chain.transact(ALICE, adapter.address(), 1500, [&] { adapter.relay_message(10, BOB, opts, message); });
        REQUIRE(chain.balance_of(TREASURY) == 100);
        REQUIRE(chain.balance_of(router.address()) == 1000);
        REQUIRE(chain.balance_of(ALICE) == 8900);
        REQUIRE(chain.balance_of(adapter.address()) == 0);
        REQUIRE(router.sent.size() == 1);
    }

    SECTION("Underpayment reverts without side effects") {
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, adapter.address(), 1099, [&] { adapter.relay_message(10, BOB, opts, message); });
        }) == errors::FEE_TOO_LOW);
        REQUIRE(chain.balance_of(ALICE) == 10000);
        REQUIRE(chain.balance_of(TREASURY) == 0);
        REQUIRE(router.sent.empty());
    }

    SECTION("min_gas is a floor") {
        chain.transact(ADMIN, adapter.address(), [&] { adapter.set_min_gas(2000); });
        REQUIRE(adapter.quote_message(10, BOB, opts, message, true) == 2000);
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, adapter.address(), 1500, [&] { adapter.relay_message(10, BOB, opts, message); });
        }) == errors::VALUE_IS_LESS_THAN_LIMIT);
    }
}

TEST_CASE("Unquoted model forwards msg.value minus the protocol fee", "[adapter][fee]") {
    Chain chain(1);
    auto& connext = chain.deploy<mocks::Connext>();
    auto& adapter = chain.deploy<ConnextAdapter>(connext.address(),
                                                 adapter_config("ConnextAdapter", {10}, {DOMAIN_10}, 200, TEN_PERCENT));
    chain.transact(ADMIN, adapter.address(), [&] { adapter.set_trusted_adapter(10, MALLORY); });
    chain.set_balance(ALICE, 10000);

    REQUIRE(adapter.quote_message(10, BOB, refund_options(), {}, false) == 200);
    REQUIRE(adapter.quote_message(10, BOB, refund_options(), {}, true) == 220);

    chain.transact(ALICE, adapter.address(), 1000, [&] {
        adapter.relay_message(10, BOB, refund_options(BOB), bytes_from_hex("0x02"));
    });
    REQUIRE(chain.balance_of(TREASURY) == 100);
    REQUIRE(connext.calls.back().relayer_fee == 900);
    REQUIRE(connext.calls.back().destination == DOMAIN_10);
    REQUIRE(connext.calls.back().to == MALLORY);
    REQUIRE(connext.calls.back().delegate == BOB);

    REQUIRE(revert_code([&] {
        chain.transact(ALICE, adapter.address(), 199, [&] {
            adapter.relay_message(10, BOB, refund_options(), bytes_from_hex("0x02"));
        });
    }) == errors::VALUE_IS_LESS_THAN_LIMIT);
}

TEST_CASE("Flat model pays min_gas and refunds the rest", "[adapter][fee]") {
    Chain chain(1);
    auto& messenger = chain.deploy<mocks::CrossDomainMessenger>();
    auto& adapter = chain.deploy<OptimismL2Adapter>(messenger.address(),
                                                    adapter_config("OptimismL2Adapter", {10}, {}, 300));
    chain.transact(ADMIN, adapter.address(), [&] { adapter.set_trusted_adapter(10, MALLORY); });
    chain.set_balance(ALICE, 1000);

    REQUIRE(adapter.quote_message(10, BOB, refund_options(), {}, true) == 300);

    chain.transact(ALICE, adapter.address(), 1000, [&] {
        adapter.relay_message(10, BOB, refund_options(BOB), bytes_from_hex("0x03"));
    });
    REQUIRE(chain.balance_of(TREASURY) == 300);
    REQUIRE(chain.balance_of(BOB) == 700);

    chain.set_balance(ALICE, 1000);
    REQUIRE(revert_code([&] {
        chain.transact(ALICE, adapter.address(), 200, [&] {
            adapter.relay_message(10, BOB, refund_options(), bytes_from_hex("0x03"));
        });
    }) == errors::VALUE_IS_LESS_THAN_LIMIT);
}

TEST_CASE("Relay preconditions and administration", "[adapter]") {
    Chain chain(1);
    auto& connext = chain.deploy<mocks::Connext>();
    auto& adapter = chain.deploy<ConnextAdapter>(connext.address(),
                                                 adapter_config("ConnextAdapter", {10}, {DOMAIN_10}));
    const Bytes opts = refund_options();

    SECTION("Unsupported chain and missing trusted adapter") {
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, adapter.address(), [&] { adapter.relay_message(56, BOB, opts, {}); });
        }) == errors::INVALID_PARAMS);
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, adapter.address(), [&] { adapter.relay_message(10, BOB, opts, {}); });
        }) == errors::INVALID_PARAMS);
        REQUIRE(revert_code([&] { (void)adapter.quote_message(56, BOB, opts, {}, true); }) ==
                errors::INVALID_PARAMS);
    }

    SECTION("Paused adapters refuse to relay") {
        chain.transact(ADMIN, adapter.address(), [&] { adapter.set_trusted_adapter(10, MALLORY); });
        REQUIRE(revert_code([&] {
            chain.transact(BOB, adapter.address(), [&] { adapter.pause(); });
        }) == errors::MISSING_ROLE);

        chain.transact(ADMIN, adapter.address(), [&] { adapter.pause(); });
        REQUIRE(revert_code([&] {
            chain.transact(ALICE, adapter.address(), [&] { adapter.relay_message(10, BOB, opts, {}); });
        }) == errors::PAUSED);

        chain.transact(ADMIN, adapter.address(), [&] { adapter.unpause(); });
        chain.transact(ALICE, adapter.address(), [&] { adapter.relay_message(10, BOB, opts, {}); });
        REQUIRE(connext.calls.size() == 1);
    }

    SECTION("Domain and fee administration") {
        REQUIRE(revert_code([&] {
            chain.transact(BOB, adapter.address(), [&] { adapter.set_domain_id({1}, {1}); });
        }) == errors::MISSING_ROLE);

        chain.transact(ADMIN, adapter.address(), [&] { adapter.set_domain_id({DOMAIN_1}, {1}); });
        REQUIRE(adapter.is_chain_id_supported(1));
        REQUIRE(adapter.chain_for_domain(DOMAIN_1) == 1);
        REQUIRE(adapter.supported_chain_ids() == std::vector<ChainId>{1, 10});

        REQUIRE(revert_code([&] {
            chain.transact(ADMIN, adapter.address(), [&] {
                adapter.set_protocol_fee(fees::FEE_DECIMALS + 1, TREASURY);
            });
        }) == errors::INVALID_PARAMS);
        chain.transact(ADMIN, adapter.address(), [&] { adapter.set_protocol_fee(500, BOB); });
        REQUIRE(adapter.protocol_fee_recipient() == BOB);
        REQUIRE(adapter.calculate_fee(100000) == 500);
    }

    SECTION("Inbound calls only from the endpoint and the trusted origin") {
        const Bytes payload = envelope::encode(BridgedMessage{{}, ALICE, BOB});
        REQUIRE(revert_code([&] {
            chain.transact(MALLORY, adapter.address(), [&] {
                adapter.x_receive(ZERO_BYTES32, 0, ZERO_ADDRESS, MALLORY, DOMAIN_10, payload);
            });
        }) == errors::UNAUTHORISED);
        REQUIRE(revert_code([&] {
            chain.transact(connext.address(), adapter.address(), [&] {
                adapter.x_receive(ZERO_BYTES32, 0, ZERO_ADDRESS, MALLORY, DOMAIN_10, payload);
            });
        }) == errors::UNAUTHORISED);
    }

    SECTION("Constructor validation") {
        REQUIRE(revert_code([&] {
            chain.deploy<ConnextAdapter>(ZERO_ADDRESS, adapter_config("ConnextAdapter", {10}, {DOMAIN_10}));
        }) == errors::INVALID_PARAMS);
        REQUIRE(revert_code([&] {
            chain.deploy<ConnextAdapter>(connext.address(), adapter_config("ConnextAdapter", {10}, {}));
        }) == errors::INVALID_PARAMS);
    }
}
