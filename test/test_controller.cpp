// xbridge - AssetController tests (two chains, Connext and Hyperlane adapters)

#include <catch2/catch_test_macros.hpp>

#include "support.hpp"

using namespace xbridge;
using namespace xbridge::test;

namespace {

Bytes32 send_single(Side& side, const Address& adapter, U128 amount, bool unwrap = false,
                    const Bytes& opts = refund_options()) {
    return side.chain.transact(ALICE, side.controller->address(), [&] {
        return side.controller->transfer_to(BOB, amount, unwrap, 10, adapter, opts);
    });
}

Bytes32 send_multi(Side& side, U128 amount) {
    return side.chain.transact(ALICE, side.controller->address(), [&] {
        return side.controller->transfer_to(
            BOB, amount, false, 10,
            std::vector<Address>{side.connext_adapter->address(), side.hyperlane_adapter->address()},
            std::vector<U128>{0, 0}, std::vector<Bytes>{refund_options(), gas_options()});
    });
}

} // namespace

TEST_CASE("Single-bridge transfer burns on the source and mints on the destination", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);
    a.approve(ALICE, a.controller->address(), ether(100));

    const Bytes32 expected = a.controller->calculate_transfer_id(10);
    const Bytes32 id = send_single(a, a.connext_adapter->address(), ether(100));

    REQUIRE(id == expected);
    REQUIRE(a.controller->nonce() == 1);
    REQUIRE(a.token->balance_of(ALICE) == ether(900));
    REQUIRE(a.token->total_supply() == ether(900));
    REQUIRE(a.controller->burning_current_limit_of(a.connext_adapter->address()) == ether(900));

    const auto record = a.controller->relayed_transfer(id);
    REQUIRE(record.has_value());
    REQUIRE(record->recipient == BOB);
    REQUIRE(record->threshold == 1);
    REQUIRE_FALSE(record->multi_bridge);

    const auto created = a.chain.last_event("TransferCreated");
    REQUIRE(created->args["transferId"] == to_hex(id));
    REQUIRE(created->args["sender"] == addresses::to_hex(ALICE));
    REQUIRE(a.chain.last_event("TransferRelayed")->args["adapter"] ==
            addresses::to_hex(a.connext_adapter->address()));

    deliver_connext(a, b, DOMAIN_1);
    REQUIRE(b.token->balance_of(BOB) == ether(100));
    REQUIRE(b.controller->minting_current_limit_of(b.connext_adapter->address()) == ether(900));
    const auto received = b.controller->received_transfer(id);
    REQUIRE(received->executed);
    REQUIRE(received->origin_chain_id == 1);

    SECTION("Redelivery is refused") {
        REQUIRE(revert_code([&] { deliver_connext(a, b, DOMAIN_1); }) == errors::TRANSFER_NOT_EXECUTABLE);
        REQUIRE(b.token->balance_of(BOB) == ether(100));
    }
}

TEST_CASE("Multi-bridge transfer waits for the threshold", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);
    a.approve(ALICE, a.controller->address(), ether(50));

    const Bytes32 id = send_multi(a, ether(50));
    REQUIRE(a.controller->relayed_transfer(id)->multi_bridge);
    REQUIRE(a.controller->burning_current_limit_of(ZERO_ADDRESS) == ether(950));

    deliver_connext(a, b, DOMAIN_1);
    REQUIRE(b.controller->delivered_by(id, b.connext_adapter->address()));
    REQUIRE(revert_code([&] {
        b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(id); });
    }) == errors::THRESHOLD_NOT_MET);
    REQUIRE(revert_code([&] { deliver_connext(a, b, DOMAIN_1); }) == errors::TRANSFER_RESENT_BY_ADAPTER);

    SECTION("Second adapter makes it executable by anyone") {
        deliver_hyperlane(a, b);
        REQUIRE(b.chain.last_event("TransferExecutable")->args["transferId"] == to_hex(id));
        REQUIRE(b.token->balance_of(BOB) == 0);

        b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(id); });
        REQUIRE(b.token->balance_of(BOB) == ether(50));
        REQUIRE(b.controller->minting_current_limit_of(ZERO_ADDRESS) == ether(950));

        REQUIRE(revert_code([&] {
            b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(id); });
        }) == errors::TRANSFER_NOT_EXECUTABLE);
    }

    SECTION("Receipts count while paused but execution waits") {
        b.chain.transact(PAUSER, b.controller->address(), [&] { b.controller->pause(); });
        deliver_hyperlane(a, b);
        REQUIRE(revert_code([&] {
            b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(id); });
        }) == errors::PAUSED);

        b.chain.transact(ADMIN, b.controller->address(), [&] { b.controller->unpause(); });
        b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(id); });
        REQUIRE(b.token->balance_of(BOB) == ether(50));
    }

    SECTION("Deliveries from adapters outside the set are refused") {
        b.chain.transact(ADMIN, b.controller->address(), [&] {
            b.controller->set_multi_bridge_adapters({b.hyperlane_adapter->address()}, {false});
        });
        REQUIRE(revert_code([&] { deliver_hyperlane(a, b); }) == errors::ADAPTER_NOT_SUPPORTED);
    }

    SECTION("Unknown transfers cannot execute") {
        REQUIRE(revert_code([&] {
            b.chain.transact(MALLORY, b.controller->address(), [&] { b.controller->execute(ZERO_BYTES32); });
        }) == errors::UNKNOWN_TRANSFER);
    }
}

TEST_CASE("Multi-bridge transfers pay the fee collector", "[controller][fee]") {
    Side a(1, 10, DOMAIN_10, 1000);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);

    a.approve(ALICE, a.controller->address(), ether(101));
    send_multi(a, ether(100));

    REQUIRE(a.token->balance_of(TREASURY) == ether(1));
    REQUIRE(a.token->balance_of(ALICE) == ether(899));
    REQUIRE(a.token->balance_of(a.controller->address()) == 0);
}

TEST_CASE("Outbound preconditions", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);
    a.approve(ALICE, a.controller->address(), ether(100));
    const Address connext = a.connext_adapter->address();
    const Address hyperlane = a.hyperlane_adapter->address();

    auto transfer = [&](ChainId dest, U128 amount, const Address& adapter) {
        return revert_code([&] {
            a.chain.transact(ALICE, a.controller->address(), [&] {
                a.controller->transfer_to(BOB, amount, false, dest, adapter, refund_options());
            });
        });
    };

    auto multi = [&](std::vector<Address> adapters, std::vector<U128> fees, U128 value) {
        std::vector<Bytes> opts(adapters.size(), gas_options());
        a.chain.set_balance(ALICE, value);
        return revert_code([&] {
            a.chain.transact(ALICE, a.controller->address(), value, [&] {
                a.controller->transfer_to(BOB, ether(1), false, 10, adapters, fees, opts);
            });
        });
    };

    REQUIRE(transfer(10, 0, connext) == errors::AMOUNT_ZERO);
    REQUIRE(transfer(56, ether(1), connext) == errors::CHAIN_NOT_SUPPORTED);
    REQUIRE(transfer(10, ether(1), MALLORY) == errors::NOT_HIGH_ENOUGH_LIMITS);
    REQUIRE(transfer(10, ether(1001), connext) == errors::NOT_HIGH_ENOUGH_LIMITS);
    REQUIRE(transfer(10, ether(101), connext) == errors::TOKEN_BURN_FAILED);

    SECTION("Paused destination and paused controller") {
        a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->pause_transfers_to_chain(10, true); });
        REQUIRE(transfer(10, ether(1), connext) == errors::TRANSFERS_PAUSED_TO_DESTINATION);
        a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->pause_transfers_to_chain(10, false); });

        a.chain.transact(PAUSER, a.controller->address(), [&] { a.controller->pause(); });
        REQUIRE(transfer(10, ether(1), connext) == errors::PAUSED);
        REQUIRE(revert_code([&] {
            a.chain.transact(PAUSER, a.controller->address(), [&] { a.controller->unpause(); });
        }) == errors::MISSING_ROLE);
    }

    SECTION("Multi-bridge argument checks") {
        REQUIRE(multi({connext}, {0}, 0) == errors::INVALID_PARAMS);
        REQUIRE(multi({connext, hyperlane}, {0, 0}, 5) == errors::FEES_SUM_MISMATCH);
        REQUIRE(multi({connext, connext}, {0, 0}, 0) == errors::DUPLICATE_ADAPTER);
        REQUIRE(multi({connext, MALLORY}, {0, 0}, 0) == errors::ADAPTER_NOT_SUPPORTED);

        a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->set_min_bridges(0); });
        REQUIRE(multi({connext, hyperlane}, {0, 0}, 0) == errors::MULTI_BRIDGE_TRANSFERS_DISABLED);
    }

    SECTION("Nothing changes on a failed transfer") {
        REQUIRE(a.token->balance_of(ALICE) == ether(1000));
        REQUIRE(a.controller->nonce() == 0);
        REQUIRE(a.controller->burning_current_limit_of(connext) == ether(1000));
    }
}

TEST_CASE("Inbound messages must come from the registered controller", "[controller]") {
    Side b(10, 1, DOMAIN_1);
    const Bytes payload = abi::Encoder()
        .add_bytes32(bytes32_from_u64(1))
        .add_address(BOB)
        .add_uint(ether(1))
        .add_bool(false)
        .add_uint(1)
        .finish();

    REQUIRE(revert_code([&] {
        b.chain.transact(b.connext_adapter->address(), b.controller->address(), [&] {
            b.controller->receive_message(payload, 1, MALLORY);
        });
    }) == errors::INVALID_PARAMS);
}

TEST_CASE("Resending a transfer through another adapter", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);
    a.approve(ALICE, a.controller->address(), ether(100));
    const Bytes32 id = send_single(a, a.connext_adapter->address(), ether(10));

    a.chain.transact(ALICE, a.controller->address(), [&] {
        a.controller->resend_transfer(id, a.hyperlane_adapter->address(), gas_options());
    });
    REQUIRE(a.chain.last_event("TransferResent")->args["transferId"] == to_hex(id));
    REQUIRE(a.token->balance_of(ALICE) == ether(990));

    deliver_hyperlane(a, b);
    REQUIRE(b.token->balance_of(BOB) == ether(10));
    REQUIRE(b.controller->minting_current_limit_of(b.hyperlane_adapter->address()) == ether(990));
    REQUIRE(revert_code([&] { deliver_connext(a, b, DOMAIN_1); }) == errors::TRANSFER_NOT_EXECUTABLE);

    SECTION("Unknown ids, wrong shape and unconfigured adapters") {
        REQUIRE(revert_code([&] {
            a.chain.transact(ALICE, a.controller->address(), [&] {
                a.controller->resend_transfer(ZERO_BYTES32, a.connext_adapter->address(), refund_options());
            });
        }) == errors::UNKNOWN_TRANSFER);
        REQUIRE(revert_code([&] {
            a.chain.transact(ALICE, a.controller->address(), [&] {
                a.controller->resend_transfer(id, std::vector<Address>{a.connext_adapter->address()},
                                              std::vector<U128>{0}, std::vector<Bytes>{refund_options()});
            });
        }) == errors::INVALID_PARAMS);
        REQUIRE(revert_code([&] {
            a.chain.transact(ALICE, a.controller->address(), [&] {
                a.controller->resend_transfer(id, MALLORY, refund_options());
            });
        }) == errors::NOT_HIGH_ENOUGH_LIMITS);
    }
}

TEST_CASE("Rate limits replenish over the duration", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);
    const Address connext = a.connext_adapter->address();
    a.approve(ALICE, a.controller->address(), ether(864));

    // 864 ether over one day replenishes exactly 0.01 ether per second
    a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->set_limits(connext, ether(864), ether(864)); });
    REQUIRE(a.controller->burning_max_limit_of(connext) == ether(864));
    REQUIRE(a.controller->burning_current_limit_of(connext) == ether(864));

    send_single(a, connext, ether(864));
    REQUIRE(a.controller->burning_current_limit_of(connext) == 0);

    a.chain.skip(43200);
    REQUIRE(a.controller->burning_current_limit_of(connext) == ether(432));

    a.chain.skip(43200);
    REQUIRE(a.controller->burning_current_limit_of(connext) == ether(864));

    SECTION("Lowering the max cuts the current limit") {
        a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->set_limits(connext, ether(400), ether(400)); });
        REQUIRE(a.controller->burning_current_limit_of(connext) == ether(400));
    }

    SECTION("Limits are bounded and admin-only") {
        REQUIRE(revert_code([&] {
            a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->set_limits(connext, U128_MAX, 0); });
        }) == errors::LIMITS_TOO_HIGH);
        REQUIRE(revert_code([&] {
            a.chain.transact(BOB, a.controller->address(), [&] { a.controller->set_limits(connext, 1, 1); });
        }) == errors::MISSING_ROLE);
    }
}

TEST_CASE("Unwrapping releases the underlying through the lockbox", "[controller]") {
    Side a(1, 10, DOMAIN_10);
    Side b(10, 1, DOMAIN_1);
    wire(a, b);

    auto& underlying = b.chain.deploy<ERC20>("Underlying", "UND", std::vector<Allocation>{{ALICE, ether(100)}});
    auto& lockbox = b.chain.deploy<Lockbox>(b.token->address(), underlying.address());
    b.chain.transact(ADMIN, b.token->address(), [&] { b.token->set_lockbox(lockbox.address()); });
    b.chain.transact(ALICE, underlying.address(), [&] { underlying.approve(lockbox.address(), ether(100)); });
    b.chain.transact(ALICE, lockbox.address(), [&] { lockbox.deposit(ether(100)); });

    a.approve(ALICE, a.controller->address(), ether(100));

    SECTION("Unwrapping disabled mints the bridge token") {
        send_single(a, a.connext_adapter->address(), ether(20), true);
        deliver_connext(a, b, DOMAIN_1);
        REQUIRE(b.token->balance_of(BOB) == ether(20));
        REQUIRE(underlying.balance_of(BOB) == 0);
    }

    SECTION("Unwrapping enabled pays the underlying") {
        b.chain.transact(ADMIN, b.controller->address(), [&] { b.controller->set_token_unwrapping(true); });
        send_single(a, a.connext_adapter->address(), ether(20), true);
        deliver_connext(a, b, DOMAIN_1);
        REQUIRE(underlying.balance_of(BOB) == ether(20));
        REQUIRE(b.token->balance_of(BOB) == 0);
        REQUIRE(b.token->balance_of(b.controller->address()) == 0);
        REQUIRE(underlying.balance_of(lockbox.address()) == ether(80));
    }
}

TEST_CASE("Controller administration", "[controller]") {
    Side a(1, 10, DOMAIN_10);

    SECTION("Withdraw sends the native balance to the admin") {
        a.chain.set_balance(a.controller->address(), 5);
        a.chain.transact(ADMIN, a.controller->address(), [&] { a.controller->withdraw(); });
        REQUIRE(a.chain.balance_of(ADMIN) == 5);
        REQUIRE(revert_code([&] {
            a.chain.transact(BOB, a.controller->address(), [&] { a.controller->withdraw(); });
        }) == errors::MISSING_ROLE);
    }

    SECTION("Registration checks lengths") {
        REQUIRE(revert_code([&] {
            a.chain.transact(ADMIN, a.controller->address(), [&] {
                a.controller->set_controller_for_chain({10, 56}, {MALLORY});
            });
        }) == errors::INVALID_PARAMS);
    }

    SECTION("Constructor validation") {
        ControllerConfig config;
        config.token = a.token->address();
        config.admin = ADMIN;
        config.fee_collector = a.collector->address();
        config.replenish_duration = 0;
        REQUIRE(revert_code([&] { a.chain.deploy<AssetController>(config); }) == errors::INVALID_PARAMS);

        config.replenish_duration = 86400;
        config.bridges = {MALLORY};
        REQUIRE(revert_code([&] { a.chain.deploy<AssetController>(config); }) == errors::INVALID_PARAMS);
    }
}
