// xbridge - Registry tests

#include <catch2/catch_test_macros.hpp>

#include "support.hpp"

using namespace xbridge;
using namespace xbridge::test;

TEST_CASE("Registry tracks local adapters", "[registry]") {
    Side side(1, 10, DOMAIN_10);
    const Address connext = side.connext_adapter->address();
    const Address hyperlane = side.hyperlane_adapter->address();
    auto& registry = side.chain.deploy<Registry>(std::vector<Address>{connext, hyperlane}, ADMIN);

    REQUIRE(registry.is_local_adapter(connext));
    REQUIRE(registry.is_local_adapter(hyperlane));
    REQUIRE_FALSE(registry.is_local_adapter(BOB));

    SECTION("Bridges for a chain follow registration order") {
        REQUIRE(registry.supported_bridges_for_chain(10) == std::vector<Address>{connext, hyperlane});
        REQUIRE(registry.supported_bridges_for_chain(5).empty());
    }

    SECTION("Disabled adapters drop out") {
        side.chain.transact(ADMIN, registry.address(), [&] {
            registry.set_adapters({hyperlane}, {false});
        });
        REQUIRE_FALSE(registry.is_local_adapter(hyperlane));
        REQUIRE(registry.supported_bridges_for_chain(10) == std::vector<Address>{connext});
        REQUIRE(side.chain.last_event("AdapterSet")->args["status"] == false);

        REQUIRE(revert_code([&] { registry.supported_chains_for_adapter(hyperlane); }) == errors::NOT_ADAPTER);
    }

    SECTION("Chains for an adapter") {
        REQUIRE(registry.supported_chains_for_adapter(connext) == std::vector<ChainId>{10});
        REQUIRE(revert_code([&] { registry.supported_chains_for_adapter(MALLORY); }) == errors::NOT_ADAPTER);
    }

    SECTION("Non-adapter entries are skipped") {
        side.chain.transact(ADMIN, registry.address(), [&] { registry.set_adapters({BOB}, {true}); });
        REQUIRE(registry.is_local_adapter(BOB));
        REQUIRE(registry.supported_bridges_for_chain(10).size() == 2);
        REQUIRE(registry.supported_chains_for_adapter(BOB).empty());
    }

    SECTION("Only the owner updates, with paired arguments") {
        REQUIRE(revert_code([&] {
            side.chain.transact(MALLORY, registry.address(), [&] { registry.set_adapters({BOB}, {true}); });
        }) == errors::OWNABLE_UNAUTHORIZED);
        REQUIRE(revert_code([&] {
            side.chain.transact(ADMIN, registry.address(), [&] { registry.set_adapters({BOB}, {true, false}); });
        }) == errors::INVALID_PARAMS);
        REQUIRE_FALSE(registry.is_local_adapter(BOB));
    }
}
