// Shared accounts, helpers and a two-chain controller deployment for tests.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <xbridge/xbridge.hpp>

#include "mocks/accounts.hpp"
#include "mocks/endpoints.hpp"

namespace xbridge::test {

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------

inline const Address ADMIN = addresses::from_u64(0xAD);
inline const Address PAUSER = addresses::from_u64(0xAE);
inline const Address MANAGER = addresses::from_u64(0x3A);
inline const Address TREASURY = addresses::from_u64(0x7E);
inline const Address ALICE = addresses::from_u64(0xA11CE);
inline const Address BOB = addresses::from_u64(0xB0B);
inline const Address MALLORY = addresses::from_u64(0x666);

inline constexpr U128 ETHER = static_cast<U128>(1000000000000000000ULL);

inline U128 ether(uint64_t whole) { return static_cast<U128>(whole) * ETHER; }

// Tenths of an ether, for fractional expectations like 3.5
inline U128 tenths(uint64_t n) { return static_cast<U128>(n) * (ETHER / 10); }

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

// Error code the call reverted with, OK when it did not revert
template <typename F>
int32_t revert_code(F&& fn) {
    try {
        fn();
    } catch (const Revert& e) {
        return e.code();
    }
    return errors::OK;
}

inline AdapterConfig adapter_config(std::string name, std::vector<ChainId> chain_ids,
                                    std::vector<uint64_t> domain_ids, U128 min_gas = 0,
                                    uint32_t protocol_fee = 0) {
    AdapterConfig config;
    config.name = std::move(name);
    config.min_gas = min_gas;
    config.treasury = TREASURY;
    config.protocol_fee = protocol_fee;
    config.chain_ids = std::move(chain_ids);
    config.domain_ids = std::move(domain_ids);
    config.owner = ADMIN;
    return config;
}

inline Bytes refund_options(const Address& refund = ALICE) {
    return options::encode(RefundOptions{refund});
}

inline Bytes gas_options(const Address& refund = ALICE, U128 gas_limit = 200000) {
    return options::encode(GasOptions{refund, gas_limit});
}

// -----------------------------------------------------------------------------
// Side - one chain with a bridge token, controller and two adapters
// -----------------------------------------------------------------------------

// Connext domain ids for the two test chains
inline constexpr uint32_t DOMAIN_1 = 6648936;
inline constexpr uint32_t DOMAIN_10 = 1869640809;

struct Side {
    Chain chain;
    BridgeToken* token = nullptr;
    FeeCollector* collector = nullptr;
    mocks::Connext* connext = nullptr;
    ConnextAdapter* connext_adapter = nullptr;
    mocks::Mailbox* mailbox = nullptr;
    HyperlaneAdapter* hyperlane_adapter = nullptr;
    AssetController* controller = nullptr;

    Side(ChainId id, ChainId remote, uint32_t remote_domain, uint32_t fee_bps = 0)
        : chain(id) {
        token = &chain.deploy<BridgeToken>("Bridged", "XB", ADMIN,
                                           std::vector<Allocation>{{ALICE, ether(1000)}});
        collector = &chain.deploy<FeeCollector>(fee_bps, TREASURY, ADMIN);

        connext = &chain.deploy<mocks::Connext>();
        connext_adapter = &chain.deploy<ConnextAdapter>(
            connext->address(), adapter_config("ConnextAdapter", {remote}, {remote_domain}));

        mailbox = &chain.deploy<mocks::Mailbox>(static_cast<uint32_t>(id), 0);
        hyperlane_adapter = &chain.deploy<HyperlaneAdapter>(
            mailbox->address(), adapter_config("HyperlaneAdapter", {remote}, {remote}));

        ControllerConfig config;
        config.token = token->address();
        config.admin = ADMIN;
        config.pauser = PAUSER;
        config.fee_collector = collector->address();
        config.replenish_duration = 86400;
        config.min_bridges = 2;
        config.bridges = {connext_adapter->address(), hyperlane_adapter->address(), ZERO_ADDRESS};
        config.minting_limits = {ether(1000), ether(1000), ether(1000)};
        config.burning_limits = {ether(1000), ether(1000), ether(1000)};
        config.multi_bridge_adapters = {connext_adapter->address(), hyperlane_adapter->address()};
        controller = &chain.deploy<AssetController>(config);

        chain.transact(ADMIN, token->address(), [&] { token->set_bridge(controller->address(), true); });
    }

    ChainId id() const { return chain.id(); }

    void approve(const Address& owner, const Address& spender, U128 amount) {
        chain.transact(owner, token->address(), [&] { token->approve(spender, amount); });
    }
};

// Registers each side's controller and adapters with the other
inline void wire(Side& a, Side& b) {
    a.chain.transact(ADMIN, a.controller->address(), [&] {
        a.controller->set_controller_for_chain({b.id()}, {b.controller->address()});
    });
    b.chain.transact(ADMIN, b.controller->address(), [&] {
        b.controller->set_controller_for_chain({a.id()}, {a.controller->address()});
    });
    a.chain.transact(ADMIN, a.connext_adapter->address(), [&] {
        a.connext_adapter->set_trusted_adapter(b.id(), b.connext_adapter->address());
    });
    b.chain.transact(ADMIN, b.connext_adapter->address(), [&] {
        b.connext_adapter->set_trusted_adapter(a.id(), a.connext_adapter->address());
    });
    a.chain.transact(ADMIN, a.hyperlane_adapter->address(), [&] {
        a.hyperlane_adapter->set_trusted_adapter(b.id(), b.hyperlane_adapter->address());
    });
    b.chain.transact(ADMIN, b.hyperlane_adapter->address(), [&] {
        b.hyperlane_adapter->set_trusted_adapter(a.id(), a.hyperlane_adapter->address());
    });
}

// Delivers the last Connext xcall made on `from` to `to`
inline void deliver_connext(Side& from, Side& to, uint32_t origin_domain) {
    const auto call = from.connext->calls.back();
    to.chain.transact(to.connext->address(), to.connext_adapter->address(), [&] {
        to.connext_adapter->x_receive(ZERO_BYTES32, 0, ZERO_ADDRESS, from.connext_adapter->address(),
                                      origin_domain, call.call_data);
    });
}

// Delivers the last Hyperlane dispatch made on `from` to `to`
inline void deliver_hyperlane(Side& from, Side& to) {
    const auto dispatch = from.mailbox->dispatched.back();
    to.chain.transact(to.mailbox->address(), to.hyperlane_adapter->address(), [&] {
        to.hyperlane_adapter->handle(static_cast<uint32_t>(from.id()),
                                     addresses::to_bytes32(from.hyperlane_adapter->address()), dispatch.body);
    });
}

} // namespace xbridge::test
