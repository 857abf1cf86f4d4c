#ifndef XBRIDGE_CONTROLLER_HPP
#define XBRIDGE_CONTROLLER_HPP

#include <map>
#include <optional>
#include <set>
#include <vector>

#include "access.hpp"
#include "adapter.hpp"
#include "chain.hpp"

namespace xbridge {

// =============================================================================
// Controller Interface
// =============================================================================

class IAssetController {
public:
    virtual ~IAssetController() = default;

    virtual const Address& token() const = 0;

    // payable; msg.value pays the adapter
    virtual Bytes32 transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                                const Address& adapter, const Bytes& options) = 0;

    // payable; fees[i] pays adapters[i] and must sum to msg.value
    virtual Bytes32 transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                                const std::vector<Address>& adapters, const std::vector<U128>& fees,
                                const std::vector<Bytes>& options) = 0;

    virtual void resend_transfer(const Bytes32& transfer_id, const Address& adapter, const Bytes& options) = 0;

    virtual void resend_transfer(const Bytes32& transfer_id, const std::vector<Address>& adapters,
                                 const std::vector<U128>& fees, const std::vector<Bytes>& options) = 0;
};

// =============================================================================
// Rate Limits (XERC20 style, linear replenishment over the duration)
// =============================================================================

struct RateLimit {
    U128 max_limit = 0;
    U128 current_limit = 0;
    U128 rate_per_second = 0;
    uint64_t timestamp = 0;
};

struct BridgeLimits {
    RateLimit minting;
    RateLimit burning;
};

// =============================================================================
// Transfer Records
// =============================================================================

// Outbound, kept for resend_transfer
struct TransferRecord {
    Address recipient;
    U128 amount = 0;
    bool unwrap = false;
    ChainId dest_chain_id = 0;
    uint32_t threshold = 1;
    bool multi_bridge = false;
};

// Inbound, one per transfer id
struct ReceivedTransfer {
    Address recipient;
    U128 amount = 0;
    bool unwrap = false;
    ChainId origin_chain_id = 0;
    uint32_t received = 0;
    uint32_t threshold = 1;
    bool executed = false;
};

struct ControllerConfig {
    Address token{};
    Address admin{};
    Address pauser{};
    Address fee_collector{};
    uint64_t replenish_duration = 0;
    uint32_t min_bridges = 0;
    std::vector<Address> bridges;
    std::vector<U128> minting_limits;
    std::vector<U128> burning_limits;
    std::vector<Address> multi_bridge_adapters;
    std::vector<ChainId> controller_chains;
    std::vector<Address> controllers;
};

// =============================================================================
// AssetController - burns on send and mints on receive
// =============================================================================

class AssetController : public Contract, public IAssetController, public IMessageReceiver {
public:
    AssetController(Chain& chain, const ControllerConfig& config);

    // =========================================================================
    // IAssetController
    // =========================================================================

    const Address& token() const override { return token_; }

    Bytes32 transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                        const Address& adapter, const Bytes& options) override;

    Bytes32 transfer_to(const Address& recipient, U128 amount, bool unwrap, ChainId dest_chain_id,
                        const std::vector<Address>& adapters, const std::vector<U128>& fees,
                        const std::vector<Bytes>& options) override;

    void resend_transfer(const Bytes32& transfer_id, const Address& adapter, const Bytes& options) override;

    void resend_transfer(const Bytes32& transfer_id, const std::vector<Address>& adapters,
                         const std::vector<U128>& fees, const std::vector<Bytes>& options) override;

    // =========================================================================
    // Inbound
    // =========================================================================

    // msg.sender is the delivering adapter; origin_sender must be the registered controller
    void receive_message(const Bytes& message, ChainId origin_chain, const Address& origin_sender) override;

    // Multi-bridge transfers whose threshold is met
    void execute(const Bytes32& transfer_id);

    // =========================================================================
    // Admin
    // =========================================================================

    void set_controller_for_chain(const std::vector<ChainId>& chain_ids, const std::vector<Address>& controllers);
    void set_min_bridges(uint32_t min_bridges);
    void set_limits(const Address& bridge, U128 minting_limit, U128 burning_limit);
    void set_multi_bridge_adapters(const std::vector<Address>& adapters, const std::vector<bool>& enabled);
    virtual void set_token_unwrapping(bool allowed);
    void pause_transfers_to_chain(ChainId chain_id, bool paused);

    // Sends the native balance to the caller
    void withdraw();

    void pause();       // Pauser
    void unpause();

    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }

    // =========================================================================
    // Views
    // =========================================================================

    uint64_t nonce() const { return state_->nonce; }
    uint32_t min_bridges() const { return state_->min_bridges; }
    uint64_t replenish_duration() const { return duration_; }
    bool allow_token_unwrapping() const { return state_->allow_unwrapping; }
    bool paused() const { return pausable_.paused(); }
    const Address& fee_collector() const { return fee_collector_; }

    Address controller_for_chain(ChainId chain_id) const;
    bool is_multi_bridge_adapter(const Address& adapter) const;
    bool transfers_paused_to(ChainId chain_id) const;

    U128 minting_max_limit_of(const Address& bridge) const;
    U128 minting_current_limit_of(const Address& bridge) const;
    U128 burning_max_limit_of(const Address& bridge) const;
    U128 burning_current_limit_of(const Address& bridge) const;

    std::optional<TransferRecord> relayed_transfer(const Bytes32& transfer_id) const;
    std::optional<ReceivedTransfer> received_transfer(const Bytes32& transfer_id) const;
    bool delivered_by(const Bytes32& transfer_id, const Address& adapter) const;

    // Id the next transfer_to towards dest_chain_id will use
    Bytes32 calculate_transfer_id(ChainId dest_chain_id) const;

protected:
    // Value effect of an outbound transfer (burn here)
    virtual void take_tokens(const Address& from, U128 amount);

    // Value effect of an executed inbound transfer (mint here, optionally unwrapped)
    virtual void release_tokens(const Address& to, U128 amount, bool unwrap);

    AccessControl access_;
    Pausable pausable_;

private:
    struct State {
        uint64_t nonce = 0;
        uint32_t min_bridges = 0;
        bool allow_unwrapping = false;
        std::map<Address, BridgeLimits> limits;
        std::map<ChainId, Address> controllers;
        std::map<ChainId, bool> paused_chains;
        std::set<Address> multi_bridge_adapters;
        std::map<Bytes32, TransferRecord> relayed;
        std::map<Bytes32, ReceivedTransfer> received;
        std::set<std::pair<Bytes32, Address>> deliveries;
    };

    Address require_destination(ChainId dest_chain_id, U128 amount) const;
    void check_multi_bridge(const std::vector<Address>& adapters, const std::vector<U128>& fees,
                            const std::vector<Bytes>& options) const;

    Bytes32 create_transfer(const TransferRecord& record);
    void relay(const Bytes32& transfer_id, const TransferRecord& record, const Address& adapter,
               U128 fee, const Bytes& options);
    void collect_multi_bridge_fee(const Address& payer, U128 amount);
    void finish_transfer(const Bytes32& transfer_id, ReceivedTransfer& transfer, const Address& limit_key);

    // XERC20 limit arithmetic
    U128 current_limit(const RateLimit& limit) const;
    void change_limit(RateLimit& limit, U128 new_max);
    void use_limit(RateLimit& limit, U128 amount);

    Address token_;
    Address fee_collector_;
    uint64_t duration_;
    Journaled<State> state_;
};

// =============================================================================
// LockReleaseAssetController - locks on send and releases from the pool on receive
// =============================================================================

class LockReleaseAssetController : public AssetController {
public:
    LockReleaseAssetController(Chain& chain, const ControllerConfig& config);

    // Always reverts: the pool holds the canonical token
    void set_token_unwrapping(bool allowed) override;

    // DefaultAdmin
    void rescue_tokens(const Address& token, const Address& to, U128 amount);
    void rescue_eth(const Address& to, U128 amount);

protected:
    void take_tokens(const Address& from, U128 amount) override;
    void release_tokens(const Address& to, U128 amount, bool unwrap) override;
};

} // namespace xbridge

#endif // XBRIDGE_CONTROLLER_HPP
