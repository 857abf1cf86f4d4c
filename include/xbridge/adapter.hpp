#ifndef XBRIDGE_ADAPTER_HPP
#define XBRIDGE_ADAPTER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "access.hpp"
#include "chain.hpp"
#include "message.hpp"

namespace xbridge {

// =============================================================================
// Receiver Interface (destination of a BridgedMessage)
// =============================================================================

class IMessageReceiver {
public:
    virtual ~IMessageReceiver() = default;

    // msg.sender is the delivering adapter
    virtual void receive_message(const Bytes& message, ChainId origin_chain,
                                 const Address& origin_sender) = 0;
};

// =============================================================================
// Adapter Interface
// =============================================================================

class IBaseAdapter {
public:
    virtual ~IBaseAdapter() = default;

    // payable; returns the transport's transfer id (zero when it has none)
    virtual Bytes32 relay_message(ChainId dest_chain_id, const Address& destination,
                                  const Bytes& options, const Bytes& message) = 0;

    virtual bool is_chain_id_supported(ChainId chain_id) const = 0;

    // Value relay_message needs; with include_fee the protocol fee is added
    virtual U128 quote_message(ChainId dest_chain_id, const Address& destination,
                               const Bytes& options, const Bytes& message,
                               bool include_fee) const = 0;

    virtual std::vector<ChainId> supported_chain_ids() const = 0;

    virtual const std::string& adapter_name() const = 0;
};

// =============================================================================
// Fee Models
// =============================================================================

enum class FeeModel : uint8_t {
    Quoted,     // transport quote + protocol fee on the quote, excess refunded
    Unquoted,   // protocol fee on msg.value, remainder pays the bridge
    Flat        // min_gas to the treasury, remainder refunded
};

struct AdapterConfig {
    std::string name;
    U128 min_gas = 0;
    Address treasury{};
    uint32_t protocol_fee = 0;          // units of FEE_DECIMALS
    std::vector<ChainId> chain_ids;
    std::vector<uint64_t> domain_ids;
    Address owner{};
};

// Copy of `config` without chain/domain pairs, for transports that key chains differently
AdapterConfig strip_domains(AdapterConfig config);

// =============================================================================
// BaseAdapter - shared relay / receive / fee logic
// =============================================================================

class BaseAdapter : public Contract, public IBaseAdapter {
public:
    BaseAdapter(Chain& chain, const Address& bridge, const AdapterConfig& config, FeeModel model);

    // =========================================================================
    // IBaseAdapter
    // =========================================================================

    Bytes32 relay_message(ChainId dest_chain_id, const Address& destination,
                          const Bytes& options, const Bytes& message) override;

    bool is_chain_id_supported(ChainId chain_id) const override;

    U128 quote_message(ChainId dest_chain_id, const Address& destination,
                       const Bytes& options, const Bytes& message,
                       bool include_fee) const override;

    std::vector<ChainId> supported_chain_ids() const override;

    const std::string& adapter_name() const override { return name_; }

    // =========================================================================
    // Fees
    // =========================================================================

    U128 calculate_fee(U128 amount) const;

    // =========================================================================
    // Admin (DefaultAdmin unless noted)
    // =========================================================================

    void set_domain_id(const std::vector<uint64_t>& domain_ids, const std::vector<ChainId>& chain_ids);
    void set_trusted_adapter(ChainId chain_id, const Address& adapter);
    void set_min_gas(U128 min_gas);
    void set_protocol_fee(uint32_t protocol_fee, const Address& recipient);

    void pause();       // Pauser
    void unpause();

    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }

    // =========================================================================
    // Views
    // =========================================================================

    const Address& bridge() const { return bridge_; }
    FeeModel fee_model() const { return fee_model_; }
    U128 min_gas() const { return state_->min_gas; }
    uint32_t protocol_fee() const { return state_->protocol_fee; }
    const Address& protocol_fee_recipient() const { return state_->fee_recipient; }
    bool paused() const { return pausable_.paused(); }

    std::optional<ChainId> chain_for_domain(uint64_t domain_id) const;
    std::optional<uint64_t> domain_for_chain(ChainId chain_id) const;
    Address trusted_adapter(ChainId chain_id) const;

protected:
    struct Outbound {
        ChainId dest_chain_id;
        Address trusted_adapter;
        Bytes payload;          // encoded BridgedMessage
        Bytes options;
    };

    // =========================================================================
    // Transport hooks
    // =========================================================================

    // Decodes the option blob, validating transport-specific fields
    virtual Address refund_address(const Bytes& options) const = 0;

    // Native value the transport charges (Quoted model only)
    virtual U128 transport_quote(const Outbound& out) const;

    // Hands the payload to the bridge, forwarding `fee`
    virtual Bytes32 transport_send(const Outbound& out, U128 fee) = 0;

    // =========================================================================
    // Helpers for derived transports
    // =========================================================================

    // Transport-authenticated origin must be the trusted adapter; then dispatch
    void dispatch_inbound(ChainId origin_chain, const Address& origin_adapter, const Bytes& payload);

    // Inbound call must come from the bridge endpoint
    void only_bridge(int32_t error_code) const;

    // Native transfer that fails the transaction with FeeTransferFailed
    void pay(const Address& to, U128 amount);

    // Flat model: pays min_gas to the treasury and returns the remainder
    U128 deduct_fee(U128 value);

    void associate_domain(uint64_t domain_id, ChainId chain_id);

    // Transports addressed by chain id: the domain is the chain id itself
    void set_chain_supported(ChainId chain_id, bool status);

    uint64_t require_domain(ChainId chain_id) const;

    struct State {
        U128 min_gas = 0;
        uint32_t protocol_fee = 0;
        Address fee_recipient{};
        std::map<uint64_t, ChainId> domain_chains;
        std::map<ChainId, uint64_t> chain_domains;
        std::map<ChainId, Address> trusted_adapters;
    };

    Journaled<State> state_;
    AccessControl access_;
    Pausable pausable_;

private:
    Bytes32 relay_quoted(const Outbound& out, const Address& refund, U128 value);
    Bytes32 relay_unquoted(const Outbound& out, U128 value);
    Bytes32 relay_flat(const Outbound& out, const Address& refund, U128 value);

    Address bridge_;
    std::string name_;
    FeeModel fee_model_;
};

} // namespace xbridge

#endif // XBRIDGE_ADAPTER_HPP
