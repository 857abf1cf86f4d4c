#ifndef XBRIDGE_BRIDGES_HPP
#define XBRIDGE_BRIDGES_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace xbridge {

// =============================================================================
// External bridge endpoints
//
// Implementations are Contracts deployed on the same Chain as the adapter.
// Payable entry points receive their value through the call frame.
// =============================================================================

// =============================================================================
// Axelar
// =============================================================================

class IAxelarGateway {
public:
    virtual ~IAxelarGateway() = default;

    virtual void call_contract(const std::string& destination_chain,
                               const std::string& contract_address,
                               const Bytes& payload) = 0;

    virtual bool validate_contract_call(const Bytes32& command_id,
                                        const std::string& source_chain,
                                        const std::string& source_address,
                                        const Bytes32& payload_hash) = 0;
};

class IAxelarGasService {
public:
    virtual ~IAxelarGasService() = default;

    // payable
    virtual void pay_native_gas_for_contract_call(const Address& sender,
                                                  const std::string& destination_chain,
                                                  const std::string& destination_address,
                                                  const Bytes& payload,
                                                  const Address& refund_address) = 0;
};

// =============================================================================
// Chainlink CCIP
// =============================================================================

struct EvmTokenAmount {
    Address token;
    U128 amount;
};

struct Evm2AnyMessage {
    Bytes receiver;                         // abi.encode(address)
    Bytes data;
    std::vector<EvmTokenAmount> token_amounts;
    Address fee_token;                      // zero = native
    Bytes extra_args;
};

struct Any2EvmMessage {
    Bytes32 message_id;
    uint64_t source_chain_selector;
    Bytes sender;                           // abi.encode(address)
    Bytes data;
    std::vector<EvmTokenAmount> dest_token_amounts;
};

class ICcipRouter {
public:
    virtual ~ICcipRouter() = default;

    virtual U128 get_fee(uint64_t dest_chain_selector, const Evm2AnyMessage& message) const = 0;

    // payable
    virtual Bytes32 ccip_send(uint64_t dest_chain_selector, const Evm2AnyMessage& message) = 0;
};

// =============================================================================
// Connext
// =============================================================================

class IConnext {
public:
    virtual ~IConnext() = default;

    // payable (relayer fee)
    virtual Bytes32 xcall(uint32_t destination, const Address& to, const Address& asset,
                          const Address& delegate, U128 amount, U128 slippage,
                          const Bytes& call_data) = 0;
};

// =============================================================================
// Hyperlane
// =============================================================================

class IMailbox {
public:
    virtual ~IMailbox() = default;

    virtual uint32_t local_domain() const = 0;

    virtual U128 quote_dispatch(uint32_t destination, const Bytes32& recipient,
                                const Bytes& body, const Bytes& hook_metadata) const = 0;

    // payable
    virtual Bytes32 dispatch(uint32_t destination, const Bytes32& recipient,
                             const Bytes& body, const Bytes& hook_metadata) = 0;
};

// =============================================================================
// LayerZero v2
// =============================================================================

struct MessagingParams {
    uint32_t dst_eid;
    Bytes32 receiver;
    Bytes message;
    Bytes options;
    bool pay_in_lz_token;
};

struct MessagingFee {
    U128 native_fee;
    U128 lz_token_fee;
};

struct MessagingReceipt {
    Bytes32 guid;
    uint64_t nonce;
    MessagingFee fee;
};

struct LzOrigin {
    uint32_t src_eid;
    Bytes32 sender;
    uint64_t nonce;
};

class ILayerZeroEndpoint {
public:
    virtual ~ILayerZeroEndpoint() = default;

    virtual MessagingFee quote(const MessagingParams& params, const Address& sender) const = 0;

    // payable
    virtual MessagingReceipt send(const MessagingParams& params, const Address& refund_address) = 0;
};

// =============================================================================
// Optimism native messaging
// =============================================================================

class ICrossDomainMessenger {
public:
    virtual ~ICrossDomainMessenger() = default;

    virtual void send_message(const Address& target, const Bytes& message, uint32_t min_gas_limit) = 0;

    // Origin-chain sender of the message currently being relayed
    virtual Address x_domain_message_sender() const = 0;
};

// =============================================================================
// Polymer
// =============================================================================

struct ProvenEvent {
    ChainId chain_id;
    Address emitting_contract;
    Bytes topics;           // concatenated 32-byte topics
    Bytes unindexed_data;
};

class ICrossL2Prover {
public:
    virtual ~ICrossL2Prover() = default;

    // Reverts when the proof does not verify
    virtual ProvenEvent validate_event(const Bytes& proof) const = 0;
};

// =============================================================================
// Wormhole
// =============================================================================

class IWormholeRelayer {
public:
    virtual ~IWormholeRelayer() = default;

    virtual U128 quote_evm_delivery_price(uint16_t target_chain, U128 receiver_value,
                                          U128 gas_limit) const = 0;

    // payable; returns the message sequence
    virtual uint64_t send_payload_to_evm(uint16_t target_chain, const Address& target_address,
                                         const Bytes& payload, U128 receiver_value, U128 gas_limit,
                                         uint16_t refund_chain, const Address& refund_address) = 0;
};

// =============================================================================
// Relay / Across deposit endpoints
// =============================================================================

class IRelayDepository {
public:
    virtual ~IRelayDepository() = default;

    // Pulls `amount` of `token` from the caller
    virtual void deposit_erc20(const Address& depositor, const Address& token, U128 amount,
                               const Bytes32& id) = 0;

    // payable
    virtual void deposit_native(const Address& depositor, const Bytes32& id) = 0;
};

struct AcrossDeposit {
    Address depositor;
    Address recipient;
    Address input_token;
    Address output_token;
    U128 input_amount;
    U128 output_amount;
    ChainId destination_chain_id;
    Address exclusive_relayer;
    uint32_t quote_timestamp;
    uint32_t fill_deadline;
    uint32_t exclusivity_parameter;
    Bytes message;
};

class ISpokePool {
public:
    virtual ~ISpokePool() = default;

    // payable when depositing native; pulls input_token otherwise
    virtual void deposit(const AcrossDeposit& params) = 0;
};

} // namespace xbridge

#endif // XBRIDGE_BRIDGES_HPP
