// Test doubles for the bridge endpoints adapters talk to.
// Each records what it was asked to carry; tests deliver by calling the
// destination adapter with the destination endpoint as msg.sender.

#pragma once

#include <map>
#include <string>
#include <vector>

#include <xbridge/bridges.hpp>
#include <xbridge/chain.hpp>
#include <xbridge/hash.hpp>
#include <xbridge/token.hpp>

namespace xbridge::mocks {

// -----------------------------------------------------------------------------
// Axelar
// -----------------------------------------------------------------------------

class AxelarGateway : public Contract, public IAxelarGateway {
public:
    struct Call {
        std::string destination_chain;
        std::string contract_address;
        Bytes payload;
    };

    using Contract::Contract;

    void call_contract(const std::string& destination_chain, const std::string& contract_address,
                       const Bytes& payload) override {
        calls.push_back(Call{destination_chain, contract_address, payload});
    }

    bool validate_contract_call(const Bytes32& command_id, const std::string&, const std::string&,
                                const Bytes32& payload_hash) override {
        auto it = approved.find(command_id);
        return it != approved.end() && it->second == payload_hash;
    }

    void approve(const Bytes32& command_id, const Bytes& payload) {
        approved[command_id] = hash::sha3_256(payload);
    }

    std::vector<Call> calls;
    std::map<Bytes32, Bytes32> approved;
};

class AxelarGasService : public Contract, public IAxelarGasService {
public:
    using Contract::Contract;

    void pay_native_gas_for_contract_call(const Address&, const std::string&, const std::string&,
                                          const Bytes&, const Address& refund_address) override {
        paid += msg_value();
        last_refund = refund_address;
    }

    U128 paid = 0;
    Address last_refund{};
};

// -----------------------------------------------------------------------------
// CCIP
// -----------------------------------------------------------------------------

class CcipRouter : public Contract, public ICcipRouter {
public:
    CcipRouter(Chain& chain, U128 fee) : Contract(chain), fee(fee) {}

    U128 get_fee(uint64_t, const Evm2AnyMessage&) const override { return fee; }

    Bytes32 ccip_send(uint64_t dest_chain_selector, const Evm2AnyMessage& message) override {
        if (msg_value() < fee) revert(errors::FEE_TOO_LOW, "router fee");
        selectors.push_back(dest_chain_selector);
        sent.push_back(message);
        return bytes32_from_u64(sent.size());
    }

    U128 fee;
    std::vector<uint64_t> selectors;
    std::vector<Evm2AnyMessage> sent;
};

// -----------------------------------------------------------------------------
// Connext
// -----------------------------------------------------------------------------

class Connext : public Contract, public IConnext {
public:
    struct XCall {
        uint32_t destination;
        Address to;
        Address delegate;
        Bytes call_data;
        U128 relayer_fee;
    };

    using Contract::Contract;

    Bytes32 xcall(uint32_t destination, const Address& to, const Address&, const Address& delegate, U128, U128,
                  const Bytes& call_data) override {
        calls.push_back(XCall{destination, to, delegate, call_data, msg_value()});
        return bytes32_from_u64(calls.size());
    }

    std::vector<XCall> calls;
};

// -----------------------------------------------------------------------------
// Hyperlane
// -----------------------------------------------------------------------------

class Mailbox : public Contract, public IMailbox {
public:
    struct Dispatch {
        uint32_t destination;
        Bytes32 recipient;
        Bytes body;
        Bytes metadata;
        U128 value;
    };

    Mailbox(Chain& chain, uint32_t domain, U128 fee) : Contract(chain), domain(domain), fee(fee) {}

    uint32_t local_domain() const override { return domain; }

    U128 quote_dispatch(uint32_t, const Bytes32&, const Bytes&, const Bytes&) const override { return fee; }

    Bytes32 dispatch(uint32_t destination, const Bytes32& recipient, const Bytes& body,
                     const Bytes& hook_metadata) override {
        dispatched.push_back(Dispatch{destination, recipient, body, hook_metadata, msg_value()});
        return hash::sha3_256(body);
    }

    uint32_t domain;
    U128 fee;
    std::vector<Dispatch> dispatched;
};

// -----------------------------------------------------------------------------
// LayerZero
// -----------------------------------------------------------------------------

class LzEndpoint : public Contract, public ILayerZeroEndpoint {
public:
    LzEndpoint(Chain& chain, U128 fee) : Contract(chain), fee(fee) {}

    MessagingFee quote(const MessagingParams&, const Address&) const override { return MessagingFee{fee, 0}; }

    MessagingReceipt send(const MessagingParams& params, const Address& refund_address) override {
        sent.push_back(params);
        refunds.push_back(refund_address);
        const uint64_t nonce = sent.size();
        return MessagingReceipt{hash::sha3_256(params.message), nonce, MessagingFee{msg_value(), 0}};
    }

    U128 fee;
    std::vector<MessagingParams> sent;
    std::vector<Address> refunds;
};

// -----------------------------------------------------------------------------
// Optimism
// -----------------------------------------------------------------------------

class CrossDomainMessenger : public Contract, public ICrossDomainMessenger {
public:
    struct Message {
        Address target;
        Bytes message;
        uint32_t min_gas_limit;
    };

    using Contract::Contract;

    void send_message(const Address& target, const Bytes& message, uint32_t min_gas_limit) override {
        sent.push_back(Message{target, message, min_gas_limit});
    }

    Address x_domain_message_sender() const override { return relaying_sender; }

    std::vector<Message> sent;
    Address relaying_sender{};
};

// -----------------------------------------------------------------------------
// Polymer
// -----------------------------------------------------------------------------

class CrossL2Prover : public Contract, public ICrossL2Prover {
public:
    using Contract::Contract;

    ProvenEvent validate_event(const Bytes& proof) const override {
        auto it = proofs.find(proof);
        if (it == proofs.end()) revert(errors::INVALID_PROOF, "unknown proof");
        return it->second;
    }

    // Registers `event` and returns an opaque proof for it
    Bytes prove(const ProvenEvent& event) {
        Bytes proof = bytes_from_hex("0xbeef");
        proof.push_back(static_cast<uint8_t>(proofs.size()));
        proofs[proof] = event;
        return proof;
    }

    std::map<Bytes, ProvenEvent> proofs;
};

// -----------------------------------------------------------------------------
// Wormhole
// -----------------------------------------------------------------------------

class WormholeRelayer : public Contract, public IWormholeRelayer {
public:
    struct Send {
        uint16_t target_chain;
        Address target_address;
        Bytes payload;
        U128 gas_limit;
        uint16_t refund_chain;
        Address refund_address;
        U128 value;
    };

    WormholeRelayer(Chain& chain, U128 price) : Contract(chain), price(price) {}

    U128 quote_evm_delivery_price(uint16_t, U128, U128) const override { return price; }

    uint64_t send_payload_to_evm(uint16_t target_chain, const Address& target_address, const Bytes& payload,
                                 U128, U128 gas_limit, uint16_t refund_chain,
                                 const Address& refund_address) override {
        sent.push_back(Send{target_chain, target_address, payload, gas_limit, refund_chain, refund_address,
                            msg_value()});
        return sent.size();
    }

    U128 price;
    std::vector<Send> sent;
};

// -----------------------------------------------------------------------------
// Relay / Across
// -----------------------------------------------------------------------------

class RelayDepository : public Contract, public IRelayDepository {
public:
    using Contract::Contract;

    void deposit_erc20(const Address& depositor, const Address& token, U128 amount, const Bytes32& id) override {
        auto& erc20 = chain().require_contract<ERC20>(token);
        const Address from = msg_sender();
        chain().call(address(), token, [&] { erc20.transfer_from(from, address(), amount); });
        last_depositor = depositor;
        last_id = id;
        last_amount = amount;
    }

    void deposit_native(const Address& depositor, const Bytes32& id) override {
        last_depositor = depositor;
        last_id = id;
        last_amount = msg_value();
    }

    Address last_depositor{};
    Bytes32 last_id{};
    U128 last_amount = 0;
};

class SpokePool : public Contract, public ISpokePool {
public:
    using Contract::Contract;

    void deposit(const AcrossDeposit& params) override {
        if (msg_value() == 0) {
            auto& erc20 = chain().require_contract<ERC20>(params.input_token);
            const Address from = msg_sender();
            chain().call(address(), params.input_token, [&] {
                erc20.transfer_from(from, address(), params.input_amount);
            });
        }
        deposits.push_back(params);
        values.push_back(msg_value());
    }

    std::vector<AcrossDeposit> deposits;
    std::vector<U128> values;
};

} // namespace xbridge::mocks
