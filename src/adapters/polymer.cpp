// =============================================================================
// polymer.cpp - Polymer Prover Adapter
// =============================================================================

#include "xbridge/adapters/polymer.hpp"
#include "xbridge/abi.hpp"
#include "xbridge/hash.hpp"
#include "xbridge/log.hpp"

#include <algorithm>

namespace xbridge {

namespace {

constexpr size_t TOPICS_LENGTH = 4 * abi::WORD;
constexpr const char* RELAY_EVENT_SIGNATURE = "RelayViaPolymer(uint256,address,bytes32,bytes)";

Bytes32 topic_at(const Bytes& topics, size_t index) {
    Bytes32 out{};
    std::copy_n(topics.begin() + static_cast<std::ptrdiff_t>(index * abi::WORD), abi::WORD, out.begin());
    return out;
}

} // namespace

PolymerAdapter::PolymerAdapter(Chain& chain, const Address& prover, const AdapterConfig& config)
    : BaseAdapter(chain, prover, strip_domains(config), FeeModel::Flat)
    , state_poly_(*this) {
    require(config.domain_ids.empty(), errors::INVALID_PARAMS, "polymer is keyed by chain id");
    for (ChainId id : config.chain_ids) {
        set_chain_supported(id, true);
    }
}

// =============================================================================
// Event Layout
// =============================================================================

Bytes32 PolymerAdapter::relay_event_hash() {
    return hash::sha3_256(std::string_view(RELAY_EVENT_SIGNATURE));
}

Bytes PolymerAdapter::encode_topics(ChainId dest_chain_id, const Address& dest_adapter,
                                    const Bytes32& transfer_id) {
    return abi::Encoder()
        .add_bytes32(relay_event_hash())
        .add_uint(dest_chain_id)
        .add_address(dest_adapter)
        .add_bytes32(transfer_id)
        .finish();
}

Bytes PolymerAdapter::encode_data(const Bytes& payload) {
    return abi::Encoder().add_bytes(payload).finish();
}

Bytes32 PolymerAdapter::calculate_transfer_id(ChainId dest_chain_id, const Bytes& payload) const {
    return hash::sha3_256(abi::Encoder()
                              .add_uint(chain().id())
                              .add_uint(dest_chain_id)
                              .add_uint(state_poly_->nonce)
                              .add_bytes(payload)
                              .finish());
}

// =============================================================================
// Outbound
// =============================================================================

Address PolymerAdapter::refund_address(const Bytes& options) const {
    return options::decode_refund(options).refund_address;
}

Bytes32 PolymerAdapter::transport_send(const Outbound& out, U128) {
    const Bytes32 transfer_id = calculate_transfer_id(out.dest_chain_id, out.payload);
    state_poly_->nonce += 1;

    emit("RelayViaPolymer", {
        {"destChainId", out.dest_chain_id},
        {"destAdapter", addresses::to_hex(out.trusted_adapter)},
        {"transferId", to_hex(transfer_id)},
        {"message", to_hex(out.payload)},
    });
    return transfer_id;
}

// =============================================================================
// Inbound
// =============================================================================

void PolymerAdapter::receive_message(const Bytes& proof) {
    ReentrancyGuard guard(reentrancy_lock_);

    auto& verifier = chain().require_contract<ICrossL2Prover>(prover());
    const ProvenEvent ev = chain().call(address(), prover(), [&] {
        return verifier.validate_event(proof);
    });

    if (ev.topics.size() != TOPICS_LENGTH) {
        revert(errors::INVALID_PROOF, "topics length " + std::to_string(ev.topics.size()));
    }
    if (topic_at(ev.topics, 0) != relay_event_hash()) {
        revert(errors::INVALID_PROOF, "not a RelayViaPolymer event");
    }
    if (topic_at(ev.topics, 1) != bytes32_from_u64(chain().id())) {
        revert(errors::INVALID_PROOF, "destination chain mismatch");
    }
    if (topic_at(ev.topics, 2) != addresses::to_bytes32(address())) {
        revert(errors::INVALID_PROOF, "destination adapter mismatch");
    }

    const Address trusted = trusted_adapter(ev.chain_id);
    if (addresses::is_zero(trusted)) {
        revert(errors::INVALID_PROOF, "no trusted adapter for " + std::to_string(ev.chain_id));
    }
    if (ev.emitting_contract != trusted) {
        revert(errors::UNAUTHORISED, "emitter " + addresses::to_hex(ev.emitting_contract));
    }

    const Bytes32 transfer_id = topic_at(ev.topics, 3);
    if (is_transfer_processed(transfer_id)) {
        revert(errors::ALREADY_PROCESSED, to_hex(transfer_id));
    }
    state_poly_->processed.insert(transfer_id);

    abi::Decoder dec(ev.unindexed_data);
    const Bytes payload = dec.read_bytes();
    dispatch_inbound(ev.chain_id, ev.emitting_contract, payload);
}

bool PolymerAdapter::is_transfer_processed(const Bytes32& transfer_id) const {
    return state_poly_->processed.count(transfer_id) > 0;
}

void PolymerAdapter::set_domain_id(const std::vector<ChainId>& chain_ids, bool status) {
    access_.only_role(Role::DefaultAdmin);
    for (ChainId id : chain_ids) {
        set_chain_supported(id, status);
    }
    XB_INFO(adapter_name() << (status ? " enabled " : " disabled ") << chain_ids.size() << " chains");
}

} // namespace xbridge
