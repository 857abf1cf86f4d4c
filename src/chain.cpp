// =============================================================================
// chain.cpp - Simulated Chain, Contracts and Transactions
// =============================================================================

#include "xbridge/chain.hpp"
#include "xbridge/log.hpp"
#include <stdexcept>

namespace xbridge {

// =============================================================================
// Contract
// =============================================================================

Contract::Contract(Chain& chain)
    : chain_(chain)
    , address_(chain.register_contract(this)) {}

Contract::~Contract() {
    chain_.unregister_contract(address_);
}

void Contract::on_value_received(const Address&, U128) {}

const Address& Contract::msg_sender() const {
    return chain_.msg_sender();
}

U128 Contract::msg_value() const {
    return chain_.msg_value();
}

U128 Contract::self_balance() const {
    return chain_.balance_of(address_);
}

uint64_t Contract::block_timestamp() const {
    return chain_.timestamp();
}

void Contract::emit(std::string name, nlohmann::json args) const {
    chain_.emit(address_, std::move(name), std::move(args));
}

void Contract::checkpoint() {
    for (auto* entry : journal_) entry->checkpoint();
}

void Contract::commit() {
    for (auto* entry : journal_) entry->commit();
}

void Contract::rollback() {
    for (auto* entry : journal_) entry->rollback();
}

// =============================================================================
// Chain
// =============================================================================

Chain::Chain(ChainId id, uint64_t timestamp)
    : id_(id)
    , timestamp_(timestamp) {}

Chain::~Chain() {
    // Contracts unregister themselves while the registry is still alive
    owned_.clear();
}

Address Chain::register_contract(Contract* contract) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // 0xC0 | chain id (8 bytes) | creation counter (8 bytes)
    Address addr = {};
    addr[0] = 0xC0;
    uint64_t id = id_;
    for (int i = 11; i >= 4; --i) {
        addr[i] = static_cast<uint8_t>(id & 0xFF);
        id >>= 8;
    }
    uint64_t n = next_contract_++;
    for (int i = 19; i >= 12; --i) {
        addr[i] = static_cast<uint8_t>(n & 0xFF);
        n >>= 8;
    }

    contracts_[addr] = contract;
    return addr;
}

void Chain::unregister_contract(const Address& addr) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    contracts_.erase(addr);
}

bool Chain::is_contract(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return contracts_.count(addr) > 0;
}

// =============================================================================
// Native Value
// =============================================================================

U128 Chain::balance_of(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find(addr);
    return it == balances_.end() ? 0 : it->second;
}

void Chain::set_balance(const Address& addr, U128 amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    balances_[addr] = amount;
}

void Chain::move_value(const Address& from, const Address& to, U128 amount) {
    U128& src = balances_[from];
    if (src < amount) {
        revert(errors::INSUFFICIENT_BALANCE,
               "native balance " + u128_to_string(src) + " < " + u128_to_string(amount));
    }
    src -= amount;
    balances_[to] += amount;
}

void Chain::transfer_value(const Address& from, const Address& to, U128 amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    call(from, to, amount, [&] {
        auto it = contracts_.find(to);
        if (it != contracts_.end()) {
            it->second->on_value_received(from, amount);
        }
    });
}

bool Chain::try_transfer_value(const Address& from, const Address& to, U128 amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Balance and log effects of a rejected transfer are undone here
    auto balances = balances_;
    const size_t event_count = events_.size();
    try {
        transfer_value(from, to, amount);
        return true;
    } catch (const Revert& e) {
        balances_ = std::move(balances);
        events_.resize(event_count);
        XB_DEBUG("value transfer to " << addresses::to_hex(to) << " failed: " << e.what());
        return false;
    }
}

// =============================================================================
// Transactions
// =============================================================================

const CallFrame& Chain::frame() const {
    if (frames_.empty()) {
        throw std::logic_error("no active call frame (use Chain::transact)");
    }
    return frames_.back();
}

void Chain::begin() {
    saved_ = Ledger{balances_, events_.size()};
    for (auto& [addr, contract] : contracts_) contract->checkpoint();
}

void Chain::commit() {
    for (auto& [addr, contract] : contracts_) contract->commit();
    saved_.reset();
}

void Chain::rollback() {
    for (auto& [addr, contract] : contracts_) contract->rollback();
    if (saved_) {
        balances_ = std::move(saved_->balances);
        events_.resize(saved_->event_count);
        saved_.reset();
    }
}

// =============================================================================
// Events
// =============================================================================

void Chain::emit(const Address& emitter, std::string name, nlohmann::json args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    XB_TRACE("event " << name << " from " << addresses::to_hex(emitter) << " " << args.dump());
    events_.push_back(Event{emitter, std::move(name), std::move(args)});
}

std::vector<Event> Chain::events_named(std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto& ev : events_) {
        if (ev.name == name) out.push_back(ev);
    }
    return out;
}

std::optional<Event> Chain::last_event(std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->name == name) return *it;
    }
    return std::nullopt;
}

} // namespace xbridge
