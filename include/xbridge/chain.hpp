#ifndef XBRIDGE_CHAIN_HPP
#define XBRIDGE_CHAIN_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "types.hpp"

namespace xbridge {

class Chain;

// =============================================================================
// Event Log Entry
// =============================================================================

// Amounts are decimal strings, addresses and byte strings are 0x-hex
struct Event {
    Address emitter;
    std::string name;
    nlohmann::json args;
};

// =============================================================================
// Journaled State
// =============================================================================

class IJournaled {
public:
    virtual ~IJournaled() = default;
    virtual void checkpoint() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// =============================================================================
// Contract - base of everything deployed on a Chain
// =============================================================================

class Contract {
public:
    explicit Contract(Chain& chain);
    virtual ~Contract();

    // Non-copyable
    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const Address& address() const { return address_; }
    Chain& chain() const { return chain_; }

    // Native value pushed by transfer_value; throw Revert to reject it
    virtual void on_value_received(const Address& from, U128 amount);

protected:
    const Address& msg_sender() const;
    U128 msg_value() const;
    U128 self_balance() const;
    uint64_t block_timestamp() const;

    void emit(std::string name, nlohmann::json args) const;

    bool reentrancy_lock_ = false;

private:
    friend class Chain;
    template <typename T> friend class Journaled;

    void track(IJournaled* entry) { journal_.push_back(entry); }
    void checkpoint();
    void commit();
    void rollback();

    Chain& chain_;
    Address address_;
    std::vector<IJournaled*> journal_;
};

// Contract member whose value is restored when the enclosing transaction reverts
template <typename T>
class Journaled : public IJournaled {
public:
    explicit Journaled(Contract& owner, T initial = T{})
        : value_(std::move(initial)) {
        owner.track(this);
    }

    Journaled(const Journaled&) = delete;
    Journaled& operator=(const Journaled&) = delete;

    T& operator*() { return value_; }
    const T& operator*() const { return value_; }
    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }

    void checkpoint() override { saved_.push_back(value_); }

    void commit() override {
        if (!saved_.empty()) saved_.pop_back();
    }

    void rollback() override {
        if (saved_.empty()) return;
        value_ = std::move(saved_.back());
        saved_.pop_back();
    }

private:
    T value_;
    std::vector<T> saved_;
};

// =============================================================================
// Reentrancy Guard
// =============================================================================

class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& flag) : flag_(flag) {
        if (flag_) revert(errors::REENTRANCY);
        flag_ = true;
    }
    ~ReentrancyGuard() { flag_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& flag_;
};

// =============================================================================
// Call Frame
// =============================================================================

struct CallFrame {
    Address sender;
    Address self;
    U128 value;
};

// =============================================================================
// Chain - one simulated blockchain
// =============================================================================

class Chain {
public:
    explicit Chain(ChainId id, uint64_t timestamp = 1700000000);
    ~Chain();

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    ChainId id() const { return id_; }
    uint64_t timestamp() const { return timestamp_; }
    void warp(uint64_t timestamp) { timestamp_ = timestamp; }
    void skip(uint64_t seconds) { timestamp_ += seconds; }

    // =========================================================================
    // Contracts
    // =========================================================================

    template <typename T, typename... Args>
    T& deploy(Args&&... args);

    // nullptr when nothing of type T lives at `addr`
    template <typename T>
    T* contract_at(const Address& addr) const;

    // Reverts NotAContract when nothing of type T lives at `addr`
    template <typename T>
    T& require_contract(const Address& addr) const;

    bool is_contract(const Address& addr) const;

    // =========================================================================
    // Native Value
    // =========================================================================

    U128 balance_of(const Address& addr) const;

    // Genesis funding; bypasses transactions
    void set_balance(const Address& addr, U128 amount);

    // Moves value and notifies a receiving contract; reverts on shortfall or rejection
    void transfer_value(const Address& from, const Address& to, U128 amount);

    // Same as transfer_value but reports failure as false (low-level call semantics)
    bool try_transfer_value(const Address& from, const Address& to, U128 amount);

    // =========================================================================
    // Execution
    // =========================================================================

    // Top-level transaction: all contract state rolls back if fn throws
    template <typename F>
    auto transact(const Address& from, const Address& to, U128 value, F&& fn);

    template <typename F>
    auto transact(const Address& from, const Address& to, F&& fn) {
        return transact(from, to, 0, std::forward<F>(fn));
    }

    // Nested message call inside a running transaction
    template <typename F>
    auto call(const Address& from, const Address& to, U128 value, F&& fn);

    template <typename F>
    auto call(const Address& from, const Address& to, F&& fn) {
        return call(from, to, 0, std::forward<F>(fn));
    }

    bool in_transaction() const { return depth_ > 0; }

    // Throws std::logic_error outside of a call
    const CallFrame& frame() const;
    const Address& msg_sender() const { return frame().sender; }
    U128 msg_value() const { return frame().value; }

    // =========================================================================
    // Events
    // =========================================================================

    void emit(const Address& emitter, std::string name, nlohmann::json args);
    const std::vector<Event>& events() const { return events_; }
    std::vector<Event> events_named(std::string_view name) const;
    std::optional<Event> last_event(std::string_view name) const;
    void clear_events() { events_.clear(); }

private:
    friend class Contract;

    Address register_contract(Contract* contract);
    void unregister_contract(const Address& addr);
    void move_value(const Address& from, const Address& to, U128 amount);

    void begin();
    void commit();
    void rollback();

    struct Ledger {
        std::map<Address, U128> balances;
        size_t event_count;
    };

    struct DepthScope {
        int& depth;
        explicit DepthScope(int& d) : depth(d) { ++depth; }
        ~DepthScope() { --depth; }
    };

    struct FrameScope {
        std::vector<CallFrame>& frames;
        FrameScope(std::vector<CallFrame>& f, CallFrame frame) : frames(f) { frames.push_back(frame); }
        ~FrameScope() { frames.pop_back(); }
    };

    ChainId id_;
    uint64_t timestamp_;
    uint64_t next_contract_ = 1;

    std::map<Address, Contract*> contracts_;
    std::vector<std::unique_ptr<Contract>> owned_;
    std::map<Address, U128> balances_;
    std::vector<Event> events_;
    std::vector<CallFrame> frames_;

    std::optional<Ledger> saved_;
    int depth_ = 0;
    mutable std::recursive_mutex mutex_;
};

// =============================================================================
// Template Implementation
// =============================================================================

template <typename T, typename... Args>
T& Chain::deploy(Args&&... args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto contract = std::make_unique<T>(*this, std::forward<Args>(args)...);
    T& ref = *contract;
    owned_.push_back(std::move(contract));
    return ref;
}

template <typename T>
T* Chain::contract_at(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = contracts_.find(addr);
    if (it == contracts_.end()) return nullptr;
    return dynamic_cast<T*>(it->second);
}

template <typename T>
T& Chain::require_contract(const Address& addr) const {
    T* contract = contract_at<T>(addr);
    if (contract == nullptr) {
        revert(errors::NOT_A_CONTRACT, addresses::to_hex(addr));
    }
    return *contract;
}

template <typename F>
auto Chain::transact(const Address& from, const Address& to, U128 value, F&& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const bool outermost = depth_ == 0;
    if (outermost) begin();

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
            call(from, to, value, fn);
            if (outermost) commit();
        } else {
            auto result = call(from, to, value, fn);
            if (outermost) commit();
            return result;
        }
    } catch (...) {
        if (outermost) rollback();
        throw;
    }
}

template <typename F>
auto Chain::call(const Address& from, const Address& to, U128 value, F&& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    DepthScope depth(depth_);
    if (value > 0) move_value(from, to, value);
    FrameScope frame(frames_, CallFrame{from, to, value});
    return fn();
}

} // namespace xbridge

#endif // XBRIDGE_CHAIN_HPP
