#ifndef XBRIDGE_DEPOSIT_WRAPPER_HPP
#define XBRIDGE_DEPOSIT_WRAPPER_HPP

#include "access.hpp"
#include "bridges.hpp"
#include "chain.hpp"
#include "fee_math.hpp"

namespace xbridge {

// =============================================================================
// DepositWrapper - flat fee in front of a third-party deposit endpoint
// =============================================================================

class DepositWrapper : public Contract {
public:
    FeeQuote quote(U128 amount) const;

    // =========================================================================
    // Owner only
    // =========================================================================

    void set_treasury(const Address& treasury);
    void set_fee_rate(uint32_t fee_rate);
    void rescue_tokens(const Address& token, const Address& to, U128 amount);
    void rescue_eth(const Address& to, U128 amount);
    void pause();
    void unpause();

    const Address& owner() const { return ownable_.owner(); }
    const Address& treasury() const { return state_->treasury; }
    uint32_t fee_rate() const { return state_->fee_rate; }
    bool paused() const { return pausable_.paused(); }

protected:
    DepositWrapper(Chain& chain, const Address& owner, const Address& treasury, uint32_t fee_rate);

    // Pulls `amount` of `token` from the caller, pays the fee and approves net to `spender`
    U128 take_erc20(const Address& token, U128 amount, const Address& spender);

    // Pays the fee out of msg.value and returns the remainder
    U128 take_native();

    // TransferSent(sender, token, <ref_name>, net, data)
    void emit_sent(const Address& token, const char* ref_name, nlohmann::json ref, U128 net, const Bytes& data);

private:
    struct State {
        Address treasury{};
        uint32_t fee_rate = 0;
    };

    Ownable ownable_;
    Pausable pausable_;
    Journaled<State> state_;
};

// =============================================================================
// RelayWrapper
// =============================================================================

class RelayWrapper : public DepositWrapper {
public:
    RelayWrapper(Chain& chain, const Address& depository, const Address& owner, const Address& treasury,
                 uint32_t fee_rate);

    // Not payable
    void deposit_erc20(const Address& token, U128 amount, const Bytes32& id, const Bytes& data);

    // payable; msg.value is the gross amount
    void deposit_native(const Bytes32& id, const Bytes& data);

    const Address& depository() const { return depository_; }

private:
    Address depository_;
};

// =============================================================================
// AcrossV4Wrapper
// =============================================================================

class AcrossV4Wrapper : public DepositWrapper {
public:
    AcrossV4Wrapper(Chain& chain, const Address& spoke_pool, const Address& owner, const Address& treasury,
                    uint32_t fee_rate);

    // params.input_amount is the gross amount; the spoke pool sees the net
    void deposit_erc20(AcrossDeposit params, const Bytes& data);

    // payable; msg.value is the gross amount and params.input_amount is ignored
    void deposit_native(AcrossDeposit params, const Bytes& data);

    const Address& spoke_pool() const { return spoke_pool_; }

private:
    Address spoke_pool_;
};

} // namespace xbridge

#endif // XBRIDGE_DEPOSIT_WRAPPER_HPP
