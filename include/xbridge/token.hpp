#ifndef XBRIDGE_TOKEN_HPP
#define XBRIDGE_TOKEN_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "access.hpp"
#include "chain.hpp"

namespace xbridge {

// =============================================================================
// Permit (EIP-2612 shaped; signature scheme is opaque)
// =============================================================================

struct Permit {
    uint64_t deadline;
    Bytes32 signature;
};

using Allocation = std::pair<Address, U128>;

// =============================================================================
// ERC20
// =============================================================================

class ERC20 : public Contract {
public:
    ERC20(Chain& chain, std::string name, std::string symbol,
          const std::vector<Allocation>& initial_balances = {});

    const std::string& name() const { return name_; }
    const std::string& symbol() const { return symbol_; }
    uint8_t decimals() const { return 18; }

    U128 total_supply() const { return state_->total_supply; }
    U128 balance_of(const Address& account) const;
    U128 allowance(const Address& owner, const Address& spender) const;
    uint64_t nonces(const Address& owner) const;

    bool transfer(const Address& to, U128 amount);
    bool transfer_from(const Address& from, const Address& to, U128 amount);
    bool approve(const Address& spender, U128 amount);

    // Sets allowance from a signed approval; callable by anyone
    void permit(const Address& owner, const Address& spender, U128 value, const Permit& permit);

    Bytes32 permit_digest(const Address& owner, const Address& spender, U128 value,
                          uint64_t nonce, uint64_t deadline) const;

    // Stand-in for the owner's wallet producing the signature over the current nonce
    Permit sign_permit(const Address& owner, const Address& spender, U128 value,
                       uint64_t deadline) const;

protected:
    // Core balance move; zero `from` mints and zero `to` burns
    virtual void update(const Address& from, const Address& to, U128 amount);

    void mint_to(const Address& to, U128 amount);
    void burn_from(const Address& from, U128 amount);
    void spend_allowance(const Address& owner, const Address& spender, U128 amount);
    void set_allowance(const Address& owner, const Address& spender, U128 amount);

    struct State {
        std::map<Address, U128> balances;
        std::map<std::pair<Address, Address>, U128> allowances;
        std::map<Address, uint64_t> nonces;
        U128 total_supply = 0;
    };

    Journaled<State> state_;

private:
    std::string name_;
    std::string symbol_;
};

// =============================================================================
// BridgeToken - XERC20-style token minted and burned by authorised bridges
// =============================================================================

class BridgeToken : public ERC20 {
public:
    BridgeToken(Chain& chain, std::string name, std::string symbol, const Address& owner,
                const std::vector<Allocation>& initial_balances = {});

    // Owner only
    void set_bridge(const Address& bridge, bool authorised);
    void set_lockbox(const Address& lockbox);

    bool is_bridge(const Address& account) const;
    const Address& lockbox() const { return *lockbox_; }
    const Address& owner() const { return ownable_.owner(); }

    // Bridge (or lockbox) only
    void mint(const Address& to, U128 amount);

    // Bridge (or lockbox) only; spends allowance unless the caller is `from`
    void burn(const Address& from, U128 amount);

private:
    void only_bridge() const;

    Ownable ownable_;
    Journaled<std::map<Address, bool>> bridges_;
    Journaled<Address> lockbox_;
};

// =============================================================================
// Lockbox - 1:1 wrapper between an ERC20 and its BridgeToken
// =============================================================================

class Lockbox : public Contract {
public:
    Lockbox(Chain& chain, const Address& bridge_token, const Address& underlying);

    const Address& bridge_token() const { return bridge_token_; }
    const Address& underlying() const { return underlying_; }

    // Pulls `amount` of the underlying and mints the bridge token to the caller
    void deposit(U128 amount);

    // Burns the caller's bridge tokens and releases the underlying to `to`
    void withdraw_to(const Address& to, U128 amount);

private:
    Address bridge_token_;
    Address underlying_;
};

} // namespace xbridge

#endif // XBRIDGE_TOKEN_HPP
