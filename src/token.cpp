// =============================================================================
// token.cpp - ERC20, BridgeToken and Lockbox
// =============================================================================

#include "xbridge/token.hpp"
#include "xbridge/abi.hpp"
#include "xbridge/hash.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

// =============================================================================
// ERC20
// =============================================================================

ERC20::ERC20(Chain& chain, std::string name, std::string symbol,
             const std::vector<Allocation>& initial_balances)
    : Contract(chain)
    , state_(*this)
    , name_(std::move(name))
    , symbol_(std::move(symbol)) {
    for (const auto& [holder, amount] : initial_balances) {
        mint_to(holder, amount);
    }
}

U128 ERC20::balance_of(const Address& account) const {
    auto it = state_->balances.find(account);
    return it == state_->balances.end() ? 0 : it->second;
}

U128 ERC20::allowance(const Address& owner, const Address& spender) const {
    auto it = state_->allowances.find({owner, spender});
    return it == state_->allowances.end() ? 0 : it->second;
}

uint64_t ERC20::nonces(const Address& owner) const {
    auto it = state_->nonces.find(owner);
    return it == state_->nonces.end() ? 0 : it->second;
}

bool ERC20::transfer(const Address& to, U128 amount) {
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "transfer to zero");
    update(msg_sender(), to, amount);
    return true;
}

bool ERC20::transfer_from(const Address& from, const Address& to, U128 amount) {
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "transfer to zero");
    spend_allowance(from, msg_sender(), amount);
    update(from, to, amount);
    return true;
}

bool ERC20::approve(const Address& spender, U128 amount) {
    require(!addresses::is_zero(spender), errors::ZERO_ADDRESS, "approve zero spender");
    set_allowance(msg_sender(), spender, amount);
    return true;
}

void ERC20::permit(const Address& owner, const Address& spender, U128 value, const Permit& permit) {
    if (block_timestamp() > permit.deadline) {
        revert(errors::PERMIT_EXPIRED, "deadline " + std::to_string(permit.deadline));
    }
    Permit expected = sign_permit(owner, spender, value, permit.deadline);
    if (expected.signature != permit.signature) {
        revert(errors::INVALID_SIGNATURE, "permit signer is not " + addresses::to_hex(owner));
    }
    state_->nonces[owner] += 1;
    set_allowance(owner, spender, value);
}

Bytes32 ERC20::permit_digest(const Address& owner, const Address& spender, U128 value,
                             uint64_t nonce, uint64_t deadline) const {
    Bytes encoded = abi::Encoder()
        .add_bytes32(hash::sha3_256(std::string_view("Permit")))
        .add_address(owner)
        .add_address(spender)
        .add_uint(value)
        .add_uint(nonce)
        .add_uint(deadline)
        .add_address(address())
        .add_uint(chain().id())
        .finish();
    return hash::sha3_256(encoded);
}

Permit ERC20::sign_permit(const Address& owner, const Address& spender, U128 value,
                          uint64_t deadline) const {
    Bytes32 digest = permit_digest(owner, spender, value, nonces(owner), deadline);
    Bytes preimage(digest.begin(), digest.end());
    preimage.insert(preimage.end(), owner.begin(), owner.end());
    return Permit{deadline, hash::sha3_256(preimage)};
}

void ERC20::update(const Address& from, const Address& to, U128 amount) {
    auto& s = *state_;
    if (addresses::is_zero(from)) {
        s.total_supply += amount;
    } else {
        U128 balance = balance_of(from);
        if (balance < amount) {
            revert(errors::INSUFFICIENT_BALANCE,
                   symbol_ + " balance " + u128_to_string(balance) + " < " + u128_to_string(amount));
        }
        s.balances[from] = balance - amount;
    }

    if (addresses::is_zero(to)) {
        s.total_supply -= amount;
    } else {
        s.balances[to] += amount;
    }

    emit("Transfer", {
        {"from", addresses::to_hex(from)},
        {"to", addresses::to_hex(to)},
        {"value", u128_to_string(amount)},
    });
}

void ERC20::mint_to(const Address& to, U128 amount) {
    require(!addresses::is_zero(to), errors::ZERO_ADDRESS, "mint to zero");
    update(ZERO_ADDRESS, to, amount);
}

void ERC20::burn_from(const Address& from, U128 amount) {
    require(!addresses::is_zero(from), errors::ZERO_ADDRESS, "burn from zero");
    update(from, ZERO_ADDRESS, amount);
}

void ERC20::spend_allowance(const Address& owner, const Address& spender, U128 amount) {
    U128 current = allowance(owner, spender);
    if (current == U128_MAX) return;
    if (current < amount) {
        revert(errors::INSUFFICIENT_ALLOWANCE,
               "allowance " + u128_to_string(current) + " < " + u128_to_string(amount));
    }
    state_->allowances[{owner, spender}] = current - amount;
}

void ERC20::set_allowance(const Address& owner, const Address& spender, U128 amount) {
    state_->allowances[{owner, spender}] = amount;
    emit("Approval", {
        {"owner", addresses::to_hex(owner)},
        {"spender", addresses::to_hex(spender)},
        {"value", u128_to_string(amount)},
    });
}

// =============================================================================
// BridgeToken
// =============================================================================

BridgeToken::BridgeToken(Chain& chain, std::string name, std::string symbol, const Address& owner,
                         const std::vector<Allocation>& initial_balances)
    : ERC20(chain, std::move(name), std::move(symbol), initial_balances)
    , ownable_(*this, owner)
    , bridges_(*this)
    , lockbox_(*this) {}

void BridgeToken::set_bridge(const Address& bridge, bool authorised) {
    ownable_.only_owner();
    (*bridges_)[bridge] = authorised;
    emit("BridgeSet", {
        {"bridge", addresses::to_hex(bridge)},
        {"authorised", authorised},
    });
}

void BridgeToken::set_lockbox(const Address& lockbox) {
    ownable_.only_owner();
    *lockbox_ = lockbox;
    emit("LockboxSet", {{"lockbox", addresses::to_hex(lockbox)}});
}

bool BridgeToken::is_bridge(const Address& account) const {
    auto it = bridges_->find(account);
    return it != bridges_->end() && it->second;
}

void BridgeToken::only_bridge() const {
    const Address& sender = msg_sender();
    if (!is_bridge(sender) && sender != *lockbox_) {
        revert(errors::NOT_BRIDGE, addresses::to_hex(sender));
    }
}

void BridgeToken::mint(const Address& to, U128 amount) {
    only_bridge();
    mint_to(to, amount);
}

void BridgeToken::burn(const Address& from, U128 amount) {
    only_bridge();
    if (msg_sender() != from) {
        spend_allowance(from, msg_sender(), amount);
    }
    burn_from(from, amount);
}

// =============================================================================
// Lockbox
// =============================================================================

Lockbox::Lockbox(Chain& chain, const Address& bridge_token, const Address& underlying)
    : Contract(chain)
    , bridge_token_(bridge_token)
    , underlying_(underlying) {
    require(!addresses::is_zero(bridge_token) && !addresses::is_zero(underlying),
            errors::ZERO_ADDRESS, "lockbox tokens");
}

void Lockbox::deposit(U128 amount) {
    const Address sender = msg_sender();
    auto& underlying = chain().require_contract<ERC20>(underlying_);
    auto& token = chain().require_contract<BridgeToken>(bridge_token_);

    chain().call(address(), underlying_, [&] {
        underlying.transfer_from(sender, address(), amount);
    });
    chain().call(address(), bridge_token_, [&] {
        token.mint(sender, amount);
    });
    emit("Deposit", {{"sender", addresses::to_hex(sender)}, {"amount", u128_to_string(amount)}});
}

void Lockbox::withdraw_to(const Address& to, U128 amount) {
    const Address sender = msg_sender();
    auto& underlying = chain().require_contract<ERC20>(underlying_);
    auto& token = chain().require_contract<BridgeToken>(bridge_token_);

    chain().call(address(), bridge_token_, [&] {
        token.burn(sender, amount);
    });
    chain().call(address(), underlying_, [&] {
        underlying.transfer(to, amount);
    });
    emit("Withdraw", {{"to", addresses::to_hex(to)}, {"amount", u128_to_string(amount)}});
}

} // namespace xbridge
