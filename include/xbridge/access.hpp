#ifndef XBRIDGE_ACCESS_HPP
#define XBRIDGE_ACCESS_HPP

#include <map>
#include <set>

#include "chain.hpp"

namespace xbridge {

// =============================================================================
// Roles
// =============================================================================

enum class Role : uint8_t {
    DefaultAdmin = 0,
    Pauser = 1,
    Manager = 2
};

const char* role_name(Role role);

// =============================================================================
// AccessControl - role membership; DefaultAdmin administers every role
// =============================================================================

class AccessControl {
public:
    explicit AccessControl(Contract& owner);

    bool has_role(Role role, const Address& account) const;

    // Caller must hold DefaultAdmin
    void grant_role(Role role, const Address& account);
    void revoke_role(Role role, const Address& account);

    // Caller must be `account`
    void renounce_role(Role role, const Address& account);

    // Reverts MissingRole unless msg.sender holds `role`
    void only_role(Role role) const;

    // Unchecked grant for constructors
    void setup_role(Role role, const Address& account);

private:
    Contract& owner_;
    Journaled<std::map<Role, std::set<Address>>> members_;
};

// =============================================================================
// Ownable
// =============================================================================

class Ownable {
public:
    Ownable(Contract& owner, const Address& initial_owner);

    const Address& owner() const { return *owner_addr_; }

    // Reverts OwnableUnauthorizedAccount unless msg.sender is the owner
    void only_owner() const;

    void transfer_ownership(const Address& new_owner);

private:
    Contract& contract_;
    Journaled<Address> owner_addr_;
};

// =============================================================================
// Pausable
// =============================================================================

class Pausable {
public:
    explicit Pausable(Contract& owner);

    bool paused() const { return *paused_; }

    void require_not_paused() const;

    // Authorization is the owning contract's job
    void pause();
    void unpause();

private:
    Contract& owner_;
    Journaled<bool> paused_;
};

} // namespace xbridge

#endif // XBRIDGE_ACCESS_HPP
