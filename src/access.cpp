// =============================================================================
// access.cpp - Roles, Ownership and Pause Switch
// =============================================================================

#include "xbridge/access.hpp"
#include "xbridge/log.hpp"

namespace xbridge {

const char* role_name(Role role) {
    switch (role) {
        case Role::DefaultAdmin: return "DEFAULT_ADMIN_ROLE";
        case Role::Pauser: return "PAUSE_ROLE";
        case Role::Manager: return "MANAGER_ROLE";
    }
    return "UNKNOWN_ROLE";
}

// =============================================================================
// AccessControl
// =============================================================================

AccessControl::AccessControl(Contract& owner)
    : owner_(owner)
    , members_(owner) {}

bool AccessControl::has_role(Role role, const Address& account) const {
    auto it = members_->find(role);
    return it != members_->end() && it->second.count(account) > 0;
}

void AccessControl::only_role(Role role) const {
    const Address& sender = owner_.chain().msg_sender();
    if (!has_role(role, sender)) {
        revert(errors::MISSING_ROLE,
               addresses::to_hex(sender) + " lacks " + role_name(role));
    }
}

void AccessControl::setup_role(Role role, const Address& account) {
    if (!(*members_)[role].insert(account).second) return;
    owner_.chain().emit(owner_.address(), "RoleGranted", {
        {"role", role_name(role)},
        {"account", addresses::to_hex(account)},
    });
}

void AccessControl::grant_role(Role role, const Address& account) {
    only_role(Role::DefaultAdmin);
    setup_role(role, account);
    XB_INFO(role_name(role) << " granted to " << addresses::to_hex(account));
}

void AccessControl::revoke_role(Role role, const Address& account) {
    only_role(Role::DefaultAdmin);
    if ((*members_)[role].erase(account) == 0) return;
    owner_.chain().emit(owner_.address(), "RoleRevoked", {
        {"role", role_name(role)},
        {"account", addresses::to_hex(account)},
    });
    XB_INFO(role_name(role) << " revoked from " << addresses::to_hex(account));
}

void AccessControl::renounce_role(Role role, const Address& account) {
    if (owner_.chain().msg_sender() != account) {
        revert(errors::MISSING_ROLE, "can only renounce roles for self");
    }
    if ((*members_)[role].erase(account) == 0) return;
    owner_.chain().emit(owner_.address(), "RoleRevoked", {
        {"role", role_name(role)},
        {"account", addresses::to_hex(account)},
    });
}

// =============================================================================
// Ownable
// =============================================================================

Ownable::Ownable(Contract& owner, const Address& initial_owner)
    : contract_(owner)
    , owner_addr_(owner, initial_owner) {
    require(!addresses::is_zero(initial_owner), errors::OWNABLE_UNAUTHORIZED, "zero owner");
}

void Ownable::only_owner() const {
    const Address& sender = contract_.chain().msg_sender();
    if (sender != *owner_addr_) {
        revert(errors::OWNABLE_UNAUTHORIZED, addresses::to_hex(sender));
    }
}

void Ownable::transfer_ownership(const Address& new_owner) {
    only_owner();
    require(!addresses::is_zero(new_owner), errors::OWNABLE_UNAUTHORIZED, "zero owner");
    Address previous = *owner_addr_;
    *owner_addr_ = new_owner;
    contract_.chain().emit(contract_.address(), "OwnershipTransferred", {
        {"previousOwner", addresses::to_hex(previous)},
        {"newOwner", addresses::to_hex(new_owner)},
    });
}

// =============================================================================
// Pausable
// =============================================================================

Pausable::Pausable(Contract& owner)
    : owner_(owner)
    , paused_(owner, false) {}

void Pausable::require_not_paused() const {
    if (*paused_) revert(errors::PAUSED);
}

void Pausable::pause() {
    require_not_paused();
    *paused_ = true;
    owner_.chain().emit(owner_.address(), "Paused", {
        {"account", addresses::to_hex(owner_.chain().msg_sender())},
    });
    XB_INFO("paused " << addresses::to_hex(owner_.address()));
}

void Pausable::unpause() {
    if (!*paused_) revert(errors::NOT_PAUSED);
    *paused_ = false;
    owner_.chain().emit(owner_.address(), "Unpaused", {
        {"account", addresses::to_hex(owner_.chain().msg_sender())},
    });
    XB_INFO("unpaused " << addresses::to_hex(owner_.address()));
}

} // namespace xbridge
