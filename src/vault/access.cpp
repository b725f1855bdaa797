// RISKVAULT - Access Control
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/access.h"

namespace riskvault {
namespace vault {

bool AccessControl::IsAuthorizedUpdater(const Address& account) const {
    if (account.IsNull()) {
        return false;
    }
    if (IsOwner(account)) {
        return true;
    }
    auto it = states_.find(account);
    return it != states_.end() && it->second.authorized;
}

bool AccessControl::SetAuthorized(const Address& account, bool authorized) {
    UpdaterState& state = states_[account];
    if (state.authorized == authorized) {
        return false;
    }
    state.authorized = authorized;
    return true;
}

VaultError AccessControl::SetOwner(const Address& newOwner) {
    if (newOwner.IsNull()) {
        return VaultError::ZeroAddress;
    }
    owner_ = newOwner;
    return VaultError::None;
}

std::optional<UpdaterState> AccessControl::GetState(const Address& account) const {
    auto it = states_.find(account);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vault
} // namespace riskvault
