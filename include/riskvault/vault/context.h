// RISKVAULT - Call Context
// Copyright (c) 2024 RiskVault Developers
// MIT License

#ifndef RISKVAULT_VAULT_CONTEXT_H
#define RISKVAULT_VAULT_CONTEXT_H

#include "riskvault/core/types.h"

namespace riskvault {
namespace vault {

/**
 * Environment of one contract call.
 * 
 * sender is the immediate caller; origin is the account that signed the
 * transaction and is preserved across cross-contract calls.
 */
struct CallContext {
    Address sender;
    Address origin;
    Timestamp timestamp{0};
    BlockHeight blockNumber{0};
    
    /// Context for a call made by a contract on behalf of this one
    CallContext ForwardedBy(const Address& contract) const {
        CallContext ctx = *this;
        ctx.sender = contract;
        return ctx;
    }
    
    /// Transaction context where sender and origin coincide
    static CallContext Direct(const Address& account, Timestamp now, BlockHeight block) {
        CallContext ctx;
        ctx.sender = account;
        ctx.origin = account;
        ctx.timestamp = now;
        ctx.blockNumber = block;
        return ctx;
    }
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_CONTEXT_H
