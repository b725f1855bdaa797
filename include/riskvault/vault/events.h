// RISKVAULT - Contract Events
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Events emitted by the vault and the passport registry. The log is
// append-only within a transaction; the ledger discards the events of a
// rejected transaction and publishes those of an accepted one.

#ifndef RISKVAULT_VAULT_EVENTS_H
#define RISKVAULT_VAULT_EVENTS_H

#include "riskvault/core/types.h"
#include "riskvault/vault/context.h"
#include "riskvault/vault/riskband.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace riskvault {
namespace vault {

// ============================================================================
// Vault Events
// ============================================================================

struct RiskAnalysisSubmitted {
    CommitmentHash commitment;
    RiskBand band{RiskBand::Unknown};
    Address analyzer;
    Timestamp timestamp{0};
    TokenId tokenId{0};
    NullifierHash nullifier;
};

struct DAOVerificationPerformed {
    CommitmentHash commitment;
    uint32_t threshold{0};
    bool result{false};
    Address requester;
};

struct UpdaterAuthorized {
    Address updater;
    bool authorized{false};
    Timestamp timestamp{0};
};

struct Paused {
    Address account;
};

struct Unpaused {
    Address account;
};

struct PassportNFTUpdated {
    Address registry;
};

struct VerifierUpdated {
    std::string verifier;
};

struct MinUpdateIntervalUpdated {
    Duration interval{0};
};

struct MaxDailyDecryptionsUpdated {
    uint32_t limit{0};
};

struct CustomValidityPeriodSet {
    CommitmentHash commitment;
    Duration period{0};
};

struct OwnershipTransferred {
    Address previousOwner;
    Address newOwner;
};

// ============================================================================
// Passport Events
// ============================================================================

struct PassportMinted {
    TokenId tokenId{0};
    Address recipient;
    CommitmentHash commitment;
    Timestamp expiry{0};
};

struct PassportRevoked {
    TokenId tokenId{0};
    Address owner;
    std::string reason;
};

struct ValidityPeriodUpdated {
    Duration period{0};
};

struct Transfer {
    Address from;
    Address to;
    TokenId tokenId{0};
};

struct Approval {
    Address owner;
    Address approved;
    TokenId tokenId{0};
};

struct ApprovalForAll {
    Address owner;
    Address operatorAddr;
    bool approved{false};
};

using EventData = std::variant<
    RiskAnalysisSubmitted,
    DAOVerificationPerformed,
    UpdaterAuthorized,
    Paused,
    Unpaused,
    PassportNFTUpdated,
    VerifierUpdated,
    MinUpdateIntervalUpdated,
    MaxDailyDecryptionsUpdated,
    CustomValidityPeriodSet,
    OwnershipTransferred,
    PassportMinted,
    PassportRevoked,
    ValidityPeriodUpdated,
    Transfer,
    Approval,
    ApprovalForAll>;

/// Recorded event with its origin
struct Event {
    Address emitter;
    Timestamp timestamp{0};
    BlockHeight blockNumber{0};
    EventData data;
};

/// Event name, e.g. "PassportMinted"
const char* EventName(const EventData& data);

/// One-line rendering for logs and the command-line tool
std::string DescribeEvent(const Event& event);

// ============================================================================
// Event Log
// ============================================================================

class EventLog {
public:
    using Listener = std::function<void(const Event&)>;
    
    /// Committed events kept for queries once published
    static constexpr size_t DEFAULT_RETENTION = 4096;
    
    EventLog() = default;
    
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;
    
    void Emit(const Address& emitter, const CallContext& ctx, EventData data);
    
    /// Position to later Commit or Rollback to
    size_t Mark() const { return events_.size(); }
    
    /// Drop every event recorded after mark
    void Rollback(size_t mark);
    
    /**
     * Accept every event recorded after mark and return them for Publish.
     * Older events beyond the retention limit are discarded.
     */
    std::vector<Event> Commit(size_t mark);
    
    /// Deliver events to the listeners registered at the time of the call
    void Publish(const std::vector<Event>& events) const;
    
    /// Register a listener for committed events
    size_t Subscribe(Listener listener);
    void Unsubscribe(size_t id);
    
    void SetRetention(size_t retention) { retention_ = retention; }
    size_t GetRetention() const { return retention_; }
    
    const std::vector<Event>& GetEvents() const { return events_; }
    size_t Size() const { return events_.size(); }
    void Clear() { events_.clear(); }
    
    /// All payloads of type T in emission order
    template<typename T>
    std::vector<T> Collect() const {
        std::vector<T> out;
        for (const auto& event : events_) {
            if (const T* p = std::get_if<T>(&event.data)) {
                out.push_back(*p);
            }
        }
        return out;
    }
    
    /// Most recent payload of type T, or nullptr
    template<typename T>
    const T* Last() const {
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (const T* p = std::get_if<T>(&it->data)) {
                return p;
            }
        }
        return nullptr;
    }

private:
    std::vector<Event> events_;
    size_t retention_{DEFAULT_RETENTION};
    
    std::map<size_t, Listener> listeners_;
    size_t nextListenerId_{1};
    mutable std::mutex listenerMutex_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_EVENTS_H
