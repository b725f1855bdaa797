// RISKVAULT - Contract Events
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/events.h"
#include "riskvault/util/time.h"

#include <cstddef>
#include <sstream>

namespace riskvault {
namespace vault {

namespace {

struct NameVisitor {
    const char* operator()(const RiskAnalysisSubmitted&) const { return "RiskAnalysisSubmitted"; }
    const char* operator()(const DAOVerificationPerformed&) const { return "DAOVerificationPerformed"; }
    const char* operator()(const UpdaterAuthorized&) const { return "UpdaterAuthorized"; }
    const char* operator()(const Paused&) const { return "Paused"; }
    const char* operator()(const Unpaused&) const { return "Unpaused"; }
    const char* operator()(const PassportNFTUpdated&) const { return "PassportNFTUpdated"; }
    const char* operator()(const VerifierUpdated&) const { return "VerifierUpdated"; }
    const char* operator()(const MinUpdateIntervalUpdated&) const { return "MinUpdateIntervalUpdated"; }
    const char* operator()(const MaxDailyDecryptionsUpdated&) const { return "MaxDailyDecryptionsUpdated"; }
    const char* operator()(const CustomValidityPeriodSet&) const { return "CustomValidityPeriodSet"; }
    const char* operator()(const OwnershipTransferred&) const { return "OwnershipTransferred"; }
    const char* operator()(const PassportMinted&) const { return "PassportMinted"; }
    const char* operator()(const PassportRevoked&) const { return "PassportRevoked"; }
    const char* operator()(const ValidityPeriodUpdated&) const { return "ValidityPeriodUpdated"; }
    const char* operator()(const Transfer&) const { return "Transfer"; }
    const char* operator()(const Approval&) const { return "Approval"; }
    const char* operator()(const ApprovalForAll&) const { return "ApprovalForAll"; }
};

struct DescribeVisitor {
    std::ostringstream& os;
    
    void operator()(const RiskAnalysisSubmitted& e) const {
        os << "commitment=" << e.commitment.ToHex() << " band=" << RiskBandToString(e.band)
           << " analyzer=" << e.analyzer.ToString() << " tokenId=" << e.tokenId;
    }
    void operator()(const DAOVerificationPerformed& e) const {
        os << "commitment=" << e.commitment.ToHex() << " threshold=" << e.threshold
           << " result=" << (e.result ? "true" : "false")
           << " requester=" << e.requester.ToString();
    }
    void operator()(const UpdaterAuthorized& e) const {
        os << "updater=" << e.updater.ToString()
           << " authorized=" << (e.authorized ? "true" : "false");
    }
    void operator()(const Paused& e) const { os << "account=" << e.account.ToString(); }
    void operator()(const Unpaused& e) const { os << "account=" << e.account.ToString(); }
    void operator()(const PassportNFTUpdated& e) const { os << "registry=" << e.registry.ToString(); }
    void operator()(const VerifierUpdated& e) const { os << "verifier=" << e.verifier; }
    void operator()(const MinUpdateIntervalUpdated& e) const {
        os << "interval=" << util::FormatDuration(util::Seconds{e.interval});
    }
    void operator()(const MaxDailyDecryptionsUpdated& e) const { os << "limit=" << e.limit; }
    void operator()(const CustomValidityPeriodSet& e) const {
        os << "commitment=" << e.commitment.ToHex()
           << " period=" << util::FormatDuration(util::Seconds{e.period});
    }
    void operator()(const OwnershipTransferred& e) const {
        os << "from=" << e.previousOwner.ToString() << " to=" << e.newOwner.ToString();
    }
    void operator()(const PassportMinted& e) const {
        os << "tokenId=" << e.tokenId << " recipient=" << e.recipient.ToString()
           << " expiry=" << util::FormatISO8601(e.expiry);
    }
    void operator()(const PassportRevoked& e) const {
        os << "tokenId=" << e.tokenId << " owner=" << e.owner.ToString()
           << " reason=\"" << e.reason << "\"";
    }
    void operator()(const ValidityPeriodUpdated& e) const {
        os << "period=" << util::FormatDuration(util::Seconds{e.period});
    }
    void operator()(const Transfer& e) const {
        os << "from=" << e.from.ToString() << " to=" << e.to.ToString()
           << " tokenId=" << e.tokenId;
    }
    void operator()(const Approval& e) const {
        os << "owner=" << e.owner.ToString() << " approved=" << e.approved.ToString()
           << " tokenId=" << e.tokenId;
    }
    void operator()(const ApprovalForAll& e) const {
        os << "owner=" << e.owner.ToString() << " operator=" << e.operatorAddr.ToString()
           << " approved=" << (e.approved ? "true" : "false");
    }
};

} // anonymous namespace

const char* EventName(const EventData& data) {
    return std::visit(NameVisitor{}, data);
}

std::string DescribeEvent(const Event& event) {
    std::ostringstream oss;
    oss << EventName(event.data) << "(";
    std::visit(DescribeVisitor{oss}, event.data);
    oss << ")";
    return oss.str();
}

// ============================================================================
// EventLog
// ============================================================================

void EventLog::Emit(const Address& emitter, const CallContext& ctx, EventData data) {
    Event event;
    event.emitter = emitter;
    event.timestamp = ctx.timestamp;
    event.blockNumber = ctx.blockNumber;
    event.data = std::move(data);
    events_.push_back(std::move(event));
}

void EventLog::Rollback(size_t mark) {
    if (mark < events_.size()) {
        events_.resize(mark);
    }
}

std::vector<Event> EventLog::Commit(size_t mark) {
    std::vector<Event> committed;
    if (mark < events_.size()) {
        committed.assign(events_.begin() + static_cast<std::ptrdiff_t>(mark), events_.end());
    }
    if (events_.size() > retention_) {
        events_.erase(events_.begin(),
                      events_.begin() + static_cast<std::ptrdiff_t>(events_.size() - retention_));
    }
    return committed;
}

void EventLog::Publish(const std::vector<Event>& events) const {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            listener(event);
        }
    }
}

size_t EventLog::Subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    size_t id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return id;
}

void EventLog::Unsubscribe(size_t id) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(id);
}

} // namespace vault
} // namespace riskvault
