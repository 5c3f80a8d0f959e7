#pragma once

#include "admit/result.hpp"
#include "admit/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

enum class ReviewState {
    Pending,
    Approved,
    Rejected,
    Escalated,
    Released,
    Purged,
};

const char* ToString(ReviewState s);
std::optional<ReviewState> ParseReviewState(std::string_view s);

// pending -> {approved, rejected, escalated}; escalated -> {approved, rejected};
// approved -> released; rejected -> purged.
bool IsTransitionAllowed(ReviewState from, ReviewState to);
bool IsTerminal(ReviewState s);
bool AwaitsDecision(ReviewState s);

enum class Decision {
    Approve,
    Reject,
    Escalate,
};

const char* ToString(Decision d);
std::optional<Decision> ParseDecision(std::string_view s);
ReviewState TargetOf(Decision d);

struct AuditEntry {
    std::string actor;
    std::string action;   // "quarantine", "approve", "release", "extend", ...
    TimePoint timestamp{};
    ReviewState from = ReviewState::Pending;
    ReviewState to = ReviewState::Pending;
    std::string note;
};

struct QuarantineRecord {
    std::string id;
    ReviewState state = ReviewState::Pending;
    ContextTag context = ContextTag::Assignment;
    std::string filename;        // as declared; display only
    std::string uploader;
    std::string extension;       // classified extension, selects the release path
    std::string content_type;
    std::uint64_t size = 0;
    std::string sha256;          // of the held bytes
    std::string policy_version;
    double risk_score = 0.0;
    std::vector<ReasonCode> reasons;
    TimePoint created{};
    TimePoint deadline{};
    std::optional<std::string> pointer; // set once released
    std::vector<AuditEntry> audit;      // append-only
};

// JSON persistence of all records in one file, rewritten atomically.
class QuarantineJournal {
public:
    explicit QuarantineJournal(std::string path) : path_(std::move(path)) {}

    // A missing file loads as empty.
    Result Load(std::map<std::string, QuarantineRecord>& out) const;
    Result Save(const std::map<std::string, QuarantineRecord>& records) const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
};

} // namespace admit
