#pragma once

#include "admit/quarantine_journal.hpp"
#include "admit/result.hpp"
#include "admit/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace admit {

// What the pipeline hands over when a verdict is quarantined.
struct HoldRequest {
    ContextTag context = ContextTag::Assignment;
    std::string filename;
    std::string uploader;
    std::string extension;
    std::string content_type;
    const ValidationVerdict* verdict = nullptr;
    std::chrono::seconds review_window{7 * 24 * 3600};
};

// Owns quarantined artifacts and their review state machine. Every state
// change is a compare-and-set on the record's current state; of two racing
// callers exactly one commits and the other gets ConcurrencyConflict.
class QuarantineCoordinator {
public:
    // Writes the held bytes of an approved record to durable storage.
    using ReleaseFn = std::function<Result(const QuarantineRecord& record,
                                           std::span<const std::uint8_t> bytes,
                                           std::optional<StoragePointer>& out)>;
    using ClockFn = std::function<TimePoint()>;

    static constexpr const char* kDeadlineActor = "system:deadline";

    QuarantineCoordinator(std::string root, ReleaseFn release, ClockFn clock = [] { return SystemClock::now(); });
    ~QuarantineCoordinator();

    QuarantineCoordinator(const QuarantineCoordinator&) = delete;
    QuarantineCoordinator& operator=(const QuarantineCoordinator&) = delete;

    // Creates <root>/holding and reloads the journal.
    Result Init();

    Result Hold(const HoldRequest& req, std::span<const std::uint8_t> bytes, std::string& out_id);

    // Commits decision iff the record is still in expected_state, then runs
    // the release (approve) or purge (reject) follow-up.
    Result Decide(const std::string& id, const std::string& actor, Decision decision, ReviewState expected_state);

    // Retries the follow-up of an approved or rejected record.
    Result Finalize(const std::string& id, const std::string& actor);

    Result ExtendDeadline(const std::string& id, const std::string& actor, ReviewState expected_state,
                          std::chrono::seconds by);

    // Fail-closed deadline rule: overdue pending/escalated records are
    // rejected and purged. Returns the number of records expired.
    size_t ExpireOverdue(TimePoint now);

    void StartDeadlineWatcher(std::chrono::milliseconds interval);
    void StopDeadlineWatcher();

    Result Get(const std::string& id, QuarantineRecord& out) const;
    std::vector<QuarantineRecord> ListPending(std::optional<ContextTag> context_filter) const;
    Result ReadHeld(const std::string& id, std::vector<std::uint8_t>& out) const;

    std::string HeldPath(const std::string& id) const;

private:
    Result CommitLocked(QuarantineRecord& rec, ReviewState to, const std::string& actor,
                        const std::string& action, std::string note);
    // claimed: the caller already put id into finalizing_ under mu_.
    Result Release(const std::string& id, const std::string& actor, bool claimed = false);
    Result Purge(const std::string& id, const std::string& actor, bool claimed = false);
    void WatchLoop(std::chrono::milliseconds interval);

    std::string root_;
    ReleaseFn release_;
    ClockFn clock_;
    QuarantineJournal journal_;

    mutable std::mutex mu_;
    std::map<std::string, QuarantineRecord> records_;
    std::set<std::string> finalizing_;

    std::mutex watch_mu_;
    std::condition_variable watch_cv_;
    std::thread watcher_;
    std::atomic<bool> stop_{false};
};

} // namespace admit
