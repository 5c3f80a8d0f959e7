#include "admit/quarantine_coordinator.hpp"
#include "admit/digest.hpp"
#include "admit/file_reader.hpp"
#include "admit/file_writer.hpp"
#include "admit/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace admit {

namespace {

constexpr size_t kRecordIdBytes = 16;

bool IsRecordId(const std::string& id) {
    if (id.size() != kRecordIdBytes * 2) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

Result Conflict(const std::string& id, ReviewState actual, ReviewState expected) {
    return Result::Fail(EAGAIN,
                        "record " + id + " is " + ToString(actual) + ", expected " + ToString(expected),
                        ErrorKind::ConcurrencyConflict);
}

Result NoRecord(const std::string& id) {
    return Result::Fail(ENOENT, "no quarantine record " + id, ErrorKind::NotFound);
}

} // namespace

QuarantineCoordinator::QuarantineCoordinator(std::string root, ReleaseFn release, ClockFn clock)
    : root_(std::move(root)),
      release_(std::move(release)),
      clock_(std::move(clock)),
      journal_(root_ + "/quarantine.json") {}

QuarantineCoordinator::~QuarantineCoordinator() {
    StopDeadlineWatcher();
}

std::string QuarantineCoordinator::HeldPath(const std::string& id) const {
    return root_ + "/holding/" + id + ".bin";
}

Result QuarantineCoordinator::Init() {
    std::error_code ec;
    fs::create_directories(root_ + "/holding", ec);
    if (ec) return Result::Fail(ec.value(), "create_directories " + root_ + "/holding: " + ec.message());

    std::lock_guard<std::mutex> lk(mu_);
    auto r = journal_.Load(records_);
    if (!r.is_ok()) return r;
    LogInfo("[quarantine] %zu record(s) in %s", records_.size(), root_.c_str());
    return Result::Ok();
}

Result QuarantineCoordinator::CommitLocked(QuarantineRecord& rec, ReviewState to, const std::string& actor,
                                           const std::string& action, std::string note) {
    if (!IsTransitionAllowed(rec.state, to)) {
        return Result::Fail(EINVAL,
                            std::string("transition ") + ToString(rec.state) + " -> " + ToString(to) + " not allowed",
                            ErrorKind::InvalidArgument);
    }

    const ReviewState from = rec.state;
    rec.state = to;
    rec.audit.push_back(AuditEntry{actor, action, clock_(), from, to, std::move(note)});

    auto r = journal_.Save(records_);
    if (!r.is_ok()) {
        rec.audit.pop_back();
        rec.state = from;
        LogError("[quarantine] %s: journal write failed, %s -> %s not committed: %s",
                 rec.id.c_str(), ToString(from), ToString(to), r.msg.c_str());
        return r;
    }
    LogInfo("[quarantine] %s: %s -> %s by %s", rec.id.c_str(), ToString(from), ToString(to), actor.c_str());
    return Result::Ok();
}

Result QuarantineCoordinator::Hold(const HoldRequest& req, std::span<const std::uint8_t> bytes, std::string& out_id) {
    if (!req.verdict) return Result::Fail(EINVAL, "hold without verdict", ErrorKind::InvalidArgument);

    std::string id;
    auto r = RandomHex(kRecordIdBytes, id);
    if (!r.is_ok()) return r;

    QuarantineRecord rec;
    rec.id = id;
    rec.state = ReviewState::Pending;
    rec.context = req.context;
    rec.filename = req.filename;
    rec.uploader = req.uploader;
    rec.extension = req.extension;
    rec.content_type = req.content_type;
    rec.size = bytes.size();
    rec.policy_version = req.verdict->PolicyVersion();
    rec.risk_score = req.verdict->RiskScore();
    rec.reasons = req.verdict->Reasons();
    rec.created = clock_();
    rec.deadline = rec.created + req.review_window;
    rec.audit.push_back(AuditEntry{"system:pipeline", "quarantine", rec.created, ReviewState::Pending,
                                   ReviewState::Pending, "risk score " + std::to_string(rec.risk_score)});

    r = Sha256::Of(bytes, rec.sha256);
    if (!r.is_ok()) return r;

    const std::string held = HeldPath(id);
    r = WriteFileAtomic(held, bytes);
    if (!r.is_ok()) return r;

    {
        std::lock_guard<std::mutex> lk(mu_);
        records_.emplace(id, rec);
        r = journal_.Save(records_);
        if (!r.is_ok()) records_.erase(id);
    }
    if (!r.is_ok()) {
        ::unlink(held.c_str());
        return r;
    }

    LogInfo("[quarantine] %s: holding %s from %s (%zu bytes, deadline %s)", id.c_str(), rec.filename.c_str(),
            rec.uploader.c_str(), bytes.size(), FormatTimestamp(rec.deadline).c_str());
    out_id = std::move(id);
    return Result::Ok();
}

Result QuarantineCoordinator::Decide(const std::string& id, const std::string& actor, Decision decision,
                                     ReviewState expected_state) {
    bool expired = false;
    ReviewState target = TargetOf(decision);
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return NoRecord(id);
        QuarantineRecord& rec = it->second;

        if (rec.state != expected_state) return Conflict(id, rec.state, expected_state);

        if (AwaitsDecision(rec.state) && clock_() >= rec.deadline) {
            auto r = CommitLocked(rec, ReviewState::Rejected, kDeadlineActor, "expire", "review deadline passed");
            if (!r.is_ok()) return r;
            expired = true;
        } else {
            auto r = CommitLocked(rec, target, actor, ToString(decision), std::string());
            if (!r.is_ok()) return r;
        }
        // Claim the follow-up before the lock drops so a concurrent sweep
        // cannot start it as well.
        finalizing_.insert(id);
    }

    if (expired) {
        auto pr = Purge(id, kDeadlineActor, true);
        if (!pr.is_ok()) LogError("[quarantine] %s: purge after expiry failed: %s", id.c_str(), pr.msg.c_str());
        return Result::Fail(EAGAIN, "record " + id + " passed its review deadline and was rejected",
                            ErrorKind::ConcurrencyConflict);
    }

    if (target == ReviewState::Approved) return Release(id, actor, true);
    if (target == ReviewState::Rejected) return Purge(id, actor, true);

    std::lock_guard<std::mutex> lk(mu_);
    finalizing_.erase(id);
    return Result::Ok();
}

Result QuarantineCoordinator::Finalize(const std::string& id, const std::string& actor) {
    ReviewState state;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return NoRecord(id);
        state = it->second.state;
    }
    switch (state) {
        case ReviewState::Approved: return Release(id, actor);
        case ReviewState::Rejected: return Purge(id, actor);
        case ReviewState::Released:
        case ReviewState::Purged:
            return Result::Ok();
        default:
            return Result::Fail(EINVAL, "record " + id + " awaits a decision", ErrorKind::InvalidArgument);
    }
}

Result QuarantineCoordinator::Release(const std::string& id, const std::string& actor, bool claimed) {
    QuarantineRecord snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return NoRecord(id);
        if (!claimed) {
            if (it->second.state == ReviewState::Released) return Result::Ok();
            if (it->second.state != ReviewState::Approved) return Conflict(id, it->second.state, ReviewState::Approved);
            if (!finalizing_.insert(id).second) {
                return Result::Fail(EAGAIN, "release of " + id + " already running", ErrorKind::ConcurrencyConflict);
            }
        }
        snapshot = it->second;
    }

    std::vector<std::uint8_t> bytes;
    std::optional<StoragePointer> ptr;
    auto r = ReadHeld(id, bytes);
    if (r.is_ok()) {
        std::string digest;
        r = Sha256::Of(bytes, digest);
        if (r.is_ok() && digest != snapshot.sha256) {
            r = Result::Fail(EIO, "held bytes of " + id + " do not match their digest");
        }
    }
    if (r.is_ok()) {
        try {
            r = release_(snapshot, bytes, ptr);
        } catch (const std::exception& e) {
            r = Result::Fail(EIO, std::string("release of ") + id + ": " + e.what(), ErrorKind::StorageFailure);
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        finalizing_.erase(id);
        if (!r.is_ok()) {
            LogError("[quarantine] %s: release failed, record stays approved: %s", id.c_str(), r.msg.c_str());
            return r;
        }
        QuarantineRecord& rec = records_.at(id);
        rec.pointer = ptr->str();
        r = CommitLocked(rec, ReviewState::Released, actor, "release", ptr->str());
        if (!r.is_ok()) {
            rec.pointer.reset();
            return r;
        }
    }

    const std::string held = HeldPath(id);
    if (::unlink(held.c_str()) != 0 && errno != ENOENT) {
        LogWarn("[quarantine] %s: could not drop held bytes: %s", id.c_str(), std::strerror(errno));
    }
    return Result::Ok();
}

Result QuarantineCoordinator::Purge(const std::string& id, const std::string& actor, bool claimed) {
    if (!claimed) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return NoRecord(id);
        if (it->second.state == ReviewState::Purged) return Result::Ok();
        if (it->second.state != ReviewState::Rejected) return Conflict(id, it->second.state, ReviewState::Rejected);
        if (!finalizing_.insert(id).second) {
            return Result::Fail(EAGAIN, "purge of " + id + " already running", ErrorKind::ConcurrencyConflict);
        }
    }

    Result r = Result::Ok();
    const std::string held = HeldPath(id);
    if (::unlink(held.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        r = Result::Fail(err, "unlink " + held + ": " + std::strerror(err));
    }

    std::lock_guard<std::mutex> lk(mu_);
    finalizing_.erase(id);
    if (!r.is_ok()) {
        LogError("[quarantine] %s: purge failed, record stays rejected: %s", id.c_str(), r.msg.c_str());
        return r;
    }
    return CommitLocked(records_.at(id), ReviewState::Purged, actor, "purge", std::string());
}

Result QuarantineCoordinator::ExtendDeadline(const std::string& id, const std::string& actor,
                                             ReviewState expected_state, std::chrono::seconds by) {
    if (by.count() <= 0) return Result::Fail(EINVAL, "extension must be positive", ErrorKind::InvalidArgument);

    bool expired = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = records_.find(id);
        if (it == records_.end()) return NoRecord(id);
        QuarantineRecord& rec = it->second;

        if (rec.state != expected_state) return Conflict(id, rec.state, expected_state);
        if (!AwaitsDecision(rec.state)) {
            return Result::Fail(EINVAL, "record " + id + " no longer awaits a decision", ErrorKind::InvalidArgument);
        }

        const TimePoint now = clock_();
        if (now >= rec.deadline) {
            auto r = CommitLocked(rec, ReviewState::Rejected, kDeadlineActor, "expire", "review deadline passed");
            if (!r.is_ok()) return r;
            finalizing_.insert(id);
            expired = true;
        } else {
            const TimePoint old_deadline = rec.deadline;
            rec.deadline += by;
            rec.audit.push_back(AuditEntry{actor, "extend", now, rec.state, rec.state,
                                           "deadline " + FormatTimestamp(rec.deadline)});
            auto r = journal_.Save(records_);
            if (!r.is_ok()) {
                rec.audit.pop_back();
                rec.deadline = old_deadline;
                return r;
            }
            LogInfo("[quarantine] %s: deadline extended to %s by %s", id.c_str(),
                    FormatTimestamp(rec.deadline).c_str(), actor.c_str());
        }
    }

    if (expired) {
        auto pr = Purge(id, kDeadlineActor, true);
        if (!pr.is_ok()) LogError("[quarantine] %s: purge after expiry failed: %s", id.c_str(), pr.msg.c_str());
        return Result::Fail(EAGAIN, "record " + id + " passed its review deadline and was rejected",
                            ErrorKind::ConcurrencyConflict);
    }
    return Result::Ok();
}

size_t QuarantineCoordinator::ExpireOverdue(TimePoint now) {
    std::vector<std::string> expired;
    std::vector<std::string> unfinished;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, rec] : records_) {
            if (AwaitsDecision(rec.state) && now >= rec.deadline) {
                auto r = CommitLocked(rec, ReviewState::Rejected, kDeadlineActor, "expire", "review deadline passed");
                if (r.is_ok()) {
                    finalizing_.insert(id);
                    expired.push_back(id);
                }
            } else if ((rec.state == ReviewState::Approved || rec.state == ReviewState::Rejected) &&
                       !finalizing_.count(id)) {
                unfinished.push_back(id);
            }
        }
    }

    for (const auto& id : expired) {
        auto r = Purge(id, kDeadlineActor, true);
        if (!r.is_ok()) LogError("[quarantine] %s: purge after expiry failed: %s", id.c_str(), r.msg.c_str());
    }
    for (const auto& id : unfinished) {
        auto r = Finalize(id, kDeadlineActor);
        if (!r.is_ok()) LogWarn("[quarantine] %s: follow-up retry failed: %s", id.c_str(), r.msg.c_str());
    }
    if (!expired.empty()) LogWarn("[quarantine] %zu record(s) expired unreviewed", expired.size());
    return expired.size();
}

void QuarantineCoordinator::StartDeadlineWatcher(std::chrono::milliseconds interval) {
    if (watcher_.joinable()) return;
    stop_ = false;
    watcher_ = std::thread(&QuarantineCoordinator::WatchLoop, this, interval);
}

void QuarantineCoordinator::StopDeadlineWatcher() {
    {
        std::lock_guard<std::mutex> lk(watch_mu_);
        stop_ = true;
    }
    watch_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
}

void QuarantineCoordinator::WatchLoop(std::chrono::milliseconds interval) {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(watch_mu_);
            if (watch_cv_.wait_for(lk, interval, [this] { return stop_.load(); })) break;
        }
        ExpireOverdue(clock_());
    }
}

Result QuarantineCoordinator::Get(const std::string& id, QuarantineRecord& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) return NoRecord(id);
    out = it->second;
    return Result::Ok();
}

std::vector<QuarantineRecord> QuarantineCoordinator::ListPending(std::optional<ContextTag> context_filter) const {
    std::vector<QuarantineRecord> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, rec] : records_) {
            if (!AwaitsDecision(rec.state)) continue;
            if (context_filter && rec.context != *context_filter) continue;
            out.push_back(rec);
        }
    }
    std::sort(out.begin(), out.end(), [](const QuarantineRecord& a, const QuarantineRecord& b) {
        if (a.created != b.created) return a.created < b.created;
        return a.id < b.id;
    });
    return out;
}

Result QuarantineCoordinator::ReadHeld(const std::string& id, std::vector<std::uint8_t>& out) const {
    if (!IsRecordId(id)) return NoRecord(id);
    FileOrStdinReader reader;
    auto r = FileOrStdinReader::Open(HeldPath(id), reader);
    if (!r.is_ok()) return r;
    return ReadAllBounded(reader, reader.TotalSize().value_or(0), out);
}

} // namespace admit
