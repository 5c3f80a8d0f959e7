#include "admit/quarantine_journal.hpp"
#include "admit/errors.hpp"
#include "admit/file_writer.hpp"
#include "admit/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <fstream>

using json = nlohmann::json;

namespace admit {

const char* ToString(ReviewState s) {
    switch (s) {
        case ReviewState::Pending:   return "pending";
        case ReviewState::Approved:  return "approved";
        case ReviewState::Rejected:  return "rejected";
        case ReviewState::Escalated: return "escalated";
        case ReviewState::Released:  return "released";
        case ReviewState::Purged:    return "purged";
    }
    return "unknown";
}

std::optional<ReviewState> ParseReviewState(std::string_view s) {
    if (s == "pending") return ReviewState::Pending;
    if (s == "approved") return ReviewState::Approved;
    if (s == "rejected") return ReviewState::Rejected;
    if (s == "escalated") return ReviewState::Escalated;
    if (s == "released") return ReviewState::Released;
    if (s == "purged") return ReviewState::Purged;
    return std::nullopt;
}

bool IsTransitionAllowed(ReviewState from, ReviewState to) {
    switch (from) {
        case ReviewState::Pending:
            return to == ReviewState::Approved || to == ReviewState::Rejected || to == ReviewState::Escalated;
        case ReviewState::Escalated:
            return to == ReviewState::Approved || to == ReviewState::Rejected;
        case ReviewState::Approved:
            return to == ReviewState::Released;
        case ReviewState::Rejected:
            return to == ReviewState::Purged;
        case ReviewState::Released:
        case ReviewState::Purged:
            return false;
    }
    return false;
}

bool IsTerminal(ReviewState s) {
    return s == ReviewState::Released || s == ReviewState::Purged;
}

bool AwaitsDecision(ReviewState s) {
    return s == ReviewState::Pending || s == ReviewState::Escalated;
}

const char* ToString(Decision d) {
    switch (d) {
        case Decision::Approve:  return "approve";
        case Decision::Reject:   return "reject";
        case Decision::Escalate: return "escalate";
    }
    return "unknown";
}

std::optional<Decision> ParseDecision(std::string_view s) {
    if (s == "approve") return Decision::Approve;
    if (s == "reject") return Decision::Reject;
    if (s == "escalate") return Decision::Escalate;
    return std::nullopt;
}

ReviewState TargetOf(Decision d) {
    switch (d) {
        case Decision::Approve:  return ReviewState::Approved;
        case Decision::Reject:   return ReviewState::Rejected;
        case Decision::Escalate: return ReviewState::Escalated;
    }
    return ReviewState::Rejected;
}

namespace {

ReviewState StateField(const json& j, const char* key) {
    auto s = ParseReviewState(j.at(key).get<std::string>());
    if (!s) throw JournalError(std::string("bad state in field '") + key + "'");
    return *s;
}

TimePoint TimeField(const json& j, const char* key) {
    auto t = ParseTimestamp(j.at(key).get<std::string>());
    if (!t) throw JournalError(std::string("bad timestamp in field '") + key + "'");
    return *t;
}

json ToJson(const AuditEntry& a) {
    return json{
        {"actor", a.actor},
        {"action", a.action},
        {"timestamp", FormatTimestamp(a.timestamp)},
        {"from", ToString(a.from)},
        {"to", ToString(a.to)},
        {"note", a.note},
    };
}

json ToJson(const QuarantineRecord& r) {
    json reasons = json::array();
    for (ReasonCode c : r.reasons) reasons.push_back(ToString(c));
    json audit = json::array();
    for (const auto& a : r.audit) audit.push_back(ToJson(a));

    json j = {
        {"id", r.id},
        {"state", ToString(r.state)},
        {"context", ToString(r.context)},
        {"filename", r.filename},
        {"uploader", r.uploader},
        {"extension", r.extension},
        {"content_type", r.content_type},
        {"size", r.size},
        {"sha256", r.sha256},
        {"policy_version", r.policy_version},
        {"risk_score", r.risk_score},
        {"reasons", std::move(reasons)},
        {"created", FormatTimestamp(r.created)},
        {"deadline", FormatTimestamp(r.deadline)},
        {"audit", std::move(audit)},
    };
    j["pointer"] = r.pointer ? json(*r.pointer) : json(nullptr);
    return j;
}

QuarantineRecord RecordFromJson(const json& j) {
    QuarantineRecord r;
    r.id = j.at("id").get<std::string>();
    r.state = StateField(j, "state");
    auto ctx = ParseContextTag(j.at("context").get<std::string>());
    if (!ctx) throw JournalError("bad context for record " + r.id);
    r.context = *ctx;
    r.filename = j.value("filename", std::string());
    r.uploader = j.value("uploader", std::string());
    r.extension = j.value("extension", std::string());
    r.content_type = j.value("content_type", std::string());
    r.size = j.value("size", std::uint64_t{0});
    r.sha256 = j.value("sha256", std::string());
    r.policy_version = j.value("policy_version", std::string());
    r.risk_score = j.value("risk_score", 0.0);
    for (const auto& c : j.value("reasons", json::array())) {
        auto code = ParseReasonCode(c.get<std::string>());
        if (!code) throw JournalError("unknown reason code in record " + r.id);
        r.reasons.push_back(*code);
    }
    r.created = TimeField(j, "created");
    r.deadline = TimeField(j, "deadline");
    if (j.contains("pointer") && !j["pointer"].is_null()) r.pointer = j["pointer"].get<std::string>();

    for (const auto& a : j.value("audit", json::array())) {
        AuditEntry e;
        e.actor = a.at("actor").get<std::string>();
        e.action = a.at("action").get<std::string>();
        e.timestamp = TimeField(a, "timestamp");
        e.from = StateField(a, "from");
        e.to = StateField(a, "to");
        e.note = a.value("note", std::string());
        r.audit.push_back(std::move(e));
    }
    return r;
}

} // namespace

Result QuarantineJournal::Load(std::map<std::string, QuarantineRecord>& out) const {
    out.clear();
    std::ifstream f(path_);
    if (!f) return Result::Ok();

    try {
        json j = json::parse(f);
        if (j.value("format", 0) != 1) throw JournalError("unsupported journal format");
        for (const auto& rec : j.at("records")) {
            QuarantineRecord r = RecordFromJson(rec);
            std::string id = r.id;
            out.emplace(std::move(id), std::move(r));
        }
    } catch (const JournalError& e) {
        out.clear();
        return Result::Fail(EINVAL, "journal " + path_ + ": " + e.what(), ErrorKind::StorageFailure);
    } catch (const json::exception& e) {
        out.clear();
        return Result::Fail(EINVAL, "journal " + path_ + ": " + e.what(), ErrorKind::StorageFailure);
    }

    LogDebug("[quarantine] loaded %zu record(s) from %s", out.size(), path_.c_str());
    return Result::Ok();
}

Result QuarantineJournal::Save(const std::map<std::string, QuarantineRecord>& records) const {
    // Uploader ids and filenames are untrusted; invalid UTF-8 is written as U+FFFD.
    std::string text;
    try {
        json arr = json::array();
        for (const auto& [id, r] : records) arr.push_back(ToJson(r));
        const json doc = {{"format", 1}, {"records", std::move(arr)}};
        text = doc.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        return Result::Fail(EIO, "journal " + path_ + ": " + e.what(), ErrorKind::StorageFailure);
    }
    return WriteFileAtomic(path_, std::span<const std::uint8_t>(
                                      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

} // namespace admit
