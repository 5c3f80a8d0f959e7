#include "admit/types.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <ctime>
#include <utility>

namespace admit {

namespace {

struct ReasonName {
    ReasonCode code;
    const char* name;
};

constexpr std::array<ReasonName, 24> kReasonNames = {{
    {ReasonCode::InvalidFilename, "invalid_filename"},
    {ReasonCode::BlockedExtension, "blocked_extension"},
    {ReasonCode::ExtensionNotAllowed, "extension_not_allowed"},
    {ReasonCode::FileTooLarge, "file_too_large"},
    {ReasonCode::EmptyFile, "empty_file"},
    {ReasonCode::ArchiveLimitsExceeded, "archive_limits_exceeded"},
    {ReasonCode::ArchivePathTraversal, "archive_path_traversal"},
    {ReasonCode::ArchiveNestingTooDeep, "archive_nesting_too_deep"},
    {ReasonCode::ArchiveMemberBlocked, "archive_member_blocked"},
    {ReasonCode::ArchiveUnsafeEntry, "archive_unsafe_entry"},
    {ReasonCode::ArchiveDuplicateEntry, "archive_duplicate_entry"},
    {ReasonCode::ArchiveCorrupt, "archive_corrupt"},
    {ReasonCode::ImageFormatUnsupported, "image_format_unsupported"},
    {ReasonCode::ImageMetadataUnparseable, "image_metadata_unparseable"},
    {ReasonCode::SignatureMismatch, "signature_mismatch"},
    {ReasonCode::DeclaredMimeMismatch, "declared_mime_mismatch"},
    {ReasonCode::DoubleExtension, "double_extension"},
    {ReasonCode::LongLine, "long_line"},
    {ReasonCode::DangerousPattern, "dangerous_pattern"},
    {ReasonCode::NonPrintableContent, "non_printable_content"},
    {ReasonCode::HighEntropyContent, "high_entropy_content"},
    {ReasonCode::ArchiveMemberUnlisted, "archive_member_unlisted"},
    {ReasonCode::ReviewDeadlineExpired, "review_deadline_expired"},
    {ReasonCode::InternalError, "internal_error"},
}};

bool IsHex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

} // namespace

const char* ToString(ContextTag tag) {
    switch (tag) {
        case ContextTag::Assignment:      return "assignment";
        case ContextTag::CourseMaterial:  return "course_material";
        case ContextTag::ForumAttachment: return "forum_attachment";
        case ContextTag::Avatar:          return "avatar";
    }
    return "assignment";
}

std::optional<ContextTag> ParseContextTag(std::string_view s) {
    if (s == "assignment") return ContextTag::Assignment;
    if (s == "course_material") return ContextTag::CourseMaterial;
    if (s == "forum_attachment") return ContextTag::ForumAttachment;
    if (s == "avatar") return ContextTag::Avatar;
    return std::nullopt;
}

const char* ToString(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::Accepted:    return "accepted";
        case VerdictKind::Rejected:    return "rejected";
        case VerdictKind::Quarantined: return "quarantined";
    }
    return "rejected";
}

const char* ToString(ReasonCode code) {
    for (const auto& r : kReasonNames) {
        if (r.code == code) return r.name;
    }
    return "internal_error";
}

std::optional<ReasonCode> ParseReasonCode(std::string_view s) {
    for (const auto& r : kReasonNames) {
        if (s == r.name) return r.code;
    }
    return std::nullopt;
}

bool ValidationVerdict::HasReason(ReasonCode code) const {
    return std::find(reasons_.begin(), reasons_.end(), code) != reasons_.end();
}

bool ValidationVerdict::SameOutcome(const ValidationVerdict& o) const {
    return kind_ == o.kind_ && reasons_ == o.reasons_ && messages_ == o.messages_ &&
           risk_score_ == o.risk_score_ && policy_version_ == o.policy_version_ &&
           error_ == o.error_;
}

void VerdictBuilder::Note(ReasonCode code, std::string message) {
    // A reason code is listed once even if several members raise it.
    if (std::find(reasons_.begin(), reasons_.end(), code) == reasons_.end()) {
        reasons_.push_back(code);
    }
    messages_.push_back(std::move(message));
}

VerdictBuilder& VerdictBuilder::Reject(ReasonCode code, ErrorKind kind, std::string message) {
    if (!rejected_) error_ = kind;
    rejected_ = true;
    Note(code, std::move(message));
    return *this;
}

VerdictBuilder& VerdictBuilder::Signal(ReasonCode code, double weight, std::string message) {
    score_ += weight;
    Note(code, std::move(message));
    return *this;
}

VerdictBuilder& VerdictBuilder::Flag(ReasonCode code, std::string message) {
    flagged_ = true;
    Note(code, std::move(message));
    return *this;
}

ValidationVerdict VerdictBuilder::Build(std::string policy_version, double quarantine_threshold, TimePoint now) const {
    ValidationVerdict v;
    v.reasons_ = reasons_;
    v.messages_ = messages_;
    v.risk_score_ = score_;
    v.policy_version_ = std::move(policy_version);
    v.timestamp_ = now;

    if (rejected_) {
        v.kind_ = VerdictKind::Rejected;
        v.error_ = error_;
    } else if (flagged_ || score_ >= quarantine_threshold) {
        v.kind_ = VerdictKind::Quarantined;
        v.error_ = ErrorKind::HeuristicFlag;
    } else {
        v.kind_ = VerdictKind::Accepted;
        v.error_ = ErrorKind::None;
    }
    return v;
}

ValidationVerdict VerdictBuilder::Restore(VerdictKind kind,
                                          std::vector<ReasonCode> reasons,
                                          std::vector<std::string> messages,
                                          double risk_score,
                                          std::string policy_version,
                                          ErrorKind error,
                                          TimePoint timestamp) {
    ValidationVerdict v;
    v.kind_ = kind;
    v.reasons_ = std::move(reasons);
    v.messages_ = std::move(messages);
    v.risk_score_ = risk_score;
    v.policy_version_ = std::move(policy_version);
    v.error_ = error;
    v.timestamp_ = timestamp;
    return v;
}

std::optional<StoragePointer> StoragePointer::Parse(std::string_view s) {
    if (s.size() != kHashHexLen + 1 + kNonceHexLen) return std::nullopt;
    if (s[kHashHexLen] != '.') return std::nullopt;
    if (!IsHex(s.substr(0, kHashHexLen)) || !IsHex(s.substr(kHashHexLen + 1))) return std::nullopt;
    return StoragePointer(std::string(s));
}

StoragePointer StoragePointer::FromParts(std::string_view hash_hex, std::string_view nonce_hex) {
    std::string v;
    v.reserve(hash_hex.size() + 1 + nonce_hex.size());
    v.append(hash_hex);
    v.push_back('.');
    v.append(nonce_hex);
    return StoragePointer(std::move(v));
}

std::string FormatTimestamp(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[40];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms % 1000));
    return buf;
}

std::optional<TimePoint> ParseTimestamp(std::string_view s) {
    std::tm tm{};
    int millis = 0;
    const std::string str(s);
    if (std::sscanf(str.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis) != 7) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    const std::time_t secs = ::timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return SystemClock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

} // namespace admit
