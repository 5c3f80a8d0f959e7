#pragma once

#include "admit/io.hpp"
#include "admit/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;

enum class ContextTag {
    Assignment,
    CourseMaterial,
    ForumAttachment,
    Avatar,
};

const char* ToString(ContextTag tag);
std::optional<ContextTag> ParseContextTag(std::string_view s);

enum class VerdictKind {
    Accepted,
    Rejected,
    Quarantined,
};

const char* ToString(VerdictKind kind);

// Machine-readable reason codes. The order of appearance in a verdict is the
// order in which the pipeline raised them.
enum class ReasonCode {
    InvalidFilename,
    BlockedExtension,
    ExtensionNotAllowed,
    FileTooLarge,
    EmptyFile,
    ArchiveLimitsExceeded,
    ArchivePathTraversal,
    ArchiveNestingTooDeep,
    ArchiveMemberBlocked,
    ArchiveUnsafeEntry,
    ArchiveDuplicateEntry,
    ArchiveCorrupt,
    ImageFormatUnsupported,
    ImageMetadataUnparseable,
    SignatureMismatch,
    DeclaredMimeMismatch,
    DoubleExtension,
    LongLine,
    DangerousPattern,
    NonPrintableContent,
    HighEntropyContent,
    ArchiveMemberUnlisted,
    ReviewDeadlineExpired,
    InternalError,
};

const char* ToString(ReasonCode code);
std::optional<ReasonCode> ParseReasonCode(std::string_view s);

// Produced exactly once per artifact; immutable afterwards. Built through
// VerdictBuilder.
class ValidationVerdict {
public:
    VerdictKind Kind() const { return kind_; }
    const std::vector<ReasonCode>& Reasons() const { return reasons_; }
    const std::vector<std::string>& Messages() const { return messages_; }
    double RiskScore() const { return risk_score_; }
    const std::string& PolicyVersion() const { return policy_version_; }
    ErrorKind Error() const { return error_; }
    TimePoint Timestamp() const { return timestamp_; }

    bool HasReason(ReasonCode code) const;

    // Equality over everything except the timestamp.
    bool SameOutcome(const ValidationVerdict& o) const;

private:
    friend class VerdictBuilder;
    ValidationVerdict() = default;

    VerdictKind kind_ = VerdictKind::Rejected;
    std::vector<ReasonCode> reasons_;
    std::vector<std::string> messages_;
    double risk_score_ = 0.0;
    std::string policy_version_;
    ErrorKind error_ = ErrorKind::None;
    TimePoint timestamp_{};
};

class VerdictBuilder {
public:
    // Terminal rejection. The first rejection's error kind wins.
    VerdictBuilder& Reject(ReasonCode code, ErrorKind kind, std::string message);

    // Non-terminal signal: adds weight to the score.
    VerdictBuilder& Signal(ReasonCode code, double weight, std::string message);

    // Forces the quarantine path regardless of score.
    VerdictBuilder& Flag(ReasonCode code, std::string message);

    bool Rejected() const { return rejected_; }
    bool Flagged() const { return flagged_; }
    double Score() const { return score_; }

    ValidationVerdict Build(std::string policy_version, double quarantine_threshold, TimePoint now) const;

    // Rebuild a verdict loaded from persistent state.
    static ValidationVerdict Restore(VerdictKind kind,
                                     std::vector<ReasonCode> reasons,
                                     std::vector<std::string> messages,
                                     double risk_score,
                                     std::string policy_version,
                                     ErrorKind error,
                                     TimePoint timestamp);

private:
    void Note(ReasonCode code, std::string message);

    std::vector<ReasonCode> reasons_;
    std::vector<std::string> messages_;
    double score_ = 0.0;
    bool rejected_ = false;
    bool flagged_ = false;
    ErrorKind error_ = ErrorKind::None;
};

// Opaque handle to a persisted object: "<sha256 hex>.<16 hex random>".
class StoragePointer {
public:
    static constexpr size_t kHashHexLen = 64;
    static constexpr size_t kNonceHexLen = 16;

    static std::optional<StoragePointer> Parse(std::string_view s);
    static StoragePointer FromParts(std::string_view hash_hex, std::string_view nonce_hex);

    const std::string& str() const { return value_; }
    std::string_view Hash() const { return std::string_view(value_).substr(0, kHashHexLen); }

    bool operator==(const StoragePointer& o) const { return value_ == o.value_; }

private:
    explicit StoragePointer(std::string v) : value_(std::move(v)) {}
    std::string value_;
};

// One user submission. Owns its byte source; consumed by the pipeline.
class UploadArtifact {
public:
    UploadArtifact(std::unique_ptr<IReader> source,
                   std::string declared_filename,
                   std::string declared_mime,
                   ContextTag context,
                   std::string uploader_id)
        : source_(std::move(source)),
          declared_filename_(std::move(declared_filename)),
          declared_mime_(std::move(declared_mime)),
          context_(context),
          uploader_id_(std::move(uploader_id)) {}

    IReader& Source() const { return *source_; }
    bool HasSource() const { return source_ != nullptr; }
    const std::string& DeclaredFilename() const { return declared_filename_; }
    const std::string& DeclaredMime() const { return declared_mime_; }
    ContextTag Context() const { return context_; }
    const std::string& UploaderId() const { return uploader_id_; }

private:
    std::unique_ptr<IReader> source_;
    std::string declared_filename_;
    std::string declared_mime_;
    ContextTag context_;
    std::string uploader_id_;
};

std::string FormatTimestamp(TimePoint tp);
std::optional<TimePoint> ParseTimestamp(std::string_view s);

} // namespace admit
