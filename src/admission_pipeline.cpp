#include "admit/admission_pipeline.hpp"

#include "admit/budget_reader.hpp"
#include "admit/content_scanner.hpp"
#include "admit/file_reader.hpp"
#include "admit/logger.hpp"
#include "admit/name_policy.hpp"

#include <algorithm>
#include <cerrno>
#include <exception>

namespace admit {

namespace {

constexpr size_t kMaxTagBytes = 96;
constexpr const char* kFallbackContentType = "application/octet-stream";

// Log tag for one artifact. Client strings are untrusted, so anything that
// could forge a log line is replaced.
std::string ArtifactTag(const UploadArtifact& a) {
    std::string tag = a.UploaderId() + ":" + a.DeclaredFilename();
    if (tag.size() > kMaxTagBytes) tag.resize(kMaxTagBytes);
    for (char& ch : tag) {
        const auto u = static_cast<unsigned char>(ch);
        if (u < 0x20 || u >= 0x7f) ch = '?';
    }
    return tag;
}

std::string ContentTypeOf(const Classification& c) {
    if (c.rule && !c.rule->content_type.empty()) return c.rule->content_type;
    return kFallbackContentType;
}

std::string ReasonList(const ValidationVerdict& v) {
    std::string out;
    for (ReasonCode code : v.Reasons()) {
        if (!out.empty()) out += ",";
        out += ToString(code);
    }
    return out.empty() ? "-" : out;
}

void LogVerdict(const std::string& tag, const ValidationVerdict& v) {
    if (v.Kind() == VerdictKind::Rejected) {
        LogWarn("[%s] rejected (%s): %s", tag.c_str(), ToString(v.Error()), ReasonList(v).c_str());
        return;
    }
    LogInfo("[%s] %s score=%.2f policy=%s reasons=%s", tag.c_str(), ToString(v.Kind()), v.RiskScore(),
            v.PolicyVersion().c_str(), ReasonList(v).c_str());
}

} // namespace

AdmissionPipeline::AdmissionPipeline(Options opt, PolicySnapshot policy)
    : clock_(opt.clock ? std::move(opt.clock) : QuarantineCoordinator::ClockFn([] { return SystemClock::now(); })),
      store_(opt.root + "/store"),
      policy_(policy ? std::move(policy) : DefaultPolicy()),
      quarantine_(
          opt.root + "/quarantine",
          [this](const QuarantineRecord& rec, std::span<const std::uint8_t> bytes, std::optional<StoragePointer>& out) {
              return ReleaseHeld(rec, bytes, out);
          },
          clock_) {}

AdmissionPipeline::~AdmissionPipeline() {
    quarantine_.StopDeadlineWatcher();
}

Result AdmissionPipeline::Init() {
    auto r = store_.Init();
    if (!r.is_ok()) {
        LogError("[pipeline] storage init failed: %s", r.msg.c_str());
        return r;
    }
    r = quarantine_.Init();
    if (!r.is_ok()) {
        LogError("[pipeline] quarantine init failed: %s", r.msg.c_str());
        return r;
    }
    LogInfo("[pipeline] ready, policy %s", Policy()->version.c_str());
    return Result::Ok();
}

Result AdmissionPipeline::UsePolicy(PolicySnapshot policy) {
    if (!policy) return Result::Fail(EINVAL, "null policy", ErrorKind::ConfigError);
    if (policy->version.empty()) return Result::Fail(EINVAL, "policy has no version", ErrorKind::ConfigError);

    std::string previous;
    {
        std::lock_guard<std::mutex> lk(policy_mu_);
        previous = policy_->version;
        policy_ = std::move(policy);
    }
    LogInfo("[pipeline] policy %s replaces %s", Policy()->version.c_str(), previous.c_str());
    return Result::Ok();
}

PolicySnapshot AdmissionPipeline::Policy() const {
    std::lock_guard<std::mutex> lk(policy_mu_);
    return policy_;
}

TimePoint AdmissionPipeline::Now() const {
    return clock_();
}

AdmissionOutcome AdmissionPipeline::Admit(UploadArtifact& artifact) {
    const PolicySnapshot policy = Policy();
    const std::string tag = ArtifactTag(artifact);
    const ContextPolicy* ctx = policy->Context(artifact.Context());
    const double threshold = ctx ? ctx->heuristics.quarantine_threshold : HeuristicWeights{}.quarantine_threshold;

    VerdictBuilder vb;
    std::optional<StoragePointer> pointer;
    std::optional<std::string> quarantine_id;
    std::optional<ScrubReport> scrub_report;

    LogDebug("[%s] admission started, context %s, policy %s", tag.c_str(), ToString(artifact.Context()),
             policy->version.c_str());

    try {
        do {
            if (!ctx) {
                vb.Reject(ReasonCode::ExtensionNotAllowed, ErrorKind::PolicyViolation,
                          std::string("uploads are not accepted in context ") + ToString(artifact.Context()));
                break;
            }

            // Stage 1: name and extension. No byte is read before these pass.
            const std::string& name = artifact.DeclaredFilename();
            if (!ValidateFilename(name, *policy, *ctx, vb)) break;

            const TypeClassifier classifier(*policy, *ctx);
            Classification cls = classifier.ClassifyName(name);
            if (cls.denied) {
                vb.Reject(ReasonCode::BlockedExtension, ErrorKind::PolicyViolation,
                          "files of type " + cls.extension + " are not accepted");
                break;
            }
            if (!cls.allowed) {
                vb.Reject(ReasonCode::ExtensionNotAllowed, ErrorKind::PolicyViolation,
                          "files of type " + cls.extension + " are not accepted for " +
                              ToString(artifact.Context()));
                break;
            }
            for (const auto& inner : cls.denied_inner) {
                vb.Signal(ReasonCode::DoubleExtension, ctx->heuristics.double_extension,
                          "name hides a " + inner + " extension");
            }

            // Stage 2: size.
            const std::uint64_t limit = ctx->MaxSizeFor(*cls.rule);
            if (!artifact.HasSource()) {
                vb.Reject(ReasonCode::EmptyFile, ErrorKind::PolicyViolation, "file is empty");
                break;
            }
            if (auto declared = artifact.Source().TotalSize()) {
                if (*declared == 0) {
                    vb.Reject(ReasonCode::EmptyFile, ErrorKind::PolicyViolation, "file is empty");
                    break;
                }
                if (*declared > limit) {
                    vb.Reject(ReasonCode::FileTooLarge, ErrorKind::PolicyViolation,
                              "file is " + std::to_string(*declared) + " bytes, limit is " + std::to_string(limit));
                    break;
                }
            }

            std::vector<std::uint8_t> bytes;
            {
                BudgetReader budget(artifact.Source(), limit,
                                    BudgetReader::Clock::now() +
                                        std::chrono::milliseconds(ctx->archive.time_budget_ms));
                auto r = ReadAllBounded(budget, limit, bytes);
                if (!r.is_ok()) {
                    if (r.kind == ErrorKind::ResourceExceeded) {
                        vb.Reject(ReasonCode::FileTooLarge, ErrorKind::ResourceExceeded,
                                  "file exceeds the limit of " + std::to_string(limit) + " bytes");
                    } else {
                        LogError("[%s] reading upload failed: %s", tag.c_str(), r.msg.c_str());
                        vb.Reject(ReasonCode::InternalError, r.kind, "upload could not be read");
                    }
                    break;
                }
            }
            if (bytes.empty()) {
                vb.Reject(ReasonCode::EmptyFile, ErrorKind::PolicyViolation, "file is empty");
                break;
            }

            // Stage 3: signature.
            const std::span<const std::uint8_t> all(bytes);
            classifier.ApplySignature(cls, all.first(std::min(all.size(), kSniffPrefixBytes)),
                                      artifact.DeclaredMime());
            if (cls.signature_mismatch) {
                vb.Flag(ReasonCode::SignatureMismatch,
                        std::string("content looks like ") + ToString(cls.signature) + ", not " + cls.extension);
            }
            if (cls.mime_mismatch) {
                vb.Signal(ReasonCode::DeclaredMimeMismatch, ctx->heuristics.declared_mime_mismatch,
                          "declared type does not match " + cls.extension);
            }
            LogDebug("[%s] class=%s signature=%s", tag.c_str(), ToString(cls.Class()), ToString(cls.signature));

            // Stage 4: class-specific inspection.
            std::optional<ArchiveReport> report;
            std::vector<std::uint8_t> scrubbed;
            const bool is_image = !cls.IsArchive() && cls.Class() == FileClass::Image;

            if (cls.IsArchive()) {
                const auto kind = ContainerKindFor(cls.extension);
                if (!kind) {
                    vb.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                              "no container reader for " + cls.extension);
                    break;
                }
                const ArchiveInspector inspector(*policy, *ctx, tag);
                report = inspector.Inspect(all, *kind, name, vb);
            } else if (is_image) {
                ScrubReport sr;
                const ScrubStatus st = ImageScrubber().Scrub(all, scrubbed, sr);
                if (st == ScrubStatus::Unsupported) {
                    vb.Reject(ReasonCode::ImageFormatUnsupported, ErrorKind::StructuralViolation,
                              "image format is not supported");
                } else if (st == ScrubStatus::Malformed) {
                    vb.Reject(ReasonCode::ImageMetadataUnparseable, ErrorKind::StructuralViolation,
                              "image structure could not be parsed: " + sr.error);
                } else {
                    LogDebug("[%s] scrubbed %s: %zu block(s) removed, %llu -> %llu bytes", tag.c_str(),
                             ToString(sr.format), sr.removed.size(), (unsigned long long)sr.bytes_in,
                             (unsigned long long)sr.bytes_out);
                }
                scrub_report = std::move(sr);
            } else if (cls.rule->requires_deep_scan) {
                ContentScanner scanner = ContentScanner::ForFamily(*policy, ctx->heuristics, cls.rule->language_family);
                MemoryReader in(all);
                auto r = ScanStream(in, scanner, ctx->archive.read_buffer_bytes);
                if (!r.is_ok()) {
                    LogError("[%s] content scan failed: %s", tag.c_str(), r.msg.c_str());
                    vb.Reject(ReasonCode::InternalError, r.kind, "content could not be scanned");
                    break;
                }
                const ScanReport sr = scanner.Finish();
                for (const auto& sig : sr.signals) vb.Signal(sig.code, sig.weight, sig.detail);
            }
            if (vb.Rejected()) break;

            // Stage 5: route. Rejected bytes never reach either store.
            const ValidationVerdict tentative = vb.Build(policy->version, threshold, Now());
            if (tentative.Kind() == VerdictKind::Quarantined) {
                HoldRequest req;
                req.context = artifact.Context();
                req.filename = name;
                req.uploader = artifact.UploaderId();
                req.extension = cls.extension;
                req.content_type = ContentTypeOf(cls);
                req.verdict = &tentative;
                req.review_window = ctx->review_deadline;

                std::string id;
                auto r = quarantine_.Hold(req, all, id);
                if (!r.is_ok()) {
                    LogError("[%s] quarantine hold failed: %s", tag.c_str(), r.msg.c_str());
                    vb.Reject(ReasonCode::InternalError, ErrorKind::StorageFailure, "upload could not be held for review");
                    break;
                }
                quarantine_id = std::move(id);
            } else {
                auto r = Persist(*policy, *ctx, cls, name, all, report ? &*report : nullptr,
                                 is_image ? &scrubbed : nullptr, tag, pointer);
                if (!r.is_ok()) {
                    LogError("[%s] storing failed: %s", tag.c_str(), r.msg.c_str());
                    pointer.reset();
                    vb.Reject(ReasonCode::InternalError, ErrorKind::StorageFailure, "upload could not be stored");
                    break;
                }
            }
        } while (false);
    } catch (const std::exception& e) {
        LogError("[%s] unexpected failure: %s", tag.c_str(), e.what());
        if (pointer) {
            auto r = store_.Remove(*pointer);
            if (!r.is_ok()) LogError("[%s] removing %s failed: %s", tag.c_str(), pointer->str().c_str(), r.msg.c_str());
        }
        pointer.reset();
        quarantine_id.reset();
        vb.Reject(ReasonCode::InternalError, ErrorKind::StorageFailure, "upload could not be processed");
    }

    AdmissionOutcome out{vb.Build(policy->version, threshold, Now()), std::nullopt, std::nullopt, std::move(scrub_report)};
    if (out.verdict.Kind() == VerdictKind::Accepted) out.pointer = std::move(pointer);
    if (out.verdict.Kind() == VerdictKind::Quarantined) out.quarantine_id = std::move(quarantine_id);

    LogVerdict(tag, out.verdict);
    if (out.pointer) LogInfo("[%s] stored as %s", tag.c_str(), out.pointer->str().c_str());
    if (out.quarantine_id) LogInfo("[%s] held for review as %s", tag.c_str(), out.quarantine_id->c_str());
    return out;
}

Result AdmissionPipeline::Persist(const PolicyTable& policy, const ContextPolicy& context, const Classification& cls,
                                  std::string_view filename, std::span<const std::uint8_t> bytes,
                                  const ArchiveReport* report, const std::vector<std::uint8_t>* scrubbed,
                                  const std::string& tag, std::optional<StoragePointer>& out) const {
    if (cls.IsArchive()) {
        const auto kind = ContainerKindFor(cls.extension);
        if (!kind) return Result::Fail(EINVAL, "no container reader for " + cls.extension, ErrorKind::StructuralViolation);

        const ArchiveInspector inspector(policy, context, tag);
        ArchiveReport fresh;
        if (!report) {
            VerdictBuilder vb;
            fresh = inspector.Inspect(bytes, *kind, filename, vb);
            if (vb.Rejected()) {
                return Result::Fail(EINVAL, "archive no longer passes inspection", ErrorKind::StructuralViolation);
            }
            report = &fresh;
        }
        return inspector.Materialize(bytes, *kind, filename, *report, store_, policy.version, out);
    }

    if (cls.Class() == FileClass::Image) {
        std::vector<std::uint8_t> local;
        if (!scrubbed) {
            ScrubReport sr;
            if (ImageScrubber().Scrub(bytes, local, sr) != ScrubStatus::Ok) {
                return Result::Fail(EINVAL, "image cannot be scrubbed: " + sr.error, ErrorKind::StructuralViolation);
            }
            scrubbed = &local;
        }
        return store_.Put(*scrubbed, ContentTypeOf(cls), context.tag, out);
    }

    return store_.Put(bytes, ContentTypeOf(cls), context.tag, out);
}

Result AdmissionPipeline::ReleaseHeld(const QuarantineRecord& record, std::span<const std::uint8_t> bytes,
                                      std::optional<StoragePointer>& out) const {
    const PolicySnapshot policy = Policy();
    const ContextPolicy* ctx = policy->Context(record.context);
    if (!ctx) {
        return Result::Fail(EINVAL, std::string("no policy for context ") + ToString(record.context),
                            ErrorKind::ConfigError);
    }

    const TypeClassifier classifier(*policy, *ctx);
    Classification cls = classifier.ClassifyName(record.filename);
    classifier.ApplySignature(cls, bytes.first(std::min(bytes.size(), kSniffPrefixBytes)), "");

    const std::string tag = "release:" + record.id;
    LogInfo("[%s] releasing %s (%s)", tag.c_str(), record.filename.c_str(), ToString(cls.Class()));
    return Persist(*policy, *ctx, cls, record.filename, bytes, nullptr, nullptr, tag, out);
}

Result AdmissionPipeline::Retrieve(std::string_view pointer, RetrievedObject& out) const {
    ObjectMeta meta;
    auto r = store_.Read(pointer, out.bytes, meta);
    if (!r.is_ok()) return r;
    out.content_type = meta.content_type.empty() ? kFallbackContentType : meta.content_type;
    return Result::Ok();
}

Result AdmissionPipeline::ExtendDeadline(const std::string& id, const std::string& actor, ReviewState expected_state) {
    QuarantineRecord rec;
    auto r = quarantine_.Get(id, rec);
    if (!r.is_ok()) return r;

    const PolicySnapshot policy = Policy();
    const ContextPolicy* ctx = policy->Context(rec.context);
    const std::chrono::seconds window = ctx ? ctx->review_deadline : ContextPolicy{}.review_deadline;
    return quarantine_.ExtendDeadline(id, actor, expected_state, window);
}

} // namespace admit
