#include "admit/archive_inspector.hpp"
#include "admit/content_scanner.hpp"
#include "admit/logger.hpp"
#include "admit/name_policy.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <exception>
#include <memory>
#include <set>

using json = nlohmann::json;

namespace admit {

namespace {

using Clock = std::chrono::steady_clock;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchivePtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// Client state for archive_read_open2. Must outlive the archive handle.
struct ReaderCtx {
    MemoryReader src;
    std::vector<std::uint8_t> buf;
    Clock::time_point deadline;
    bool timed_out = false;

    ReaderCtx(std::span<const std::uint8_t> bytes, size_t buf_sz, Clock::time_point dl)
        : src(bytes), buf(buf_sz), deadline(dl) {}
};

la_ssize_t ReadCb(struct archive*, void* client_data, const void** out_buf) {
    auto* ctx = static_cast<ReaderCtx*>(client_data);
    if (Clock::now() > ctx->deadline) {
        ctx->timed_out = true;
        errno = ETIMEDOUT;
        return -1;
    }
    const ssize_t n = ctx->src.Read(std::span<std::uint8_t>(ctx->buf.data(), ctx->buf.size()));
    if (n < 0) return -1;
    *out_buf = ctx->buf.data();
    return static_cast<la_ssize_t>(n); // 0 => EOF
}

std::string ArchiveErr(archive* a) {
    const char* s = a ? archive_error_string(a) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

Result OpenContainer(ContainerKind kind,
                     std::span<const std::uint8_t> bytes,
                     std::uint32_t buffer_bytes,
                     Clock::time_point deadline,
                     std::unique_ptr<ReaderCtx>& ctx,
                     ArchivePtr& ar) {
    ar.reset(archive_read_new());
    if (!ar) return Result::Fail(ENOMEM, "archive_read_new failed");

    switch (kind) {
        case ContainerKind::Zip:
            archive_read_support_format_zip(ar.get());
            break;
        case ContainerKind::Tar:
            archive_read_support_format_tar(ar.get());
            archive_read_support_filter_gzip(ar.get());
            archive_read_support_filter_bzip2(ar.get());
            archive_read_support_filter_xz(ar.get());
            break;
        case ContainerKind::CompressedStream:
            archive_read_support_format_raw(ar.get());
            archive_read_support_filter_gzip(ar.get());
            archive_read_support_filter_bzip2(ar.get());
            archive_read_support_filter_xz(ar.get());
            break;
    }

    ctx = std::make_unique<ReaderCtx>(bytes, buffer_bytes ? buffer_bytes : 64 * 1024, deadline);
    if (archive_read_open2(ar.get(), ctx.get(), nullptr, ReadCb, nullptr, nullptr) != ARCHIVE_OK) {
        return Result::Fail(EINVAL, "archive_read_open2: " + ArchiveErr(ar.get()),
                            ErrorKind::StructuralViolation);
    }
    return Result::Ok();
}

std::string_view Basename(std::string_view path) {
    const size_t slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// A bare compressed stream has one member named after the container minus
// its compression suffix.
std::string StreamMemberName(std::string_view container_name) {
    std::string_view base = Basename(container_name);
    const size_t dot = base.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return std::string(base);
    return std::string(base.substr(0, dot));
}

// Raw member path for the current header, or empty when it has none.
std::string EntryRawPath(archive_entry* entry, ContainerKind kind, std::string_view container_name) {
    if (kind == ContainerKind::CompressedStream) return StreamMemberName(container_name);
    const char* p = archive_entry_pathname(entry);
    return p ? std::string(p) : std::string();
}

const char* UnsafeEntryKind(archive_entry* entry) {
    if (archive_entry_is_encrypted(entry)) return "encrypted entry";
    if (const char* hl = archive_entry_hardlink(entry); hl && *hl) return "hard link";
    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
        case AE_IFDIR:
            return nullptr;
        case AE_IFLNK:
            return "symbolic link";
        case AE_IFCHR:
        case AE_IFBLK:
            return "device node";
        case AE_IFIFO:
            return "fifo";
        case AE_IFSOCK:
            return "socket";
        default:
            return "special file";
    }
}

struct PendingEntry {
    std::string path;
    std::optional<std::uint64_t> declared;
    std::int64_t header_pos = 0;
    std::uint64_t compressed = 0;
    Classification cls;
};

json ManifestJson(const ArchiveManifestEntry& e, const std::string* pointer) {
    json j = {
        {"path", e.path},
        {"compressed_size", e.compressed_size},
        {"actual_size", e.actual_size},
        {"content_type", e.content_type},
        {"signature", ToString(e.signature)},
        {"risk_score", e.risk_score},
    };
    j["declared_size"] = e.declared_size ? json(*e.declared_size) : json(nullptr);
    if (pointer) j["pointer"] = *pointer;
    if (!e.children.empty()) {
        json children = json::array();
        for (const auto& c : e.children) children.push_back(ManifestJson(c, nullptr));
        j["children"] = std::move(children);
    }
    return j;
}

} // namespace

std::optional<ContainerKind> ContainerKindFor(std::string_view extension) {
    if (extension == ".zip") return ContainerKind::Zip;
    if (extension == ".tar" || extension == ".tar.gz" || extension == ".tgz" ||
        extension == ".tar.bz2" || extension == ".tbz2" || extension == ".tar.xz" ||
        extension == ".txz") {
        return ContainerKind::Tar;
    }
    if (extension == ".gz" || extension == ".bz2" || extension == ".xz") {
        return ContainerKind::CompressedStream;
    }
    return std::nullopt;
}

struct ArchiveInspector::Budget {
    Clock::time_point deadline;
    std::uint32_t entries = 0;
    std::uint64_t total_declared = 0;
    std::uint64_t total_actual = 0;
};

ArchiveInspector::ArchiveInspector(const PolicyTable& table, const ContextPolicy& context, std::string tag)
    : table_(&table), context_(&context), classifier_(table, context), tag_(std::move(tag)) {}

ArchiveReport ArchiveInspector::Inspect(std::span<const std::uint8_t> container,
                                        ContainerKind kind,
                                        std::string_view container_name,
                                        VerdictBuilder& verdict) const {
    ArchiveReport report;
    report.container_bytes = container.size();

    Budget budget;
    budget.deadline = Clock::now() + std::chrono::milliseconds(context_->archive.time_budget_ms);

    const bool ok = InspectLevel(container, kind, container_name, 0, std::string(), budget, verdict, report.entries);

    report.entry_count = budget.entries;
    report.total_declared = budget.total_declared;
    report.total_actual = budget.total_actual;

    LogDebug("[%s] archive: %u entries, %llu declared, %llu read, %llu container bytes%s",
             tag_.c_str(), report.entry_count,
             static_cast<unsigned long long>(report.total_declared),
             static_cast<unsigned long long>(report.total_actual),
             static_cast<unsigned long long>(report.container_bytes),
             ok ? "" : " (aborted)");
    return report;
}

bool ArchiveInspector::InspectLevel(std::span<const std::uint8_t> container,
                                    ContainerKind kind,
                                    std::string_view container_name,
                                    std::uint32_t depth,
                                    const std::string& prefix,
                                    Budget& budget,
                                    VerdictBuilder& verdict,
                                    std::vector<ArchiveManifestEntry>& out) const {
    const ArchiveLimits& lim = context_->archive;
    const HeuristicWeights& hw = context_->heuristics;
    const double container_size = static_cast<double>(std::max<size_t>(container.size(), 1));

    auto limits = [&](const std::string& msg) {
        verdict.Reject(ReasonCode::ArchiveLimitsExceeded, ErrorKind::ResourceExceeded, prefix + msg);
        return false;
    };
    auto corrupt = [&](const ReaderCtx& ctx, archive* ar, const std::string& what) {
        if (ctx.timed_out) {
            return limits("inspection exceeded " + std::to_string(lim.time_budget_ms) + " ms");
        }
        verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                       prefix + what + ": " + ArchiveErr(ar));
        return false;
    };

    // Pass 1: walk the index only. Member payloads are skipped.
    std::vector<PendingEntry> pending;
    {
        std::unique_ptr<ReaderCtx> ctx;
        ArchivePtr ar;
        auto r = OpenContainer(kind, container, lim.read_buffer_bytes, budget.deadline, ctx, ar);
        if (!r.is_ok()) {
            if (ctx && ctx->timed_out) return limits("inspection exceeded time budget");
            verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                           prefix + "cannot open archive: " + r.msg);
            return false;
        }

        std::set<std::string> seen;
        std::uint64_t level_declared = 0;
        archive_entry* entry = nullptr;

        while (true) {
            const int h = archive_read_next_header(ar.get(), &entry);
            if (h == ARCHIVE_EOF) break;
            if (h != ARCHIVE_OK) return corrupt(*ctx, ar.get(), "bad entry header");

            if (++budget.entries > lim.max_entries) {
                return limits("more than " + std::to_string(lim.max_entries) + " entries");
            }

            const std::string raw = EntryRawPath(entry, kind, container_name);
            std::string rel;
            const EntryPathStatus st = NormalizeEntryPath(raw, rel);
            if (st == EntryPathStatus::Empty) {
                if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) return corrupt(*ctx, ar.get(), "skip failed");
                continue;
            }
            if (st != EntryPathStatus::Ok) {
                verdict.Reject(ReasonCode::ArchivePathTraversal, ErrorKind::StructuralViolation,
                               prefix + "entry '" + raw + "': " + ToString(st));
                return false;
            }

            if (const char* unsafe = UnsafeEntryKind(entry)) {
                verdict.Reject(ReasonCode::ArchiveUnsafeEntry, ErrorKind::StructuralViolation,
                               prefix + rel + ": " + unsafe);
                return false;
            }
            if (archive_entry_filetype(entry) == AE_IFDIR) {
                if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) return corrupt(*ctx, ar.get(), "skip failed");
                continue;
            }

            if (!seen.insert(rel).second) {
                verdict.Reject(ReasonCode::ArchiveDuplicateEntry, ErrorKind::StructuralViolation,
                               prefix + rel + ": duplicate entry");
                return false;
            }

            PendingEntry p;
            p.path = rel;
            p.header_pos = archive_read_header_position(ar.get());
            if (archive_entry_size_is_set(entry) && archive_entry_size(entry) >= 0) {
                const std::uint64_t d = static_cast<std::uint64_t>(archive_entry_size(entry));
                p.declared = d;
                if (d > lim.max_member_uncompressed) {
                    return limits(rel + " declares " + std::to_string(d) + " bytes, member limit " +
                                  std::to_string(lim.max_member_uncompressed));
                }
                level_declared += d;
                budget.total_declared += d;
                if (budget.total_declared > lim.max_total_uncompressed) {
                    return limits("declared total exceeds " + std::to_string(lim.max_total_uncompressed) + " bytes");
                }
                if (static_cast<double>(level_declared) > lim.max_ratio * container_size) {
                    return limits("declared compression ratio exceeds " + std::to_string(static_cast<int>(lim.max_ratio)) + ":1");
                }
            }

            p.cls = classifier_.ClassifyName(Basename(rel));
            if (p.cls.denied) {
                verdict.Reject(ReasonCode::ArchiveMemberBlocked, ErrorKind::PolicyViolation,
                               prefix + rel + ": blocked extension " + p.cls.extension);
                return false;
            }
            for (const auto& inner : p.cls.denied_inner) {
                verdict.Signal(ReasonCode::DoubleExtension, hw.double_extension,
                               prefix + rel + ": hidden extension " + inner);
            }
            if (!p.cls.allowed) {
                verdict.Signal(ReasonCode::ArchiveMemberUnlisted, hw.archive_member_unlisted,
                               prefix + rel + ": type not listed for this context");
            }
            if (p.cls.IsArchive() && depth + 1 > lim.max_nesting_depth) {
                verdict.Reject(ReasonCode::ArchiveNestingTooDeep, ErrorKind::StructuralViolation,
                               prefix + rel + ": archive nested deeper than " + std::to_string(lim.max_nesting_depth));
                return false;
            }

            pending.push_back(std::move(p));
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) return corrupt(*ctx, ar.get(), "skip failed");
        }

        const std::int64_t end = archive_filter_bytes(ar.get(), 0);
        for (size_t i = 0; i < pending.size(); ++i) {
            const std::int64_t next = (i + 1 < pending.size()) ? pending[i + 1].header_pos : end;
            pending[i].compressed = next > pending[i].header_pos
                                        ? static_cast<std::uint64_t>(next - pending[i].header_pos)
                                        : 0;
        }
        if (kind == ContainerKind::CompressedStream && !pending.empty()) {
            pending.front().compressed = container.size();
        }
        for (const auto& p : pending) {
            if (p.declared && p.compressed > 0 &&
                static_cast<double>(*p.declared) > lim.max_ratio * static_cast<double>(p.compressed)) {
                return limits(p.path + " declares a compression ratio above " +
                              std::to_string(static_cast<int>(lim.max_ratio)) + ":1");
            }
        }
    }

    // Pass 2: decompress through a fixed buffer, checking actual sizes
    // against declared ones and against the ceilings.
    std::unique_ptr<ReaderCtx> ctx;
    ArchivePtr ar;
    auto r = OpenContainer(kind, container, lim.read_buffer_bytes, budget.deadline, ctx, ar);
    if (!r.is_ok()) {
        verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                       prefix + "cannot reopen archive: " + r.msg);
        return false;
    }

    std::vector<std::uint8_t> buf(lim.read_buffer_bytes ? lim.read_buffer_bytes : 64 * 1024);
    std::uint64_t level_actual = 0;
    size_t idx = 0;
    archive_entry* entry = nullptr;

    while (true) {
        const int h = archive_read_next_header(ar.get(), &entry);
        if (h == ARCHIVE_EOF) break;
        if (h != ARCHIVE_OK) return corrupt(*ctx, ar.get(), "bad entry header");

        std::string rel;
        if (NormalizeEntryPath(EntryRawPath(entry, kind, container_name), rel) != EntryPathStatus::Ok ||
            archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        if (idx >= pending.size() || pending[idx].path != rel) {
            verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                           prefix + "entry order differs between reads");
            return false;
        }
        PendingEntry& p = pending[idx++];

        ArchiveManifestEntry e;
        e.path = p.path;
        e.declared_size = p.declared;
        e.compressed_size = p.compressed;
        e.extension = p.cls.extension;
        e.allowed = p.cls.allowed;
        e.content_type = p.cls.rule ? p.cls.rule->content_type : std::string("application/octet-stream");

        std::optional<ContentScanner> scanner;
        if (p.cls.rule && p.cls.rule->requires_deep_scan) {
            scanner.emplace(ContentScanner::ForFamily(*table_, hw, p.cls.rule->language_family));
        }
        const bool nested = p.cls.IsArchive();
        std::vector<std::uint8_t> head;
        std::vector<std::uint8_t> spool;

        while (true) {
            const la_ssize_t n = archive_read_data(ar.get(), buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) return corrupt(*ctx, ar.get(), rel + ": data error");

            const auto got = static_cast<std::uint64_t>(n);
            e.actual_size += got;
            level_actual += got;
            budget.total_actual += got;

            if (p.declared && e.actual_size > *p.declared) {
                return limits(rel + " decompressed past its declared " + std::to_string(*p.declared) + " bytes");
            }
            if (e.actual_size > lim.max_member_uncompressed) {
                return limits(rel + " exceeds member limit " + std::to_string(lim.max_member_uncompressed));
            }
            if (budget.total_actual > lim.max_total_uncompressed) {
                return limits("decompressed total exceeds " + std::to_string(lim.max_total_uncompressed) + " bytes");
            }
            if (static_cast<double>(level_actual) > lim.max_ratio * container_size) {
                return limits("actual compression ratio exceeds " + std::to_string(static_cast<int>(lim.max_ratio)) + ":1");
            }
            if (p.compressed > 0 &&
                static_cast<double>(e.actual_size) > lim.max_ratio * static_cast<double>(p.compressed)) {
                return limits(rel + " compression ratio exceeds " + std::to_string(static_cast<int>(lim.max_ratio)) + ":1");
            }

            std::span<const std::uint8_t> chunk(buf.data(), static_cast<size_t>(n));
            if (head.size() < kSniffPrefixBytes) {
                const size_t take = std::min(chunk.size(), kSniffPrefixBytes - head.size());
                head.insert(head.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(take));
            }
            if (scanner) scanner->Feed(chunk);
            if (nested) spool.insert(spool.end(), chunk.begin(), chunk.end());
        }

        classifier_.ApplySignature(p.cls, head, std::string_view());
        e.signature = p.cls.signature;
        if (p.cls.signature_mismatch) {
            verdict.Flag(ReasonCode::SignatureMismatch,
                         prefix + rel + ": content looks like " + ToString(p.cls.signature) +
                             ", not " + p.cls.extension);
        } else if (!p.cls.allowed && IsExecutableSignature(p.cls.signature)) {
            verdict.Flag(ReasonCode::SignatureMismatch, prefix + rel + ": executable content");
        }

        if (scanner) {
            const ScanReport rep = scanner->Finish();
            for (const auto& s : rep.signals) {
                verdict.Signal(s.code, s.weight, prefix + rel + ": " + s.detail);
            }
            e.risk_score = rep.score;
        }

        if (nested) {
            const auto nk = ContainerKindFor(p.cls.extension);
            if (!nk) {
                verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                               prefix + rel + ": no container reader for " + p.cls.extension);
                return false;
            }
            if (!InspectLevel(spool, *nk, Basename(rel), depth + 1, prefix + rel + "/", budget, verdict,
                              e.children)) {
                return false;
            }
        }

        out.push_back(std::move(e));
    }

    if (idx != pending.size()) {
        verdict.Reject(ReasonCode::ArchiveCorrupt, ErrorKind::StructuralViolation,
                       prefix + "entry count differs between reads");
        return false;
    }
    return true;
}

Result ArchiveInspector::Materialize(std::span<const std::uint8_t> container,
                                     ContainerKind kind,
                                     std::string_view container_name,
                                     const ArchiveReport& report,
                                     const StorageGateway& store,
                                     std::string_view policy_version,
                                     std::optional<StoragePointer>& bundle) const {
    bundle.reset();
    std::vector<StoragePointer> written;

    auto rollback = [&](Result failure) {
        for (const auto& p : written) {
            auto rr = store.Remove(p);
            if (!rr.is_ok()) LogError("[%s] rollback of %s failed: %s", tag_.c_str(), p.str().c_str(), rr.msg.c_str());
        }
        LogError("[%s] bundle write failed, %zu member(s) rolled back: %s",
                 tag_.c_str(), written.size(), failure.msg.c_str());
        return failure;
    };

    std::unique_ptr<ReaderCtx> ctx;
    ArchivePtr ar;
    auto r = OpenContainer(kind, container, context_->archive.read_buffer_bytes, Clock::time_point::max(), ctx, ar);
    if (!r.is_ok()) return r;

    try {
        std::vector<std::uint8_t> buf(context_->archive.read_buffer_bytes ? context_->archive.read_buffer_bytes : 64 * 1024);
        json entries = json::array();
        size_t idx = 0;
        archive_entry* entry = nullptr;

        while (true) {
            const int h = archive_read_next_header(ar.get(), &entry);
            if (h == ARCHIVE_EOF) break;
            if (h != ARCHIVE_OK) {
                return rollback(Result::Fail(EIO, "archive_read_next_header: " + ArchiveErr(ar.get()),
                                             ErrorKind::StructuralViolation));
            }

            std::string rel;
            if (NormalizeEntryPath(EntryRawPath(entry, kind, container_name), rel) != EntryPathStatus::Ok ||
                archive_entry_filetype(entry) != AE_IFREG) {
                continue;
            }
            if (idx >= report.entries.size() || report.entries[idx].path != rel) {
                return rollback(Result::Fail(EIO, "archive differs from its inspection report",
                                             ErrorKind::StructuralViolation));
            }
            const ArchiveManifestEntry& e = report.entries[idx++];

            std::unique_ptr<ObjectWriter> w;
            r = store.OpenWriter(e.content_type, context_->tag, w);
            if (!r.is_ok()) return rollback(r);

            while (true) {
                const la_ssize_t n = archive_read_data(ar.get(), buf.data(), buf.size());
                if (n == 0) break;
                if (n < 0) {
                    return rollback(Result::Fail(EIO, "archive_read_data: " + ArchiveErr(ar.get()),
                                                 ErrorKind::StructuralViolation));
                }
                r = w->WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
                if (!r.is_ok()) return rollback(r);
            }

            std::optional<StoragePointer> ptr;
            r = w->Commit(ptr);
            if (!r.is_ok()) return rollback(r);
            written.push_back(*ptr);
            entries.push_back(ManifestJson(e, &ptr->str()));
        }

        json manifest = {
            {"policy_version", std::string(policy_version)},
            {"container_bytes", report.container_bytes},
            {"total_uncompressed", report.total_actual},
            {"entries", std::move(entries)},
        };
        const std::string text = manifest.dump(2, ' ', false, json::error_handler_t::replace);
        r = store.Put(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()),
                      kBundleContentType, context_->tag, bundle);
        if (!r.is_ok()) return rollback(r);
    } catch (const std::exception& e) {
        if (bundle) {
            auto rr = store.Remove(*bundle);
            if (!rr.is_ok()) LogError("[%s] rollback of %s failed: %s", tag_.c_str(), bundle->str().c_str(), rr.msg.c_str());
            bundle.reset();
        }
        return rollback(Result::Fail(EIO, std::string("bundle write: ") + e.what(), ErrorKind::StorageFailure));
    }

    LogInfo("[%s] bundle %s stored with %zu member(s)", tag_.c_str(), bundle->str().c_str(), written.size());
    return Result::Ok();
}

} // namespace admit
