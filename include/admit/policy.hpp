#pragma once

#include "admit/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

enum class FileClass {
    Text,
    Source,
    Document,
    Data,
    Image,
    Archive,
};

const char* ToString(FileClass c);
std::optional<FileClass> ParseFileClass(std::string_view s);

// Byte signatures the classifier can sniff from the first bytes of a file.
enum class SignatureKind {
    Unknown,
    Empty,
    Text,
    Script,      // "#!" interpreter line
    Php,
    Html,
    Xml,
    Pdf,
    Zip,
    Gzip,
    Bzip2,
    Xz,
    SevenZip,
    Rar,
    Tar,
    Ole2,
    PeExecutable,
    ElfExecutable,
    MachOExecutable,
    Jpeg,
    Png,
    Gif,
    Webp,
};

const char* ToString(SignatureKind k);
std::optional<SignatureKind> ParseSignatureKind(std::string_view s);

struct ExtensionRule {
    std::string extension;   // lowercase, with leading dot: ".py", ".tar.gz"
    FileClass file_class = FileClass::Text;
    bool allowed = true;
    std::uint64_t max_size = 0;            // 0 => context default
    bool requires_deep_scan = false;
    bool archive_allowed = false;
    std::vector<SignatureKind> signatures; // empty => no signature check
    std::string language_family;           // pattern family for deep scan
    std::vector<std::string> mime_types;   // client MIME values that are consistent
    std::string content_type;              // type recorded with the stored object
};

struct ArchiveLimits {
    std::uint32_t max_entries = 1000;
    std::uint64_t max_total_uncompressed = 500ULL * 1024 * 1024;
    std::uint64_t max_member_uncompressed = 100ULL * 1024 * 1024;
    double max_ratio = 100.0;
    std::uint32_t max_nesting_depth = 1;
    std::uint32_t read_buffer_bytes = 64 * 1024;
    std::uint32_t time_budget_ms = 10000;
};

struct HeuristicWeights {
    std::uint32_t long_line_threshold = 2000;
    double long_line = 3.0;
    double dangerous_pattern = 1.0;
    double non_printable_ratio = 0.05;
    double non_printable = 3.0;
    std::uint32_t entropy_window = 512;
    double entropy_bits_threshold = 5.8;
    double high_entropy_window_ratio = 0.10;
    double high_entropy = 2.0;
    double declared_mime_mismatch = 0.5;
    double archive_member_unlisted = 0.5;
    double double_extension = 3.0;
    double quarantine_threshold = 3.0;
};

struct ContextPolicy {
    ContextTag tag = ContextTag::Assignment;
    std::uint64_t max_size = 50ULL * 1024 * 1024;
    bool strict_filename_charset = true;
    std::map<std::string, ExtensionRule> extensions;
    ArchiveLimits archive;
    HeuristicWeights heuristics;
    std::chrono::seconds review_deadline{7 * 24 * 3600};

    const ExtensionRule* FindRule(std::string_view extension) const;
    std::uint64_t MaxSizeFor(const ExtensionRule& rule) const;
};

// Versioned, immutable policy input. Shared as shared_ptr<const PolicyTable>;
// a new version replaces the pointer, never the contents.
struct PolicyTable {
    std::string version;
    std::vector<std::string> denied_extensions;
    std::map<std::string, std::vector<std::string>> pattern_families;
    std::map<ContextTag, ContextPolicy> contexts;

    bool IsDenied(std::string_view extension) const;
    const ContextPolicy* Context(ContextTag tag) const;
    const std::vector<std::string>* Patterns(std::string_view family) const;
};

using PolicySnapshot = std::shared_ptr<const PolicyTable>;

// Built-in table, version "builtin-1".
PolicyTable DefaultPolicyTable();
PolicySnapshot DefaultPolicy();

// Longest suffix of filename that the table knows about (deny-list or any
// context), falling back to the last dot segment. Lowercase, with the dot.
std::string ExtensionOf(std::string_view filename, const PolicyTable& table);

} // namespace admit
