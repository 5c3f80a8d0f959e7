#pragma once

#include "admit/policy.hpp"
#include "admit/storage_gateway.hpp"
#include "admit/type_classifier.hpp"
#include "admit/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

enum class ContainerKind {
    Zip,
    Tar,              // plain or gzip/bzip2/xz compressed
    CompressedStream, // single gzip/bzip2/xz stream
};

// Container kind implied by an archive extension (".zip", ".tar.gz", ...).
std::optional<ContainerKind> ContainerKindFor(std::string_view extension);

struct ArchiveManifestEntry {
    std::string path;                 // normalized, relative
    std::uint64_t compressed_size = 0;  // bytes the entry occupies in the container stream
    std::optional<std::uint64_t> declared_size;
    std::uint64_t actual_size = 0;    // bytes decompressed before completion or abort
    std::string extension;
    SignatureKind signature = SignatureKind::Unknown;
    std::string content_type;
    double risk_score = 0.0;
    bool allowed = false;
    std::vector<ArchiveManifestEntry> children; // nested archive members
};

struct ArchiveReport {
    std::vector<ArchiveManifestEntry> entries; // regular files, container order
    std::uint64_t container_bytes = 0;
    std::uint64_t total_declared = 0;
    std::uint64_t total_actual = 0;
    std::uint32_t entry_count = 0;             // including directories and nested members
};

// Validates an archive held in memory without writing anything. Rejections
// and signals are recorded on the verdict builder; inspection stops at the
// first rejection.
class ArchiveInspector {
public:
    ArchiveInspector(const PolicyTable& table, const ContextPolicy& context, std::string tag);

    ArchiveReport Inspect(std::span<const std::uint8_t> container,
                          ContainerKind kind,
                          std::string_view container_name,
                          VerdictBuilder& verdict) const;

    // Stores every regular member of an inspected archive and then a bundle
    // manifest; the manifest's pointer is returned. Members written before a
    // failure are removed again.
    Result Materialize(std::span<const std::uint8_t> container,
                       ContainerKind kind,
                       std::string_view container_name,
                       const ArchiveReport& report,
                       const StorageGateway& store,
                       std::string_view policy_version,
                       std::optional<StoragePointer>& bundle) const;

    static constexpr const char* kBundleContentType = "application/vnd.admit.bundle+json";

private:
    struct Budget;

    bool InspectLevel(std::span<const std::uint8_t> container,
                      ContainerKind kind,
                      std::string_view container_name,
                      std::uint32_t depth,
                      const std::string& prefix,
                      Budget& budget,
                      VerdictBuilder& verdict,
                      std::vector<ArchiveManifestEntry>& out) const;

    const PolicyTable* table_;
    const ContextPolicy* context_;
    TypeClassifier classifier_;
    std::string tag_;
};

} // namespace admit
