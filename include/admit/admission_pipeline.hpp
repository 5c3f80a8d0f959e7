#pragma once

#include "admit/archive_inspector.hpp"
#include "admit/image_scrubber.hpp"
#include "admit/policy.hpp"
#include "admit/quarantine_coordinator.hpp"
#include "admit/storage_gateway.hpp"
#include "admit/type_classifier.hpp"
#include "admit/types.hpp"

#include <memory>
#include <span>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

struct AdmissionOutcome {
    ValidationVerdict verdict;
    std::optional<StoragePointer> pointer;      // accepted only
    std::optional<std::string> quarantine_id;   // quarantined only
    std::optional<ScrubReport> scrub;           // raster images that reached the scrubber
};

struct RetrievedObject {
    std::vector<std::uint8_t> bytes;
    std::string content_type;
};

// Entry point for every upload. Each Admit() call works on its own policy
// snapshot and its own buffers; calls may run in parallel.
class AdmissionPipeline {
public:
    struct Options {
        std::string root;                     // store under <root>/store, holding under <root>/quarantine
        QuarantineCoordinator::ClockFn clock; // empty => system clock
    };

    AdmissionPipeline(Options opt, PolicySnapshot policy);
    ~AdmissionPipeline();

    AdmissionPipeline(const AdmissionPipeline&) = delete;
    AdmissionPipeline& operator=(const AdmissionPipeline&) = delete;

    Result Init();

    // Later admissions use the new table; running ones keep theirs.
    Result UsePolicy(PolicySnapshot policy);
    PolicySnapshot Policy() const;

    AdmissionOutcome Admit(UploadArtifact& artifact);

    // Unknown or malformed pointers are NotFound.
    Result Retrieve(std::string_view pointer, RetrievedObject& out) const;

    // Pushes the deadline by the record context's review window.
    Result ExtendDeadline(const std::string& id, const std::string& actor, ReviewState expected_state);

    QuarantineCoordinator& Quarantine() { return quarantine_; }
    const StorageGateway& Store() const { return store_; }

private:
    // Class-specific persistence of validated bytes: archives become bundles,
    // raster images are stored scrubbed, everything else as is. report and
    // scrubbed may be null, in which case the work is redone here.
    Result Persist(const PolicyTable& policy, const ContextPolicy& context, const Classification& cls,
                   std::string_view filename, std::span<const std::uint8_t> bytes,
                   const ArchiveReport* report, const std::vector<std::uint8_t>* scrubbed,
                   const std::string& tag, std::optional<StoragePointer>& out) const;

    Result ReleaseHeld(const QuarantineRecord& record, std::span<const std::uint8_t> bytes,
                       std::optional<StoragePointer>& out) const;

    TimePoint Now() const;

    // quarantine_ comes last: its deadline watcher may release records
    // through the store and the policy snapshot until it is joined.
    QuarantineCoordinator::ClockFn clock_;
    StorageGateway store_;
    mutable std::mutex policy_mu_;
    PolicySnapshot policy_;
    QuarantineCoordinator quarantine_;
};

} // namespace admit
