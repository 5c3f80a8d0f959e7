#pragma once

#include "admit/io.hpp"
#include "admit/policy.hpp"
#include "admit/types.hpp"

#include <array>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

struct ScanSignal {
    ReasonCode code;
    double weight = 0.0;
    std::string detail;
};

struct ScanReport {
    double score = 0.0;
    std::vector<ScanSignal> signals;
    std::uint64_t bytes_scanned = 0;

    bool Triggered(ReasonCode code) const;
};

// Shannon entropy of a byte histogram, in bits per byte.
double EntropyBits(const std::array<std::uint32_t, 256>& histogram, std::uint64_t total);

// Incremental scanner for textual content. Feed() may be called with chunks of
// any size; state is bounded by the longest pattern and the entropy window.
class ContentScanner {
public:
    ContentScanner(const HeuristicWeights& weights, std::vector<std::string> patterns);

    // Patterns of the generic family plus the named family, if any.
    static ContentScanner ForFamily(const PolicyTable& table,
                                    const HeuristicWeights& weights,
                                    std::string_view family);

    void Feed(std::span<const std::uint8_t> chunk);
    ScanReport Finish();

private:
    void CloseWindow();

    HeuristicWeights weights_;
    std::vector<std::string> patterns_;
    size_t max_pattern_ = 0;

    std::string tail_;                 // lowercase overlap from the previous chunk
    std::set<size_t> hits_;            // indices into patterns_

    std::uint64_t total_ = 0;
    std::uint64_t non_printable_ = 0;
    std::uint64_t line_len_ = 0;
    std::uint64_t longest_line_ = 0;

    std::array<std::uint32_t, 256> window_{};
    std::uint32_t window_fill_ = 0;
    std::uint64_t windows_ = 0;
    std::uint64_t high_windows_ = 0;
};

// Pull the whole reader through the scanner with a fixed buffer.
Result ScanStream(IReader& in, ContentScanner& scanner, std::uint32_t buffer_bytes);

} // namespace admit
