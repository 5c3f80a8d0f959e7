#include "admit/content_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>

namespace admit {

namespace {

bool IsPrintable(std::uint8_t c) {
    if (c == '\t' || c == '\n' || c == '\r' || c == '\f') return true;
    if (c < 0x20 || c == 0x7F) return false;
    return true; // high bytes are treated as UTF-8 text
}

} // namespace

bool ScanReport::Triggered(ReasonCode code) const {
    return std::any_of(signals.begin(), signals.end(),
                       [code](const ScanSignal& s) { return s.code == code; });
}

double EntropyBits(const std::array<std::uint32_t, 256>& histogram, std::uint64_t total) {
    if (total == 0) return 0.0;
    const double sum = static_cast<double>(total);
    double h = 0.0;
    for (std::uint32_t count : histogram) {
        if (count == 0) continue;
        const double p = count / sum;
        h -= p * std::log2(p);
    }
    return h;
}

ContentScanner::ContentScanner(const HeuristicWeights& weights, std::vector<std::string> patterns)
    : weights_(weights) {
    for (auto& p : patterns) {
        if (p.empty()) continue;
        std::transform(p.begin(), p.end(), p.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(patterns_.begin(), patterns_.end(), p) != patterns_.end()) continue;
        max_pattern_ = std::max(max_pattern_, p.size());
        patterns_.push_back(std::move(p));
    }
    if (weights_.entropy_window == 0) weights_.entropy_window = 512;
}

ContentScanner ContentScanner::ForFamily(const PolicyTable& table,
                                         const HeuristicWeights& weights,
                                         std::string_view family) {
    std::vector<std::string> patterns;
    if (const auto* generic = table.Patterns("generic")) {
        patterns.insert(patterns.end(), generic->begin(), generic->end());
    }
    if (!family.empty() && family != "generic") {
        if (const auto* fam = table.Patterns(family)) {
            patterns.insert(patterns.end(), fam->begin(), fam->end());
        }
    }
    return ContentScanner(weights, std::move(patterns));
}

void ContentScanner::Feed(std::span<const std::uint8_t> chunk) {
    if (chunk.empty()) return;

    for (std::uint8_t c : chunk) {
        if (!IsPrintable(c)) ++non_printable_;

        if (c == '\n') {
            longest_line_ = std::max(longest_line_, line_len_);
            line_len_ = 0;
        } else {
            ++line_len_;
        }

        ++window_[c];
        if (++window_fill_ == weights_.entropy_window) CloseWindow();
    }
    total_ += chunk.size();

    if (patterns_.empty()) return;

    // Search the lowercase overlap plus this chunk so matches across the
    // chunk boundary are found.
    std::string hay = tail_;
    hay.reserve(tail_.size() + chunk.size());
    for (std::uint8_t c : chunk) hay.push_back(static_cast<char>(std::tolower(c)));

    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (hits_.count(i)) continue;
        if (hay.find(patterns_[i]) != std::string::npos) hits_.insert(i);
    }

    const size_t keep = max_pattern_ > 0 ? max_pattern_ - 1 : 0;
    tail_ = hay.size() > keep ? hay.substr(hay.size() - keep) : hay;
}

void ContentScanner::CloseWindow() {
    const double bits = EntropyBits(window_, window_fill_);
    ++windows_;
    if (bits > weights_.entropy_bits_threshold) ++high_windows_;
    window_.fill(0);
    window_fill_ = 0;
}

ScanReport ContentScanner::Finish() {
    longest_line_ = std::max(longest_line_, line_len_);

    ScanReport r;
    r.bytes_scanned = total_;
    char detail[128];

    if (longest_line_ > weights_.long_line_threshold) {
        std::snprintf(detail, sizeof(detail), "line of %llu bytes exceeds %u",
                      static_cast<unsigned long long>(longest_line_), weights_.long_line_threshold);
        r.signals.push_back({ReasonCode::LongLine, weights_.long_line, detail});
    }

    // Report patterns in table order so the verdict does not depend on chunking.
    for (size_t i : hits_) {
        r.signals.push_back({ReasonCode::DangerousPattern, weights_.dangerous_pattern,
                             "pattern '" + patterns_[i] + "'"});
    }

    if (total_ > 0) {
        const double ratio = static_cast<double>(non_printable_) / static_cast<double>(total_);
        if (ratio > weights_.non_printable_ratio) {
            std::snprintf(detail, sizeof(detail), "%.1f%% non-printable bytes", ratio * 100.0);
            r.signals.push_back({ReasonCode::NonPrintableContent, weights_.non_printable, detail});
        }
    }

    if (windows_ > 0) {
        const double ratio = static_cast<double>(high_windows_) / static_cast<double>(windows_);
        if (ratio > weights_.high_entropy_window_ratio) {
            std::snprintf(detail, sizeof(detail), "%llu of %llu windows above %.2f bits/byte",
                          static_cast<unsigned long long>(high_windows_),
                          static_cast<unsigned long long>(windows_),
                          weights_.entropy_bits_threshold);
            r.signals.push_back({ReasonCode::HighEntropyContent, weights_.high_entropy, detail});
        }
    }

    for (const auto& s : r.signals) r.score += s.weight;
    return r;
}

Result ScanStream(IReader& in, ContentScanner& scanner, std::uint32_t buffer_bytes) {
    std::vector<std::uint8_t> buf(buffer_bytes ? buffer_bytes : 64 * 1024);
    while (true) {
        const ssize_t n = in.Read(buf);
        if (n < 0) {
            const int err = errno;
            const ErrorKind kind = (err == EFBIG || err == ETIMEDOUT) ? ErrorKind::ResourceExceeded
                                                                      : ErrorKind::StorageFailure;
            return Result::Fail(err, "read failed during scan", kind);
        }
        if (n == 0) break;
        scanner.Feed(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return Result::Ok();
}

} // namespace admit
