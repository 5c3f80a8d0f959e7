#pragma once

#include "admit/io.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>

namespace admit {

// Counts bytes pulled through an inner reader and fails the read once the
// byte ceiling or the deadline is crossed. Used to cap hostile streams.
class BudgetReader final : public IReader {
public:
    using Clock = std::chrono::steady_clock;

    enum class Stop { None, Bytes, Deadline, Inner };

    BudgetReader(IReader& inner, std::uint64_t max_bytes, Clock::time_point deadline)
        : inner_(&inner), max_bytes_(max_bytes), deadline_(deadline) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (Clock::now() > deadline_) {
            stop_ = Stop::Deadline;
            errno = ETIMEDOUT;
            return -1;
        }
        const ssize_t n = inner_->Read(out);
        if (n < 0) {
            stop_ = Stop::Inner;
            return n;
        }
        read_ += static_cast<std::uint64_t>(n);
        if (read_ > max_bytes_) {
            stop_ = Stop::Bytes;
            errno = EFBIG;
            return -1;
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return inner_->TotalSize(); }

    std::uint64_t BytesRead() const { return read_; }
    Stop Stopped() const { return stop_; }

private:
    IReader* inner_ = nullptr;
    std::uint64_t max_bytes_ = 0;
    Clock::time_point deadline_;
    std::uint64_t read_ = 0;
    Stop stop_ = Stop::None;
};

} // namespace admit
