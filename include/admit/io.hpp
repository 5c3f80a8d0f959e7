#pragma once

#include "admit/result.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <sys/types.h>
#include <vector>

namespace admit {

// Sequential byte source of known or bounded length. Every artifact source
// (request body, file, archive member, held quarantine bytes) implements it.
class IReader {
public:
    virtual ~IReader() = default;

    // Returns bytes read into out (0 => EOF, <0 => error).
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;

    virtual std::optional<std::uint64_t> TotalSize() const = 0;
};

class IWriter {
public:
    virtual ~IWriter() = default;
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

// Reader over a byte buffer. Either owns the bytes or borrows a span that
// must outlive the reader.
class MemoryReader final : public IReader {
public:
    explicit MemoryReader(std::vector<std::uint8_t> owned)
        : owned_(std::move(owned)), view_(owned_) {}

    explicit MemoryReader(std::span<const std::uint8_t> borrowed)
        : view_(borrowed) {}

    MemoryReader(const MemoryReader&) = delete;
    MemoryReader& operator=(const MemoryReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= view_.size()) return 0;
        const size_t n = std::min(out.size(), view_.size() - pos_);
        std::memcpy(out.data(), view_.data() + pos_, n);
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(view_.size());
    }

private:
    std::vector<std::uint8_t> owned_;
    std::span<const std::uint8_t> view_;
    size_t pos_ = 0;
};

} // namespace admit
