#pragma once

#include "admit/fd.hpp"
#include "admit/io.hpp"
#include "admit/result.hpp"

#include <string>

namespace admit {

// Reads a regular file, or stdin when the path is "-".
class FileOrStdinReader final : public IReader {
public:
    static Result Open(const std::string& path, FileOrStdinReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return size_; }

private:
    Fd fd_;
    bool is_stdin_ = false;
    std::optional<std::uint64_t> size_;
};

// Read the whole source into memory, failing once more than limit bytes arrive.
Result ReadAllBounded(IReader& in, std::uint64_t limit, std::vector<std::uint8_t>& out);

} // namespace admit
