#pragma once

#include "admit/fd.hpp"
#include "admit/io.hpp"
#include "admit/result.hpp"

#include <span>
#include <string>

namespace admit {

// Writer for a freshly created file. Open refuses to touch an existing path.
class FileWriter final : public IWriter {
public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
};

// Write bytes to path via a temp sibling, fsync and rename.
Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> bytes);

// fsync the directory holding path so a rename into it is durable.
Result FsyncParentDir(const std::string& path);

} // namespace admit
