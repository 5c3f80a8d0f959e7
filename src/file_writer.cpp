#include "admit/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace admit {

Result FileWriter::Open(std::string path, FileWriter& out) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0640);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "open " + path + ": " + std::strerror(err));
    }
    out.path_ = std::move(path);
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    const std::uint8_t* p = in.data();
    size_t left = in.size();
    while (left > 0) {
        const ssize_t n = ::write(fd_.Get(), p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, "write " + path_ + ": " + std::strerror(err));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) != 0) {
        const int err = errno;
        return Result::Fail(err, "fsync " + path_ + ": " + std::strerror(err));
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    const int fd = fd_.Release();
    if (fd < 0) return Result::Ok();
    if (::close(fd) != 0) {
        const int err = errno;
        return Result::Fail(err, "close " + path_ + ": " + std::strerror(err));
    }
    return Result::Ok();
}

Result FsyncParentDir(const std::string& path) {
    std::string dir = std::filesystem::path(path).parent_path().string();
    if (dir.empty()) dir = ".";
    Fd d(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!d.Valid()) {
        const int err = errno;
        return Result::Fail(err, "open dir " + dir + ": " + std::strerror(err));
    }
    if (::fsync(d.Get()) != 0) {
        const int err = errno;
        return Result::Fail(err, "fsync dir " + dir + ": " + std::strerror(err));
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, std::span<const std::uint8_t> bytes) {
    const std::string tmp_path = path + ".tmp";
    ::unlink(tmp_path.c_str());

    FileWriter writer;
    auto res = FileWriter::Open(tmp_path, writer);
    if (!res.is_ok()) return res;

    res = writer.WriteAll(bytes);
    if (res.is_ok()) res = writer.FsyncNow();
    if (res.is_ok()) res = writer.Close();
    if (!res.is_ok()) {
        ::unlink(tmp_path.c_str());
        return res;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "atomic rename failed: " + std::string(std::strerror(err)));
    }
    return FsyncParentDir(path);
}

} // namespace admit
