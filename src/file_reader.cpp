#include "admit/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace admit {

Result FileOrStdinReader::Open(const std::string& path, FileOrStdinReader& out) {
    if (path.empty()) return Result::Fail(EINVAL, "input path is empty", ErrorKind::InvalidArgument);

    if (path == "-") {
        out.fd_.Reset(::dup(STDIN_FILENO));
        if (!out.fd_.Valid()) {
            const int err = errno;
            return Result::Fail(err, "dup(stdin) failed: " + std::string(std::strerror(err)));
        }
        out.is_stdin_ = true;
        out.size_.reset();
        return Result::Ok();
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "open " + path + ": " + std::strerror(err),
                            err == ENOENT ? ErrorKind::NotFound : ErrorKind::StorageFailure);
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        return Result::Fail(err, "fstat " + path + ": " + std::strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL, "not a regular file: " + path, ErrorKind::InvalidArgument);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

Result ReadAllBounded(IReader& in, std::uint64_t limit, std::vector<std::uint8_t>& out) {
    out.clear();
    if (auto total = in.TotalSize(); total && *total <= limit) {
        out.reserve(static_cast<size_t>(*total));
    }

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            const int err = errno;
            const ErrorKind kind = (err == EFBIG || err == ETIMEDOUT) ? ErrorKind::ResourceExceeded
                                                                      : ErrorKind::StorageFailure;
            out.clear();
            return Result::Fail(err, "read failed while spooling input", kind);
        }

        if (out.size() + static_cast<size_t>(n) > limit) {
            out.clear();
            return Result::Fail(EFBIG, "input exceeds " + std::to_string(limit) + " bytes",
                                ErrorKind::ResourceExceeded);
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

} // namespace admit
