#include "admit/storage_gateway.hpp"
#include "admit/file_reader.hpp"
#include "admit/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace admit {

namespace {

Result MakeDirs(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result::Fail(ec.value(), "create_directories " + dir + ": " + ec.message());
    return Result::Ok();
}

} // namespace

// --------------------------- ObjectWriter ---------------------------

ObjectWriter::ObjectWriter(const StorageGateway& store, std::string content_type, ContextTag context)
    : store_(&store), content_type_(std::move(content_type)), context_(context) {}

ObjectWriter::~ObjectWriter() {
    Abandon();
}

void ObjectWriter::Abandon() {
    if (!open_) return;
    const std::string path = file_.Path();
    (void)file_.Close();
    ::unlink(path.c_str());
    open_ = false;
}

Result ObjectWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!open_ || failed_) return Result::Fail(EBADF, "object writer is closed");
    auto r = file_.WriteAll(in);
    if (r.is_ok()) r = hash_.Update(in);
    if (!r.is_ok()) {
        failed_ = true;
        return r;
    }
    size_ += in.size();
    return Result::Ok();
}

Result ObjectWriter::FsyncNow() {
    if (!open_) return Result::Fail(EBADF, "object writer is closed");
    return file_.FsyncNow();
}

Result ObjectWriter::Commit(std::optional<StoragePointer>& out) {
    out.reset();
    if (!open_ || failed_) {
        Abandon();
        return Result::Fail(EBADF, "object writer cannot commit");
    }

    std::string hash_hex;
    std::string nonce_hex;
    auto r = hash_.Final(hash_hex);
    if (r.is_ok()) r = RandomHex(StoragePointer::kNonceHexLen / 2, nonce_hex);
    if (r.is_ok()) r = file_.FsyncNow();
    const std::string tmp_path = file_.Path();
    if (r.is_ok()) r = file_.Close();
    if (!r.is_ok()) {
        Abandon();
        return r;
    }

    const StoragePointer ptr = StoragePointer::FromParts(hash_hex, nonce_hex);
    const std::string final_path = store_->ObjectPath(ptr);
    const std::string meta_path = final_path + ".meta";

    r = MakeDirs(fs::path(final_path).parent_path().string());
    if (!r.is_ok()) {
        Abandon();
        return r;
    }

    json meta = {
        {"content_type", content_type_},
        {"size", size_},
        {"context", ToString(context_)},
        {"created", FormatTimestamp(SystemClock::now())},
    };
    const std::string meta_text = meta.dump(2, ' ', false, json::error_handler_t::replace);
    r = WriteFileAtomic(meta_path, std::span<const std::uint8_t>(
                                       reinterpret_cast<const std::uint8_t*>(meta_text.data()), meta_text.size()));
    if (!r.is_ok()) {
        Abandon();
        return r;
    }

    if (::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(meta_path.c_str());
        Abandon();
        return Result::Fail(err, "rename into store failed: " + std::string(std::strerror(err)));
    }
    open_ = false;

    r = FsyncParentDir(final_path);
    if (!r.is_ok()) {
        ::unlink(final_path.c_str());
        ::unlink(meta_path.c_str());
        return r;
    }

    out = ptr;
    return Result::Ok();
}

// --------------------------- StorageGateway ---------------------------

Result StorageGateway::Init() const {
    if (root_.empty()) return Result::Fail(EINVAL, "storage root is empty", ErrorKind::InvalidArgument);
    auto r = MakeDirs(root_ + "/objects");
    if (r.is_ok()) r = MakeDirs(TmpDir());
    return r;
}

std::string StorageGateway::ObjectPath(const StoragePointer& pointer) const {
    const std::string_view h = pointer.Hash();
    std::string p = root_;
    p += "/objects/";
    p.append(h.substr(0, 2));
    p.push_back('/');
    p.append(h.substr(2, 2));
    p.push_back('/');
    p += pointer.str();
    return p;
}

Result StorageGateway::OpenWriter(std::string content_type, ContextTag context,
                                  std::unique_ptr<ObjectWriter>& out) const {
    std::string name;
    auto r = RandomHex(16, name);
    if (!r.is_ok()) return r;

    std::unique_ptr<ObjectWriter> w(new ObjectWriter(*this, std::move(content_type), context));
    r = FileWriter::Open(TmpDir() + "/" + name + ".part", w->file_);
    if (!r.is_ok()) return r;
    w->open_ = true;
    out = std::move(w);
    return Result::Ok();
}

Result StorageGateway::Put(std::span<const std::uint8_t> bytes, std::string content_type, ContextTag context,
                           std::optional<StoragePointer>& out) const {
    std::unique_ptr<ObjectWriter> w;
    auto r = OpenWriter(std::move(content_type), context, w);
    if (!r.is_ok()) return r;

    constexpr size_t kChunk = 64 * 1024;
    for (size_t off = 0; off < bytes.size(); off += kChunk) {
        r = w->WriteAll(bytes.subspan(off, std::min(kChunk, bytes.size() - off)));
        if (!r.is_ok()) return r;
    }
    r = w->Commit(out);
    if (r.is_ok()) {
        LogDebug("[store] put %s (%zu bytes)", out->str().c_str(), bytes.size());
    }
    return r;
}

Result StorageGateway::ReadMeta(const StoragePointer& pointer, ObjectMeta& meta) const {
    const std::string path = ObjectPath(pointer) + ".meta";
    std::ifstream f(path);
    if (!f) return Result::Fail(ENOENT, "object not found", ErrorKind::NotFound);

    try {
        json j = json::parse(f);
        meta.content_type = j.value("content_type", std::string("application/octet-stream"));
        meta.size = j.value("size", std::uint64_t{0});
        meta.context = j.value("context", std::string());
        auto created = ParseTimestamp(j.value("created", std::string()));
        meta.created = created ? *created : TimePoint{};
    } catch (const json::exception& e) {
        return Result::Fail(EIO, "object metadata unreadable: " + std::string(e.what()));
    }
    return Result::Ok();
}

Result StorageGateway::Open(std::string_view pointer, std::unique_ptr<IReader>& out, ObjectMeta& meta) const {
    auto ptr = StoragePointer::Parse(pointer);
    if (!ptr) return Result::Fail(ENOENT, "object not found", ErrorKind::NotFound);

    auto r = ReadMeta(*ptr, meta);
    if (!r.is_ok()) return r;

    auto reader = std::make_unique<FileOrStdinReader>();
    r = FileOrStdinReader::Open(ObjectPath(*ptr), *reader);
    if (!r.is_ok()) {
        if (r.kind == ErrorKind::NotFound) r.msg = "object not found";
        return r;
    }
    out = std::move(reader);
    return Result::Ok();
}

Result StorageGateway::Read(std::string_view pointer, std::vector<std::uint8_t>& out, ObjectMeta& meta) const {
    std::unique_ptr<IReader> reader;
    auto r = Open(pointer, reader, meta);
    if (!r.is_ok()) return r;
    const std::uint64_t limit = reader->TotalSize().value_or(meta.size);
    return ReadAllBounded(*reader, limit, out);
}

Result StorageGateway::Remove(const StoragePointer& pointer) const {
    const std::string path = ObjectPath(pointer);
    const std::string meta = path + ".meta";
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        return Result::Fail(err, "unlink " + path + ": " + std::strerror(err));
    }
    if (::unlink(meta.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        return Result::Fail(err, "unlink " + meta + ": " + std::strerror(err));
    }
    return Result::Ok();
}

bool StorageGateway::Exists(const StoragePointer& pointer) const {
    std::error_code ec;
    return fs::is_regular_file(ObjectPath(pointer), ec);
}

} // namespace admit
