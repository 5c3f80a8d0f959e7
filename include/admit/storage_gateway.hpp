#pragma once

#include "admit/digest.hpp"
#include "admit/file_writer.hpp"
#include "admit/io.hpp"
#include "admit/result.hpp"
#include "admit/types.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

struct ObjectMeta {
    std::string content_type;
    std::uint64_t size = 0;
    std::string context;
    TimePoint created{};
};

class StorageGateway;

// Streams one object into the store. Bytes go to a private temp file and are
// hashed on the way; Commit() makes the object visible in one rename. A writer
// destroyed without Commit() leaves nothing behind.
class ObjectWriter final : public IWriter {
public:
    ~ObjectWriter() override;

    ObjectWriter(const ObjectWriter&) = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    Result Commit(std::optional<StoragePointer>& out);
    void Abandon();

    std::uint64_t BytesWritten() const { return size_; }

private:
    friend class StorageGateway;
    ObjectWriter(const StorageGateway& store, std::string content_type, ContextTag context);

    const StorageGateway* store_;
    std::string content_type_;
    ContextTag context_;
    FileWriter file_;
    Sha256 hash_;
    std::uint64_t size_ = 0;
    bool open_ = false;
    bool failed_ = false;
};

// Content-addressed object store rooted at one directory:
//   <root>/objects/<h0h1>/<h2h3>/<pointer>       object bytes
//   <root>/objects/<h0h1>/<h2h3>/<pointer>.meta  JSON sidecar
//   <root>/tmp/                                  in-flight writes
class StorageGateway {
public:
    explicit StorageGateway(std::string root) : root_(std::move(root)) {}

    Result Init() const;

    Result OpenWriter(std::string content_type, ContextTag context,
                      std::unique_ptr<ObjectWriter>& out) const;

    Result Put(std::span<const std::uint8_t> bytes, std::string content_type, ContextTag context,
               std::optional<StoragePointer>& out) const;

    // Pointer strings that do not parse are reported as NotFound.
    Result Open(std::string_view pointer, std::unique_ptr<IReader>& out, ObjectMeta& meta) const;
    Result Read(std::string_view pointer, std::vector<std::uint8_t>& out, ObjectMeta& meta) const;

    Result Remove(const StoragePointer& pointer) const;
    bool Exists(const StoragePointer& pointer) const;

    std::string ObjectPath(const StoragePointer& pointer) const;
    const std::string& Root() const { return root_; }

private:
    friend class ObjectWriter;
    std::string TmpDir() const { return root_ + "/tmp"; }
    Result ReadMeta(const StoragePointer& pointer, ObjectMeta& meta) const;

    std::string root_;
};

} // namespace admit
