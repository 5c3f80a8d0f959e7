#pragma once

#include "admit/policy.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace admit {

inline constexpr size_t kSniffPrefixBytes = 4096;

struct Classification {
    std::string extension;                 // lowercase, "" if none
    const ExtensionRule* rule = nullptr;   // into the policy snapshot; null if not allowed here
    bool denied = false;                   // on the global deny-list
    bool allowed = false;                  // rule exists and is enabled in the context
    std::vector<std::string> denied_inner; // deny-listed inner segments ("x.exe.txt")

    // Filled once the prefix has been sniffed.
    SignatureKind signature = SignatureKind::Unknown;
    bool signature_mismatch = false;
    bool mime_mismatch = false;

    FileClass Class() const { return rule ? rule->file_class : FileClass::Data; }
    bool IsArchive() const { return rule && rule->archive_allowed; }
};

SignatureKind SniffSignature(std::span<const std::uint8_t> prefix);

bool IsExecutableSignature(SignatureKind k);

// Maps (filename, sniffed prefix) to a policy class. Pure function of the
// policy table and its inputs.
class TypeClassifier {
public:
    TypeClassifier(const PolicyTable& table, const ContextPolicy& context)
        : table_(&table), context_(&context) {}

    // Extension stage. Needs no bytes, so deny-listed names are rejected
    // before anything is read.
    Classification ClassifyName(std::string_view filename) const;

    // Signature stage over the first kSniffPrefixBytes bytes.
    void ApplySignature(Classification& c,
                        std::span<const std::uint8_t> prefix,
                        std::string_view declared_mime) const;

    Classification Classify(std::string_view filename,
                            std::span<const std::uint8_t> prefix,
                            std::string_view declared_mime) const {
        Classification c = ClassifyName(filename);
        ApplySignature(c, prefix, declared_mime);
        return c;
    }

private:
    const PolicyTable* table_;
    const ContextPolicy* context_;
};

} // namespace admit
