#pragma once

#include "admit/policy.hpp"
#include "admit/types.hpp"

#include <string>
#include <string_view>

namespace admit {

// Checks a client-declared filename. Records a rejection on the builder and
// returns false when the name is unusable.
bool ValidateFilename(std::string_view name,
                      const PolicyTable& table,
                      const ContextPolicy& context,
                      VerdictBuilder& verdict);

enum class EntryPathStatus {
    Ok,
    Empty,       // "", ".", "./" (directory markers)
    Absolute,    // leading '/', drive letter, UNC
    Escapes,     // ".." climbs above the container root
    BadChar,     // NUL, control characters, ':', invalid UTF-8
};

const char* ToString(EntryPathStatus s);

// Strict UTF-8: no overlong forms, no surrogates, nothing past U+10FFFF.
bool IsValidUtf8(std::string_view s);

// Normalizes an archive member path to a clean relative form: '\' becomes
// '/', "." segments and duplicate slashes go, ".." is resolved. The result
// never starts with '/' and never contains "..".
EntryPathStatus NormalizeEntryPath(std::string_view raw, std::string& out_relative);

} // namespace admit
