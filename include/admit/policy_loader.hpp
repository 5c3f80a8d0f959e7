#pragma once

#include "admit/policy.hpp"
#include "admit/result.hpp"

#include <string>

namespace admit {

// Reads a JSON policy document. Fields the document omits inherit the
// built-in table; "version" is mandatory. On failure out is left untouched.
Result LoadPolicyFile(const std::string& path, PolicySnapshot& out);
Result ParsePolicyJson(const std::string& text, PolicySnapshot& out);

} // namespace admit
