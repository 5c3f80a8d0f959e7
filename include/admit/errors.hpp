#pragma once

#include <stdexcept>
#include <string>

namespace admit {

// Thrown while interpreting a policy document; never escapes LoadPolicyFile/ParsePolicyJson.
struct PolicyError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Thrown while decoding a quarantine journal; never escapes QuarantineJournal::Load.
struct JournalError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace admit
