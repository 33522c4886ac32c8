#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace tasktrack {

    /// Generate a new opaque identifier shaped like an RFC 4122 version 4 UUID
    /// (lowercase, 36 characters). Built from a SHA-256 digest of fresh entropy,
    /// the wall clock and a process-wide sequence number.
    dp::Result<std::string, dp::Error> generateId();

    /// True if `id` has the 8-4-4-4-12 lowercase hex layout produced by generateId()
    bool isWellFormedId(const std::string &id);

} // namespace tasktrack
