#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace ure::core {

// Translates a failed repository result into the matching util:: error.
// No-op for OK results.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace ure::core
