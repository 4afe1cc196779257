#pragma once

#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>

namespace sgw::domain {

// now + ttl_seconds, or nullopt when the TTL is unknown, already negative,
// or lands past Timestamp::kMaxIso8601Seconds.
std::optional<Timestamp> compute_expiration(std::optional<int64_t> ttl_seconds, Timestamp now);

} // namespace sgw::domain
