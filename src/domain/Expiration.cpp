#include "domain/Expiration.hpp"

namespace sgw::domain {

std::optional<Timestamp> compute_expiration(std::optional<int64_t> ttl_seconds, Timestamp now) {
    if (!ttl_seconds || *ttl_seconds < 0) {
        return std::nullopt;
    }
    // A TTL that runs past year 9999 has no meaningful instant.
    if (now.seconds() > Timestamp::kMaxIso8601Seconds - *ttl_seconds) {
        return std::nullopt;
    }
    return now.plus_seconds(*ttl_seconds);
}

} // namespace sgw::domain
