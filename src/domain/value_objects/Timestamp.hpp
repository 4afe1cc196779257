#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace sgw::domain {

// A UTC instant with whole-second precision.
class Timestamp {
public:
    explicit Timestamp(int64_t seconds_since_epoch);

    // 9999-12-31T23:59:59Z, the last instant with a four-digit year.
    static constexpr int64_t kMaxIso8601Seconds = 253402300799;

    static Timestamp now();

    int64_t seconds() const noexcept { return seconds_; }

    Timestamp plus_seconds(int64_t seconds) const;

    // "YYYY-MM-DDTHH:MM:SSZ". Throws std::out_of_range past kMaxIso8601Seconds.
    std::string to_iso8601() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t seconds_;
};

} // namespace sgw::domain
