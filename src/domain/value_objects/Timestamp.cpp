#include "domain/value_objects/Timestamp.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace sgw::domain {

Timestamp::Timestamp(int64_t seconds_since_epoch) : seconds_(seconds_since_epoch) {
    if (seconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(seconds_since_epoch));
    }
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

Timestamp Timestamp::plus_seconds(int64_t seconds) const {
    if (seconds > 0 && seconds_ > std::numeric_limits<int64_t>::max() - seconds) {
        throw std::out_of_range("Timestamp overflow adding " + std::to_string(seconds) + "s");
    }
    return Timestamp(seconds_ + seconds);
}

std::string Timestamp::to_iso8601() const {
    std::time_t time = static_cast<std::time_t>(seconds_);
    std::tm tm{};
    if (seconds_ > kMaxIso8601Seconds || gmtime_r(&time, &tm) == nullptr) {
        throw std::out_of_range(
            "Timestamp has no ISO-8601 form: " + std::to_string(seconds_));
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace sgw::domain
