#pragma once

#include "domain/value_objects/BatchId.hpp"
#include "domain/value_objects/Timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sgw::domain {

// Upstream accounting fields. Absent or malformed values keep these defaults.
struct StampAttributes {
    int64_t utilization = 0;
    bool usable = false;
    std::optional<std::string> label;
    int64_t depth = 0;
    std::optional<std::string> amount;  // arbitrary precision, kept as text
    int64_t bucket_depth = 0;
    int64_t block_number = 0;
    bool immutable_flag = false;
    std::optional<int64_t> batch_ttl;
    std::optional<bool> exists;

    bool operator==(const StampAttributes&) const = default;
};

// One postage stamp as served to callers. Built once per request.
class StampRecord {
public:
    StampRecord(BatchId batch_id, StampAttributes attributes, std::optional<Timestamp> expires_at);

    const BatchId& batch_id() const noexcept { return batch_id_; }
    const StampAttributes& attributes() const noexcept { return attributes_; }
    const std::optional<Timestamp>& expires_at() const noexcept { return expires_at_; }

    bool operator==(const StampRecord&) const = default;

private:
    BatchId batch_id_;
    StampAttributes attributes_;
    std::optional<Timestamp> expires_at_;
};

} // namespace sgw::domain
