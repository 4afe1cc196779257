#pragma once

#include "domain/StampRecord.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace sgw::infrastructure {

class StampRecordMapper {
public:
    // Build a validated record from one raw upstream stamp object.
    // batchID must be a non-empty string, else ValidationError is thrown.
    // Every other field is coerced to its default when absent or mistyped.
    sgw::domain::StampRecord build(const nlohmann::json& raw,
                                   std::optional<sgw::domain::Timestamp> expires_at) const;

    // batchTTL as an integer, or nullopt when absent or non-numeric.
    std::optional<int64_t> ttl_seconds(const nlohmann::json& raw) const;

    nlohmann::json to_json(const sgw::domain::StampRecord& record) const;
};

} // namespace sgw::infrastructure
