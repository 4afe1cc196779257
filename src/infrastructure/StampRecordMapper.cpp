#include "infrastructure/StampRecordMapper.hpp"

#include "domain/Errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using json = nlohmann::json;
using namespace sgw::domain;

namespace sgw::infrastructure {

namespace {

std::optional<int64_t> as_integer(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;

    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (std::trunc(value) != value || std::abs(value) > 9.0e15) return std::nullopt;
        return static_cast<int64_t>(value);
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed);
            if (consumed != text.size()) return std::nullopt;
            return static_cast<int64_t>(value);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

std::optional<std::string> as_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

// Large integers stay text. Integer JSON numbers are rendered exactly;
// floats are rejected since their digits are already lost.
std::optional<std::string> as_amount(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return it->dump();
    return std::nullopt;
}

template <typename T>
json nullable(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::optional<int64_t> StampRecordMapper::ttl_seconds(const json& raw) const {
    if (!raw.is_object()) return std::nullopt;
    return as_integer(raw, "batchTTL");
}

StampRecord StampRecordMapper::build(const json& raw, std::optional<Timestamp> expires_at) const {
    if (!raw.is_object()) {
        throw ValidationError(std::string("stamp record is not an object: ") + raw.type_name());
    }

    auto batch_id = as_string(raw, "batchID");
    if (!batch_id || batch_id->empty()) {
        throw ValidationError("stamp record has no batchID string");
    }

    StampAttributes attrs;
    attrs.utilization = as_integer(raw, "utilization").value_or(0);
    attrs.usable = as_bool(raw, "usable").value_or(false);
    attrs.label = as_string(raw, "label");
    attrs.depth = as_integer(raw, "depth").value_or(0);
    attrs.amount = as_amount(raw, "amount");
    attrs.bucket_depth = as_integer(raw, "bucketDepth").value_or(0);
    attrs.block_number = as_integer(raw, "blockNumber").value_or(0);
    attrs.immutable_flag = as_bool(raw, "immutableFlag").value_or(false);
    attrs.batch_ttl = as_integer(raw, "batchTTL");
    attrs.exists = as_bool(raw, "exists");

    return StampRecord(BatchId(std::move(*batch_id)), std::move(attrs), expires_at);
}

json StampRecordMapper::to_json(const StampRecord& record) const {
    const auto& attrs = record.attributes();
    std::optional<std::string> expires_at;
    if (record.expires_at()) {
        expires_at = record.expires_at()->to_iso8601();
    }

    return json{
        {"batchID", record.batch_id().value()},
        {"utilization", attrs.utilization},
        {"usable", attrs.usable},
        {"label", nullable(attrs.label)},
        {"depth", attrs.depth},
        {"amount", nullable(attrs.amount)},
        {"bucketDepth", attrs.bucket_depth},
        {"blockNumber", attrs.block_number},
        {"immutableFlag", attrs.immutable_flag},
        {"batchTTL", nullable(attrs.batch_ttl)},
        {"exists", nullable(attrs.exists)},
        {"expiresAt", nullable(expires_at)},
    };
}

} // namespace sgw::infrastructure
