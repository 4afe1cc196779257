#include "domain/StampRecord.hpp"

namespace sgw::domain {

StampRecord::StampRecord(BatchId batch_id, StampAttributes attributes,
                         std::optional<Timestamp> expires_at)
    : batch_id_(std::move(batch_id))
    , attributes_(std::move(attributes))
    , expires_at_(expires_at) {}

} // namespace sgw::domain
