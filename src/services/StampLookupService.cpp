#include "services/StampLookupService.hpp"

#include "domain/Errors.hpp"
#include "domain/Expiration.hpp"

#include <iostream>

using json = nlohmann::json;
using namespace sgw::domain;

namespace sgw::services {

const char* to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Fetching:    return "Fetching";
        case PipelineStage::Normalizing: return "Normalizing";
        case PipelineStage::Resolving:   return "Resolving";
        case PipelineStage::Computing:   return "Computing";
        case PipelineStage::Building:    return "Building";
        case PipelineStage::Done:        return "Done";
        case PipelineStage::Failed:      return "Failed";
    }
    return "Unknown";
}

StampLookupService::StampLookupService(const IUpstreamClient& upstream, Clock clock)
    : upstream_(upstream)
    , clock_(std::move(clock)) {}

void StampLookupService::set_on_stage(StageCallback callback) {
    on_stage_ = std::move(callback);
}

void StampLookupService::enter(PipelineStage stage) const {
    if (on_stage_) {
        on_stage_(stage);
    }
}

StampRecord StampLookupService::lookup(const std::string& batch_id) const {
    PipelineStage stage = PipelineStage::Fetching;
    try {
        enter(stage);
        json body = upstream_.fetch_all_stamps();
        // Fetch time is the reference instant for expiration.
        Timestamp fetched_at = clock_();

        enter(stage = PipelineStage::Normalizing);
        std::vector<json> stamps = normalizer_.normalize(body);

        enter(stage = PipelineStage::Resolving);
        const json& raw = resolver_.resolve(stamps, batch_id);

        enter(stage = PipelineStage::Computing);
        auto expires_at = compute_expiration(mapper_.ttl_seconds(raw), fetched_at);

        enter(stage = PipelineStage::Building);
        StampRecord record = mapper_.build(raw, expires_at);

        enter(PipelineStage::Done);
        return record;
    } catch (const GatewayError& e) {
        std::cerr << "[lookup] " << to_string(e.kind())
                  << " stage=" << to_string(stage)
                  << " batch_id=" << batch_id
                  << " upstream=" << upstream_.base_url()
                  << " detail=" << e.what() << std::endl;
        enter(PipelineStage::Failed);
        throw;
    }
}

} // namespace sgw::services
