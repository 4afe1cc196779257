#pragma once

#include "domain/StampRecord.hpp"
#include "infrastructure/StampRecordMapper.hpp"
#include "infrastructure/StampResponseNormalizer.hpp"
#include "services/IUpstreamClient.hpp"
#include "services/StampResolver.hpp"

#include <functional>
#include <string>

namespace sgw::services {

enum class PipelineStage {
    Fetching,
    Normalizing,
    Resolving,
    Computing,
    Building,
    Done,
    Failed,
};

const char* to_string(PipelineStage stage);

// Fetch -> normalize -> resolve -> compute expiration -> build.
// Holds no per-request state; concurrent lookups share nothing mutable.
class StampLookupService {
public:
    using Clock = std::function<sgw::domain::Timestamp()>;
    using StageCallback = std::function<void(PipelineStage)>;

    explicit StampLookupService(const IUpstreamClient& upstream,
                                Clock clock = &sgw::domain::Timestamp::now);

    // Observer for stage transitions. Set before lookups start.
    void set_on_stage(StageCallback callback);

    // Throws a domain::GatewayError subclass on any failure.
    sgw::domain::StampRecord lookup(const std::string& batch_id) const;

    const sgw::infrastructure::StampRecordMapper& mapper() const noexcept { return mapper_; }

private:
    void enter(PipelineStage stage) const;

    const IUpstreamClient& upstream_;
    Clock clock_;
    StageCallback on_stage_;
    sgw::infrastructure::StampResponseNormalizer normalizer_;
    StampResolver resolver_;
    sgw::infrastructure::StampRecordMapper mapper_;
};

} // namespace sgw::services
