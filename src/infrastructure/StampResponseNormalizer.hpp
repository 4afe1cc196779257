#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <variant>
#include <vector>

namespace sgw::infrastructure {

// The two envelope shapes the storage node is known to answer /batches with.
struct BareSequence {
    const nlohmann::json* items;
};

struct WrappedSequence {
    std::string key;
    const nlohmann::json* items;
};

using UpstreamEnvelope = std::variant<BareSequence, WrappedSequence>;

class StampResponseNormalizer {
public:
    // Wrapper keys probed in priority order.
    static constexpr std::array<const char*, 2> kWrapperKeys{"stamps", "batches"};

    // Classify the response shape. Throws NormalizationError if neither matches.
    // The returned envelope points into `body` and must not outlive it.
    UpstreamEnvelope decode(const nlohmann::json& body) const;

    // Uniform ordered sequence of raw stamp objects, upstream order preserved.
    std::vector<nlohmann::json> normalize(const nlohmann::json& body) const;
};

} // namespace sgw::infrastructure
