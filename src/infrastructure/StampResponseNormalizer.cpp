#include "infrastructure/StampResponseNormalizer.hpp"

#include "domain/Errors.hpp"

using json = nlohmann::json;

namespace sgw::infrastructure {

UpstreamEnvelope StampResponseNormalizer::decode(const json& body) const {
    if (body.is_array()) {
        return BareSequence{&body};
    }
    if (body.is_object()) {
        for (const char* key : kWrapperKeys) {
            auto it = body.find(key);
            if (it != body.end() && it->is_array()) {
                return WrappedSequence{key, &*it};
            }
        }
        throw sgw::domain::NormalizationError(
            "upstream object has no stamp list under 'stamps' or 'batches'");
    }
    throw sgw::domain::NormalizationError(
        std::string("upstream response is neither a list nor an object: ") + body.type_name());
}

std::vector<json> StampResponseNormalizer::normalize(const json& body) const {
    auto envelope = decode(body);
    const json& items = *std::visit([](const auto& e) { return e.items; }, envelope);
    return std::vector<json>(items.begin(), items.end());
}

} // namespace sgw::infrastructure
