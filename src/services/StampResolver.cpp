#include "services/StampResolver.hpp"

#include "domain/Errors.hpp"

namespace sgw::services {

const nlohmann::json& StampResolver::resolve(const std::vector<nlohmann::json>& stamps,
                                             const std::string& batch_id) const {
    // The node has no server-side filter, so this is a linear scan.
    for (const auto& stamp : stamps) {
        if (!stamp.is_object()) continue;
        auto it = stamp.find("batchID");
        if (it != stamp.end() && it->is_string() &&
            it->get_ref<const std::string&>() == batch_id) {
            return stamp;
        }
    }
    throw sgw::domain::NotFoundError(batch_id);
}

} // namespace sgw::services
