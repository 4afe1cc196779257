#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sgw::services {

class StampResolver {
public:
    // First record whose batchID equals `batch_id` exactly (case-sensitive).
    // Throws NotFoundError when no record matches.
    const nlohmann::json& resolve(const std::vector<nlohmann::json>& stamps,
                                  const std::string& batch_id) const;
};

} // namespace sgw::services
