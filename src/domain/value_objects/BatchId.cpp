#include "domain/value_objects/BatchId.hpp"

#include <stdexcept>

namespace sgw::domain {

BatchId::BatchId(std::string value) : value_(std::move(value)) {
    if (value_.empty()) {
        throw std::invalid_argument("BatchId must not be empty");
    }
}

} // namespace sgw::domain
