#pragma once

#include <compare>
#include <string>

namespace sgw::domain {

class BatchId {
public:
    explicit BatchId(std::string value);

    const std::string& value() const noexcept { return value_; }

    bool operator==(const BatchId&) const = default;
    auto operator<=>(const BatchId&) const = default;

private:
    std::string value_;
};

} // namespace sgw::domain
