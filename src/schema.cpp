// SPDX-License-Identifier: MIT

#include "rowkit/schema.hpp"

#include <fmt/format.h>

namespace rowkit {

std::string DataType::to_string() const {
    if (kind == ScalarType::Decimal) {
        return fmt::format("Decimal({},{})", precision, scale);
    }
    return std::string(scalar_type_name(kind));
}

std::vector<std::string> Schema::names() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& field : fields_) {
        result.push_back(field.name);
    }
    return result;
}

std::optional<std::size_t> Schema::index_of(std::string_view name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return std::nullopt;
}

}  // namespace rowkit
