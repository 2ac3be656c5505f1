// SPDX-License-Identifier: MIT

// include/rowkit/schema.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowkit {

/// @name Storage scalar types
/// Closed set of column types the storage side models.
/// @{
enum class ScalarType : uint8_t {
    Integer,    ///< 64-bit signed integer.
    Double,     ///< 64-bit IEEE 754 floating point.
    Decimal,    ///< Fixed-point decimal with precision and scale.
    Boolean,    ///< Boolean value.
    Date,       ///< Calendar date.
    Timestamp,  ///< Point in time, microsecond resolution.
    String,     ///< Variable-length UTF-8 text.
};
/// @}

constexpr std::string_view scalar_type_name(ScalarType type) {
    switch (type) {
        case ScalarType::Integer: return "Integer";
        case ScalarType::Double: return "Double";
        case ScalarType::Decimal: return "Decimal";
        case ScalarType::Boolean: return "Boolean";
        case ScalarType::Date: return "Date";
        case ScalarType::Timestamp: return "Timestamp";
        case ScalarType::String: return "String";
    }
    return "Unknown";
}

/// Column type; precision and scale are only meaningful for Decimal.
struct DataType {
    ScalarType kind = ScalarType::String;
    uint8_t precision = 0;
    uint8_t scale = 0;

    static constexpr DataType integer() { return {ScalarType::Integer}; }
    static constexpr DataType float64() { return {ScalarType::Double}; }
    static constexpr DataType decimal(uint8_t precision = 38, uint8_t scale = 18) {
        return {ScalarType::Decimal, precision, scale};
    }
    static constexpr DataType boolean() { return {ScalarType::Boolean}; }
    static constexpr DataType date() { return {ScalarType::Date}; }
    static constexpr DataType timestamp() { return {ScalarType::Timestamp}; }
    static constexpr DataType string() { return {ScalarType::String}; }

    /// "Integer", "Decimal(38,18)", ...
    std::string to_string() const;

    bool operator==(const DataType&) const = default;
};

/// One column of a schema.
struct Field {
    std::string name;     ///< Storage-side name.
    DataType type;
    bool nullable = true;

    bool operator==(const Field&) const = default;
};

/// Ordered list of fields; position i describes row slot i.
class Schema {
public:
    using const_iterator = std::vector<Field>::const_iterator;

    Schema() = default;
    explicit Schema(std::vector<Field> fields) : fields_(std::move(fields)) {}

    const std::vector<Field>& fields() const { return fields_; }
    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const Field& operator[](std::size_t i) const { return fields_[i]; }

    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    /// @return Field names in schema order.
    std::vector<std::string> names() const;

    /// @return Position of the field named exactly @p name.
    std::optional<std::size_t> index_of(std::string_view name) const;

    bool operator==(const Schema&) const = default;

private:
    std::vector<Field> fields_;
};

}  // namespace rowkit
