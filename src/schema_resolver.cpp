// SPDX-License-Identifier: MIT

#include "rowkit/schema_resolver.hpp"

#include <algorithm>
#include <string_view>

#include "rowkit/error.hpp"
#include "rowkit/log.hpp"

namespace rowkit {

namespace {

struct ScalarTag {
    std::string_view tag;
    DataType type;
};

// Tags with a storage type.  uuid, keyword, symbol, nil and any are
// carried as their string form.
constexpr ScalarTag kScalarTags[] = {
    {"int", DataType::integer()},
    {"double", DataType::float64()},
    {"decimal", DataType::decimal()},
    {"boolean", DataType::boolean()},
    {"date", DataType::date()},
    {"inst", DataType::timestamp()},
    {"string", DataType::string()},
    {"uuid", DataType::string()},
    {"keyword", DataType::string()},
    {"symbol", DataType::string()},
    {"nil", DataType::string()},
    {"any", DataType::string()},
};

DataType enumeration_type(const TypeSpec& spec) {
    const auto& values = spec.values();
    auto all = [&](auto pred) {
        return !values.empty() && std::all_of(values.begin(), values.end(), pred);
    };
    if (all([](const Value& v) { return std::holds_alternative<int64_t>(v); })) {
        return DataType::integer();
    }
    if (all([](const Value& v) { return std::holds_alternative<double>(v); })) {
        return DataType::float64();
    }
    if (all([](const Value& v) {
            return std::holds_alternative<std::string>(v) || std::holds_alternative<Symbol>(v);
        })) {
        return DataType::string();
    }
    throw UnsupportedTypeError("Unsupported schema: " + spec.describe() +
                               " (enumeration members must share one scalar type)");
}

}  // namespace

DataType infer_type(const Value& value) {
    if (std::holds_alternative<int64_t>(value)) return DataType::integer();
    if (std::holds_alternative<double>(value)) return DataType::float64();
    if (std::holds_alternative<Decimal>(value)) return DataType::decimal();
    if (std::holds_alternative<bool>(value)) return DataType::boolean();
    if (std::holds_alternative<Date>(value)) return DataType::date();
    if (std::holds_alternative<Timestamp>(value)) return DataType::timestamp();
    return DataType::string();
}

Schema infer_schema(const Record& sample, const EncodeFn& encode) {
    std::vector<Field> fields;
    fields.reserve(sample.size());
    for (const auto& [key, value] : sample) {
        fields.push_back(Field{encode(key), infer_type(value), true});
    }
    log::logger()->debug("inferred schema with {} fields", fields.size());
    return Schema(std::move(fields));
}

Schema infer_schema(std::span<const Record> records, const EncodeFn& encode) {
    if (records.empty()) {
        throw EmptyInputError("Cannot infer schema from empty collection");
    }
    return infer_schema(records.front(), encode);
}

DataType storage_type_for(const TypeSpec& spec) {
    switch (spec.kind()) {
        case TypeSpec::Kind::Scalar: {
            for (const auto& entry : kScalarTags) {
                if (entry.tag == spec.tag()) return entry.type;
            }
            break;
        }
        case TypeSpec::Kind::Enumeration:
            return enumeration_type(spec);
        case TypeSpec::Kind::Record:
        case TypeSpec::Kind::Collection:
        case TypeSpec::Kind::Union:
            break;
    }
    throw UnsupportedTypeError("Unsupported schema: " + spec.describe());
}

Schema derive_schema(const TypeSpec& spec, const EncodeFn& encode) {
    if (spec.kind() != TypeSpec::Kind::Record) {
        throw InvalidSchemaError("Only record schemas are supported, got " + spec.describe());
    }

    std::vector<Field> fields;
    fields.reserve(spec.fields().size());
    for (const auto& field : spec.fields()) {
        fields.push_back(Field{encode(field.key), storage_type_for(field.type), field.optional});
    }
    log::logger()->debug("derived schema with {} fields", fields.size());
    return Schema(std::move(fields));
}

}  // namespace rowkit
