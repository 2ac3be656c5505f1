// SPDX-License-Identifier: MIT

#include "rowkit/record_converter.hpp"

#include <cctype>
#include <unordered_map>

#include <fmt/format.h>

#include "rowkit/error.hpp"

namespace rowkit {

namespace {

std::string fold_case(std::string_view s) {
    std::string result(s);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

}  // namespace

Value to_storage_value(const Value& value) {
    if (const auto* symbol = std::get_if<Symbol>(&value)) {
        return Value{symbol->name};
    }
    return value;
}

Row record_to_row(const Record& record, const Schema& schema, const EncodeFn& encode) {
    // Encoded, case-folded key -> value; later keys overwrite earlier ones
    std::unordered_map<std::string, const Value*> by_name;
    by_name.reserve(record.size());
    for (const auto& [key, value] : record) {
        by_name[fold_case(encode(key))] = &value;
    }

    Row row;
    row.reserve(schema.size());
    for (const auto& field : schema) {
        auto it = by_name.find(fold_case(field.name));
        if (it == by_name.end()) {
            row.emplace_back(std::nullopt);
        } else {
            row.emplace_back(to_storage_value(*it->second));
        }
    }
    return row;
}

Record row_to_record(const Row& row, const Schema& schema, const DecodeFn& decode) {
    if (row.size() != schema.size()) {
        throw SchemaMismatchError(fmt::format(
            "Row has {} cells but schema has {} fields", row.size(), schema.size()));
    }

    Record record;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (row[i]) {
            record.set(decode(schema[i].name), *row[i]);
        }
    }
    return record;
}

std::vector<Row> records_to_rows(std::span<const Record> records, const Schema& schema,
                                 const EncodeFn& encode) {
    std::vector<Row> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        rows.push_back(record_to_row(record, schema, encode));
    }
    return rows;
}

std::vector<Record> rows_to_records(std::span<const Row> rows, const Schema& schema,
                                    const DecodeFn& decode) {
    std::vector<Record> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        records.push_back(row_to_record(row, schema, decode));
    }
    return records;
}

bool is_assignable(const Value& value, const DataType& type) {
    switch (type.kind) {
        case ScalarType::Integer:
            return std::holds_alternative<int64_t>(value);
        case ScalarType::Double:
            return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
        case ScalarType::Decimal:
            return std::holds_alternative<Decimal>(value) || std::holds_alternative<int64_t>(value);
        case ScalarType::Boolean:
            return std::holds_alternative<bool>(value);
        case ScalarType::Date:
            return std::holds_alternative<Date>(value);
        case ScalarType::Timestamp:
            return std::holds_alternative<Timestamp>(value);
        case ScalarType::String:
            return std::holds_alternative<std::string>(value);
    }
    return false;
}

std::vector<SchemaMismatch> validate_row(const Row& row, const Schema& schema) {
    std::vector<SchemaMismatch> mismatches;

    if (row.size() != schema.size()) {
        mismatches.push_back({"(row)", fmt::format("{} cells", schema.size()),
                              fmt::format("{} cells", row.size())});
        return mismatches;
    }

    for (std::size_t i = 0; i < row.size(); ++i) {
        const auto& field = schema[i];
        const auto& cell = row[i];
        if (!cell) {
            if (!field.nullable) {
                mismatches.push_back({field.name, field.type.to_string(), "(null)"});
            }
            continue;
        }
        if (!is_assignable(*cell, field.type)) {
            mismatches.push_back({field.name, field.type.to_string(),
                                  std::string(value_kind(*cell))});
        }
    }
    return mismatches;
}

}  // namespace rowkit
