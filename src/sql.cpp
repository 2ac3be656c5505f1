// SPDX-License-Identifier: MIT

#include "rowkit/sql.hpp"

#include <cctype>
#include <charconv>
#include <cmath>

#include <fmt/format.h>

namespace rowkit::sql {

namespace {

std::string upper(std::string_view s) {
    std::string result(s);
    for (auto& c : result) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return result;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// Parse "DECIMAL(p,s)"; falls back to the default decimal type.
DataType parse_decimal(std::string_view name) {
    auto open = name.find('(');
    auto comma = name.find(',');
    auto close = name.find(')');
    if (open == std::string_view::npos || comma == std::string_view::npos ||
        close == std::string_view::npos || !(open < comma && comma < close)) {
        return DataType::decimal();
    }
    auto trim = [](std::string_view s) {
        while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
        while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
        return s;
    };
    auto width_text = trim(name.substr(open + 1, comma - open - 1));
    auto scale_text = trim(name.substr(comma + 1, close - comma - 1));
    unsigned width = 0;
    unsigned scale = 0;
    auto w = std::from_chars(width_text.data(), width_text.data() + width_text.size(), width);
    auto s = std::from_chars(scale_text.data(), scale_text.data() + scale_text.size(), scale);
    if (w.ec != std::errc{} || s.ec != std::errc{} || width > 255 || scale > width) {
        return DataType::decimal();
    }
    return DataType::decimal(static_cast<uint8_t>(width), static_cast<uint8_t>(scale));
}

// TIMESTAMP 'YYYY-MM-DD hh:mm:ss.ffffff' (UTC)
std::string timestamp_literal(const Timestamp& ts) {
    return fmt::format("TIMESTAMP '{}'", ts.to_iso_string());
}

std::string double_literal(double d) {
    if (std::isnan(d)) return "'nan'::DOUBLE";
    if (std::isinf(d)) return d > 0 ? "'inf'::DOUBLE" : "'-inf'::DOUBLE";
    return fmt::format("{}::DOUBLE", d);
}

}  // namespace

std::string escape_string(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '\'') {
            result += "''";  // Double single quote
        } else {
            result += c;
        }
    }
    return result;
}

std::string quote_identifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (char c : ident) {
        if (c == '"') {
            result += '"';  // Double the quote
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string quote_qualified(std::string_view name) {
    std::string result;
    std::size_t start = 0;
    while (true) {
        auto dot = name.find('.', start);
        if (!result.empty()) result += '.';
        result += quote_identifier(name.substr(start, dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return result;
}

std::string type_name(const DataType& type) {
    switch (type.kind) {
        case ScalarType::Integer: return "BIGINT";
        case ScalarType::Double: return "DOUBLE";
        case ScalarType::Decimal:
            return fmt::format("DECIMAL({},{})", type.precision, type.scale);
        case ScalarType::Boolean: return "BOOLEAN";
        case ScalarType::Date: return "DATE";
        case ScalarType::Timestamp: return "TIMESTAMP";
        case ScalarType::String: return "VARCHAR";
    }
    return "VARCHAR";
}

DataType parse_type_name(std::string_view name) {
    const std::string t = upper(name);

    if (t == "BIGINT" || t == "INTEGER" || t == "SMALLINT" || t == "TINYINT" ||
        t == "HUGEINT" || t == "UBIGINT" || t == "UINTEGER" || t == "USMALLINT" ||
        t == "UTINYINT" || t == "INT" || t == "INT8" || t == "INT4") {
        return DataType::integer();
    }
    if (t == "DOUBLE" || t == "FLOAT" || t == "REAL" || t == "FLOAT8" || t == "FLOAT4") {
        return DataType::float64();
    }
    if (starts_with(t, "DECIMAL") || starts_with(t, "NUMERIC")) {
        return parse_decimal(t);
    }
    if (t == "BOOLEAN" || t == "BOOL") {
        return DataType::boolean();
    }
    if (t == "DATE") {
        return DataType::date();
    }
    // TIMESTAMP, TIMESTAMP_S/_MS/_NS, TIMESTAMP WITH TIME ZONE, DATETIME
    if (starts_with(t, "TIMESTAMP") || t == "DATETIME") {
        return DataType::timestamp();
    }
    return DataType::string();
}

std::string literal(const Cell& cell, const DataType& type) {
    if (!cell) return "NULL";
    const Value& value = *cell;

    if (const auto* i = std::get_if<int64_t>(&value)) {
        if (type.kind == ScalarType::Double) return fmt::format("{}::DOUBLE", *i);
        return fmt::format("{}", *i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return double_literal(*d);
    }
    if (const auto* dec = std::get_if<Decimal>(&value)) {
        return fmt::format("'{}'::{}", escape_string(dec->text),
                           type_name(type.kind == ScalarType::Decimal ? type : DataType::decimal()));
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "TRUE" : "FALSE";
    }
    if (const auto* date = std::get_if<Date>(&value)) {
        return fmt::format("DATE '{}'", date->to_iso_string());
    }
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return timestamp_literal(*ts);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return fmt::format("'{}'", escape_string(*s));
    }
    const auto& symbol = std::get<Symbol>(value);
    return fmt::format("'{}'", escape_string(symbol.name));
}

}  // namespace rowkit::sql
