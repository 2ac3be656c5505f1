// SPDX-License-Identifier: MIT

// include/rowkit/sql.hpp
#pragma once

#include <string>
#include <string_view>

#include "rowkit/schema.hpp"
#include "rowkit/value.hpp"

namespace rowkit::sql {

// Escape single quotes in a string for SQL string literals
std::string escape_string(std::string_view s);

// Quote an identifier (table/column name) to prevent SQL injection.
// Doubles any embedded double-quotes and wraps in double-quotes.
std::string quote_identifier(std::string_view ident);

// Quote a possibly schema-qualified name ("staging.trades") part by part.
std::string quote_qualified(std::string_view name);

// Column type in DuckDB's SQL dialect, e.g. "BIGINT", "DECIMAL(38,18)".
std::string type_name(const DataType& type);

// Storage type for a column type name reported by DESCRIBE.
// Unrecognized names map to String.
DataType parse_type_name(std::string_view name);

// SQL literal for one cell stored into a column of @p type; Null -> "NULL".
std::string literal(const Cell& cell, const DataType& type);

}  // namespace rowkit::sql
