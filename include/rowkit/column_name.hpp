// SPDX-License-Identifier: MIT

// include/rowkit/column_name.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rowkit {

/// Raw storage column name split by quoting.
///
/// Exactly one of @c unquoted / @c quoted is set.
struct ParsedColumnName {
    std::string raw;                    ///< Name as returned by the engine.
    std::optional<std::string> unquoted;  ///< Set when the name is not quote-wrapped.
    std::optional<std::string> quoted;    ///< Interior of a "..."-wrapped name.

    bool operator==(const ParsedColumnName&) const = default;
};

/// Split @p name into its unquoted form or its quoted interior.
/// A name is quote-wrapped when it is at least two characters long and
/// starts and ends with '"'.
ParsedColumnName parse_column_name(std::string_view name);

/// Canonical token for a storage column name.
///
/// Plain names are returned unchanged.  Aggregate names such as
/// "\"COUNT(DEPT)\"" become "COUNT-DEPT".
/// @throws UnsupportedColumnNameError for any other quoted name.
std::string normalize_column_name(const ParsedColumnName& parsed);
std::string normalize_column_name(std::string_view name);

/// Like normalize_column_name(), but std::nullopt for a quoted name that is
/// not an aggregate.
std::optional<std::string> try_normalize_column_name(const ParsedColumnName& parsed);

/// @name Nullable names
/// std::nullopt maps to std::nullopt; an empty name maps to an empty name.
/// @{
std::optional<ParsedColumnName> parse_nullable_column_name(const std::optional<std::string>& name);
std::optional<std::string> normalize_nullable_column_name(const std::optional<std::string>& name);
/// @}

}  // namespace rowkit
