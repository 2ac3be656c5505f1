// SPDX-License-Identifier: MIT

#include "rowkit/column_name.hpp"

#include <cctype>

#include "rowkit/error.hpp"

namespace rowkit {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Matches WORD(ARGS) against the whole text: WORD is one or more word
// characters, ARGS one or more characters on a single line.
std::optional<std::string> match_aggregate(std::string_view text) {
    std::size_t word_end = 0;
    while (word_end < text.size() && is_word_char(text[word_end])) {
        ++word_end;
    }
    if (word_end == 0 || word_end + 2 >= text.size()) return std::nullopt;
    if (text[word_end] != '(' || text.back() != ')') return std::nullopt;

    std::string_view args = text.substr(word_end + 1, text.size() - word_end - 2);
    for (char c : args) {
        if (c == '\n' || c == '\r') return std::nullopt;
    }

    std::string result;
    result.reserve(text.size() - 1);
    result.append(text.substr(0, word_end));
    result += '-';
    result.append(args);
    return result;
}

}  // namespace

ParsedColumnName parse_column_name(std::string_view name) {
    ParsedColumnName parsed;
    parsed.raw = std::string(name);
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
        parsed.quoted = std::string(name.substr(1, name.size() - 2));
    } else {
        parsed.unquoted = std::string(name);
    }
    return parsed;
}

std::optional<std::string> try_normalize_column_name(const ParsedColumnName& parsed) {
    if (parsed.unquoted) {
        return *parsed.unquoted;
    }
    if (parsed.quoted) {
        return match_aggregate(*parsed.quoted);
    }
    return std::nullopt;
}

std::string normalize_column_name(const ParsedColumnName& parsed) {
    if (auto normalized = try_normalize_column_name(parsed)) {
        return *std::move(normalized);
    }
    throw UnsupportedColumnNameError("Quoted column names are not supported: " + parsed.raw);
}

std::string normalize_column_name(std::string_view name) {
    return normalize_column_name(parse_column_name(name));
}

std::optional<ParsedColumnName> parse_nullable_column_name(const std::optional<std::string>& name) {
    if (!name) return std::nullopt;
    return parse_column_name(*name);
}

std::optional<std::string> normalize_nullable_column_name(const std::optional<std::string>& name) {
    if (!name) return std::nullopt;
    return normalize_column_name(*name);
}

}  // namespace rowkit
