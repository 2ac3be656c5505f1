// SPDX-License-Identifier: MIT

#include "rowkit/table_view.hpp"

#include "rowkit/column_name.hpp"
#include "rowkit/error.hpp"

namespace rowkit {

TableView::TableView(std::shared_ptr<const ITable> table, KeyMapper keys)
    : table_(std::move(table)), keys_(std::move(keys)) {}

std::optional<ColumnRef> TableView::find(std::string_view key) const {
    const std::string name = keys_.encode(key);
    const Schema schema = table_->schema();

    if (auto index = schema.index_of(name)) {
        return table_->column(schema[*index].name);
    }
    // Plain quoted names never match a key; only aggregates normalize
    for (const auto& field : schema) {
        auto parsed = parse_column_name(field.name);
        if (parsed.quoted && try_normalize_column_name(parsed) == name) {
            return table_->column(field.name);
        }
    }
    return std::nullopt;
}

std::size_t TableView::size() const {
    return table_->schema().size();
}

std::vector<TableView::value_type> TableView::entries() const {
    const Schema schema = table_->schema();

    std::vector<value_type> result;
    result.reserve(schema.size());
    for (const auto& field : schema) {
        // Quoted aggregates are keyed by their normalized name
        result.emplace_back(keys_.decode(normalize_column_name(field.name)),
                            table_->column(field.name));
    }
    return result;
}

std::vector<std::string> TableView::keys() const {
    std::vector<std::string> result;
    for (auto& entry : entries()) {
        result.push_back(std::move(entry.first));
    }
    return result;
}

std::vector<ColumnRef> TableView::values() const {
    std::vector<ColumnRef> result;
    for (auto& entry : entries()) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

TableView::iterator TableView::begin() const {
    return iterator(std::make_shared<const std::vector<value_type>>(entries()));
}

void TableView::insert(std::string_view key, const ColumnRef&) {
    throw UnsupportedOperationError(
        "TableView is read-only: cannot insert '" + std::string(key) + "'");
}

void TableView::erase(std::string_view key) {
    throw UnsupportedOperationError(
        "TableView is read-only: cannot erase '" + std::string(key) + "'");
}

bool TableView::operator==(const TableView& other) const {
    return table_ == other.table_ && keys_.name == other.keys_.name;
}

std::string TableView::to_string() const {
    return fmt::format("TableView[{}, keys={}]", table_->describe(), keys_.name);
}

}  // namespace rowkit
