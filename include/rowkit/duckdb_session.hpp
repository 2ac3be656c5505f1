// SPDX-License-Identifier: MIT

// include/rowkit/duckdb_session.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rowkit/config.hpp"
#include "rowkit/error.hpp"
#include "rowkit/key_mapper.hpp"
#include "rowkit/schema.hpp"
#include "rowkit/table.hpp"
#include "rowkit/table_view.hpp"
#include "rowkit/value.hpp"

namespace rowkit {

namespace detail {
struct DuckDbEngine;
}  // namespace detail

/// Behaviour of DuckDbTable::save_as_table when the target already exists.
enum class SaveMode {
    Overwrite,      ///< Replace the existing table.
    Append,         ///< Insert rows into the existing table.
    ErrorIfExists,  ///< Fail with EngineError.
    Ignore,         ///< Leave the existing table untouched.
};

/// Join flavour for DuckDbTable::join().
enum class JoinType {
    Inner,
    Left,
    Right,
    Outer,  ///< Full outer join.
};

/// One aggregate output column: @c function over the column for @c key.
///
/// The output column is named the way the engine names an unaliased
/// aggregate in quoted form, e.g. "\"COUNT(DEPT)\"", so a TableView
/// addresses it as "count-dept".
struct Aggregate {
    std::string function;  ///< COUNT, SUM, AVG, MIN, MAX, ...
    std::string key;       ///< Application key, or "*" for every row.
};

class DuckDbGroupedTable;

/// Lazily evaluated relation held by a DuckDB connection.
///
/// A handle names either a stored table or a query; select(), where(),
/// sort(), limit(), agg() and join() derive new handles without running
/// anything.  schema() and the
/// collect family execute against the connection every time they are called.
///
/// Application keys passed to the derivations are encoded with the
/// handle's KeyMapper; collect() decodes storage names back into keys.
///
/// **Thread safety:** Not thread-safe.  Handles share their session's
/// connection.
class DuckDbTable : public ITable {
public:
    /// @throws EngineError if the relation cannot be described.
    Schema schema() const override;

    /// Quoted-identifier reference; existence is not checked.
    ColumnRef column(std::string_view name) const override;

    /// "DuckDbTable[trades]" or "DuckDbTable[query]".
    std::string describe() const override;

    /// @name Derived relations
    /// @{
    std::shared_ptr<DuckDbTable> select(std::span<const std::string> keys) const;
    std::shared_ptr<DuckDbTable> sort(std::span<const std::string> keys) const;
    std::shared_ptr<DuckDbTable> limit(std::size_t n) const;

    /// Rows for which @p condition, a SQL boolean expression, holds.
    /// Column expressions from column() or a TableView can be spliced in.
    std::shared_ptr<DuckDbTable> where(std::string_view condition) const;

    /// Group rows by @p keys; see DuckDbGroupedTable::agg().
    DuckDbGroupedTable group_by(std::span<const std::string> keys) const;

    /// Aggregate over every row as one group.
    /// @throws UnsupportedOperationError for an empty list or a function
    ///         name that is not a plain identifier.
    std::shared_ptr<DuckDbTable> agg(std::span<const Aggregate> aggregates) const;

    /// Join with @p other on the columns both sides have for @p keys.
    /// Join columns appear once in the result.
    /// @throws UnsupportedOperationError if @p keys is empty or @p other
    ///         belongs to another session.
    std::shared_ptr<DuckDbTable> join(const DuckDbTable& other,
                                      std::span<const std::string> keys,
                                      JoinType how = JoinType::Inner) const;
    /// @}

    /// @name Execution
    /// @throws EngineError on any statement failure.
    /// @{
    std::vector<Row> collect_rows() const;
    std::vector<Record> collect() const;
    std::vector<Record> take(std::size_t n) const;
    int64_t count() const;
    void save_as_table(std::string_view name, SaveMode mode = SaveMode::ErrorIfExists) const;

    /// First @p n rows as an aligned text grid under storage column names.
    std::string to_text(std::size_t n = 20) const;

    /// Print to_text(@p n) to stdout.
    void show(std::size_t n = 20) const;
    /// @}

    const KeyMapper& key_mapper() const { return keys_; }

private:
    friend class DuckDbSession;
    friend class DuckDbGroupedTable;

    // Quoted column expressions for application keys
    std::vector<std::string> encoded_columns(std::span<const std::string> keys) const;

    DuckDbTable(std::shared_ptr<detail::DuckDbEngine> engine, KeyMapper keys,
                std::string relation, std::string label, bool stored);

    std::shared_ptr<DuckDbTable> derive(std::string relation) const;

    std::shared_ptr<detail::DuckDbEngine> engine_;
    KeyMapper keys_;
    std::string relation_;
    std::string label_;
    bool stored_;  // relation_ names a table, not a subquery
};

/// Rows of a DuckDbTable partitioned by grouping columns.
///
/// Only agg() turns a grouping back into a table.
class DuckDbGroupedTable {
public:
    /// Grouping columns followed by one column per aggregate.
    /// @throws UnsupportedOperationError as DuckDbTable::agg().
    std::shared_ptr<DuckDbTable> agg(std::span<const Aggregate> aggregates) const;

private:
    friend class DuckDbTable;

    DuckDbGroupedTable(std::shared_ptr<DuckDbTable> source, std::vector<std::string> columns)
        : source_(std::move(source)), columns_(std::move(columns)) {}

    std::shared_ptr<DuckDbTable> source_;
    std::vector<std::string> columns_;  // quoted grouping expressions
};

/// Session over one DuckDB database.
///
/// Owns the database and its connection; every handle it returns keeps the
/// connection alive.  Records enter through create_records(), which
/// materializes them into a temporary table.
///
/// **Thread safety:** Not thread-safe.
class DuckDbSession {
public:
    /// Open the database @p config describes with the key convention it names.
    /// @throws Exception (InvalidConfig) if @p config does not validate.
    /// @throws EngineError if the database cannot be opened or prepared.
    explicit DuckDbSession(const SessionConfig& config = {});

    /// Open the database with an explicit key convention, ignoring
    /// config.key_convention.
    DuckDbSession(const SessionConfig& config, KeyMapper keys);

    ~DuckDbSession();

    DuckDbSession(const DuckDbSession&) = delete;
    DuckDbSession& operator=(const DuckDbSession&) = delete;

    /// Factory method that returns an expected instead of throwing.
    static std::expected<std::unique_ptr<DuckDbSession>, Error>
    create(const SessionConfig& config = {});

    const KeyMapper& keys() const { return keys_; }

    /// @name Record ingestion
    /// @throws EmptyInputError if there is nothing to store.
    /// @throws SchemaMismatchError if a row does not fit the schema.
    /// @{

    /// Infer the schema from the first record.
    std::shared_ptr<DuckDbTable> create_records(std::span<const Record> records);

    /// Position records by @p schema.
    std::shared_ptr<DuckDbTable> create_records(std::span<const Record> records,
                                                const Schema& schema);

    /// Store already positioned rows.
    std::shared_ptr<DuckDbTable> create_records(std::span<const Row> rows,
                                                const Schema& schema);
    /// @}

    /// Handle to the stored table @p name ("table" or "schema.table").
    std::shared_ptr<DuckDbTable> table(std::string_view name) const;

    /// Handle to the result of a SELECT statement.
    std::shared_ptr<DuckDbTable> sql(std::string_view query) const;

    /// Name-addressed view over @p table using this session's keys.
    TableView view(std::shared_ptr<const ITable> table) const;

private:
    std::shared_ptr<detail::DuckDbEngine> engine_;
    KeyMapper keys_;
};

}  // namespace rowkit
