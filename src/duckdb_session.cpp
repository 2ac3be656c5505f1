// SPDX-License-Identifier: MIT

#include "rowkit/duckdb_session.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <duckdb.hpp>

#include "rowkit/log.hpp"
#include "rowkit/record_converter.hpp"
#include "rowkit/schema_resolver.hpp"
#include "rowkit/sql.hpp"

namespace rowkit {

namespace detail {

// Database and connection shared by a session and every handle it produced.
struct DuckDbEngine {
    std::unique_ptr<duckdb::DuckDB> db;
    std::unique_ptr<duckdb::Connection> conn;
    std::size_t temp_tables = 0;

    std::unique_ptr<duckdb::MaterializedQueryResult> run(const std::string& sql) {
        log::logger()->trace("sql: {}", sql);
        auto result = conn->Query(sql);
        if (result->HasError()) {
            throw EngineError(result->GetError());
        }
        return result;
    }
};

}  // namespace detail

namespace {

// Rows per INSERT statement when materializing records.
constexpr std::size_t kInsertBatchRows = 1000;

std::shared_ptr<detail::DuckDbEngine> open_engine(const SessionConfig& config) {
    if (auto ok = validate(config); !ok) {
        throw Exception(ok.error().code, ok.error().message);
    }

    auto engine = std::make_shared<detail::DuckDbEngine>();
    duckdb::DBConfig db_config;
    if (config.read_only) {
        db_config.options.access_mode = duckdb::AccessMode::READ_ONLY;
    }

    try {
        const char* path = config.in_memory() ? nullptr : config.database.c_str();
        engine->db = std::make_unique<duckdb::DuckDB>(path, &db_config);
        engine->conn = std::make_unique<duckdb::Connection>(*engine->db);
    } catch (const std::exception& e) {
        throw EngineError(fmt::format("Failed to open database '{}': {}",
                                      config.in_memory() ? ":memory:" : config.database,
                                      e.what()));
    }

    if (config.threads) {
        engine->run(fmt::format("SET threads TO {}", *config.threads));
    }
    if (config.schema) {
        if (!config.read_only) {
            engine->run(fmt::format("CREATE SCHEMA IF NOT EXISTS {}",
                                    sql::quote_identifier(*config.schema)));
        }
        engine->run(fmt::format("SET schema = '{}'", sql::escape_string(*config.schema)));
    }

    log::logger()->debug("opened {} database{}",
                         config.in_memory() ? "in-memory" : config.database,
                         config.read_only ? " (read-only)" : "");
    return engine;
}

KeyMapper configured_keys(const SessionConfig& config) {
    if (auto ok = validate(config); !ok) {
        throw Exception(ok.error().code, ok.error().message);
    }
    auto keys = key_mapper_for(config);
    if (!keys) {
        throw Exception(keys.error().code, keys.error().message);
    }
    return *std::move(keys);
}

// Convert one fetched cell according to the declared column type.
// Timestamp columns are fetched as epoch_us() so arrive as BIGINT.
Cell from_engine_value(const duckdb::Value& value, const DataType& type) {
    if (value.IsNull()) return std::nullopt;

    switch (type.kind) {
        case ScalarType::Integer:
            return Value{value.GetValue<int64_t>()};
        case ScalarType::Double:
            return Value{value.GetValue<double>()};
        case ScalarType::Decimal:
            // Printed at the column's full scale
            return Value{Decimal{Decimal{value.ToString()}.canonical()}};
        case ScalarType::Boolean:
            return Value{value.GetValue<bool>()};
        case ScalarType::Date:
            return Value{Date::from_iso_string(value.ToString())};
        case ScalarType::Timestamp:
            return Value{Timestamp{value.GetValue<int64_t>()}};
        case ScalarType::String:
            break;
    }
    return Value{value.ToString()};
}

std::string column_definitions(const Schema& schema) {
    std::vector<std::string> defs;
    defs.reserve(schema.size());
    for (const auto& field : schema) {
        defs.push_back(fmt::format("{} {}{}", sql::quote_identifier(field.name),
                                   sql::type_name(field.type),
                                   field.nullable ? "" : " NOT NULL"));
    }
    return fmt::format("{}", fmt::join(defs, ", "));
}

std::string row_literal(const Row& row, const Schema& schema) {
    std::vector<std::string> cells;
    cells.reserve(row.size());
    for (std::size_t i = 0; i < row.size(); ++i) {
        cells.push_back(sql::literal(row[i], schema[i].type));
    }
    return fmt::format("({})", fmt::join(cells, ", "));
}

// Throws SchemaMismatchError listing every cell that does not fit.
void check_rows(std::span<const Row> rows, const Schema& schema) {
    std::vector<std::string> problems;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (const auto& m : validate_row(rows[i], schema)) {
            problems.push_back(fmt::format("row {}: {} expected {}, got {}",
                                           i, m.column, m.expected, m.actual));
        }
    }
    if (!problems.empty()) {
        throw SchemaMismatchError(fmt::format("Rows do not match schema: {}",
                                              fmt::join(problems, "; ")));
    }
}

std::string_view join_keyword(JoinType how) {
    switch (how) {
        case JoinType::Inner: return "INNER";
        case JoinType::Left: return "LEFT";
        case JoinType::Right: return "RIGHT";
        case JoinType::Outer: return "FULL OUTER";
    }
    return "INNER";
}

bool is_identifier(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

std::string upper(std::string_view s) {
    std::string result(s);
    for (auto& c : result) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// DuckDbTable
// ---------------------------------------------------------------------------

DuckDbTable::DuckDbTable(std::shared_ptr<detail::DuckDbEngine> engine, KeyMapper keys,
                         std::string relation, std::string label, bool stored)
    : engine_(std::move(engine))
    , keys_(std::move(keys))
    , relation_(std::move(relation))
    , label_(std::move(label))
    , stored_(stored) {}

std::shared_ptr<DuckDbTable> DuckDbTable::derive(std::string relation) const {
    return std::shared_ptr<DuckDbTable>(
        new DuckDbTable(engine_, keys_, std::move(relation), "query", false));
}

Schema DuckDbTable::schema() const {
    auto result = engine_->run(stored_ ? "DESCRIBE " + relation_
                                       : "DESCRIBE SELECT * FROM " + relation_);

    // DESCRIBE columns: column_name, column_type, null, key, default, extra
    std::vector<Field> fields;
    while (true) {
        auto chunk = result->Fetch();
        if (!chunk || chunk->size() == 0) {
            break;
        }
        for (duckdb::idx_t i = 0; i < chunk->size(); ++i) {
            Field field;
            field.name = chunk->GetValue(0, i).ToString();
            field.type = sql::parse_type_name(chunk->GetValue(1, i).ToString());
            field.nullable = chunk->GetValue(2, i).ToString() != "NO";
            fields.push_back(std::move(field));
        }
    }
    return Schema(std::move(fields));
}

ColumnRef DuckDbTable::column(std::string_view name) const {
    return ColumnRef(std::string(name), sql::quote_identifier(name));
}

std::string DuckDbTable::describe() const {
    return fmt::format("DuckDbTable[{}]", label_);
}

std::vector<std::string> DuckDbTable::encoded_columns(std::span<const std::string> keys) const {
    std::vector<std::string> columns;
    columns.reserve(keys.size());
    for (const auto& key : keys) {
        columns.push_back(column(keys_.encode(key)).expression());
    }
    return columns;
}

std::shared_ptr<DuckDbTable> DuckDbTable::select(std::span<const std::string> keys) const {
    if (keys.empty()) {
        return derive(fmt::format("(SELECT * FROM {})", relation_));
    }
    return derive(fmt::format("(SELECT {} FROM {})", fmt::join(encoded_columns(keys), ", "),
                              relation_));
}

std::shared_ptr<DuckDbTable> DuckDbTable::sort(std::span<const std::string> keys) const {
    if (keys.empty()) {
        return derive(fmt::format("(SELECT * FROM {})", relation_));
    }
    return derive(fmt::format("(SELECT * FROM {} ORDER BY {})", relation_,
                              fmt::join(encoded_columns(keys), ", ")));
}

std::shared_ptr<DuckDbTable> DuckDbTable::where(std::string_view condition) const {
    return derive(fmt::format("(SELECT * FROM {} WHERE {})", relation_, condition));
}

DuckDbGroupedTable DuckDbTable::group_by(std::span<const std::string> keys) const {
    return DuckDbGroupedTable(derive(relation_), encoded_columns(keys));
}

std::shared_ptr<DuckDbTable> DuckDbTable::agg(std::span<const Aggregate> aggregates) const {
    return group_by({}).agg(aggregates);
}

std::shared_ptr<DuckDbTable> DuckDbTable::join(const DuckDbTable& other,
                                               std::span<const std::string> keys,
                                               JoinType how) const {
    if (other.engine_ != engine_) {
        throw UnsupportedOperationError("Cannot join tables from different sessions");
    }
    if (keys.empty()) {
        throw UnsupportedOperationError("Join requires at least one key");
    }
    return derive(fmt::format("(SELECT * FROM {} AS rowkit_left {} JOIN {} AS rowkit_right "
                              "USING ({}))",
                              relation_, join_keyword(how), other.relation_,
                              fmt::join(encoded_columns(keys), ", ")));
}

std::shared_ptr<DuckDbTable> DuckDbTable::limit(std::size_t n) const {
    return derive(fmt::format("(SELECT * FROM {} LIMIT {})", relation_, n));
}

std::vector<Row> DuckDbTable::collect_rows() const {
    const Schema fields = schema();
    if (fields.empty()) {
        return {};
    }

    std::vector<std::string> columns;
    columns.reserve(fields.size());
    for (const auto& field : fields) {
        auto expr = sql::quote_identifier(field.name);
        if (field.type.kind == ScalarType::Timestamp) {
            expr = fmt::format("epoch_us({})", expr);
        }
        columns.push_back(std::move(expr));
    }

    auto result = engine_->run(fmt::format("SELECT {} FROM {}", fmt::join(columns, ", "),
                                           relation_));

    std::vector<Row> rows;
    while (true) {
        auto chunk = result->Fetch();
        if (!chunk || chunk->size() == 0) {
            break;
        }
        for (duckdb::idx_t i = 0; i < chunk->size(); ++i) {
            Row row;
            row.reserve(fields.size());
            for (std::size_t c = 0; c < fields.size(); ++c) {
                try {
                    row.push_back(from_engine_value(chunk->GetValue(c, i), fields[c].type));
                } catch (const std::exception& e) {
                    throw EngineError(fmt::format("Failed to read column {}: {}",
                                                  fields[c].name, e.what()));
                }
            }
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::vector<Record> DuckDbTable::collect() const {
    const Schema fields = schema();
    const auto rows = collect_rows();
    return rows_to_records(rows, fields, keys_.decode);
}

std::vector<Record> DuckDbTable::take(std::size_t n) const {
    return limit(n)->collect();
}

int64_t DuckDbTable::count() const {
    auto result = engine_->run(fmt::format("SELECT COUNT(*) FROM {}", relation_));
    auto chunk = result->Fetch();
    if (!chunk || chunk->size() == 0) {
        throw EngineError("COUNT(*) returned no rows");
    }
    return chunk->GetValue(0, 0).GetValue<int64_t>();
}

void DuckDbTable::save_as_table(std::string_view name, SaveMode mode) const {
    const std::string target = sql::quote_qualified(name);

    switch (mode) {
        case SaveMode::Overwrite:
            engine_->run(fmt::format("CREATE OR REPLACE TABLE {} AS SELECT * FROM {}",
                                     target, relation_));
            break;
        case SaveMode::Append:
            engine_->run(fmt::format("CREATE TABLE IF NOT EXISTS {} AS SELECT * FROM {} LIMIT 0",
                                     target, relation_));
            engine_->run(fmt::format("INSERT INTO {} SELECT * FROM {}", target, relation_));
            break;
        case SaveMode::ErrorIfExists:
            engine_->run(fmt::format("CREATE TABLE {} AS SELECT * FROM {}", target, relation_));
            break;
        case SaveMode::Ignore:
            engine_->run(fmt::format("CREATE TABLE IF NOT EXISTS {} AS SELECT * FROM {}",
                                     target, relation_));
            break;
    }
    log::logger()->debug("saved {} as {}", describe(), name);
}

std::string DuckDbTable::to_text(std::size_t n) const {
    const Schema fields = schema();
    const auto rows = limit(n)->collect_rows();

    std::vector<std::vector<std::string>> grid;
    grid.reserve(rows.size() + 1);
    grid.push_back(fields.names());
    for (const auto& row : rows) {
        std::vector<std::string> line;
        line.reserve(row.size());
        for (const auto& cell : row) {
            line.push_back(cell ? value_text(*cell) : "NULL");
        }
        grid.push_back(std::move(line));
    }

    std::vector<std::size_t> widths(fields.size(), 0);
    for (const auto& line : grid) {
        for (std::size_t c = 0; c < line.size(); ++c) {
            widths[c] = std::max(widths[c], line[c].size());
        }
    }

    auto render = [&](const std::vector<std::string>& line) {
        std::vector<std::string> padded;
        padded.reserve(line.size());
        for (std::size_t c = 0; c < line.size(); ++c) {
            padded.push_back(fmt::format("{:<{}}", line[c], widths[c]));
        }
        return fmt::format("|{}|\n", fmt::join(padded, "|"));
    };

    std::vector<std::string> rule;
    rule.reserve(widths.size());
    for (auto width : widths) rule.emplace_back(width, '-');

    std::string out = render(grid.front());
    out += render(rule);
    for (std::size_t i = 1; i < grid.size(); ++i) {
        out += render(grid[i]);
    }
    return out;
}

void DuckDbTable::show(std::size_t n) const {
    fmt::print("{}", to_text(n));
}

// ---------------------------------------------------------------------------
// DuckDbGroupedTable
// ---------------------------------------------------------------------------

std::shared_ptr<DuckDbTable> DuckDbGroupedTable::agg(std::span<const Aggregate> aggregates) const {
    if (aggregates.empty()) {
        throw UnsupportedOperationError("Aggregation requires at least one aggregate");
    }

    std::vector<std::string> outputs = columns_;
    outputs.reserve(columns_.size() + aggregates.size());
    for (const auto& aggregate : aggregates) {
        if (!is_identifier(aggregate.function)) {
            throw UnsupportedOperationError(
                fmt::format("Invalid aggregate function: '{}'", aggregate.function));
        }
        const std::string function = upper(aggregate.function);
        const bool all_rows = aggregate.key == "*";
        const std::string argument = all_rows ? "*" : source_->keys_.encode(aggregate.key);
        const std::string expression =
            all_rows ? "*" : source_->column(argument).expression();
        // Named as the quoted aggregate, e.g. "COUNT(DEPT)" including the quotes
        outputs.push_back(fmt::format(
            "{}({}) AS {}", function, expression,
            sql::quote_identifier(fmt::format("\"{}({})\"", function, argument))));
    }

    const std::string& relation = source_->relation_;
    if (columns_.empty()) {
        return source_->derive(
            fmt::format("(SELECT {} FROM {})", fmt::join(outputs, ", "), relation));
    }
    return source_->derive(fmt::format("(SELECT {} FROM {} GROUP BY {})",
                                       fmt::join(outputs, ", "), relation,
                                       fmt::join(columns_, ", ")));
}

// ---------------------------------------------------------------------------
// DuckDbSession
// ---------------------------------------------------------------------------

DuckDbSession::DuckDbSession(const SessionConfig& config)
    : DuckDbSession(config, configured_keys(config)) {}

DuckDbSession::DuckDbSession(const SessionConfig& config, KeyMapper keys)
    : engine_(open_engine(config)), keys_(std::move(keys)) {}

DuckDbSession::~DuckDbSession() = default;

std::expected<std::unique_ptr<DuckDbSession>, Error>
DuckDbSession::create(const SessionConfig& config) {
    try {
        return std::make_unique<DuckDbSession>(config);
    } catch (const Exception& e) {
        return std::unexpected(e.error());
    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorCode::EngineError, e.what()});
    }
}

std::shared_ptr<DuckDbTable> DuckDbSession::create_records(std::span<const Record> records) {
    const Schema schema = infer_schema(records, keys_.encode);
    return create_records(records, schema);
}

std::shared_ptr<DuckDbTable> DuckDbSession::create_records(std::span<const Record> records,
                                                           const Schema& schema) {
    if (records.empty()) {
        throw EmptyInputError("Cannot create a table from empty data");
    }
    const auto rows = records_to_rows(records, schema, keys_.encode);
    return create_records(std::span<const Row>(rows), schema);
}

std::shared_ptr<DuckDbTable> DuckDbSession::create_records(std::span<const Row> rows,
                                                           const Schema& schema) {
    if (rows.empty()) {
        throw EmptyInputError("Cannot create a table from empty data");
    }
    if (schema.empty()) {
        throw InvalidSchemaError("Cannot create a table with no fields");
    }
    check_rows(rows, schema);

    const std::string name = fmt::format("rowkit_records_{}", ++engine_->temp_tables);
    const std::string target = sql::quote_identifier(name);
    engine_->run(fmt::format("CREATE TEMP TABLE {} ({})", target, column_definitions(schema)));

    for (std::size_t begin = 0; begin < rows.size(); begin += kInsertBatchRows) {
        const std::size_t end = std::min(rows.size(), begin + kInsertBatchRows);
        std::vector<std::string> values;
        values.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            values.push_back(row_literal(rows[i], schema));
        }
        engine_->run(fmt::format("INSERT INTO {} VALUES {}", target, fmt::join(values, ", ")));
    }

    log::logger()->debug("stored {} rows in {}", rows.size(), name);
    return std::shared_ptr<DuckDbTable>(new DuckDbTable(engine_, keys_, target, name, true));
}

std::shared_ptr<DuckDbTable> DuckDbSession::table(std::string_view name) const {
    return std::shared_ptr<DuckDbTable>(
        new DuckDbTable(engine_, keys_, sql::quote_qualified(name), std::string(name), true));
}

std::shared_ptr<DuckDbTable> DuckDbSession::sql(std::string_view query) const {
    return std::shared_ptr<DuckDbTable>(
        new DuckDbTable(engine_, keys_, fmt::format("({})", query), "query", false));
}

TableView DuckDbSession::view(std::shared_ptr<const ITable> table) const {
    return TableView(std::move(table), keys_);
}

}  // namespace rowkit
