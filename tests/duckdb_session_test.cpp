// SPDX-License-Identifier: MIT

// tests/duckdb_session_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "rowkit/duckdb_session.hpp"
#include "rowkit/error.hpp"
#include "rowkit/schema_resolver.hpp"
#include "rowkit/type_spec.hpp"

using namespace rowkit;

namespace {

Schema people_schema() {
    return Schema({
        Field{"ID", DataType::integer(), false},
        Field{"AGE", DataType::integer(), true},
    });
}

std::vector<Record> people() {
    return {
        Record{{"id", int64_t{1}}, {"name", std::string("ada")}, {"age", int64_t{36}}},
        Record{{"id", int64_t{2}}, {"name", std::string("alan")}, {"age", int64_t{41}}},
        Record{{"id", int64_t{3}}, {"name", std::string("grace")}, {"age", int64_t{29}}},
    };
}

}  // namespace

TEST(DuckDbSessionTest, CreatesInMemorySession) {
    auto session = DuckDbSession::create();
    ASSERT_TRUE(session.has_value()) << session.error().message;
    EXPECT_EQ((*session)->keys().name, "upper-lower");
}

TEST(DuckDbSessionTest, CreateReportsInvalidConfig) {
    SessionConfig config;
    config.threads = -1;
    auto session = DuckDbSession::create(config);
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().code, ErrorCode::InvalidConfig);
}

TEST(DuckDbSessionTest, ConstructorThrowsOnInvalidConfig) {
    SessionConfig config;
    config.key_convention = "camel";
    EXPECT_THROW(DuckDbSession{config}, Exception);
}

TEST(DuckDbSessionTest, EndToEndMissingOptionalKey) {
    DuckDbSession session;
    std::vector<Record> records{Record{{"id", int64_t{1}}}};

    auto table = session.create_records(records, people_schema());
    auto back = table->collect();

    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0], (Record{{"id", int64_t{1}}}));
    EXPECT_FALSE(back[0].contains("age"));
}

TEST(DuckDbSessionTest, InferredSchemaRoundTrip) {
    DuckDbSession session;
    auto records = people();
    auto table = session.create_records(records);

    auto schema = table->schema();
    EXPECT_EQ(schema.names(), (std::vector<std::string>{"ID", "NAME", "AGE"}));
    for (const auto& field : schema) {
        EXPECT_TRUE(field.nullable) << field.name;
    }

    auto sorted = table->sort(std::vector<std::string>{"id"})->collect();
    EXPECT_EQ(sorted, records);
}

TEST(DuckDbSessionTest, DerivedSchemaKeepsRequiredness) {
    DuckDbSession session;
    auto spec = TypeSpec::record({
        FieldSpec{"id", TypeSpec::scalar("int")},
        FieldSpec{"age", TypeSpec::scalar("int"), true},
    });
    auto schema = derive_schema(spec, session.keys().encode);

    std::vector<Record> records{Record{{"id", int64_t{9}}}};
    auto table = session.create_records(records, schema);

    auto stored = table->schema();
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_FALSE(stored[0].nullable);
    EXPECT_TRUE(stored[1].nullable);
}

TEST(DuckDbSessionTest, AllScalarTypesSurviveStorage) {
    DuckDbSession session;
    std::vector<Record> records{Record{
        {"id", int64_t{-7}},
        {"score", 0.1},
        {"balance", Decimal{"12.50"}},
        {"active", true},
        {"joined", Date(2024, 2, 29)},
        {"seen", Timestamp{1700000000123456}},
        {"name", std::string("O'Brien")},
    }};

    auto back = session.create_records(records)->collect();
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0], records[0]);
    EXPECT_EQ(std::get<Decimal>(*back[0].find("balance")).text, "12.5");
}

TEST(DuckDbSessionTest, SymbolsStoredAsStrings) {
    DuckDbSession session;
    Schema schema({Field{"STATUS", DataType::string(), true}});
    std::vector<Record> records{Record{{"status", Symbol{"active"}}}};

    auto back = session.create_records(records, schema)->collect();
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(*back[0].find("status"), Value{std::string("active")});
}

TEST(DuckDbSessionTest, EmptyInputRejected) {
    DuckDbSession session;
    std::vector<Record> none;
    EXPECT_THROW(session.create_records(none), EmptyInputError);
    EXPECT_THROW(session.create_records(none, people_schema()), EmptyInputError);
}

TEST(DuckDbSessionTest, MissingRequiredValueRejected) {
    DuckDbSession session;
    std::vector<Record> records{Record{{"age", int64_t{3}}}};
    EXPECT_THROW(session.create_records(records, people_schema()), SchemaMismatchError);
}

TEST(DuckDbSessionTest, RowsWithWrongTypesRejected) {
    DuckDbSession session;
    std::vector<Row> rows{Row{Value{std::string("one")}, std::nullopt}};
    try {
        session.create_records(rows, people_schema());
        FAIL() << "expected SchemaMismatchError";
    } catch (const SchemaMismatchError& e) {
        EXPECT_NE(std::string(e.what()).find("row 0: ID expected Integer, got string"),
                  std::string::npos)
            << e.what();
    }
}

TEST(DuckDbSessionTest, StoresPositionedRows) {
    DuckDbSession session;
    std::vector<Row> rows{
        Row{Value{int64_t{1}}, Value{int64_t{20}}},
        Row{Value{int64_t{2}}, std::nullopt},
    };
    auto table = session.create_records(rows, people_schema());
    EXPECT_EQ(table->count(), 2);
    EXPECT_EQ(table->sort(std::vector<std::string>{"id"})->collect_rows(), rows);
}

TEST(DuckDbSessionTest, SelectSortLimit) {
    DuckDbSession session;
    auto records = people();
    auto table = session.create_records(records);

    auto youngest = table->sort(std::vector<std::string>{"age"})
                        ->select(std::vector<std::string>{"name"})
                        ->take(2);
    ASSERT_EQ(youngest.size(), 2u);
    EXPECT_EQ(youngest[0], (Record{{"name", std::string("grace")}}));
    EXPECT_EQ(youngest[1], (Record{{"name", std::string("ada")}}));

    EXPECT_EQ(table->limit(1)->count(), 1);
}

TEST(DuckDbSessionTest, SqlQueryHandle) {
    DuckDbSession session;
    auto table = session.sql("SELECT 42::BIGINT AS \"ANSWER\", 'x' AS \"LABEL\"");
    EXPECT_EQ(table->describe(), "DuckDbTable[query]");

    auto records = table->collect();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{{"answer", int64_t{42}}, {"label", std::string("x")}}));
}

TEST(DuckDbSessionTest, EngineErrorsSurface) {
    DuckDbSession session;
    EXPECT_THROW(session.table("no_such_table")->schema(), EngineError);
    EXPECT_THROW(session.sql("SELEC 1")->collect(), EngineError);
}

TEST(DuckDbSessionTest, SaveModes) {
    DuckDbSession session;
    auto records = people();
    auto table = session.create_records(records);

    table->save_as_table("PEOPLE", SaveMode::ErrorIfExists);
    EXPECT_EQ(session.table("PEOPLE")->count(), 3);

    EXPECT_THROW(table->save_as_table("PEOPLE", SaveMode::ErrorIfExists), EngineError);

    table->save_as_table("PEOPLE", SaveMode::Ignore);
    EXPECT_EQ(session.table("PEOPLE")->count(), 3);

    table->save_as_table("PEOPLE", SaveMode::Append);
    EXPECT_EQ(session.table("PEOPLE")->count(), 6);

    table->limit(1)->save_as_table("PEOPLE", SaveMode::Overwrite);
    EXPECT_EQ(session.table("PEOPLE")->count(), 1);

    table->save_as_table("ARCHIVE", SaveMode::Append);
    EXPECT_EQ(session.table("ARCHIVE")->count(), 3);
}

TEST(DuckDbSessionTest, ConfiguredSchemaIsCurrent) {
    SessionConfig config;
    config.schema = "staging";
    DuckDbSession session(config);

    auto table = session.create_records(people());
    table->save_as_table("PEOPLE");
    EXPECT_EQ(session.table("staging.PEOPLE")->count(), 3);
}

TEST(DuckDbSessionTest, ViewOverQueryHandle) {
    DuckDbSession session;
    auto table = session.sql("SELECT 1::BIGINT AS \"DEPT\", 2::BIGINT AS \"\"\"COUNT(DEPT)\"\"\"");
    auto view = session.view(table);

    EXPECT_EQ(view.size(), 2u);
    EXPECT_EQ(view.keys(), (std::vector<std::string>{"dept", "count-dept"}));

    auto dept = view["dept"];
    ASSERT_TRUE(dept.has_value());
    EXPECT_EQ(dept->expression(), "\"DEPT\"");
    EXPECT_FALSE(view["salary"].has_value());
}

TEST(DuckDbSessionTest, ExplicitKeyMapper) {
    DuckDbSession session(SessionConfig{}, identity_keys());
    std::vector<Record> records{Record{{"Total", int64_t{10}}}};
    auto table = session.create_records(records);
    EXPECT_EQ(table->schema().names(), (std::vector<std::string>{"Total"}));
    EXPECT_EQ(table->collect(), records);
}

TEST(DuckDbSessionTest, PersistsToFile) {
    auto path = std::filesystem::temp_directory_path() / "rowkit_session_test.duckdb";
    std::filesystem::remove(path);

    SessionConfig config;
    config.database = path.string();
    {
        DuckDbSession session(config);
        session.create_records(people())->save_as_table("PEOPLE");
    }

    config.read_only = true;
    {
        DuckDbSession session(config);
        EXPECT_EQ(session.table("PEOPLE")->count(), 3);
        EXPECT_THROW(session.table("PEOPLE")->save_as_table("COPY"), EngineError);
    }
    std::filesystem::remove(path);
}

namespace {

std::vector<Record> staff() {
    return {
        Record{{"id", int64_t{1}}, {"dept", std::string("eng")}, {"salary", int64_t{120}}},
        Record{{"id", int64_t{2}}, {"dept", std::string("eng")}, {"salary", int64_t{100}}},
        Record{{"id", int64_t{3}}, {"dept", std::string("ops")}, {"salary", int64_t{90}}},
    };
}

}  // namespace

TEST(DuckDbSessionTest, WhereFiltersWithViewColumns) {
    DuckDbSession session;
    auto table = session.create_records(people());
    auto view = session.view(table);

    auto older = table->where(fmt::format("{} > 30", view["age"]->expression()))
                     ->sort(std::vector<std::string>{"id"})
                     ->select(std::vector<std::string>{"name"})
                     ->collect();
    EXPECT_EQ(older, (std::vector<Record>{Record{{"name", std::string("ada")}},
                                          Record{{"name", std::string("alan")}}}));
}

TEST(DuckDbSessionTest, GroupByAggregateIsAddressedByNormalizedKey) {
    DuckDbSession session;
    auto table = session.create_records(staff());

    std::vector<Aggregate> aggregates{{"count", "id"}, {"sum", "salary"}};
    auto grouped = table->group_by(std::vector<std::string>{"dept"})
                       .agg(aggregates)
                       ->sort(std::vector<std::string>{"dept"});

    EXPECT_EQ(grouped->schema().names(),
              (std::vector<std::string>{"DEPT", "\"COUNT(ID)\"", "\"SUM(SALARY)\""}));

    auto view = session.view(grouped);
    EXPECT_EQ(view.keys(), (std::vector<std::string>{"dept", "count-id", "sum-salary"}));
    auto count = view["count-id"];
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(count->name(), "\"COUNT(ID)\"");

    auto eng = grouped->where(fmt::format("{} = 2", count->expression()))->collect_rows();
    ASSERT_EQ(eng.size(), 1u);
    EXPECT_EQ(eng[0][0], Cell{Value{std::string("eng")}});
}

TEST(DuckDbSessionTest, AggregateOverWholeTable) {
    DuckDbSession session;
    auto table = session.create_records(staff());

    std::vector<Aggregate> aggregates{{"COUNT", "*"}, {"max", "salary"}};
    auto rows = table->agg(aggregates)->collect_rows();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (Row{Value{int64_t{3}}, Value{int64_t{120}}}));

    auto view = session.view(table->agg(aggregates));
    EXPECT_TRUE(view.contains("count-*"));
    EXPECT_TRUE(view.contains("max-salary"));
}

TEST(DuckDbSessionTest, AggregateRejectsBadInput) {
    DuckDbSession session;
    auto table = session.create_records(staff());

    EXPECT_THROW(table->agg(std::vector<Aggregate>{}), UnsupportedOperationError);
    std::vector<Aggregate> injected{{"count(*)); DROP TABLE x; --", "id"}};
    EXPECT_THROW(table->agg(injected), UnsupportedOperationError);
}

TEST(DuckDbSessionTest, JoinOnSharedKey) {
    DuckDbSession session;
    auto left = session.create_records(people());
    std::vector<Record> badges{
        Record{{"id", int64_t{1}}, {"badge", std::string("A-1")}},
        Record{{"id", int64_t{3}}, {"badge", std::string("C-3")}},
    };
    auto right = session.create_records(badges);
    const std::vector<std::string> on{"id"};

    auto inner = left->join(*right, on)->sort(on);
    EXPECT_EQ(inner->schema().names(), (std::vector<std::string>{"ID", "NAME", "AGE", "BADGE"}));
    auto joined = inner->collect();
    ASSERT_EQ(joined.size(), 2u);
    EXPECT_EQ(joined[1], (Record{{"id", int64_t{3}},
                                 {"name", std::string("grace")},
                                 {"age", int64_t{29}},
                                 {"badge", std::string("C-3")}}));

    auto outer = left->join(*right, on, JoinType::Left)->sort(on)->collect();
    ASSERT_EQ(outer.size(), 3u);
    EXPECT_FALSE(outer[1].contains("badge"));
}

TEST(DuckDbSessionTest, JoinRejectsMisuse) {
    DuckDbSession session;
    DuckDbSession other;
    auto left = session.create_records(people());
    auto right = other.create_records(people());

    const std::vector<std::string> on{"id"};
    EXPECT_THROW(left->join(*right, on), UnsupportedOperationError);
    EXPECT_THROW(left->join(*left, std::vector<std::string>{}), UnsupportedOperationError);
}

TEST(DuckDbSessionTest, TextGridShowsFirstRows) {
    DuckDbSession session;
    std::vector<Record> records{
        Record{{"id", int64_t{1}}, {"name", std::string("ada")}},
        Record{{"id", int64_t{20}}},
    };
    Schema schema({Field{"ID", DataType::integer(), false},
                   Field{"NAME", DataType::string(), true}});
    auto table = session.create_records(records, schema)->sort(std::vector<std::string>{"id"});

    EXPECT_EQ(table->to_text(),
              "|ID|NAME|\n"
              "|--|----|\n"
              "|1 |ada |\n"
              "|20|NULL|\n");
    EXPECT_EQ(table->to_text(1),
              "|ID|NAME|\n"
              "|--|----|\n"
              "|1 |ada |\n");
}
