// SPDX-License-Identifier: MIT

// tests/record_converter_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rowkit/error.hpp"
#include "rowkit/key_mapper.hpp"
#include "rowkit/record_converter.hpp"
#include "rowkit/schema_resolver.hpp"

using namespace rowkit;

namespace {

// {id: Integer, required}, {age: Integer, optional}
Schema people_schema() {
    return Schema({
        Field{"ID", DataType::integer(), false},
        Field{"AGE", DataType::integer(), true},
    });
}

}  // namespace

TEST(RecordConverterTest, EndToEndMissingOptionalKey) {
    auto keys = upper_lower_keys();
    auto schema = people_schema();
    Record record{{"id", int64_t{1}}};

    auto row = record_to_row(record, schema, keys.encode);
    ASSERT_EQ(row.size(), 2u);
    EXPECT_EQ(row[0], Cell{Value{int64_t{1}}});
    EXPECT_FALSE(row[1].has_value());

    auto back = row_to_record(row, schema, keys.decode);
    EXPECT_EQ(back, record);
    EXPECT_FALSE(back.contains("age"));
}

TEST(RecordConverterTest, RoundTripReproducesKeySet) {
    auto keys = upper_lower_keys();
    Schema schema({
        Field{"ID", DataType::integer(), false},
        Field{"NAME", DataType::string(), true},
        Field{"SCORE", DataType::float64(), true},
        Field{"JOINED", DataType::date(), true},
        Field{"SEEN", DataType::timestamp(), true},
        Field{"BALANCE", DataType::decimal(), true},
        Field{"ACTIVE", DataType::boolean(), true},
    });
    Record record{
        {"id", int64_t{7}},
        {"name", std::string("ada")},
        {"score", 9.25},
        {"joined", Date(2024, 2, 29)},
        {"seen", Timestamp{1700000000000000}},
        {"balance", Decimal{"12.50"}},
        {"active", false},
    };

    auto back = row_to_record(record_to_row(record, schema, keys.encode), schema, keys.decode);
    EXPECT_EQ(back, record);
}

TEST(RecordConverterTest, RowFollowsSchemaOrderNotRecordOrder) {
    auto keys = upper_lower_keys();
    auto schema = people_schema();
    Record record{{"age", int64_t{30}}, {"id", int64_t{2}}};

    auto row = record_to_row(record, schema, keys.encode);
    EXPECT_EQ(row, (Row{Value{int64_t{2}}, Value{int64_t{30}}}));
}

TEST(RecordConverterTest, ExtraKeysIgnored) {
    auto keys = upper_lower_keys();
    Record record{{"id", int64_t{1}}, {"nickname", std::string("x")}};
    auto row = record_to_row(record, people_schema(), keys.encode);
    EXPECT_EQ(row.size(), 2u);
}

TEST(RecordConverterTest, MatchIsCaseInsensitive) {
    // encode is identity, field names are upper case
    auto keys = identity_keys();
    Record record{{"Id", int64_t{5}}};
    auto row = record_to_row(record, people_schema(), keys.encode);
    EXPECT_EQ(row[0], Cell{Value{int64_t{5}}});
}

TEST(RecordConverterTest, CollidingKeysLastWins) {
    auto keys = identity_keys();
    Record record{{"id", int64_t{1}}, {"ID", int64_t{2}}};
    auto row = record_to_row(record, people_schema(), keys.encode);
    EXPECT_EQ(row[0], Cell{Value{int64_t{2}}});
}

TEST(RecordConverterTest, SymbolsBecomePlainStrings) {
    Schema schema({Field{"STATUS", DataType::string(), true}});
    Record record{{"status", Symbol{"active"}}};
    auto row = record_to_row(record, schema, upper_lower_keys().encode);
    EXPECT_EQ(row[0], Cell{Value{std::string("active")}});
    EXPECT_EQ(to_storage_value(Value{int64_t{3}}), Value{int64_t{3}});
}

TEST(RecordConverterTest, IdentityMapperKeepsNames) {
    auto keys = identity_keys();
    Record record{{"Total", int64_t{10}}};
    auto schema = infer_schema(record, keys.encode);
    EXPECT_EQ(schema[0].name, "Total");

    auto back = row_to_record(record_to_row(record, schema, keys.encode), schema, keys.decode);
    EXPECT_EQ(back, record);
}

TEST(RecordConverterTest, UsesSuppliedFunctionsEvenWhenNotInverse) {
    // decode is deliberately not the inverse of encode
    EncodeFn encode = [](std::string_view k) { return "c_" + std::string(k); };
    DecodeFn decode = [](std::string_view n) { return "k_" + std::string(n); };

    Record record{{"x", int64_t{1}}};
    auto schema = infer_schema(record, encode);
    EXPECT_EQ(schema[0].name, "c_x");

    auto row = record_to_row(record, schema, encode);
    EXPECT_EQ(row[0], Cell{Value{int64_t{1}}});

    auto back = row_to_record(row, schema, decode);
    EXPECT_TRUE(back.contains("k_c_x"));
    EXPECT_FALSE(back.contains("x"));
}

TEST(RecordConverterTest, NullSlotsOmitted) {
    Schema schema({Field{"A", DataType::integer(), true}, Field{"B", DataType::integer(), true}});
    auto back = row_to_record(Row{std::nullopt, std::nullopt}, schema, upper_lower_keys().decode);
    EXPECT_TRUE(back.empty());
}

TEST(RecordConverterTest, RowLengthMismatchThrows) {
    EXPECT_THROW(row_to_record(Row{Value{int64_t{1}}}, people_schema(), upper_lower_keys().decode),
                 SchemaMismatchError);
}

TEST(RecordConverterTest, BatchPreservesOrder) {
    auto keys = upper_lower_keys();
    auto schema = people_schema();
    std::vector<Record> records{
        Record{{"id", int64_t{1}}},
        Record{{"id", int64_t{2}}, {"age", int64_t{20}}},
        Record{{"id", int64_t{3}}},
    };

    auto rows = records_to_rows(records, schema, keys.encode);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1], (Row{Value{int64_t{2}}, Value{int64_t{20}}}));

    auto back = rows_to_records(rows, schema, keys.decode);
    EXPECT_EQ(back, records);
}

TEST(ValidateRowTest, FittingRowHasNoMismatches) {
    Row row{Value{int64_t{1}}, std::nullopt};
    EXPECT_TRUE(validate_row(row, people_schema()).empty());
}

TEST(ValidateRowTest, NullInRequiredField) {
    Row row{std::nullopt, Value{int64_t{3}}};
    auto mismatches = validate_row(row, people_schema());
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0], (SchemaMismatch{"ID", "Integer", "(null)"}));
}

TEST(ValidateRowTest, WrongType) {
    Row row{Value{std::string("one")}, Value{1.5}};
    auto mismatches = validate_row(row, people_schema());
    ASSERT_EQ(mismatches.size(), 2u);
    EXPECT_EQ(mismatches[0], (SchemaMismatch{"ID", "Integer", "string"}));
    EXPECT_EQ(mismatches[1], (SchemaMismatch{"AGE", "Integer", "double"}));
}

TEST(ValidateRowTest, ArityMismatch) {
    auto mismatches = validate_row(Row{Value{int64_t{1}}}, people_schema());
    ASSERT_EQ(mismatches.size(), 1u);
    EXPECT_EQ(mismatches[0], (SchemaMismatch{"(row)", "2 cells", "1 cells"}));
}

TEST(ValidateRowTest, IntegersWidenToDoubleAndDecimal) {
    EXPECT_TRUE(is_assignable(Value{int64_t{1}}, DataType::float64()));
    EXPECT_TRUE(is_assignable(Value{int64_t{1}}, DataType::decimal()));
    EXPECT_FALSE(is_assignable(Value{1.0}, DataType::integer()));
    EXPECT_FALSE(is_assignable(Value{true}, DataType::integer()));
    EXPECT_FALSE(is_assignable(Value{Symbol{"a"}}, DataType::string()));
}
