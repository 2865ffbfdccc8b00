#include <gtest/gtest.h>

#include "../src/common/Errors.hpp"
#include "../src/validator/RowValidator.hpp"
#include "TestSupport.hpp"

using namespace BulkBridge;

TEST(RowValidatorTest, AcceptsWellFormedRows)
{
    for (const auto &row : order_rows(20))
        EXPECT_TRUE(RowValidator::validate(row, order_schema()).valid) << to_debug_string(row);
}

TEST(RowValidatorTest, RequiredColumnMustBeSet)
{
    auto result = RowValidator::validate(TableRow{{"customer", std::string("x")}}, order_schema());
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.reason, "NULL in REQUIRED column 'order_id'");
}

TEST(RowValidatorTest, UnknownColumnIsRejected)
{
    auto result = RowValidator::validate(TableRow{{"order_id", int64_t{1}}, {"coupon", std::string("X")}}, order_schema());
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.reason, "Unknown column: 'coupon'");
}

TEST(RowValidatorTest, TypesMustMatchButIntegersWidenToFloat)
{
    EXPECT_TRUE(RowValidator::validate(TableRow{{"order_id", int64_t{1}}, {"amount", int64_t{5}}}, order_schema()).valid);

    auto wrong = RowValidator::validate(TableRow{{"order_id", int64_t{1}}, {"priority", std::string("yes")}}, order_schema());
    EXPECT_FALSE(wrong.valid);
    EXPECT_EQ(wrong.reason, "Column 'priority' expects BOOLEAN");

    EXPECT_FALSE(RowValidator::validate(TableRow{{"order_id", 1.5}}, order_schema()).valid);
}

TEST(RowValidatorTest, SchemaChecks)
{
    EXPECT_TRUE(RowValidator::validate_schema(order_schema()).valid);
    EXPECT_FALSE(RowValidator::validate_schema(TableSchema{}).valid);

    TableSchema bad_name;
    bad_name.fields = {{"1st", FieldType::String}};
    EXPECT_EQ(RowValidator::validate_schema(bad_name).reason, "Invalid column name: '1st'");

    TableSchema duplicate;
    duplicate.fields = {{"a", FieldType::String}, {"a", FieldType::Integer}};
    EXPECT_EQ(RowValidator::validate_schema(duplicate).reason, "Duplicate column name: 'a'");

    EXPECT_TRUE(RowValidator::is_valid_column_name("_private"));
    EXPECT_FALSE(RowValidator::is_valid_column_name("has space"));
}

TEST(RowValidatorTest, BatchPolicy)
{
    auto rows = order_rows(5);
    rows.insert(rows.begin() + 2, TableRow{{"amount", 1.0}});

    EXPECT_THROW((void)RowValidator::validate_batch(rows, order_schema(), InvalidRowPolicy::Reject), ValidationError);

    auto kept = RowValidator::validate_batch(rows, order_schema(), InvalidRowPolicy::Drop);
    EXPECT_EQ(kept, order_rows(5));
}
