#include <gtest/gtest.h>

#include "../src/common/Errors.hpp"
#include "../src/model/TableReference.hpp"

using namespace BulkBridge;

TEST(TableReferenceTest, ParsesFullSpec)
{
    auto ref = parse_table_spec("my-project:sales_data.orders_2024");
    EXPECT_EQ(ref.project_id, "my-project");
    EXPECT_EQ(ref.dataset_id, "sales_data");
    EXPECT_EQ(ref.table_id, "orders_2024");
    EXPECT_EQ(to_table_spec(ref), "my-project:sales_data.orders_2024");
}

TEST(TableReferenceTest, ProjectIsOptional)
{
    auto ref = parse_table_spec("sales_data.orders");
    EXPECT_FALSE(ref.has_project());
    EXPECT_EQ(ref.dataset_id, "sales_data");
    EXPECT_EQ(ref.table_id, "orders");
    EXPECT_EQ(to_table_spec(ref), "sales_data.orders");
}

TEST(TableReferenceTest, DefaultProjectFillsOnlyWhenUnset)
{
    auto bare = parse_table_spec("ds.t");
    EXPECT_EQ(bare.with_default_project("fallback-proj").project_id, "fallback-proj");

    auto qualified = parse_table_spec("owner-proj:ds.t");
    EXPECT_EQ(qualified.with_default_project("fallback-proj").project_id, "owner-proj");
}

TEST(TableReferenceTest, TableIdAllowsDollarAndAt)
{
    auto ref = parse_table_spec("ds.events$20240301");
    EXPECT_EQ(ref.table_id, "events$20240301");
}

TEST(TableReferenceTest, RejectsMalformedSpecs)
{
    EXPECT_THROW((void)parse_table_spec("no_dot_here"), ConfigurationError);
    EXPECT_THROW((void)parse_table_spec(""), ConfigurationError);
    EXPECT_THROW((void)parse_table_spec("ds."), ConfigurationError);
    EXPECT_THROW((void)parse_table_spec("Upper:ds.t"), ConfigurationError);

    EXPECT_FALSE(is_valid_table_spec("a b.c"));
    EXPECT_TRUE(is_valid_table_spec("project-x:ds.t"));
}

TEST(TableReferenceTest, ErrorNamesTheExpectedFormat)
{
    try
    {
        (void)parse_table_spec("bad spec");
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError &e)
    {
        EXPECT_NE(std::string(e.what()).find("[project_id]:[dataset_id].[table_id]"), std::string::npos);
    }
}
