#include "sqlxfer/error.h"
#include "sqlxfer/identifier.h"

#include <gtest/gtest.h>

using namespace sqlxfer;

TEST(QualifiedNameTest, BareNameDefaultsToDbo) {
    QualifiedName qn = parse_qualified_name("Orders");
    EXPECT_EQ(qn.schema_name, "dbo");
    EXPECT_EQ(qn.name, "Orders");
    EXPECT_EQ(qn.quoted(), "[dbo].[Orders]");
    EXPECT_EQ(qn.display(), "dbo.Orders");
}

TEST(QualifiedNameTest, SchemaQualified) {
    QualifiedName qn = parse_qualified_name(" sales . Orders ");
    EXPECT_EQ(qn.schema_name, "sales");
    EXPECT_EQ(qn.name, "Orders");
}

TEST(QualifiedNameTest, BracketedPartsMayContainDotsAndBrackets) {
    QualifiedName qn = parse_qualified_name("[my.schema].[Order]]s]");
    EXPECT_EQ(qn.schema_name, "my.schema");
    EXPECT_EQ(qn.name, "Order]s");
    EXPECT_EQ(qn.quoted(), "[my.schema].[Order]]s]");
}

TEST(QualifiedNameTest, EmptySchemaPartFallsBackToDbo) {
    EXPECT_EQ(parse_qualified_name(".Orders").schema_name, "dbo");
}

TEST(QualifiedNameTest, InvalidNamesAreConfigErrors) {
    EXPECT_THROW(parse_qualified_name(""), ConfigError);
    EXPECT_THROW(parse_qualified_name("   "), ConfigError);
    EXPECT_THROW(parse_qualified_name("dbo."), ConfigError);
    EXPECT_THROW(parse_qualified_name("Sales.dbo.Orders"), ConfigError);
    EXPECT_THROW(parse_qualified_name("[dbo"), ConfigError);
}

TEST(QuotingTest, Identifier) {
    EXPECT_EQ(quote_identifier("Orders"), "[Orders]");
    EXPECT_EQ(quote_identifier("a]b"), "[a]]b]");
    EXPECT_EQ(quote_identifier(""), "[]");
}

TEST(QuotingTest, UnicodeLiteral) {
    EXPECT_EQ(quote_nliteral("[dbo].[Orders]"), "N'[dbo].[Orders]'");
    EXPECT_EQ(quote_nliteral("O'Brien"), "N'O''Brien'");
}

TEST(TrimQueryTest, StripsWhitespaceAndTerminators) {
    EXPECT_EQ(trim_query("  SELECT 1 ;  ; \n"), "SELECT 1");
    EXPECT_EQ(trim_query("SELECT 'a;b' AS x"), "SELECT 'a;b' AS x");
    EXPECT_EQ(trim_query(" ; "), "");
}
