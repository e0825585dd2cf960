#include <gtest/gtest.h>
#include <tabula/StatementReader.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace tabula;

static std::vector<std::string> readAll(const std::string& input) {
    std::istringstream in(input);
    StatementReader reader(in);
    std::vector<std::string> out;
    while (auto st = reader.next())
        out.push_back(*st);
    return out;
}

TEST(StatementReader, SplitsOnSemicolonAndNewline) {
    const auto got = readAll("CREATE TABLE t (a INT); INSERT INTO t VALUES (1)\nSELECT * FROM t;\n");
    const std::vector<std::string> expected = {"CREATE TABLE t (a INT)", "INSERT INTO t VALUES (1)",
                                               "SELECT * FROM t"};
    EXPECT_EQ(got, expected);
}

TEST(StatementReader, SkipsEmptyStatements) {
    const auto got = readAll(";;\n\n   \nSELECT * FROM t;;\n");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "SELECT * FROM t");
}

TEST(StatementReader, TerminatorsInsideLiteralsDoNotSplit) {
    const auto got = readAll("INSERT INTO t VALUES ('a;b', 'it''s\nfine');\n");
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], "INSERT INTO t VALUES ('a;b', 'it''s\nfine')");
}

TEST(StatementReader, StripsComments) {
    const auto got = readAll("-- header comment\n"
                             "SELECT * /* all\ncolumns; really */ FROM t -- trailing\n"
                             "INSERT INTO t VALUES ('--not a comment')\n");
    const std::vector<std::string> expected = {"SELECT *  FROM t",
                                               "INSERT INTO t VALUES ('--not a comment')"};
    EXPECT_EQ(got, expected);
}

TEST(StatementReader, ReturnsTrailingTextAtEof) {
    const auto got = readAll("SELECT * FROM a;SELECT * FROM b");
    const std::vector<std::string> expected = {"SELECT * FROM a", "SELECT * FROM b"};
    EXPECT_EQ(got, expected);
}

TEST(StatementReader, EmptyInput) {
    std::istringstream in("  -- nothing here\n");
    StatementReader reader(in);
    EXPECT_EQ(reader.next(), std::nullopt);
    EXPECT_FALSE(reader.readsFromCin());
}
