#include <gtest/gtest.h>
#include <tabula/Database.h>
#include <tabula/Errors.h>
#include <tabula/Row.h>
#include <tabula/Schema.h>
#include <tabula/Statement.h>
#include <tabula/StatementExecutor.h>
#include <tabula/Storage.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace tabula;

// ---------- Helpers: statements, values ----------

static RowValue VStr(std::string s) {
    return RowValue{std::move(s)};
}
static RowValue VInt(int64_t v) {
    return RowValue{v};
}

static CreateTable createTable(std::string name, std::vector<Column> cols) {
    return CreateTable{std::move(name), std::move(cols)};
}

static Insert insertRow(std::string table, std::vector<RowValue> values) {
    return Insert{std::move(table), std::move(values)};
}

// convenience: SELECT * FROM table [JOIN other ON l = r]
static Select selectStar(std::string table) {
    Select s;
    s.table = std::move(table);
    s.projection = Select::Star{};
    return s;
}

static Select selectJoin(std::string left, std::string right, ColumnRef l, ColumnRef r) {
    Select s = selectStar(std::move(left));
    s.join = Join{std::move(right), std::move(l), std::move(r)};
    return s;
}

static ColumnRef col(std::string name) {
    return ColumnRef{std::nullopt, std::move(name)};
}
static ColumnRef col(std::string table, std::string name) {
    return ColumnRef{std::move(table), std::move(name)};
}

// teams(id INT PRIMARY, name TEXT UNIQUE), devs(id INT PRIMARY, name TEXT, team_id INT)
static void initTeamsAndDevs(StatementExecutor& exec) {
    exec.execCreateTable(createTable(
        "teams", {{"id", ColumnType::Int, true, false}, {"name", ColumnType::Text, false, true}}));
    exec.execCreateTable(createTable("devs", {{"id", ColumnType::Int, true, false},
                                              {"name", ColumnType::Text},
                                              {"team_id", ColumnType::Int}}));
}

// ============================================================
//                       Tests
// ============================================================

TEST(StatementExecutor, ExecCreateTable_CreatesAndRejectsDuplicate) {
    Database db;
    StatementExecutor exec{db};

    auto created = exec.execute(createTable("t", {{"c1", ColumnType::Text}}));
    ASSERT_TRUE(std::holds_alternative<TableCreated>(created));
    EXPECT_EQ(std::get<TableCreated>(created).table, "t");
    EXPECT_TRUE(db.hasTable("t"));

    EXPECT_THROW(exec.execCreateTable(createTable("t", {{"c1", ColumnType::Text}})), DuplicateTable);
}

TEST(StatementExecutor, ExecCreateTable_DuplicateColumnLeavesCatalogUntouched) {
    Database db;
    StatementExecutor exec{db};

    EXPECT_THROW(exec.execCreateTable(createTable("t", {{"a", ColumnType::Int}, {"a", ColumnType::Int}})),
                 DuplicateColumn);
    EXPECT_FALSE(db.hasTable("t"));
}

TEST(StatementExecutor, ExecInsert_Basic) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);

    auto res = exec.execute(insertRow("teams", {VInt(1), VStr("Engineering")}));
    ASSERT_TRUE(std::holds_alternative<RowInserted>(res));

    QueryResult qr = exec.execSelect(selectStar("teams"));
    EXPECT_EQ(qr.header, (std::vector<std::string>{"id", "name"}));
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0], (Row{VInt(1), VStr("Engineering")}));
}

TEST(StatementExecutor, ExecInsert_StructuralErrors) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);

    EXPECT_THROW(exec.execInsert(insertRow("nope", {VInt(1)})), UnknownTable);
    EXPECT_THROW(exec.execInsert(insertRow("teams", {VInt(1)})), ArityMismatch);
    EXPECT_THROW(exec.execInsert(insertRow("teams", {VStr("1"), VStr("x")})), TypeMismatch);
    EXPECT_EQ(db.getTable("teams").rowCount(), 0u);
}

TEST(StatementExecutor, DuplicateKeyLeavesRowCountUnchanged) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);
    exec.execInsert(insertRow("teams", {VInt(1), VStr("Engineering")}));

    try {
        exec.execInsert(insertRow("teams", {VInt(1), VStr("Ops")}));
        FAIL() << "Expected ConstraintViolation";
    } catch (const ConstraintViolation& e) {
        EXPECT_EQ(e.column, "id");
        EXPECT_EQ(e.value, VInt(1));
    }
    EXPECT_EQ(db.getTable("teams").rowCount(), 1u);
}

TEST(StatementExecutor, ExecSelect_UnknownTable) {
    Database db;
    StatementExecutor exec{db};
    EXPECT_THROW((void)exec.execSelect(selectStar("ghost")), UnknownTable);
}

TEST(StatementExecutor, ExecSelect_ColumnProjection) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);
    exec.execInsert(insertRow("devs", {VInt(101), VStr("Alice"), VInt(1)}));

    Select s = selectStar("devs");
    s.projection = std::vector<ColumnRef>{col("team_id"), col("devs", "name")};
    QueryResult qr = exec.execSelect(s);
    EXPECT_EQ(qr.header, (std::vector<std::string>{"team_id", "name"}));
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0], (Row{VInt(1), VStr("Alice")}));

    s.projection = std::vector<ColumnRef>{col("salary")};
    EXPECT_THROW((void)exec.execSelect(s), UnknownColumn);
    s.projection = std::vector<ColumnRef>{col("teams", "name")};
    EXPECT_THROW((void)exec.execSelect(s), UnknownColumn);
}

TEST(StatementExecutor, Join_ScenarioRows) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);
    exec.execInsert(insertRow("teams", {VInt(1), VStr("Engineering")}));
    exec.execInsert(insertRow("devs", {VInt(101), VStr("Alice"), VInt(1)}));

    const Select join = selectJoin("devs", "teams", col("team_id"), col("id"));
    QueryResult qr = exec.execSelect(join);
    EXPECT_EQ(qr.header, (std::vector<std::string>{"devs.id", "devs.name", "devs.team_id",
                                                   "teams.id", "teams.name"}));
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0], (Row{VInt(101), VStr("Alice"), VInt(1), VInt(1), VStr("Engineering")}));

    // Bob's team does not exist: inner join drops him
    exec.execInsert(insertRow("devs", {VInt(102), VStr("Bob"), VInt(2)}));
    qr = exec.execSelect(join);
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0].at(0), VInt(101));
}

TEST(StatementExecutor, Join_EmitsEveryMatchInLeftThenRightOrder) {
    Database db;
    StatementExecutor exec{db};
    exec.execCreateTable(createTable("l", {{"k", ColumnType::Int}, {"tag", ColumnType::Text}}));
    exec.execCreateTable(createTable("r", {{"k", ColumnType::Int}, {"tag", ColumnType::Text}}));

    exec.execInsert(insertRow("l", {VInt(2), VStr("l1")}));
    exec.execInsert(insertRow("l", {VInt(1), VStr("l2")}));
    exec.execInsert(insertRow("l", {VInt(2), VStr("l3")}));
    exec.execInsert(insertRow("l", {VInt(9), VStr("l4")}));
    exec.execInsert(insertRow("r", {VInt(2), VStr("r1")}));
    exec.execInsert(insertRow("r", {VInt(1), VStr("r2")}));
    exec.execInsert(insertRow("r", {VInt(2), VStr("r3")}));

    QueryResult qr = exec.execSelect(selectJoin("l", "r", col("k"), col("k")));

    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& row : qr.rows)
        pairs.emplace_back(std::get<std::string>(row.at(1)), std::get<std::string>(row.at(3)));

    const std::vector<std::pair<std::string, std::string>> expected = {
        {"l1", "r1"}, {"l1", "r3"}, {"l2", "r2"}, {"l3", "r1"}, {"l3", "r3"}};
    EXPECT_EQ(pairs, expected);
}

TEST(StatementExecutor, Join_MismatchedKindsNeverMatch) {
    Database db;
    StatementExecutor exec{db};
    exec.execCreateTable(createTable("a", {{"v", ColumnType::Int}}));
    exec.execCreateTable(createTable("b", {{"v", ColumnType::Text}}));
    exec.execInsert(insertRow("a", {VInt(1)}));
    exec.execInsert(insertRow("b", {VStr("1")}));

    QueryResult qr;
    ASSERT_NO_THROW(qr = exec.execSelect(selectJoin("a", "b", col("v"), col("v"))));
    EXPECT_TRUE(qr.rows.empty());
}

TEST(StatementExecutor, Join_QualifiedOperandsMayBeSwapped) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);
    exec.execInsert(insertRow("teams", {VInt(1), VStr("Engineering")}));
    exec.execInsert(insertRow("devs", {VInt(101), VStr("Alice"), VInt(1)}));

    QueryResult qr =
        exec.execSelect(selectJoin("devs", "teams", col("teams", "id"), col("devs", "team_id")));
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0].at(4), VStr("Engineering"));
}

TEST(StatementExecutor, Join_ResolutionErrors) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);

    EXPECT_THROW((void)exec.execSelect(selectJoin("devs", "ghosts", col("team_id"), col("id"))),
                 UnknownTable);
    EXPECT_THROW((void)exec.execSelect(selectJoin("ghosts", "teams", col("team_id"), col("id"))),
                 UnknownTable);
    EXPECT_THROW((void)exec.execSelect(selectJoin("devs", "teams", col("team"), col("id"))),
                 UnknownColumn);
    // team_id lives in devs, not teams
    EXPECT_THROW((void)exec.execSelect(selectJoin("devs", "teams", col("id"), col("team_id"))),
                 UnknownColumn);
    EXPECT_THROW(
        (void)exec.execSelect(selectJoin("devs", "teams", col("x", "id"), col("id"))),
        UnknownTable);
}

TEST(StatementExecutor, Join_ProjectionOverJoinedColumns) {
    Database db;
    StatementExecutor exec{db};
    initTeamsAndDevs(exec);
    exec.execInsert(insertRow("teams", {VInt(1), VStr("Engineering")}));
    exec.execInsert(insertRow("devs", {VInt(101), VStr("Alice"), VInt(1)}));

    Select s = selectJoin("devs", "teams", col("team_id"), col("id"));
    s.projection = std::vector<ColumnRef>{col("devs", "name"), col("teams", "name"), col("team_id")};
    QueryResult qr = exec.execSelect(s);
    EXPECT_EQ(qr.header, (std::vector<std::string>{"devs.name", "teams.name", "devs.team_id"}));
    ASSERT_EQ(qr.rows.size(), 1u);
    EXPECT_EQ(qr.rows[0], (Row{VStr("Alice"), VStr("Engineering"), VInt(1)}));

    // "name" exists on both sides
    s.projection = std::vector<ColumnRef>{col("name")};
    EXPECT_THROW((void)exec.execSelect(s), UnknownColumn);
}

// ---------- persistence hook ----------

static std::filesystem::path unwritablePath() {
    return std::filesystem::temp_directory_path() / "tabula-no-such-dir" / "sub" / "db.json";
}

TEST(StatementExecutor, FailedSaveRollsBackCreateTable) {
    Database db;
    Storage storage{unwritablePath()};
    StatementExecutor exec{db, &storage};

    EXPECT_THROW(exec.execCreateTable(createTable("t", {{"a", ColumnType::Int}})), IoError);
    EXPECT_FALSE(db.hasTable("t"));
}

TEST(StatementExecutor, FailedSaveRollsBackInsert) {
    Database db;
    db.createTable("t", Schema{std::vector<Column>{{"a", ColumnType::Int, true, false}}});
    Storage storage{unwritablePath()};
    StatementExecutor exec{db, &storage};

    EXPECT_THROW(exec.execInsert(insertRow("t", {VInt(1)})), IoError);
    const Table& t = db.getTable("t");
    EXPECT_EQ(t.rowCount(), 0u);
    EXPECT_FALSE(t.indexContains(0, VInt(1)));
}

TEST(StatementExecutor, SuccessfulMutationIsSaved) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("tabula-exec-" + std::string{::testing::UnitTest::GetInstance()->current_test_info()->name()});
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    Database db;
    Storage storage{dir / "db.json"};
    StatementExecutor exec{db, &storage};
    exec.execCreateTable(createTable("t", {{"a", ColumnType::Int, true, false}}));
    exec.execInsert(insertRow("t", {VInt(5)}));

    Database reloaded = storage.load();
    ASSERT_TRUE(reloaded.hasTable("t"));
    EXPECT_EQ(reloaded.getTable("t").rows(), db.getTable("t").rows());

    std::filesystem::remove_all(dir);
}

TEST(StatementExecutor, UnencodableTextRollsBackInsert) {
    const auto dir = std::filesystem::temp_directory_path() / "tabula-exec-unencodable";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    Database db;
    Storage storage{dir / "db.json"};
    StatementExecutor exec{db, &storage};
    exec.execCreateTable(createTable("t", {{"a", ColumnType::Text, false, true}}));

    EXPECT_THROW(exec.execInsert(insertRow("t", {VStr("\xc3")})), IoError);
    EXPECT_EQ(db.getTable("t").rowCount(), 0u);
    EXPECT_FALSE(db.getTable("t").indexContains(0, VStr("\xc3")));
    EXPECT_EQ(storage.load().getTable("t").rowCount(), 0u);

    // the failed row left nothing behind that would poison later saves
    exec.execInsert(insertRow("t", {VStr("ok")}));
    EXPECT_EQ(storage.load().getTable("t").rowCount(), 1u);

    std::filesystem::remove_all(dir);
}
