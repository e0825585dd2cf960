#ifndef TABULA_STATEMENTEXECUTOR_H
#define TABULA_STATEMENTEXECUTOR_H

#include "Database.h"
#include "Row.h"
#include "Statement.h"

#include <string>
#include <variant>
#include <vector>

namespace tabula {

class Storage;

struct TableCreated {
    std::string table;
};

struct RowInserted {
    std::string table;
};

struct QueryResult {
    std::vector<std::string> header;
    std::vector<Row> rows;
};

using ExecResult = std::variant<TableCreated, RowInserted, QueryResult>;

// Runs statements against a Database. With a Storage attached, every
// successful CREATE TABLE / INSERT is saved before returning; if the save
// fails the in-memory change is undone and the IoError is rethrown.
// Not synchronised: callers hold the appropriate lock (see Engine).
class StatementExecutor {
  public:
    explicit StatementExecutor(Database& db, const Storage* storage = nullptr)
        : db_(db), storage_(storage) {}

    // High-level single entry point.
    [[nodiscard]] ExecResult execute(const Statement& st);

    // Fine-grained operations (useful for tests or REPL routing)
    TableCreated execCreateTable(const CreateTable& st) const; // DuplicateTable / DuplicateColumn
    RowInserted execInsert(const Insert& st) const; // UnknownTable / ArityMismatch / TypeMismatch /
                                                    // ConstraintViolation
    [[nodiscard]] QueryResult execSelect(const Select& st) const; // UnknownTable / UnknownColumn

  private:
    Database& db_;
    const Storage* storage_;

    void persist() const;

    // Nested-loop equality join; row order is left rows outer, right rows inner.
    [[nodiscard]] QueryResult execJoin(const Select& st) const;

    // Turn SELECT projection into column indices over a single table
    [[nodiscard]] std::vector<std::size_t> compileProjection(const Select::Projection& proj,
                                                             const std::string& tableName,
                                                             const Schema& schema) const;
};

} // namespace tabula

#endif // TABULA_STATEMENTEXECUTOR_H
