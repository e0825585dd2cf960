#ifndef TABULA_TABLE_H
#define TABULA_TABLE_H

#include "Row.h"
#include "Schema.h"

#include <map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tabula {

// Set of values already present in one PRIMARY/UNIQUE column.
using ColumnIndex = std::unordered_set<RowValue>;

// Rows in insertion order plus one constraint index per constrained column.
// Indexes are derived state: they always equal the set of values found in
// the rows and are rebuilt from the rows, never stored.
class Table {
  public:
    explicit Table(Schema schema);

    // Rebuilds a table from stored rows. Each row is checked against the
    // schema, then the indexes are populated by one scan over the rows.
    [[nodiscard]] static Table restore(Schema schema, std::vector<Row> rows);

    // metadata
    [[nodiscard]] const Schema& getSchema() const noexcept;
    [[nodiscard]] std::size_t rowCount() const noexcept;

    // Appends a row after checking arity, types and every constraint index.
    // Throws ArityMismatch / TypeMismatch / ConstraintViolation and leaves the
    // table untouched on failure.
    void insertRow(Row row);

    // Undo of the most recent insertRow: drops the row and its index entries.
    void removeLastRow();

    // Clears and repopulates every index from the rows. Throws
    // ConstraintViolation if the rows hold a duplicate in a constrained column.
    void rebuildIndexes();

    // full scan in insertion order
    [[nodiscard]] const std::vector<Row>& rows() const noexcept;

    [[nodiscard]] std::vector<Row> getColumnRows(const std::vector<std::size_t>& columnIndices) const;

    [[nodiscard]] bool hasIndex(std::size_t column) const noexcept;
    [[nodiscard]] bool indexContains(std::size_t column, const RowValue& value) const;
    [[nodiscard]] const ColumnIndex& index(std::size_t column) const; // throws std::out_of_range

  private:
    void checkShape(const Row& row) const;
    void resetIndexes();

    Schema schema_;
    std::vector<Row> rows_;
    std::map<std::size_t, ColumnIndex> indexes_; // keyed by column position
};

} // namespace tabula

#endif // TABULA_TABLE_H
