#include "tabula/StatementExecutor.h"

#include "tabula/Errors.h"
#include "tabula/Storage.h"
#include "tabula/Table.h"

#include <optional>
#include <type_traits>

namespace tabula {

namespace {

enum class Side { Left, Right };

// One column of the concatenated join row, named by its source table.
struct JoinedColumn {
    const std::string* table;
    const std::string* column;
};

// Binds an ON operand to a side. A qualifier picks the table by name; an
// unqualified operand goes to the side it was written on.
Side bindSide(const ColumnRef& ref, Side written, const std::string& leftName,
              const std::string& rightName) {
    if (!ref.table)
        return written;
    const bool isLeft = *ref.table == leftName;
    const bool isRight = *ref.table == rightName;
    if (isLeft && isRight) // self join, only position disambiguates
        return written;
    if (isLeft)
        return Side::Left;
    if (isRight)
        return Side::Right;
    throw UnknownTable(*ref.table);
}

std::size_t requireColumn(const Table& t, const ColumnRef& ref) {
    if (auto idx = t.getSchema().index_of(ref.column))
        return *idx;
    throw UnknownColumn(ref.toString());
}

Row project(const Row& r, const std::vector<std::size_t>& indices) {
    std::vector<RowValue> cells;
    cells.reserve(indices.size());
    for (auto idx : indices)
        cells.push_back(r.at(idx));
    return Row{std::move(cells)};
}

} // namespace

// ----------------------- high-level dispatch -----------------------

ExecResult StatementExecutor::execute(const Statement& st) {
    return std::visit(
        [&](const auto& node) -> ExecResult {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, CreateTable>) {
                return execCreateTable(node);
            } else if constexpr (std::is_same_v<T, Insert>) {
                return execInsert(node);
            } else if constexpr (std::is_same_v<T, Select>) {
                return execSelect(node);
            } else {
                static_assert(!sizeof(T*), "Unhandled Statement alternative");
            }
        },
        st);
}

// ----------------------- exec* methods -----------------------

void StatementExecutor::persist() const {
    if (storage_)
        storage_->save(db_);
}

TableCreated StatementExecutor::execCreateTable(const CreateTable& st) const {
    Schema schema{st.columns}; // DuplicateColumn / MultiplePrimaryKeys
    db_.createTable(st.tableName, std::move(schema));

    try {
        persist();
    } catch (const IoError&) {
        db_.dropTable(st.tableName);
        throw;
    }
    return TableCreated{st.tableName};
}

RowInserted StatementExecutor::execInsert(const Insert& st) const {
    Table& tbl = db_.getTable(st.tableName);
    tbl.insertRow(Row(st.values)); // all-or-nothing

    try {
        persist();
    } catch (const IoError&) {
        tbl.removeLastRow();
        throw;
    }
    return RowInserted{st.tableName};
}

QueryResult StatementExecutor::execSelect(const Select& st) const {
    if (st.join)
        return execJoin(st);

    const Table& tbl = db_.getTable(st.table);
    const Schema& sch = tbl.getSchema();

    QueryResult out;
    if (std::holds_alternative<Select::Star>(st.projection)) {
        // header = all columns
        out.header.reserve(sch.size());
        for (const auto& c : sch.columns())
            out.header.push_back(c.name);

        out.rows = tbl.rows();
    } else {
        const auto indices = compileProjection(st.projection, st.table, sch);
        for (auto idx : indices)
            out.header.push_back(sch.column(idx).name);
        out.rows = tbl.getColumnRows(indices);
    }
    return out;
}

QueryResult StatementExecutor::execJoin(const Select& st) const {
    const Join& join = *st.join;
    const Table& left = db_.getTable(st.table);
    const Table& right = db_.getTable(join.table);

    // resolve the ON clause to (left column, right column)
    const Side lhsSide = bindSide(join.left, Side::Left, st.table, join.table);
    const Side rhsSide = bindSide(join.right, Side::Right, st.table, join.table);
    if (lhsSide == rhsSide)
        throw UnknownColumn(join.right.toString());

    const ColumnRef& leftRef = lhsSide == Side::Left ? join.left : join.right;
    const ColumnRef& rightRef = lhsSide == Side::Left ? join.right : join.left;
    const std::size_t leftCol = requireColumn(left, leftRef);
    const std::size_t rightCol = requireColumn(right, rightRef);

    // joined header is left columns then right columns, qualified by table
    std::vector<JoinedColumn> joined;
    joined.reserve(left.getSchema().size() + right.getSchema().size());
    for (const auto& c : left.getSchema().columns())
        joined.push_back(JoinedColumn{&st.table, &c.name});
    for (const auto& c : right.getSchema().columns())
        joined.push_back(JoinedColumn{&join.table, &c.name});

    std::optional<std::vector<std::size_t>> indices;
    if (const auto* refs = std::get_if<std::vector<ColumnRef>>(&st.projection)) {
        indices.emplace();
        for (const auto& ref : *refs) {
            std::optional<std::size_t> found;
            for (std::size_t i = 0; i < joined.size(); ++i) {
                if (*joined[i].column != ref.column || (ref.table && *joined[i].table != *ref.table))
                    continue;
                // a qualified name that matches both sides of a self join takes the left one
                if (found && !ref.table)
                    throw UnknownColumn(ref.column + " (ambiguous)");
                if (!found)
                    found = i;
            }
            if (!found)
                throw UnknownColumn(ref.toString());
            indices->push_back(*found);
        }
    }

    QueryResult out;
    if (indices) {
        for (auto i : *indices)
            out.header.push_back(*joined[i].table + "." + *joined[i].column);
    } else {
        for (const auto& jc : joined)
            out.header.push_back(*jc.table + "." + *jc.column);
    }

    // NESTED LOOP JOIN: no index is consulted, O(|left| * |right|)
    for (const Row& l : left.rows()) {
        for (const Row& r : right.rows()) {
            // variant equality: values of different kinds never match
            if (l.at(leftCol) != r.at(rightCol))
                continue;
            Row combined = l.concat(r);
            out.rows.push_back(indices ? project(combined, *indices) : std::move(combined));
        }
    }
    return out;
}

// ----------------------- helper compilers -----------------------

std::vector<std::size_t> StatementExecutor::compileProjection(const Select::Projection& proj,
                                                              const std::string& tableName,
                                                              const Schema& schema) const {
    if (std::holds_alternative<Select::Star>(proj)) {
        std::vector<std::size_t> idx(schema.size());
        for (std::size_t i = 0; i < schema.size(); ++i)
            idx[i] = i;
        return idx;
    }
    const auto& refs = std::get<std::vector<ColumnRef>>(proj);
    std::vector<std::size_t> idx;
    idx.reserve(refs.size());
    for (const auto& ref : refs) {
        if (ref.table && *ref.table != tableName)
            throw UnknownColumn(ref.toString());
        idx.push_back(schema.require_index(ref.column));
    }
    return idx;
}

} // namespace tabula
