#include "tabula/Printer.h"

#include "tabula/Errors.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula {

void Printer::printResult(const ExecResult& result) {
    std::visit(
        [this](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, TableCreated>) {
                out_ << "Table '" << r.table << "' created\n";
            } else if constexpr (std::is_same_v<T, RowInserted>) {
                out_ << "1 row inserted\n";
            } else {
                printQueryResult(r);
            }
        },
        result);
}

void Printer::printQueryResult(const QueryResult& qr) {
    printTable(qr.header, qr.rows);
    out_ << '(' << qr.rows.size() << (qr.rows.size() == 1 ? " row)" : " rows)") << '\n';
}

void Printer::printError(const std::exception& e) {
    err_ << "Error";
    if (const auto* db = dynamic_cast<const DbError*>(&e))
        err_ << " [" << toString(db->code()) << ']';
    err_ << ": " << e.what() << '\n';
}

void Printer::printHelpMessage(std::string_view prog) {
    out_ << prog << " - embedded SQL shell\n"
         << "Statements end at ';' or at the end of a line:\n"
         << "  CREATE TABLE teams (id INT PRIMARY KEY, name TEXT UNIQUE)\n"
         << "  INSERT INTO teams VALUES (1, 'Engineering')\n"
         << "  SELECT * FROM devs JOIN teams ON team_id = id\n"
         << "Type 'exit' or press Ctrl-D to quit.\n";
}

// Integer columns are right-aligned, text columns left-aligned:
//
//  id | name
// ----+-------
//   1 | Alice
void Printer::printTable(const std::vector<std::string>& header, const std::vector<Row>& rows) {
    if (header.empty()) {
        out_ << '\n';
        return;
    }

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    std::vector<std::size_t> widths;
    widths.reserve(header.size());
    for (const auto& h : header)
        widths.push_back(h.size());
    std::vector<bool> rightAligned(header.size(), false);

    for (const Row& r : rows) {
        auto& line = cells.emplace_back();
        for (std::size_t i = 0; i < header.size(); ++i) {
            line.push_back(valueToString(r.at(i)));
            widths[i] = std::max(widths[i], line.back().size());
            if (std::holds_alternative<int64_t>(r.at(i)))
                rightAligned[i] = true;
        }
    }

    auto emit = [&](const std::vector<std::string>& line, bool isHeader) {
        for (std::size_t i = 0; i < line.size(); ++i) {
            const std::string pad(widths[i] - line[i].size(), ' ');
            out_ << (i == 0 ? " " : " | ");
            if (rightAligned[i] && !isHeader)
                out_ << pad << line[i];
            else
                out_ << line[i] << pad;
        }
        out_ << '\n';
    };

    emit(header, true);
    for (std::size_t i = 0; i < widths.size(); ++i)
        out_ << (i == 0 ? "" : "+") << std::string(widths[i] + 2, '-');
    out_ << '\n';
    for (const auto& line : cells)
        emit(line, false);
}

} // namespace tabula
