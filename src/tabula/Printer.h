#ifndef TABULA_PRINTER_H
#define TABULA_PRINTER_H

#include "StatementExecutor.h"

#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

class Printer {
  public:
    explicit Printer(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out), err_(err) {}

    void printResult(const ExecResult& result);  // to out_
    void printQueryResult(const QueryResult& qr); // to out_
    void printError(const std::exception& e);     // to err_
    void printHelpMessage(std::string_view prog = "tabula_shell");

  private:
    std::ostream& out_;
    std::ostream& err_;

    void printTable(const std::vector<std::string>& header,
                    const std::vector<Row>& rows); // internal used by printQueryResult
};

} // namespace tabula

#endif // TABULA_PRINTER_H
