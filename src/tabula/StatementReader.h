#ifndef TABULA_STATEMENTREADER_H
#define TABULA_STATEMENTREADER_H

#include <iostream>
#include <optional>
#include <string>

namespace tabula {

// Cuts an input stream into statements. A statement ends at ';' or at the
// end of a line, unless the break falls inside a quoted literal or a block
// comment. Comments (-- and /* */) are removed.
class StatementReader {
  public:
    explicit StatementReader(std::istream& in);

    [[nodiscard]] bool readsFromCin() const noexcept { return &in_ == &std::cin; }

    // Next non-empty statement without its terminator, or nullopt at EOF.
    std::optional<std::string> next();

    // Prompt for interactive input only
    void printPrompt(std::ostream& out = std::cout) const;

  private:
    std::istream& in_;
    bool interactive_;
    std::string buffer_; // leftover after splitting

    // Removes the first complete statement from buffer_. At EOF the unterminated
    // remainder counts as a statement.
    std::optional<std::string> cutStatement(bool atEof);
};

} // namespace tabula

#endif // TABULA_STATEMENTREADER_H
