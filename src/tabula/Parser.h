#ifndef TABULA_PARSER_H
#define TABULA_PARSER_H

#include "Statement.h"
#include "Token.h"

#include <string_view>
#include <vector>

namespace tabula {

// Recursive-descent parser for CREATE TABLE / INSERT / SELECT [JOIN].
// Pure text -> AST translation: no catalog access, no semantic checks.
class Parser {
  public:
    Parser() = default;

    // lex + parse one statement; throws LexError / ParseError
    [[nodiscard]] Statement prepareStatement(std::string_view sql) const;

    // tokens must end with TokenType::End
    [[nodiscard]] static Statement parse(const std::vector<Token>& tokens);
};

} // namespace tabula

#endif // TABULA_PARSER_H
