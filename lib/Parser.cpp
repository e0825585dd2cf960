#include "tabula/Parser.h"

#include "tabula/Errors.h"
#include "tabula/Lexer.h"

#include <stdexcept>
#include <utility>

namespace tabula {

namespace {

// Walks a token vector; the last token is always End so current() is safe.
class Cursor {
  public:
    explicit Cursor(const std::vector<Token>& tokens) : tokens_(tokens) {
        if (tokens_.empty() || tokens_.back().type != TokenType::End)
            throw std::invalid_argument("token stream must end with End");
    }

    [[nodiscard]] const Token& current() const { return tokens_.at(i_); }
    [[nodiscard]] bool at(TokenType t) const { return current().type == t; }

    void advance() {
        if (!at(TokenType::End))
            ++i_;
    }

    bool accept(TokenType t) {
        if (!at(t))
            return false;
        advance();
        return true;
    }

    [[noreturn]] void fail(const std::string& expected, const std::string& context) const {
        throw ParseError(expected, describe(current()), current().pos, context);
    }

    const Token& expect(TokenType t, const std::string& context) {
        if (!at(t))
            fail(toString(t), context);
        const Token& tok = current();
        advance();
        return tok;
    }

    // KEY, INTEGER and INNER are keywords only where the grammar asks for
    // them; anywhere a name is expected they are read as identifiers.
    [[nodiscard]] bool atIdentifier() const {
        switch (current().type) {
        case TokenType::Identifier:
        case TokenType::KeywordKey:
        case TokenType::KeywordInteger:
        case TokenType::KeywordInner:
            return true;
        default:
            return false;
        }
    }

    std::string identifier(const std::string& what, const std::string& context) {
        if (!atIdentifier())
            fail(what, context);
        const Token& tok = current();
        std::string name = tok.type == TokenType::Identifier ? tok.text : tok.spelling;
        advance();
        return name;
    }

  private:
    const std::vector<Token>& tokens_;
    std::size_t i_ = 0;
};

// ColumnRef ::= ident ['.' ident]
ColumnRef parseColumnRef(Cursor& c, const std::string& context) {
    ColumnRef ref;
    std::string first = c.identifier("column name", context);
    if (c.accept(TokenType::Dot)) {
        ref.table = std::move(first);
        ref.column = c.identifier("column name", "after '.'");
    } else {
        ref.column = std::move(first);
    }
    return ref;
}

// ColumnDef ::= ident (INT|INTEGER|TEXT) (PRIMARY [KEY] | UNIQUE)?
Column parseColumnDef(Cursor& c) {
    Column col;
    col.name = c.identifier("column name", "in column list");

    if (c.accept(TokenType::KeywordInt) || c.accept(TokenType::KeywordInteger)) {
        col.type = ColumnType::Int;
    } else if (c.accept(TokenType::KeywordText)) {
        col.type = ColumnType::Text;
    } else {
        c.fail("column type INT or TEXT", "after column '" + col.name + "'");
    }

    if (c.accept(TokenType::KeywordPrimary)) {
        c.accept(TokenType::KeywordKey);
        col.primaryKey = true;
    } else if (c.accept(TokenType::KeywordUnique)) {
        col.unique = true;
    }
    return col;
}

Statement parseCreateTable(Cursor& c) {
    c.expect(TokenType::KeywordCreate, "at start of statement");
    c.expect(TokenType::KeywordTable, "after CREATE");
    std::string table = c.identifier("table name", "after CREATE TABLE");
    c.expect(TokenType::LParen, "after table name");

    std::vector<Column> cols;
    while (true) {
        cols.push_back(parseColumnDef(c));
        if (c.accept(TokenType::Comma))
            continue;
        if (c.accept(TokenType::RParen))
            break;
        c.fail("',' or ')'", "in column list");
    }
    return CreateTable{std::move(table), std::move(cols)};
}

RowValue parseLiteral(Cursor& c) {
    const Token& tok = c.current();
    if (tok.type == TokenType::Integer) {
        RowValue v{tok.number};
        c.advance();
        return v;
    }
    if (tok.type == TokenType::String) {
        RowValue v{tok.text};
        c.advance();
        return v;
    }
    c.fail("literal", "in VALUES list");
}

Statement parseInsert(Cursor& c) {
    c.expect(TokenType::KeywordInsert, "at start of statement");
    c.expect(TokenType::KeywordInto, "after INSERT");
    std::string table = c.identifier("table name", "after INSERT INTO");
    c.expect(TokenType::KeywordValues, "after table name");
    c.expect(TokenType::LParen, "after VALUES");

    std::vector<RowValue> values;
    while (true) {
        values.push_back(parseLiteral(c));
        if (c.accept(TokenType::Comma))
            continue;
        if (c.accept(TokenType::RParen))
            break;
        c.fail("',' or ')'", "in VALUES list");
    }
    return Insert{std::move(table), std::move(values)};
}

Statement parseSelect(Cursor& c) {
    c.expect(TokenType::KeywordSelect, "at start of statement");

    Select sel;
    if (c.accept(TokenType::Star)) {
        sel.projection = Select::Star{};
    } else {
        if (!c.atIdentifier())
            c.fail("'*' or column name", "after SELECT");
        std::vector<ColumnRef> cols;
        do {
            cols.push_back(parseColumnRef(c, "in select list"));
        } while (c.accept(TokenType::Comma));
        sel.projection = std::move(cols);
    }

    c.expect(TokenType::KeywordFrom, "after select list");
    sel.table = c.identifier("table name", "after FROM");

    const bool inner = c.accept(TokenType::KeywordInner);
    if (inner || c.at(TokenType::KeywordJoin)) {
        c.expect(TokenType::KeywordJoin, inner ? "after INNER" : "");
        Join j;
        j.table = c.identifier("table name", "after JOIN");
        c.expect(TokenType::KeywordOn, "after JOIN table");
        j.left = parseColumnRef(c, "after ON");
        c.expect(TokenType::Equal, "in join condition");
        j.right = parseColumnRef(c, "after '='");
        sel.join = std::move(j);
    }
    return sel;
}

} // namespace

Statement Parser::parse(const std::vector<Token>& tokens) {
    Cursor c{tokens};

    Statement st = [&]() -> Statement {
        switch (c.current().type) {
        case TokenType::KeywordCreate:
            return parseCreateTable(c);
        case TokenType::KeywordInsert:
            return parseInsert(c);
        case TokenType::KeywordSelect:
            return parseSelect(c);
        default:
            c.fail("CREATE, INSERT or SELECT", "at start of statement");
        }
    }();

    if (!c.at(TokenType::End))
        c.fail("end of statement", "");
    return st;
}

Statement Parser::prepareStatement(std::string_view sql) const {
    return parse(Lexer::tokenize(sql));
}

} // namespace tabula
