#pragma once

#include "lexer.hpp"
#include "parse_tree.hpp"
#include "exceptions.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace strategy_engine {

    // --- Parser ---
    // Recursive descent over the token stream, one method per precedence level:
    //
    //   strategy       := ENTRY ':' expression EXIT ':' expression END
    //   expression     := or_expr
    //   or_expr        := and_expr (OR and_expr)*
    //   and_expr       := comparison (AND comparison)*
    //   comparison     := additive (cmp_op additive)?
    //   additive       := multiplicative (('+' | '-') multiplicative)*
    //   multiplicative := primary (('*' | '/') primary)*
    //   primary        := NUMBER | ('+' | '-') NUMBER | IDENT '(' expression (',' expression)* ')'
    //                   | IDENT | TRUE | FALSE | '(' expression ')'
    //
    // Comparisons do not chain. Any violation throws core::SyntaxError.
    class Parser {
    public:
        explicit Parser(std::vector<Token> tokens);

        ParseNode parseStrategy();

        // Convenience: lex + parse.
        static ParseNode parse(const std::string& dsl_text);

    private:
        ParseNode parseSection(TokenType keyword);
        ParseNode parseExpression();
        ParseNode parseOr();
        ParseNode parseAnd();
        ParseNode parseComparison();
        ParseNode parseAdditive();
        ParseNode parseMultiplicative();
        ParseNode parsePrimary();
        ParseNode parseCall(const Token& name);

        const Token& current() const;
        const Token& lookahead(std::size_t offset) const;
        bool check(TokenType type) const;
        bool match(TokenType type);
        const Token& expect(TokenType type, const std::string& context);
        core::SyntaxError unexpected(const std::string& expected) const;

        std::vector<Token> tokens_;
        std::size_t pos_ = 0;
    };

} // namespace strategy_engine
