#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace strategy_engine {

    enum class TokenType {
        Entry,        // ENTRY
        Exit,         // EXIT
        And,          // AND
        Or,           // OR
        CrossesAbove, // CROSSES_ABOVE
        CrossesBelow, // CROSSES_BELOW
        True,         // TRUE
        False,        // FALSE
        Identifier,   // field or indicator name (lowercased)
        Number,       // unsigned numeric literal
        Greater,      // >
        Less,         // <
        GreaterEqual, // >=
        LessEqual,    // <=
        EqualEqual,   // ==
        Plus,
        Minus,
        Star,
        Slash,
        LParen,
        RParen,
        Comma,
        Colon,
        End           // end of input
    };

    struct Token {
        TokenType type = TokenType::End;
        std::string text;      // Source text (identifiers lowercased)
        int line = 1;
        int column = 1;
    };

    std::string tokenTypeName(TokenType type);

    // --- Lexer ---
    // Splits DSL text into tokens. Keywords are matched case-insensitively.
    // Throws core::SyntaxError on characters outside the language.
    class Lexer {
    public:
        explicit Lexer(std::string source);

        std::vector<Token> tokenize();

    private:
        char peek(std::size_t offset = 0) const;
        char advance();
        void skipWhitespace();
        Token lexNumber();
        Token lexWord();
        Token makeToken(TokenType type, std::string text, int line, int column) const;

        std::string source_;
        std::size_t pos_ = 0;
        int line_ = 1;
        int column_ = 1;
    };

} // namespace strategy_engine
