#include "lexer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <map>
#include <utility>

namespace strategy_engine {

    namespace {

        bool isIdentifierStart(char c) {
            return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
        }

        bool isIdentifierChar(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        bool isDigit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        const std::map<std::string, TokenType>& keywords() {
            static const std::map<std::string, TokenType> table = {
                {"ENTRY", TokenType::Entry},
                {"EXIT", TokenType::Exit},
                {"AND", TokenType::And},
                {"OR", TokenType::Or},
                {"CROSSES_ABOVE", TokenType::CrossesAbove},
                {"CROSSES_BELOW", TokenType::CrossesBelow},
                {"TRUE", TokenType::True},
                {"FALSE", TokenType::False},
            };
            return table;
        }

    } // end anonymous namespace

    std::string tokenTypeName(TokenType type) {
        switch (type) {
            case TokenType::Entry: return "ENTRY";
            case TokenType::Exit: return "EXIT";
            case TokenType::And: return "AND";
            case TokenType::Or: return "OR";
            case TokenType::CrossesAbove: return "CROSSES_ABOVE";
            case TokenType::CrossesBelow: return "CROSSES_BELOW";
            case TokenType::True: return "TRUE";
            case TokenType::False: return "FALSE";
            case TokenType::Identifier: return "identifier";
            case TokenType::Number: return "number";
            case TokenType::Greater: return "'>'";
            case TokenType::Less: return "'<'";
            case TokenType::GreaterEqual: return "'>='";
            case TokenType::LessEqual: return "'<='";
            case TokenType::EqualEqual: return "'=='";
            case TokenType::Plus: return "'+'";
            case TokenType::Minus: return "'-'";
            case TokenType::Star: return "'*'";
            case TokenType::Slash: return "'/'";
            case TokenType::LParen: return "'('";
            case TokenType::RParen: return "')'";
            case TokenType::Comma: return "','";
            case TokenType::Colon: return "':'";
            case TokenType::End: return "end of input";
        }
        return "unknown";
    }

    Lexer::Lexer(std::string source) : source_(std::move(source)) {}

    char Lexer::peek(std::size_t offset) const {
        const std::size_t at = pos_ + offset;
        return at < source_.size() ? source_[at] : '\0';
    }

    char Lexer::advance() {
        const char c = source_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    void Lexer::skipWhitespace() {
        while (pos_ < source_.size() && std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    Token Lexer::makeToken(TokenType type, std::string text, int line, int column) const {
        Token tok;
        tok.type = type;
        tok.text = std::move(text);
        tok.line = line;
        tok.column = column;
        return tok;
    }

    // digits ['.' digits] [('e'|'E') ['+'|'-'] digits], or '.' digits ...
    Token Lexer::lexNumber() {
        const int line = line_;
        const int column = column_;
        std::string text;
        while (isDigit(peek())) {
            text += advance();
        }
        if (peek() == '.' && isDigit(peek(1))) {
            text += advance();
            while (isDigit(peek())) {
                text += advance();
            }
        } else if (peek() == '.' && !text.empty()) {
            // "20." is accepted as 20
            text += advance();
        }
        if (peek() == 'e' || peek() == 'E') {
            std::size_t look = 1;
            if (peek(1) == '+' || peek(1) == '-') {
                look = 2;
            }
            if (isDigit(peek(look))) {
                for (std::size_t i = 0; i < look; ++i) {
                    text += advance();
                }
                while (isDigit(peek())) {
                    text += advance();
                }
            }
        }
        return makeToken(TokenType::Number, std::move(text), line, column);
    }

    Token Lexer::lexWord() {
        const int line = line_;
        const int column = column_;
        std::string text;
        while (isIdentifierChar(peek())) {
            text += advance();
        }
        auto keyword = keywords().find(core::utils::toUpper(text));
        if (keyword != keywords().end()) {
            return makeToken(keyword->second, keyword->first, line, column);
        }
        return makeToken(TokenType::Identifier, core::utils::toLower(text), line, column);
    }

    std::vector<Token> Lexer::tokenize() {
        auto logger = core::logging::getLogger();
        std::vector<Token> tokens;

        skipWhitespace();
        while (pos_ < source_.size()) {
            const char c = peek();
            const int line = line_;
            const int column = column_;

            if (isDigit(c) || (c == '.' && isDigit(peek(1)))) {
                tokens.push_back(lexNumber());
            } else if (isIdentifierStart(c)) {
                tokens.push_back(lexWord());
            } else {
                TokenType type = TokenType::End;
                std::string text(1, c);
                advance();
                switch (c) {
                    case '>':
                    case '<':
                        if (peek() == '=') {
                            text += advance();
                            type = (c == '>') ? TokenType::GreaterEqual : TokenType::LessEqual;
                        } else {
                            type = (c == '>') ? TokenType::Greater : TokenType::Less;
                        }
                        break;
                    case '=':
                        if (peek() != '=') {
                            throw core::SyntaxError(
                                fmt::format("Unexpected character '=' at line {}, column {} (did you mean '=='?)", line, column),
                                text, line, column);
                        }
                        text += advance();
                        type = TokenType::EqualEqual;
                        break;
                    case '+': type = TokenType::Plus; break;
                    case '-': type = TokenType::Minus; break;
                    case '*': type = TokenType::Star; break;
                    case '/': type = TokenType::Slash; break;
                    case '(': type = TokenType::LParen; break;
                    case ')': type = TokenType::RParen; break;
                    case ',': type = TokenType::Comma; break;
                    case ':': type = TokenType::Colon; break;
                    default:
                        throw core::SyntaxError(
                            fmt::format("Unexpected character '{}' at line {}, column {}", text, line, column),
                            text, line, column);
                }
                tokens.push_back(makeToken(type, std::move(text), line, column));
            }
            skipWhitespace();
        }

        tokens.push_back(makeToken(TokenType::End, "", line_, column_));
        logger->trace("Lexer produced {} tokens", tokens.size());
        return tokens;
    }

} // namespace strategy_engine
