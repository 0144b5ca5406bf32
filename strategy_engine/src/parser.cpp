#include "parser.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace strategy_engine {

    std::string productionName(Production production) {
        switch (production) {
            case Production::Strategy: return "strategy";
            case Production::Section: return "section";
            case Production::OrExpr: return "or_expr";
            case Production::AndExpr: return "and_expr";
            case Production::Comparison: return "comparison";
            case Production::Arithmetic: return "arithmetic";
            case Production::Number: return "number";
            case Production::Call: return "call";
            case Production::Identifier: return "identifier";
            case Production::BoolLiteral: return "bool_literal";
            case Production::Group: return "group";
        }
        return "unknown";
    }

    namespace {

        ParseNode makeNode(Production production, Token token) {
            ParseNode node;
            node.production = production;
            node.token = std::move(token);
            return node;
        }

        ParseNode makeBinary(Production production, Token op, ParseNode left, ParseNode right) {
            ParseNode node = makeNode(production, std::move(op));
            node.children.push_back(std::move(left));
            node.children.push_back(std::move(right));
            return node;
        }

        bool isComparisonOperator(TokenType type) {
            switch (type) {
                case TokenType::Greater:
                case TokenType::Less:
                case TokenType::GreaterEqual:
                case TokenType::LessEqual:
                case TokenType::EqualEqual:
                case TokenType::CrossesAbove:
                case TokenType::CrossesBelow:
                    return true;
                default:
                    return false;
            }
        }

        std::string describeToken(const Token& tok) {
            if (tok.type == TokenType::End) {
                return "end of input";
            }
            return fmt::format("'{}'", tok.text);
        }

    } // end anonymous namespace

    Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
        if (tokens_.empty() || tokens_.back().type != TokenType::End) {
            Token end;
            end.type = TokenType::End;
            if (!tokens_.empty()) {
                end.line = tokens_.back().line;
                end.column = tokens_.back().column + static_cast<int>(tokens_.back().text.size());
            }
            tokens_.push_back(end);
        }
    }

    ParseNode Parser::parse(const std::string& dsl_text) {
        Lexer lexer(dsl_text);
        Parser parser(lexer.tokenize());
        return parser.parseStrategy();
    }

    // --- Token cursor ---

    const Token& Parser::current() const {
        return tokens_[pos_];
    }

    const Token& Parser::lookahead(std::size_t offset) const {
        const std::size_t at = pos_ + offset;
        return at < tokens_.size() ? tokens_[at] : tokens_.back();
    }

    bool Parser::check(TokenType type) const {
        return current().type == type;
    }

    bool Parser::match(TokenType type) {
        if (!check(type)) {
            return false;
        }
        if (type != TokenType::End) {
            ++pos_;
        }
        return true;
    }

    const Token& Parser::expect(TokenType type, const std::string& context) {
        if (!check(type)) {
            throw unexpected(fmt::format("{} {}", tokenTypeName(type), context));
        }
        const Token& tok = current();
        ++pos_;
        return tok;
    }

    core::SyntaxError Parser::unexpected(const std::string& expected) const {
        const Token& tok = current();
        return core::SyntaxError(
            fmt::format("Syntax error at line {}, column {}: expected {} but found {}",
                        tok.line, tok.column, expected, describeToken(tok)),
            tok.text, tok.line, tok.column);
    }

    // --- Productions ---

    ParseNode Parser::parseStrategy() {
        auto logger = core::logging::getLogger();
        ParseNode root = makeNode(Production::Strategy, current());
        root.children.push_back(parseSection(TokenType::Entry));
        root.children.push_back(parseSection(TokenType::Exit));
        if (!check(TokenType::End)) {
            throw unexpected("end of input after EXIT section");
        }
        logger->trace("Parsed strategy ({} tokens)", tokens_.size());
        return root;
    }

    ParseNode Parser::parseSection(TokenType keyword) {
        const std::string name = tokenTypeName(keyword);
        ParseNode section = makeNode(Production::Section, expect(keyword, "section header"));
        expect(TokenType::Colon, fmt::format("after {}", name));
        section.children.push_back(parseExpression());
        return section;
    }

    ParseNode Parser::parseExpression() {
        return parseOr();
    }

    ParseNode Parser::parseOr() {
        ParseNode node = makeNode(Production::OrExpr, current());
        node.children.push_back(parseAnd());
        while (match(TokenType::Or)) {
            node.children.push_back(parseAnd());
        }
        return node;
    }

    ParseNode Parser::parseAnd() {
        ParseNode node = makeNode(Production::AndExpr, current());
        node.children.push_back(parseComparison());
        while (match(TokenType::And)) {
            node.children.push_back(parseComparison());
        }
        return node;
    }

    ParseNode Parser::parseComparison() {
        ParseNode left = parseAdditive();
        if (!isComparisonOperator(current().type)) {
            return left;
        }
        Token op = current();
        ++pos_;
        ParseNode right = parseAdditive();
        if (isComparisonOperator(current().type)) {
            // a > b > c
            throw unexpected("AND, OR or end of condition (comparisons do not chain)");
        }
        return makeBinary(Production::Comparison, std::move(op), std::move(left), std::move(right));
    }

    ParseNode Parser::parseAdditive() {
        ParseNode left = parseMultiplicative();
        while (check(TokenType::Plus) || check(TokenType::Minus)) {
            Token op = current();
            ++pos_;
            ParseNode right = parseMultiplicative();
            left = makeBinary(Production::Arithmetic, std::move(op), std::move(left), std::move(right));
        }
        return left;
    }

    ParseNode Parser::parseMultiplicative() {
        ParseNode left = parsePrimary();
        while (check(TokenType::Star) || check(TokenType::Slash)) {
            Token op = current();
            ++pos_;
            ParseNode right = parsePrimary();
            left = makeBinary(Production::Arithmetic, std::move(op), std::move(left), std::move(right));
        }
        return left;
    }

    ParseNode Parser::parsePrimary() {
        const Token tok = current();
        switch (tok.type) {
            case TokenType::Number:
                ++pos_;
                return makeNode(Production::Number, tok);

            case TokenType::Plus:
            case TokenType::Minus: {
                // Signed literal only; there is no general unary operator.
                if (lookahead(1).type != TokenType::Number) {
                    ++pos_;
                    throw unexpected(fmt::format("number after sign '{}'", tok.text));
                }
                ++pos_;
                Token number = current();
                ++pos_;
                if (tok.type == TokenType::Minus) {
                    number.text = "-" + number.text;
                }
                number.line = tok.line;
                number.column = tok.column;
                return makeNode(Production::Number, std::move(number));
            }

            case TokenType::Identifier:
                ++pos_;
                if (check(TokenType::LParen)) {
                    return parseCall(tok);
                }
                return makeNode(Production::Identifier, tok);

            case TokenType::True:
            case TokenType::False:
                ++pos_;
                return makeNode(Production::BoolLiteral, tok);

            case TokenType::LParen: {
                ++pos_;
                ParseNode group = makeNode(Production::Group, tok);
                group.children.push_back(parseExpression());
                expect(TokenType::RParen, "to close '('");
                return group;
            }

            default:
                throw unexpected("a field, indicator call, number, TRUE/FALSE or '('");
        }
    }

    ParseNode Parser::parseCall(const Token& name) {
        ParseNode call = makeNode(Production::Call, name);
        expect(TokenType::LParen, fmt::format("after '{}'", name.text));
        call.children.push_back(parseExpression());
        while (match(TokenType::Comma)) {
            call.children.push_back(parseExpression());
        }
        expect(TokenType::RParen, fmt::format("to close call to '{}'", name.text));
        return call;
    }

} // namespace strategy_engine
