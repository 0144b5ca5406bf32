#include "json_to_dsl.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace {

        bool hasSection(const json& ir, const char* name) {
            if (!ir.contains(name) || ir[name].is_null()) {
                return false;
            }
            if (!ir[name].is_array()) {
                throw core::ValidationError(fmt::format("IR section '{}' must be an array of conditions", name));
            }
            return !ir[name].empty();
        }

    } // end anonymous namespace

    std::string JsonToDsl::convert(const json& ir) {
        auto logger = core::logging::getLogger();
        if (!ir.is_object()) {
            throw core::ValidationError("Strategy IR must be a JSON object with 'entry' and 'exit' arrays");
        }

        const std::string entry = hasSection(ir, "entry") ? buildExpression(ir["entry"], "entry") : "TRUE";
        const std::string exit = hasSection(ir, "exit") ? buildExpression(ir["exit"], "exit") : "FALSE";

        std::string dsl = fmt::format("ENTRY:\n  {}\n\nEXIT:\n  {}", entry, exit);
        logger->debug("Converted IR to DSL:\n{}", dsl);
        return dsl;
    }

    std::string JsonToDsl::buildExpression(const json& conditions, const std::string& section) {
        std::vector<std::string> parts;
        for (std::size_t i = 0; i < conditions.size(); ++i) {
            const json& cond = conditions[i];
            if (!cond.is_object()) {
                throw core::ValidationError(fmt::format("Condition {} in '{}' must be an object", i, section));
            }
            for (const char* key : {"left", "operator", "right"}) {
                if (!cond.contains(key)) {
                    throw core::ValidationError(fmt::format(
                        "Condition {} in '{}' is missing '{}'. Required keys: left, operator, right", i, section, key));
                }
            }
            if (!cond["operator"].is_string()) {
                throw core::ValidationError(fmt::format("Condition {} in '{}': 'operator' must be a string", i, section));
            }

            parts.push_back(fmt::format("{} {} {}",
                                        formatTerm(cond["left"]),
                                        formatOperator(cond["operator"].get<std::string>()),
                                        formatTerm(cond["right"])));

            // The last condition's connector has nothing to join
            if (i + 1 < conditions.size()) {
                std::string connector = "AND";
                if (cond.contains("connector") && cond["connector"].is_string()) {
                    connector = core::utils::toUpper(core::utils::trim(cond["connector"].get<std::string>()));
                }
                parts.push_back(connector);
            }
        }

        std::string expression;
        for (const auto& part : parts) {
            if (!expression.empty()) expression += " ";
            expression += part;
        }
        return expression;
    }

    std::string JsonToDsl::formatTerm(const json& term) {
        if (term.is_number_integer()) {
            return fmt::format("{}", term.get<long long>());
        }
        if (term.is_number()) {
            return core::utils::formatNumber(term.get<double>());
        }
        if (!term.is_string()) {
            throw core::ValidationError(fmt::format("Unsupported term in IR: {}", term.dump()));
        }

        const std::string text = term.get<std::string>();

        // Indicator call: uppercase the name, keep the arguments and any trailing arithmetic as written
        const auto open = text.find('(');
        if (open != std::string::npos && text.find(')') != std::string::npos) {
            std::size_t close = std::string::npos;
            int depth = 0;
            for (std::size_t i = open; i < text.size(); ++i) {
                if (text[i] == '(') {
                    ++depth;
                } else if (text[i] == ')' && --depth == 0) {
                    close = i;
                    break;
                }
            }
            if (close == std::string::npos) {
                throw core::ValidationError(fmt::format("Unbalanced parentheses in IR term: '{}'", text));
            }
            return fmt::format("{}({}){}",
                               core::utils::toUpper(core::utils::trim(text.substr(0, open))),
                               text.substr(open + 1, close - open - 1),
                               text.substr(close + 1));
        }

        // Arithmetic passes through unchanged
        if (text.find_first_of("+-*/") != std::string::npos) {
            return text;
        }

        return core::utils::toLower(text);
    }

    std::string JsonToDsl::formatOperator(const std::string& op) {
        const std::string lower = core::utils::toLower(core::utils::trim(op));
        if (lower == ">" || lower == "<" || lower == ">=" || lower == "<=" || lower == "==") {
            return lower;
        }
        if (lower == "crosses_above" || lower == "crosses_below") {
            return core::utils::toUpper(lower);
        }
        return core::utils::toUpper(op);
    }

} // namespace strategy_engine
