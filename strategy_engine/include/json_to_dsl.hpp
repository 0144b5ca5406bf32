#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace strategy_engine {

    // --- JsonToDsl ---
    // Renders the structured strategy IR
    //   {"entry": [{"left": ..., "operator": ..., "right": ..., "connector": "AND"}, ...],
    //    "exit":  [...]}
    // as DSL text. A missing or empty entry section renders TRUE, a missing or
    // empty exit section FALSE. Malformed IR throws core::ValidationError.
    class JsonToDsl {
    public:
        static std::string convert(const nlohmann::json& ir);

        static std::string formatTerm(const nlohmann::json& term);
        static std::string formatOperator(const std::string& op);

    private:
        static std::string buildExpression(const nlohmann::json& conditions, const std::string& section);
    };

} // namespace strategy_engine
