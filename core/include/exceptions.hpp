#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace core {

    class QuantDslException : public std::runtime_error {
    public:
        explicit QuantDslException(const std::string& message)
            : std::runtime_error(message) {}

        explicit QuantDslException(const char* message)
            : std::runtime_error(message) {}
    };

    // --- Strategy language errors ---

    // Grammar violation. Carries the offending token and where it was found.
    class SyntaxError : public QuantDslException {
    public:
        SyntaxError(const std::string& message, std::string token, int line, int column)
            : QuantDslException(message), token_(std::move(token)), line_(line), column_(column) {}

        const std::string& token() const { return token_; }
        int line() const { return line_; }
        int column() const { return column_; }

    private:
        std::string token_;
        int line_;
        int column_;
    };

    // Grammatically valid but names something outside the fixed field/indicator/operator sets.
    class ValidationError : public QuantDslException {
    public: using QuantDslException::QuantDslException; };

    // Unexpected failure while computing signals. Wraps the indicator involved.
    class RuntimeError : public QuantDslException {
    public:
        RuntimeError(const std::string& message, std::string indicator_name = {})
            : QuantDslException(message), indicator_name_(std::move(indicator_name)) {}

        const std::string& indicatorName() const { return indicator_name_; }

    private:
        std::string indicator_name_;
    };

    // --- Ambient layers ---
    class ConfigException : public QuantDslException {
    public: using QuantDslException::QuantDslException; };

    class DataLoadException : public QuantDslException {
    public: using QuantDslException::QuantDslException; };

    class BacktestException : public QuantDslException {
    public: using QuantDslException::QuantDslException; };

} // namespace core
