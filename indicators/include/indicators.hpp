#pragma once

#include "datatypes.hpp" // Needs TimeSeries
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace indicators {

    // Closed set of indicator kinds. Validation and computation both dispatch
    // through an exhaustive switch over this enum.
    enum class IndicatorKind {
        Sma,
        Ema,
        Rsi,
        Prev
    };

    // Call shape of an indicator: (series, parameter). The parameter may be
    // optional, in which case default_parameter applies.
    struct IndicatorSignature {
        IndicatorKind kind;
        std::string name;             // Lowercase DSL name, e.g. "sma"
        std::size_t required_args;
        std::size_t max_args;
        std::optional<double> default_parameter;
    };

    // Lookup by lowercase name; std::nullopt if not in the registry.
    std::optional<IndicatorKind> indicatorFromName(const std::string& name);

    std::string indicatorName(IndicatorKind kind);

    IndicatorSignature signatureOf(IndicatorKind kind);

    // Sorted list of registry names, used in validation messages.
    const std::vector<std::string>& validIndicatorNames();

    // Period-like parameters arrive as doubles from the DSL and are truncated
    // toward zero. Non-finite or out-of-range values throw std::invalid_argument.
    int coercePeriod(double value, const std::string& indicator);

    // Computes an aligned output (same length as series, NaN where undefined).
    // Throws std::invalid_argument for bad parameters.
    core::TimeSeries<double> compute(IndicatorKind kind,
                                     const core::TimeSeries<double>& series,
                                     double parameter);

} // namespace indicators
