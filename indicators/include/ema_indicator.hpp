#pragma once

#include "datatypes.hpp"
#include <string>

namespace indicators {

// Exponential moving average with span = period (alpha = 2 / (period + 1)).
// Recursive form seeded with the first defined value; undefined until
// `period` defined values have been seen.
class EmaIndicator {
public:
    explicit EmaIndicator(int period);

    std::string getName() const;
    int getLookback() const;
    void calculate(const core::TimeSeries<double>& input);
    const core::TimeSeries<double>& getResult() const;

private:
    const int period_;
    const double alpha_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
