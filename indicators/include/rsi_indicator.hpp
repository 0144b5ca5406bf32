#pragma once

#include "datatypes.hpp"
#include <string>

namespace indicators {

class RsiIndicator {
public:
    // Constructor: Requires the period for the RSI
    explicit RsiIndicator(int period);

    std::string getName() const;
    int getLookback() const;
    void calculate(const core::TimeSeries<double>& input);
    const core::TimeSeries<double>& getResult() const;

private:
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
