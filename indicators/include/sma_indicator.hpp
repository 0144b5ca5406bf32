#pragma once

#include "datatypes.hpp"
#include <string>

namespace indicators {

class SmaIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    std::string getName() const;
    // Bars consumed before the first defined output (period - 1)
    int getLookback() const;
    // Output is aligned with input; NaN marks bars without a full window.
    void calculate(const core::TimeSeries<double>& input);
    const core::TimeSeries<double>& getResult() const;

private:
    const int period_;          // SMA period (e.g., 50, 200)
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(50)")
    core::TimeSeries<double> results_;
};

} // namespace indicators
