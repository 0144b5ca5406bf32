#pragma once

#include "datatypes.hpp"
#include <string>

namespace indicators {

// Value exactly n bars prior. prev(x, 0) is x itself.
class PrevIndicator {
public:
    explicit PrevIndicator(int bars_back);

    std::string getName() const;
    int getLookback() const;
    void calculate(const core::TimeSeries<double>& input);
    const core::TimeSeries<double>& getResult() const;

private:
    const int bars_back_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
