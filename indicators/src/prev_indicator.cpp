#include "prev_indicator.hpp"
#include "logging.hpp"
#include <limits>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

PrevIndicator::PrevIndicator(int bars_back) : bars_back_(bars_back) {
    if (bars_back_ < 0) {
        throw std::invalid_argument(fmt::format("PREV bars back must not be negative, got {}", bars_back_));
    }
    name_ = fmt::format("PREV({})", bars_back_);
}

std::string PrevIndicator::getName() const {
    return name_;
}

int PrevIndicator::getLookback() const {
    return bars_back_;
}

const core::TimeSeries<double>& PrevIndicator::getResult() const {
    return results_;
}

void PrevIndicator::calculate(const core::TimeSeries<double>& input) {
    results_.assign(input.size(), std::numeric_limits<double>::quiet_NaN());
    const std::size_t shift = static_cast<std::size_t>(bars_back_);
    for (std::size_t i = shift; i < input.size(); ++i) {
        results_[i] = input[i - shift];
    }
    core::logging::getLogger()->trace("Calculated {} over {} bars", name_, results_.size());
}

} // namespace indicators
