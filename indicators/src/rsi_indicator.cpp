#include "rsi_indicator.hpp"
#include "logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument(fmt::format("RSI period must be positive, got {}", period_));
    }
    // The first delta has no predecessor and counts as zero movement, so the
    // first full window closes at index period - 1.
    lookback_ = period_ - 1;
    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->trace("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RsiIndicator::getResult() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    const std::size_t n = input.size();
    results_.assign(n, std::numeric_limits<double>::quiet_NaN());
    if (n < static_cast<std::size_t>(period_)) {
        logger->trace("Input size ({}) is less than period ({}) for {}. No values defined.", n, period_, name_);
        return;
    }

    // Per-bar gains and losses; an undefined delta is no movement.
    std::vector<double> gains(n, 0.0);
    std::vector<double> losses(n, 0.0);
    for (std::size_t i = 1; i < n; ++i) {
        const double delta = input[i] - input[i - 1];
        if (delta > 0.0) {
            gains[i] = delta;
        } else if (delta < 0.0) {
            losses[i] = -delta;
        }
    }

    // Trailing window sums. Counting the non-zero members keeps an all-flat
    // side exactly zero instead of a rounding residue.
    const std::size_t window = static_cast<std::size_t>(period_);
    double gain_sum = 0.0;
    double loss_sum = 0.0;
    int gain_count = 0;
    int loss_count = 0;
    for (std::size_t i = 0; i < n; ++i) {
        gain_sum += gains[i];
        loss_sum += losses[i];
        gain_count += gains[i] > 0.0 ? 1 : 0;
        loss_count += losses[i] > 0.0 ? 1 : 0;
        if (i >= window) {
            gain_sum -= gains[i - window];
            loss_sum -= losses[i - window];
            gain_count -= gains[i - window] > 0.0 ? 1 : 0;
            loss_count -= losses[i - window] > 0.0 ? 1 : 0;
        }
        if (i + 1 < window) {
            continue;
        }

        const double avg_gain = gain_count > 0 ? gain_sum / period_ : 0.0;
        const double avg_loss = loss_count > 0 ? loss_sum / period_ : 0.0;
        if (avg_loss == 0.0) {
            // All gains: RS is infinite. Flat window: undefined.
            if (avg_gain > 0.0) {
                results_[i] = 100.0;
            }
            continue;
        }
        const double rs = avg_gain / avg_loss;
        results_[i] = 100.0 - 100.0 / (1.0 + rs);
    }

    logger->trace("Calculated {} over {} bars", name_, results_.size());
}

} // namespace indicators
