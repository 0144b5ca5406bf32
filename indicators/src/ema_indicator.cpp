#include "ema_indicator.hpp"
#include "logging.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period)
    : period_(period), alpha_(2.0 / (static_cast<double>(period) + 1.0)) {
    if (period_ <= 0) {
        throw std::invalid_argument(fmt::format("EMA period must be positive, got {}", period_));
    }
    name_ = fmt::format("EMA({})", period_);
    core::logging::getLogger()->trace("EmaIndicator created: Name='{}', Period={}, Alpha={}", name_, period_, alpha_);
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return period_ - 1;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    results_.assign(input.size(), nan);

    double weighted = nan;
    double old_weight = 1.0;
    int observations = 0;

    for (std::size_t i = 0; i < input.size(); ++i) {
        const double value = input[i];
        const bool is_observation = !std::isnan(value);
        if (is_observation) {
            ++observations;
        }

        if (!std::isnan(weighted)) {
            // The previous mean decays on every bar, including undefined ones,
            // so a gap weights the next observation more heavily.
            old_weight *= (1.0 - alpha_);
            if (is_observation) {
                if (weighted != value) {
                    weighted = (old_weight * weighted + alpha_ * value) / (old_weight + alpha_);
                }
                old_weight = 1.0;
            }
        } else if (is_observation) {
            weighted = value; // Seed
        }

        if (observations >= period_) {
            results_[i] = weighted;
        }
    }

    logger->trace("Calculated {} over {} bars", name_, results_.size());
}

} // namespace indicators
