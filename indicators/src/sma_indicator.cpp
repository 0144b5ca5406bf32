#include "sma_indicator.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument(fmt::format("SMA period must be positive, got {}", period_));
    }

    // Determine the lookback period required by TA-Lib for this period
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    core::logging::getLogger()->trace("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& SmaIndicator::getResult() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<double>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.assign(input.size(), std::numeric_limits<double>::quiet_NaN());

    // A window touching an undefined input is undefined, so TA-Lib runs on
    // each maximal stretch of defined values separately.
    std::vector<double> buffer;
    std::size_t start = 0;
    while (start < input.size()) {
        if (std::isnan(input[start])) {
            ++start;
            continue;
        }
        std::size_t end = start;
        while (end < input.size() && !std::isnan(input[end])) {
            ++end;
        }

        const int run_length = static_cast<int>(end - start);
        if (run_length > lookback_) {
            buffer.assign(static_cast<std::size_t>(run_length - lookback_), 0.0);
            int out_begin_idx = 0;
            int out_nb_element = 0;

            TA_RetCode ret_code = TA_MA(
                0,                         // startIdx
                run_length - 1,            // endIdx
                input.data() + start,      // inReal
                period_,                   // optInTimePeriod
                TA_MAType_SMA,             // optInMAType
                &out_begin_idx,
                &out_nb_element,
                buffer.data()
            );

            if (ret_code != TA_SUCCESS) {
                logger->error("TA-Lib TA_MA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code));
                throw std::runtime_error(fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
            }

            for (int k = 0; k < out_nb_element; ++k) {
                results_[start + static_cast<std::size_t>(out_begin_idx + k)] = buffer[static_cast<std::size_t>(k)];
            }
        }
        start = end;
    }

    logger->trace("Calculated {} over {} bars", name_, results_.size());
}

} // namespace indicators
