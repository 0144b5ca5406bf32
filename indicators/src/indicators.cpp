#include "indicators.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "prev_indicator.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace indicators {

    std::optional<IndicatorKind> indicatorFromName(const std::string& name) {
        if (name == "sma") return IndicatorKind::Sma;
        if (name == "ema") return IndicatorKind::Ema;
        if (name == "rsi") return IndicatorKind::Rsi;
        if (name == "prev") return IndicatorKind::Prev;
        return std::nullopt;
    }

    std::string indicatorName(IndicatorKind kind) {
        switch (kind) {
            case IndicatorKind::Sma: return "sma";
            case IndicatorKind::Ema: return "ema";
            case IndicatorKind::Rsi: return "rsi";
            case IndicatorKind::Prev: return "prev";
        }
        throw std::logic_error("Unhandled IndicatorKind");
    }

    IndicatorSignature signatureOf(IndicatorKind kind) {
        switch (kind) {
            case IndicatorKind::Sma: return {kind, "sma", 2, 2, std::nullopt};
            case IndicatorKind::Ema: return {kind, "ema", 2, 2, std::nullopt};
            case IndicatorKind::Rsi: return {kind, "rsi", 1, 2, 14.0};
            case IndicatorKind::Prev: return {kind, "prev", 1, 2, 1.0};
        }
        throw std::logic_error("Unhandled IndicatorKind");
    }

    const std::vector<std::string>& validIndicatorNames() {
        static const std::vector<std::string> names = {"ema", "prev", "rsi", "sma"};
        return names;
    }

    int coercePeriod(double value, const std::string& indicator) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument(fmt::format("{} period must be finite, got {}", indicator, value));
        }
        // Fractional periods truncate toward zero
        const double truncated = std::trunc(value);
        if (truncated > static_cast<double>(std::numeric_limits<int>::max()) ||
            truncated < static_cast<double>(std::numeric_limits<int>::min())) {
            throw std::invalid_argument(fmt::format("{} period is out of range: {}", indicator, value));
        }
        return static_cast<int>(truncated);
    }

    core::TimeSeries<double> compute(IndicatorKind kind,
                                     const core::TimeSeries<double>& series,
                                     double parameter) {
        const int period = coercePeriod(parameter, indicatorName(kind));
        switch (kind) {
            case IndicatorKind::Sma: {
                SmaIndicator sma(period);
                sma.calculate(series);
                return sma.getResult();
            }
            case IndicatorKind::Ema: {
                EmaIndicator ema(period);
                ema.calculate(series);
                return ema.getResult();
            }
            case IndicatorKind::Rsi: {
                RsiIndicator rsi(period);
                rsi.calculate(series);
                return rsi.getResult();
            }
            case IndicatorKind::Prev: {
                PrevIndicator prev(period);
                prev.calculate(series);
                return prev.getResult();
            }
        }
        throw std::logic_error("Unhandled IndicatorKind");
    }

} // namespace indicators
