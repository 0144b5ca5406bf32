#include "portfolio.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital),
          cash_(initial_capital),
          equity_(initial_capital),
          peak_equity_(initial_capital) {
        if (!(initial_capital > 0)) {
            throw core::BacktestException(fmt::format("Initial capital must be positive, got {}", initial_capital));
        }
    }

    void Portfolio::openPosition(core::Timestamp timestamp, double price) {
        if (state_ == core::PositionState::InPosition) {
            throw core::BacktestException("Cannot open a position while one is already open.");
        }
        if (!(price > 0)) {
            throw core::BacktestException(fmt::format(
                "Cannot enter at non-positive price {} ({})", price, core::utils::timestampToString(timestamp)));
        }

        core::Position position;
        position.entry_time = timestamp;
        position.entry_price = price;
        position.share_count = equity_ / price;   // Fully invested
        open_position_ = position;
        state_ = core::PositionState::InPosition;
        cash_ = 0.0;

        core::logging::getLogger()->debug("ENTER {} @ {:.2f}: {:.4f} shares",
                                          core::utils::timestampToString(timestamp), price, position.share_count);
    }

    const core::Trade& Portfolio::closePosition(core::Timestamp timestamp, double price) {
        if (state_ != core::PositionState::InPosition || !open_position_) {
            throw core::BacktestException("Cannot close a position when none is open.");
        }

        const core::Position& position = *open_position_;
        core::Trade trade;
        trade.entry_time = position.entry_time;
        trade.exit_time = timestamp;
        trade.entry_price = position.entry_price;
        trade.exit_price = price;
        trade.share_count = position.share_count;
        trade.pnl = position.share_count * (price - position.entry_price);
        trade.pnl_pct = (price - position.entry_price) / position.entry_price;

        // Realized PnL is added on top of the last marked equity
        equity_ += trade.pnl;
        cash_ = equity_;
        open_position_.reset();
        state_ = core::PositionState::NoPosition;
        trade_log_.push_back(trade);

        core::logging::getLogger()->debug("EXIT  {} @ {:.2f}: pnl {:.2f} ({:.2f}%)",
                                          core::utils::timestampToString(timestamp), price, trade.pnl, trade.pnl_pct * 100.0);
        return trade_log_.back();
    }

    void Portfolio::markToMarket(double price) {
        if (state_ != core::PositionState::InPosition || !open_position_) {
            return;
        }
        equity_ = open_position_->share_count * price;
    }

    PortfolioState Portfolio::currentState(core::Timestamp timestamp) const {
        PortfolioState state;
        state.timestamp = timestamp;
        state.cash = cash_;
        state.positions_value = open_position_ ? equity_ - cash_ : 0.0;
        state.total_equity = equity_;
        return state;
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp) {
        if (equity_ > peak_equity_) {
            peak_equity_ = equity_;
        }
        const double drawdown = (equity_ - peak_equity_) / peak_equity_;
        if (drawdown < max_drawdown_) {
            max_drawdown_ = drawdown;
        }
        equity_curve_.push_back(currentState(timestamp));
    }

    void Portfolio::recordCarryForward(core::Timestamp timestamp) {
        equity_curve_.push_back(currentState(timestamp));
    }

} // namespace backtester
