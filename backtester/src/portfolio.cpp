#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <algorithm>

namespace backtester {

    Portfolio::Portfolio(const core::BacktestConfig& config, std::string run_id)
        : symbol_(config.symbol),
          run_id_(std::move(run_id)),
          starting_cash_(config.starting_cash),
          cash_(config.starting_cash),
          fee_bps_(config.fee_bps),
          slippage_bps_(config.slippage_bps),
          realized_pnl_net_fees_(config.realized_pnl_net_fees)
    {
        if (config.starting_cash <= 0) {
            throw core::ConfigException("Starting cash must be positive.");
        }
        if (config.fee_bps < 0 || config.slippage_bps < 0) {
            throw core::ConfigException("Fee and slippage rates must be non-negative.");
        }
        core::logging::getLogger()->debug("{}Portfolio initialized: symbol={}, cash={:.2f}, fee_bps={}, slippage_bps={}",
                                          logPrefix(), symbol_, cash_, fee_bps_, slippage_bps_);
    }

    std::string Portfolio::logPrefix() const {
        return run_id_.empty() ? std::string() : "[run:" + run_id_ + "] ";
    }

    void Portfolio::setExecutionRules(const rules::SymbolRules& rules, double slippage_bps) {
        if (slippage_bps < 0) {
            throw core::ConfigException("Slippage must be non-negative.");
        }
        rules_ = rules;
        slippage_bps_ = slippage_bps;
        core::logging::getLogger()->info("{}Execution rules set for {}: tick={}, step={}, slippage_bps={}",
                                         logPrefix(), rules.symbol, rules.tick_size.toString(),
                                         rules.step_size.toString(), slippage_bps_);
    }

    void Portfolio::clearExecutionRules() {
        rules_.reset();
    }

    void Portfolio::markToMarket(double price) {
        last_price_ = price;
    }

    double Portfolio::equity(std::optional<double> price) const {
        std::optional<double> p = price ? price : last_price_;
        if (!p) {
            return cash_;
        }
        return cash_ + quantity_ * *p;
    }

    double Portfolio::pnlTotal() const {
        return equity() - starting_cash_;
    }

    void Portfolio::recordEquitySample(core::Timestamp timestamp) {
        equity_curve_.push_back(EquitySample{timestamp, equity()});
    }

    double Portfolio::affordableQuantity(double price, double alloc_fraction) const {
        if (price <= 0 || alloc_fraction <= 0) {
            return 0.0;
        }
        const double fee_mult = 1.0 + fee_bps_ / 10000.0;
        const double budget = cash_ * alloc_fraction;
        return std::max(0.0, budget / (price * fee_mult));
    }

    ExecutionPreview Portfolio::preview(core::Side side, double quantity, double reference_price) const {
        ExecutionRequest request;
        request.side = side;
        request.reference_price = reference_price;
        request.requested_quantity = quantity;
        request.cash = cash_;
        request.position = quantity_;
        request.fee_bps = fee_bps_;
        request.slippage_bps = slippage_bps_;
        request.rules = rules_ ? &*rules_ : nullptr;
        return previewExecution(request);
    }

    void Portfolio::ensureChronological(core::Timestamp timestamp) const {
        if (!trades_.empty() && timestamp < trades_.back().trade.timestamp) {
            throw core::BacktestException(fmt::format(
                "Trade at {} precedes the last ledger entry at {}",
                core::utils::timestampToString(timestamp),
                core::utils::timestampToString(trades_.back().trade.timestamp)));
        }
    }

    void Portfolio::record(const core::Trade& trade, const ExecutionPreview& execution) {
        TradeRecord entry;
        entry.trade = trade;
        entry.execution = execution;
        entry.fee_bps = execution.notional_after_round != 0.0
            ? 1e4 * (trade.fee / execution.notional_after_round)
            : 0.0;
        entry.schema_version = kSchemaVersion;
        entry.run_id = run_id_;
        if (rules_) {
            entry.tick_size_used = rules_->tick_size;
            entry.step_size_used = rules_->step_size;
            entry.min_notional_used = rules_->min_notional;
        }
        trades_.push_back(std::move(entry));
    }

    bool Portfolio::buy(core::Timestamp timestamp, double quantity, double reference_price, const std::string& note) {
        auto logger = core::logging::getLogger();

        ExecutionPreview prev = preview(core::Side::Buy, quantity, reference_price);
        if (!prev.accepted) {
            logger->info("{}[BUY rejected] {} | qty_raw={:.8f} ref={:.2f}",
                         logPrefix(), rejectionReasonToString(prev.reason), quantity, reference_price);
            return false;
        }
        ensureChronological(timestamp);

        const double price = prev.exec_price;
        const double qty = prev.qty_rounded;
        const double notional = qty * price;
        const double fee = notional * (fee_bps_ / 10000.0);

        // --- Update Portfolio State ---
        cash_ -= notional + fee;
        const double new_qty = quantity_ + qty;
        if (quantity_ <= 0) {
            avg_price_ = price;
        } else {
            avg_price_ = (avg_price_ * quantity_ + price * qty) / new_qty;
        }
        quantity_ = new_qty;
        last_price_ = price;

        core::Trade trade;
        trade.timestamp = timestamp;
        trade.symbol = symbol_;
        trade.side = core::Side::Buy;
        trade.quantity = qty;
        trade.price = price;
        trade.fee = fee;
        trade.cash_after = cash_;
        trade.quantity_after = quantity_;
        trade.equity_after = equity(price);
        trade.realized_pnl = 0.0;
        trade.cum_realized_pnl = realized_pnl_;
        trade.note = note;
        record(trade, prev);

        logger->info("{}Trade Executed: Time={}, Side=BUY, Qty={:.8f}, Price={:.8f}, Fee={:.8f}, NewCash={:.2f}, NewPosQty={:.8f}",
                     logPrefix(), core::utils::timestampToString(timestamp), qty, price, fee, cash_, quantity_);
        return true;
    }

    bool Portfolio::sell(core::Timestamp timestamp, double quantity, double reference_price, const std::string& note) {
        auto logger = core::logging::getLogger();

        if (quantity > quantity_ + kQuantityEpsilon) {
            throw core::InsufficientPositionException(fmt::format(
                "Cannot sell {:.8f} {}: only {:.8f} held", quantity, symbol_, quantity_));
        }

        ExecutionPreview prev = preview(core::Side::Sell, quantity, reference_price);
        if (!prev.accepted) {
            logger->info("{}[SELL rejected] {} | qty_raw={:.8f} ref={:.2f}",
                         logPrefix(), rejectionReasonToString(prev.reason), quantity, reference_price);
            return false;
        }
        ensureChronological(timestamp);

        const double price = prev.exec_price;
        const double qty = std::min(prev.qty_rounded, quantity_);
        const double notional = qty * price;
        const double fee = notional * (fee_bps_ / 10000.0);

        // Average-cost accounting: no lot matching
        double realized = (price - avg_price_) * qty;
        if (realized_pnl_net_fees_) {
            realized -= fee;
        }
        realized_pnl_ += realized;

        cash_ += notional - fee;
        quantity_ -= qty;
        if (quantity_ <= kQuantityEpsilon) {
            quantity_ = 0.0;
            avg_price_ = 0.0;
        }
        last_price_ = price;

        core::Trade trade;
        trade.timestamp = timestamp;
        trade.symbol = symbol_;
        trade.side = core::Side::Sell;
        trade.quantity = qty;
        trade.price = price;
        trade.fee = fee;
        trade.cash_after = cash_;
        trade.quantity_after = quantity_;
        trade.equity_after = equity(price);
        trade.realized_pnl = realized;
        trade.cum_realized_pnl = realized_pnl_;
        trade.note = note;
        record(trade, prev);

        logger->info("{}Trade Executed: Time={}, Side=SELL, Qty={:.8f}, Price={:.8f}, Fee={:.8f}, Realized={:.2f}, NewCash={:.2f}, NewPosQty={:.8f}",
                     logPrefix(), core::utils::timestampToString(timestamp), qty, price, fee, realized, cash_, quantity_);
        return true;
    }

    PortfolioSummary Portfolio::summary() const {
        PortfolioSummary s;
        s.starting_cash = starting_cash_;
        s.cash = cash_;
        s.quantity = quantity_;
        s.last_price = last_price_;
        s.equity = equity();
        s.realized_pnl = realized_pnl_;
        s.total_pnl = pnlTotal();
        s.avg_price = avg_price_;
        return s;
    }

} // namespace backtester
