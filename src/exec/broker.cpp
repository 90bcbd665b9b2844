#include "exec/broker.hpp"
#include "filters.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace exec {

Broker::Broker(BrokerConfig cfg) : cfg_(cfg), cash_(cfg.cash) {}

void Broker::submit(const strat::Intent& intent){
    if (intent.type == strat::IntentType::None) return;
    pending_ = intent;
}

void Broker::open_long(const Bar& b, std::size_t i, double sl, double tp){
    const double px  = b.open;
    const double adj = px * (1.0 + cfg_.commission);
    const double qty = floor_step(cash_ * cfg_.size_fraction / adj, cfg_.size_step);
    if (qty <= 0.0){
        spdlog::warn("bar {}: not enough cash ({:.2f}) for one unit at {:.2f}, order skipped", i, cash_, px);
        return;
    }
    entry_fee_ = qty * px * cfg_.commission;
    cash_ -= qty * px + entry_fee_;
    size_ = qty;
    entry_bar_ = i;
    entry_time_ = b.open_time_ms;
    pos_ = {strat::Side::Long, px, sl, tp};
    spdlog::debug("bar {}: BUY {} @ {:.2f} sl={:.2f} tp={:.2f}", i, qty, px, sl, tp);
}

void Broker::close_long(double price, std::int64_t t, std::size_t i, ExitReason r){
    const double exit_fee = size_ * price * cfg_.commission;
    cash_ += size_ * price - exit_fee;

    Trade tr;
    tr.entry_bar = entry_bar_;
    tr.exit_bar = i;
    tr.entry_time_ms = entry_time_;
    tr.exit_time_ms = t;
    tr.size = size_;
    tr.entry_price = pos_.entry_price;
    tr.exit_price = price;
    tr.stop_loss = pos_.stop_loss;
    tr.take_profit = pos_.take_profit;
    tr.commission = entry_fee_ + exit_fee;
    tr.pnl = size_ * (price - pos_.entry_price) - tr.commission;
    tr.return_pct = tr.pnl / (size_ * pos_.entry_price) * 100.0;
    tr.reason = r;
    trades_.push_back(tr);
    spdlog::debug("bar {}: SELL {} @ {:.2f} ({}) pnl={:.2f}", i, size_, price, to_string(r), tr.pnl);

    size_ = 0.0;
    entry_fee_ = 0.0;
    pos_ = {};
}

void Broker::check_brackets(const Bar& b, std::size_t i){
    if (!pos_.is_long()) return;
    // mindkettő érintve egy baron belül -> a stop-loss nyer
    if (b.low <= pos_.stop_loss){
        close_long(std::min(b.open, pos_.stop_loss), b.open_time_ms, i, ExitReason::StopLoss);
    } else if (b.high >= pos_.take_profit){
        close_long(std::max(b.open, pos_.take_profit), b.open_time_ms, i, ExitReason::TakeProfit);
    }
}

void Broker::on_bar(const Bar& b, std::size_t i){
    if (pending_){
        const strat::Intent it = *pending_;
        pending_.reset();
        if (it.type == strat::IntentType::OpenLong){
            if (pos_.is_long()) spdlog::debug("bar {}: open ignored, already long", i);
            else open_long(b, i, it.stop_loss, it.take_profit);
        } else if (it.type == strat::IntentType::CloseLong){
            if (pos_.is_long()) close_long(b.open, b.open_time_ms, i, ExitReason::Signal);
        }
    }
    check_brackets(b, i);
}

void Broker::close_all(const Bar& last, std::size_t i){
    pending_.reset();
    if (pos_.is_long()) close_long(last.close, last.open_time_ms, i, ExitReason::EndOfData);
}

BacktestResult run_backtest(const Bars& bars, const ind::IndicatorSeries& s,
                            const strat::StrategyConfig& scfg, const BrokerConfig& bcfg){
    BacktestResult r;
    r.initial_cash = bcfg.cash;
    r.intents.assign(bars.size(), strat::Intent::none());
    r.equity.reserve(bars.size());

    Broker br(bcfg);
    for (std::size_t i = 0; i < bars.size(); ++i){
        br.on_bar(bars[i], i);

        const strat::Intent it = strat::evaluate(bars, s, br.position(), i, scfg);
        r.intents[i] = it;
        if (it.type != strat::IntentType::None){
            if (i + 1 < bars.size()) br.submit(it);
            else spdlog::debug("bar {}: {} on last bar discarded", i, strat::to_string(it.type));
        }

        if (br.position().is_long()) ++r.bars_in_position;
        r.equity.push_back({bars[i].open_time_ms, br.equity(bars[i].close)});
    }

    if (!bars.empty()){
        br.close_all(bars.back(), bars.size() - 1);
        r.equity.back().equity = br.cash();
    }
    r.final_cash = br.cash();
    r.trades = br.trades();
    return r;
}

} // namespace exec
