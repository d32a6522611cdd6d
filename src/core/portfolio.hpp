#pragma once

namespace backtester {

struct PortfolioState {
    double cash{0.0};
    double quantity{0.0};          // shares held, never negative
    double avg_entry_price{0.0};   // 0 when flat
    double accrued_commission{0.0};
    double accrued_slippage{0.0};  // price penalty paid versus the raw close
};

/**
 * Cash and a single long position.
 *
 * Long-only, no leverage: a buy that would overdraw cash or a sell larger
 * than the held quantity throws std::logic_error. Order sizing is the
 * caller's job; an exception here means the sizing logic is wrong.
 */
class Portfolio {
public:
    explicit Portfolio(double initial_cash = 10000.0);

    // Debit qty * price + commission; avg entry price becomes the weighted average.
    void apply_buy(double price, double qty, double commission);

    // Credit qty * price - commission; avg entry price resets when flat.
    void apply_sell(double price, double qty, double commission);

    // Track slippage paid for reporting; does not touch cash.
    void record_slippage(double amount);

    double mark_to_market(double price) const;

    const PortfolioState& state() const { return state_; }
    double cash() const { return state_.cash; }
    double quantity() const { return state_.quantity; }
    bool is_flat() const { return state_.quantity == 0.0; }

private:
    PortfolioState state_;
};

} // namespace backtester
