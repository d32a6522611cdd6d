#include "portfolio.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace backtester {

namespace {
// Rounding slack when an order spends the whole cash balance.
constexpr double kCashTolerance = 1e-9;
// Remaining quantity below this is treated as flat.
constexpr double kQtyEpsilon = 1e-12;
}

Portfolio::Portfolio(double initial_cash) {
    state_.cash = initial_cash;
}

void Portfolio::apply_buy(double price, double qty, double commission) {
    if (!(qty > 0.0) || !(price > 0.0) || commission < 0.0) {
        throw std::logic_error("invalid buy: qty=" + std::to_string(qty) +
                               " price=" + std::to_string(price));
    }
    double cost = qty * price + commission;
    double remaining = state_.cash - cost;
    if (remaining < -kCashTolerance * std::max(1.0, state_.cash)) {
        throw std::logic_error("buy of " + std::to_string(cost) +
                               " exceeds cash " + std::to_string(state_.cash));
    }

    double old_qty = state_.quantity;
    double new_qty = old_qty + qty;
    state_.avg_entry_price = (state_.avg_entry_price * old_qty + price * qty) / new_qty;
    state_.quantity = new_qty;
    state_.cash = std::max(0.0, remaining);
    state_.accrued_commission += commission;
}

void Portfolio::apply_sell(double price, double qty, double commission) {
    if (!(qty > 0.0) || !(price > 0.0) || commission < 0.0) {
        throw std::logic_error("invalid sell: qty=" + std::to_string(qty) +
                               " price=" + std::to_string(price));
    }
    if (qty > state_.quantity + kQtyEpsilon) {
        throw std::logic_error("sell of " + std::to_string(qty) +
                               " exceeds position " + std::to_string(state_.quantity));
    }

    state_.quantity -= qty;
    if (state_.quantity <= kQtyEpsilon) {
        state_.quantity = 0.0;
        state_.avg_entry_price = 0.0;
    }
    state_.cash += qty * price;
    state_.cash -= commission;
    state_.accrued_commission += commission;
}

void Portfolio::record_slippage(double amount) {
    state_.accrued_slippage += amount;
}

double Portfolio::mark_to_market(double price) const {
    return state_.cash + state_.quantity * price;
}

} // namespace backtester
