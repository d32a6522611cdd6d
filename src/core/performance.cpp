#include "performance.hpp"
#include <algorithm>
#include <cmath>
#include "errors.hpp"

namespace backtester {

namespace {

// Standard deviations at or below this are treated as zero variance.
constexpr double kStdevEpsilon = 1e-12;

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double s = 0.0;
    for (double x : v) s += x;
    return s / static_cast<double>(v.size());
}

// Sample (n-1) standard deviation; 0 for fewer than two values.
double stdev_of(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    double mean = mean_of(v);
    double var = 0.0;
    for (double x : v) {
        double d = x - mean;
        var += d * d;
    }
    var /= static_cast<double>(v.size() - 1);
    return std::sqrt(var);
}

} // namespace

MetricsCalculator::MetricsCalculator(double risk_free_rate)
    : risk_free_rate_(risk_free_rate) {}

std::vector<double> MetricsCalculator::daily_returns(const EquityCurve& curve) {
    std::vector<double> rets;
    if (curve.size() < 2) return rets;
    rets.reserve(curve.size() - 1);
    for (size_t i = 1; i < curve.size(); ++i) {
        double prev = curve[i - 1].equity;
        double cur = curve[i].equity;
        rets.push_back(prev != 0.0 ? (cur - prev) / prev : 0.0);
    }
    return rets;
}

PerformanceMetrics MetricsCalculator::compute(const EquityCurve& curve,
                                              const TradeLog& trades,
                                              const EquityCurve* benchmark) const {
    if (curve.empty()) {
        throw InputError("equity curve is empty");
    }
    if (!(curve.front().equity > 0.0)) {
        throw InputError("equity curve must start above zero");
    }

    PerformanceMetrics out;
    compute_return_stats(curve, out);
    compute_drawdown(curve, out);
    if (out.max_drawdown < 0.0) {
        out.calmar = out.annualized_return / std::abs(out.max_drawdown);
    }
    compute_trade_stats(trades, out);
    if (benchmark) {
        compute_alpha_beta(curve, *benchmark, out);
    }
    return out;
}

void MetricsCalculator::compute_return_stats(const EquityCurve& curve, PerformanceMetrics& out) const {
    double start = curve.front().equity;
    double end = curve.back().equity;
    out.total_return = end / start - 1.0;

    const size_t n = curve.size() - 1;
    if (n >= 1) {
        double growth = std::max(0.0, 1.0 + out.total_return);
        out.annualized_return = std::pow(growth, kTradingDaysPerYear / static_cast<double>(n)) - 1.0;
    }

    auto rets = daily_returns(curve);
    if (rets.size() < 2) return;

    out.volatility = stdev_of(rets) * std::sqrt(kTradingDaysPerYear);

    const double daily_rf = std::pow(1.0 + risk_free_rate_, 1.0 / kTradingDaysPerYear) - 1.0;
    std::vector<double> excess;
    std::vector<double> downside;
    excess.reserve(rets.size());
    for (double r : rets) {
        double e = r - daily_rf;
        excess.push_back(e);
        if (e < 0.0) downside.push_back(e);
    }

    double mean_excess = mean_of(excess);
    double sd = stdev_of(excess);
    if (sd > kStdevEpsilon) {
        out.sharpe = mean_excess / sd * std::sqrt(kTradingDaysPerYear);
    }
    double downside_sd = stdev_of(downside);
    if (downside_sd > kStdevEpsilon) {
        out.sortino = mean_excess / downside_sd * std::sqrt(kTradingDaysPerYear);
    }
}

void MetricsCalculator::compute_drawdown(const EquityCurve& curve, PerformanceMetrics& out) {
    double peak = curve.front().equity;
    double max_dd = 0.0;
    size_t run = 0;
    size_t longest = 0;
    for (const auto& p : curve) {
        if (p.equity > peak) peak = p.equity;
        double dd = p.equity / peak - 1.0;
        if (dd < max_dd) max_dd = dd;
        if (p.equity < peak) {
            longest = std::max(longest, ++run);
        } else {
            run = 0;
        }
    }
    out.max_drawdown = max_dd;
    out.max_drawdown_duration = longest;
}

void MetricsCalculator::compute_trade_stats(const TradeLog& trades, PerformanceMetrics& out) {
    out.num_trades = trades.size();
    if (trades.empty()) return;

    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double sum_return = 0.0;
    for (const auto& t : trades) {
        sum_return += t.return_pct;
        if (t.pnl > 0.0) {
            ++out.winning_trades;
            gross_profit += t.pnl;
        } else if (t.pnl < 0.0) {
            ++out.losing_trades;
            gross_loss += t.pnl;
        }
    }

    const double n = static_cast<double>(trades.size());
    out.win_rate = static_cast<double>(out.winning_trades) / n;
    out.avg_trade_return_pct = sum_return / n;
    if (out.winning_trades > 0) out.avg_win = gross_profit / static_cast<double>(out.winning_trades);
    if (out.losing_trades > 0) out.avg_loss = gross_loss / static_cast<double>(out.losing_trades);

    if (gross_loss < 0.0) {
        out.profit_factor = gross_profit / std::abs(gross_loss);
    } else if (gross_profit > 0.0) {
        out.profit_factor = kProfitFactorNoLosses;
    }
}

void MetricsCalculator::compute_alpha_beta(const EquityCurve& curve, const EquityCurve& benchmark,
                                           PerformanceMetrics& out) {
    out.alpha = 0.0;
    out.beta = 0.0;

    // Both curves are chronological; keep only timestamps present in both.
    EquityCurve s_aligned;
    EquityCurve b_aligned;
    size_t i = 0;
    size_t j = 0;
    while (i < curve.size() && j < benchmark.size()) {
        if (curve[i].timestamp < benchmark[j].timestamp) {
            ++i;
        } else if (benchmark[j].timestamp < curve[i].timestamp) {
            ++j;
        } else {
            s_aligned.push_back(curve[i++]);
            b_aligned.push_back(benchmark[j++]);
        }
    }

    auto s = daily_returns(s_aligned);
    auto b = daily_returns(b_aligned);
    if (s.size() < 2) return;

    double mean_s = mean_of(s);
    double mean_b = mean_of(b);
    double cov = 0.0;
    double var_b = 0.0;
    for (size_t k = 0; k < s.size(); ++k) {
        cov += (s[k] - mean_s) * (b[k] - mean_b);
        var_b += (b[k] - mean_b) * (b[k] - mean_b);
    }
    const double denom = static_cast<double>(s.size() - 1);
    cov /= denom;
    var_b /= denom;
    if (std::sqrt(var_b) <= kStdevEpsilon) return;

    double beta = cov / var_b;
    out.beta = beta;
    out.alpha = (mean_s - beta * mean_b) * kTradingDaysPerYear;
}

} // namespace backtester
