// src/indicators/indicator_engine.cpp

#include "finpipe/indicators/indicator_engine.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include "finpipe/core/logger.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "IndicatorEngine";
constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

struct PriceColumns {
    std::vector<Timestamp> dates;
    Eigen::VectorXd high;
    Eigen::VectorXd low;
    Eigen::VectorXd close;
    Eigen::VectorXd volume;

    Eigen::Index size() const {
        return close.size();
    }
};

PriceColumns to_columns(std::vector<PriceBar> bars) {
    std::sort(bars.begin(), bars.end(),
              [](const PriceBar& a, const PriceBar& b) { return a.date < b.date; });
    const auto n = static_cast<Eigen::Index>(bars.size());
    PriceColumns cols;
    cols.dates.reserve(bars.size());
    cols.high.resize(n);
    cols.low.resize(n);
    cols.close.resize(n);
    cols.volume.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& bar = bars[static_cast<size_t>(i)];
        cols.dates.push_back(bar.date);
        cols.high(i) = bar.high;
        cols.low(i) = bar.low;
        cols.close(i) = bar.close;
        cols.volume(i) = bar.volume;
    }
    return cols;
}

Eigen::VectorXd undefined(Eigen::Index n) {
    return Eigen::VectorXd::Constant(n, kUndefined);
}

Eigen::VectorXd typical_price(const PriceColumns& c) {
    return (c.high + c.low + c.close) / 3.0;
}

// Mean of the n values ending at i
double window_mean(const Eigen::VectorXd& x, Eigen::Index i, Eigen::Index n) {
    return x.segment(i + 1 - n, n).mean();
}

Eigen::VectorXd sma(const Eigen::VectorXd& x, Eigen::Index n) {
    Eigen::VectorXd out = undefined(x.size());
    for (Eigen::Index i = n - 1; i < x.size(); ++i) {
        out(i) = window_mean(x, i, n);
    }
    return out;
}

// Seeded with the SMA of the first n values
Eigen::VectorXd ema(const Eigen::VectorXd& x, Eigen::Index n) {
    Eigen::VectorXd out = undefined(x.size());
    if (x.size() < n) {
        return out;
    }
    const double k = 2.0 / (static_cast<double>(n) + 1.0);
    double value = x.head(n).mean();
    out(n - 1) = value;
    for (Eigen::Index i = n; i < x.size(); ++i) {
        value = (x(i) - value) * k + value;
        out(i) = value;
    }
    return out;
}

Eigen::VectorXd rsi(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    Eigen::VectorXd diff = c.close.tail(len - 1) - c.close.head(len - 1);
    Eigen::VectorXd gains = diff.cwiseMax(0.0);
    Eigen::VectorXd losses = (-diff).cwiseMax(0.0);

    auto value = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            return 100.0;
        }
        return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
    };

    double avg_gain = gains.head(n).mean();
    double avg_loss = losses.head(n).mean();
    out(n) = value(avg_gain, avg_loss);
    const double p = static_cast<double>(n);
    for (Eigen::Index k = n; k < diff.size(); ++k) {
        avg_gain = (avg_gain * (p - 1.0) + gains(k)) / p;
        avg_loss = (avg_loss * (p - 1.0) + losses(k)) / p;
        out(k + 1) = value(avg_gain, avg_loss);
    }
    return out;
}

std::vector<Eigen::VectorXd> macd(const PriceColumns& c, Eigen::Index fast, Eigen::Index slow,
                                  Eigen::Index signal) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd fast_ema = ema(c.close, fast);
    Eigen::VectorXd slow_ema = ema(c.close, slow);

    Eigen::VectorXd line = undefined(len);
    for (Eigen::Index i = slow; i < len; ++i) {
        line(i) = fast_ema(i) - slow_ema(i);
    }

    Eigen::VectorXd signal_line = undefined(len);
    const Eigen::Index first = slow + signal - 1;
    const double k = 2.0 / (static_cast<double>(signal) + 1.0);
    double value = line.segment(slow, signal).mean();
    signal_line(first) = value;
    for (Eigen::Index i = first + 1; i < len; ++i) {
        value = (line(i) - value) * k + value;
        signal_line(i) = value;
    }

    // All three outputs share the first date on which the signal line exists
    Eigen::VectorXd macd_out = undefined(len);
    Eigen::VectorXd hist = undefined(len);
    for (Eigen::Index i = first; i < len; ++i) {
        macd_out(i) = line(i);
        hist(i) = line(i) - signal_line(i);
    }
    return {macd_out, signal_line, hist};
}

std::vector<Eigen::VectorXd> bollinger(const PriceColumns& c, Eigen::Index n, double width) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd upper = undefined(len);
    Eigen::VectorXd middle = undefined(len);
    Eigen::VectorXd lower = undefined(len);
    for (Eigen::Index i = n - 1; i < len; ++i) {
        auto window = c.close.segment(i + 1 - n, n);
        const double mean = window.mean();
        const double sd =
            std::sqrt((window.array() - mean).square().sum() / static_cast<double>(n));
        middle(i) = mean;
        upper(i) = mean + width * sd;
        lower(i) = mean - width * sd;
    }
    return {upper, middle, lower};
}

Eigen::VectorXd true_range(const PriceColumns& c) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd tr = undefined(len);
    for (Eigen::Index i = 1; i < len; ++i) {
        const double prev_close = c.close(i - 1);
        tr(i) = std::max({c.high(i) - c.low(i), std::abs(c.high(i) - prev_close),
                          std::abs(c.low(i) - prev_close)});
    }
    return tr;
}

Eigen::VectorXd atr(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    Eigen::VectorXd tr = true_range(c);
    const double p = static_cast<double>(n);
    double value = tr.segment(1, n).mean();
    out(n) = value;
    for (Eigen::Index i = n + 1; i < len; ++i) {
        value = (value * (p - 1.0) + tr(i)) / p;
        out(i) = value;
    }
    return out;
}

std::vector<Eigen::VectorXd> stochastic(const PriceColumns& c, Eigen::Index k_period,
                                        Eigen::Index d_period) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd k = undefined(len);
    for (Eigen::Index i = k_period - 1; i < len; ++i) {
        const double hh = c.high.segment(i + 1 - k_period, k_period).maxCoeff();
        const double ll = c.low.segment(i + 1 - k_period, k_period).minCoeff();
        const double range = hh - ll;
        k(i) = range == 0.0 ? 50.0 : 100.0 * (c.close(i) - ll) / range;
    }
    Eigen::VectorXd d = undefined(len);
    for (Eigen::Index i = k_period + d_period - 2; i < len; ++i) {
        d(i) = window_mean(k, i, d_period);
    }
    return {k, d};
}

std::vector<Eigen::VectorXd> adx(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    const Eigen::Index m = len - 1;  // Directional movement starts at the second bar
    Eigen::VectorXd plus_dm(m), minus_dm(m), tr(m);
    for (Eigen::Index i = 1; i < len; ++i) {
        const double up = c.high(i) - c.high(i - 1);
        const double down = c.low(i - 1) - c.low(i);
        plus_dm(i - 1) = (up > down && up > 0.0) ? up : 0.0;
        minus_dm(i - 1) = (down > up && down > 0.0) ? down : 0.0;
        const double prev_close = c.close(i - 1);
        tr(i - 1) = std::max({c.high(i) - c.low(i), std::abs(c.high(i) - prev_close),
                              std::abs(c.low(i) - prev_close)});
    }

    Eigen::VectorXd plus_di = undefined(len);
    Eigen::VectorXd minus_di = undefined(len);
    Eigen::VectorXd dx = undefined(len);
    const double p = static_cast<double>(n);
    double s_plus = plus_dm.head(n).sum();
    double s_minus = minus_dm.head(n).sum();
    double s_tr = tr.head(n).sum();
    for (Eigen::Index k = n - 1; k < m; ++k) {
        if (k >= n) {
            s_plus = s_plus - s_plus / p + plus_dm(k);
            s_minus = s_minus - s_minus / p + minus_dm(k);
            s_tr = s_tr - s_tr / p + tr(k);
        }
        const double pdi = s_tr == 0.0 ? 0.0 : 100.0 * s_plus / s_tr;
        const double mdi = s_tr == 0.0 ? 0.0 : 100.0 * s_minus / s_tr;
        const double sum = pdi + mdi;
        plus_di(k + 1) = pdi;
        minus_di(k + 1) = mdi;
        dx(k + 1) = sum == 0.0 ? 0.0 : 100.0 * std::abs(pdi - mdi) / sum;
    }

    Eigen::VectorXd adx_out = undefined(len);
    const Eigen::Index first = 2 * n - 1;
    double value = dx.segment(n, n).mean();
    adx_out(first) = value;
    for (Eigen::Index i = first + 1; i < len; ++i) {
        value = (value * (p - 1.0) + dx(i)) / p;
        adx_out(i) = value;
    }
    return {adx_out, plus_di, minus_di};
}

Eigen::VectorXd cci(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    Eigen::VectorXd tp = typical_price(c);
    for (Eigen::Index i = n - 1; i < len; ++i) {
        auto window = tp.segment(i + 1 - n, n);
        const double mean = window.mean();
        const double mad = (window.array() - mean).abs().mean();
        out(i) = mad == 0.0 ? 0.0 : (tp(i) - mean) / (0.015 * mad);
    }
    return out;
}

Eigen::VectorXd obv(const PriceColumns& c) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out(len);
    double value = c.volume(0);
    out(0) = value;
    for (Eigen::Index i = 1; i < len; ++i) {
        if (c.close(i) > c.close(i - 1)) {
            value += c.volume(i);
        } else if (c.close(i) < c.close(i - 1)) {
            value -= c.volume(i);
        }
        out(i) = value;
    }
    return out;
}

Eigen::VectorXd williams_r(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    for (Eigen::Index i = n - 1; i < len; ++i) {
        const double hh = c.high.segment(i + 1 - n, n).maxCoeff();
        const double ll = c.low.segment(i + 1 - n, n).minCoeff();
        const double range = hh - ll;
        out(i) = range == 0.0 ? -50.0 : ((hh - c.close(i)) / range) * -100.0;
    }
    return out;
}

Eigen::VectorXd mfi(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    Eigen::VectorXd tp = typical_price(c);
    Eigen::VectorXd flow = tp.cwiseProduct(c.volume);
    for (Eigen::Index i = n; i < len; ++i) {
        double positive = 0.0;
        double negative = 0.0;
        for (Eigen::Index j = i + 1 - n; j <= i; ++j) {
            if (tp(j) > tp(j - 1)) {
                positive += flow(j);
            } else if (tp(j) < tp(j - 1)) {
                negative += flow(j);
            }
        }
        if (negative == 0.0) {
            out(i) = 100.0;
        } else if (positive == 0.0) {
            out(i) = 0.0;
        } else {
            out(i) = 100.0 - 100.0 / (1.0 + positive / negative);
        }
    }
    return out;
}

Eigen::VectorXd rate_of_change(const PriceColumns& c, Eigen::Index n) {
    const Eigen::Index len = c.size();
    Eigen::VectorXd out = undefined(len);
    for (Eigen::Index i = n; i < len; ++i) {
        const double past = c.close(i - n);
        out(i) = past == 0.0 ? 0.0 : (c.close(i) - past) / past * 100.0;
    }
    return out;
}

IndicatorSeries to_series(const std::string& symbol, const std::string& name,
                          const PriceColumns& c, const Eigen::VectorXd& values) {
    IndicatorSeries series;
    series.symbol = symbol;
    series.name = name;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (std::isfinite(values(i))) {
            series.points.push_back({c.dates[static_cast<size_t>(i)], values(i)});
        }
    }
    return series;
}

std::vector<Eigen::VectorXd> evaluate(const PriceColumns& c, const IndicatorSpec& spec) {
    auto p = [&spec](size_t i) { return static_cast<Eigen::Index>(spec.params.at(i)); };
    switch (spec.family) {
        case IndicatorFamily::SMA:
            return {sma(c.close, p(0))};
        case IndicatorFamily::EMA:
            return {ema(c.close, p(0))};
        case IndicatorFamily::RSI:
            return {rsi(c, p(0))};
        case IndicatorFamily::MACD:
            return macd(c, p(0), p(1), p(2));
        case IndicatorFamily::BBANDS:
            return bollinger(c, p(0), spec.band_width);
        case IndicatorFamily::STOCH:
            return stochastic(c, p(0), p(1));
        case IndicatorFamily::ADX:
            return adx(c, p(0));
        case IndicatorFamily::ATR:
            return {atr(c, p(0))};
        case IndicatorFamily::CCI:
            return {cci(c, p(0))};
        case IndicatorFamily::OBV:
            return {obv(c)};
        case IndicatorFamily::WILLR:
            return {williams_r(c, p(0))};
        case IndicatorFamily::MFI:
            return {mfi(c, p(0))};
        case IndicatorFamily::ROC:
            return {rate_of_change(c, p(0))};
    }
    return {};
}

}  // namespace

IndicatorEngine::IndicatorEngine(std::shared_ptr<TimeSeriesStore> store)
    : store_(std::move(store)) {}

Result<std::vector<IndicatorSeries>> IndicatorEngine::compute_from_bars(
    const std::string& symbol, const std::vector<PriceBar>& bars, const IndicatorSpec& spec) {
    auto valid = spec.validate();
    if (valid.is_error()) {
        return forward_error<std::vector<IndicatorSeries>>(valid, kComponent);
    }
    const size_t needed = spec.min_history();
    if (bars.size() < needed) {
        return make_error<std::vector<IndicatorSeries>>(
            ErrorCode::INSUFFICIENT_HISTORY,
            spec.label() + " needs " + std::to_string(needed) + " bars, have " +
                std::to_string(bars.size()),
            kComponent);
    }

    PriceColumns columns = to_columns(bars);
    std::vector<Eigen::VectorXd> values = evaluate(columns, spec);
    std::vector<std::string> names = spec.output_names();
    if (values.size() != names.size()) {
        return make_error<std::vector<IndicatorSeries>>(
            ErrorCode::INVALID_ARGUMENT, "Unsupported indicator " + spec.label(), kComponent);
    }

    std::vector<IndicatorSeries> out;
    out.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        out.push_back(to_series(symbol, names[i], columns, values[i]));
    }
    return out;
}

Result<std::vector<IndicatorSeries>> IndicatorEngine::compute(const std::string& symbol,
                                                              const IndicatorSpec& spec) const {
    auto history = store_->price_history(symbol);
    if (history.is_error()) {
        return forward_error<std::vector<IndicatorSeries>>(history);
    }
    return compute_from_bars(symbol, history.value(), spec);
}

Result<ComputeReport> IndicatorEngine::compute_all(const std::string& symbol,
                                                   const std::vector<IndicatorSpec>& specs,
                                                   bool persist) {
    ScopedLogComponent log_component(kComponent);
    auto history = store_->price_history(symbol);
    if (history.is_error()) {
        return forward_error<ComputeReport>(history);
    }
    const auto& bars = history.value();

    ComputeReport report;
    report.symbol = symbol;
    report.bars = bars.size();

    for (const auto& spec : specs) {
        auto computed = compute_from_bars(symbol, bars, spec);
        if (computed.is_error()) {
            if (computed.error()->code() == ErrorCode::INSUFFICIENT_HISTORY) {
                DEBUG(symbol << ": " << computed.error()->what());
                report.insufficient.push_back(spec.label());
            } else {
                report.failed.push_back(spec.label() + ": " + computed.error()->what());
            }
            continue;
        }

        for (const auto& series : computed.value()) {
            if (persist) {
                auto stored = store_->replace_indicator_series(series);
                if (stored.is_error()) {
                    WARN("Failed to store " << series.name << " for " << symbol << ": "
                                            << stored.error()->what());
                    report.failed.push_back(series.name + ": " + stored.error()->what());
                    continue;
                }
            }
            report.computed.push_back(series.name);
        }
    }

    INFO("Indicators for " << symbol << " over " << bars.size() << " bars: "
                           << report.computed.size() << " computed, "
                           << report.insufficient.size() << " insufficient, "
                           << report.failed.size() << " failed");
    return report;
}

}  // namespace finpipe
