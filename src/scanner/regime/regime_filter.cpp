#include "regime_filter.hpp"
#include "scanner/indicators/indicators.hpp"
#include <stdexcept>
#include <string>

namespace SwingScanner {
namespace Core {

namespace {
    RegimeSnapshot regime_error(const std::string& error_message) {
        RegimeSnapshot error_snapshot;
        error_snapshot.is_bullish = false;
        error_snapshot.benchmark_close = 0.0;
        error_snapshot.benchmark_ema20 = 0.0;
        error_snapshot.label = "ERROR: " + error_message.substr(0, 120);
        return error_snapshot;
    }
}

RegimeSnapshot check_market_regime(const std::vector<PriceBar>& benchmark_bars, const Config::RegimeConfig& regime_config) {
    try {
        if (benchmark_bars.empty()) {
            return regime_error("No benchmark data");
        }

        IndicatorSeries benchmark_closes = drop_undefined(extract_closes(benchmark_bars));
        if (static_cast<int>(benchmark_closes.size()) < regime_config.minimum_bars) {
            return regime_error("Insufficient benchmark data: " + std::to_string(benchmark_closes.size()) + " bars");
        }

        IndicatorSeries benchmark_ema = ema(benchmark_closes, regime_config.ema_period);
        double latest_ema = last_value(benchmark_ema);
        if (!is_defined(latest_ema)) {
            return regime_error("EMA-" + std::to_string(regime_config.ema_period) + " calculation failed");
        }

        RegimeSnapshot regime_snapshot;
        regime_snapshot.benchmark_close = last_value(benchmark_closes);
        regime_snapshot.benchmark_ema20 = latest_ema;
        regime_snapshot.is_bullish = regime_snapshot.benchmark_close > latest_ema;
        regime_snapshot.label = regime_snapshot.is_bullish ? "BULLISH" : "BEARISH";
        return regime_snapshot;
    } catch (const std::exception& exception_error) {
        return regime_error(exception_error.what());
    }
}

} // namespace Core
} // namespace SwingScanner
