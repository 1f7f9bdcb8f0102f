#ifndef TEST_FIXTURES_HPP
#define TEST_FIXTURES_HPP

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "api/general/market_data_provider_interface.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Testing {

constexpr double BASE_VOLUME = 1000000.0;

// Monday 2021-01-04 plus bar_index weekdays
std::string business_date(int bar_index);

// Bar with open = close, high / low at +/- range_pct around the close
Core::PriceBar make_bar(int bar_index, double close, double range_pct, double volume);
std::vector<Core::PriceBar> make_bars(const std::vector<double>& closes, double range_pct, double volume);

std::vector<double> geometric_closes(int count, double start_price, double growth_per_bar);

// Steady low-volatility advance, constant volume
std::vector<Core::PriceBar> make_rising_bars(int count, double start_price, double growth_per_bar);
std::vector<Core::PriceBar> make_falling_bars(int count, double start_price, double decline_per_bar);

/**
 * 300 bars: advance 50 -> 100, 40-bar 20% deep U, 20-bar 8% handle on contracting early volume,
 * then a breakout bar at 102 on about 1.3x the 50-day volume.
 */
std::vector<Core::PriceBar> make_cup_handle_bars();

/**
 * 281 bars: advance 50 -> 100, a 60-bar base cycling between 97 and 100 every 10 bars on full volume
 * that drops to 0.3x over its last 10 bars, then a signal bar at signal_close on signal_volume_factor.
 */
std::vector<Core::PriceBar> make_flat_base_bars(double signal_close, double signal_volume_factor);

/**
 * 96-bar advance at 0.4% a bar, drop_count drops of drop_return, then one bar of last_return.
 * The last bar's low sits last_low_pct under its close.
 */
std::vector<Core::PriceBar> make_pullback_bars(int drop_count, double drop_return, double last_return, double last_low_pct);

// Provider over fixed series; symbols can be made to throw. Records every requested symbol.
class InMemoryMarketDataProvider : public API::MarketDataProviderInterface {
public:
    void set_bars(const std::string& symbol, const std::vector<Core::PriceBar>& bars);
    void set_failure(const std::string& symbol, const std::string& error_message);

    std::vector<Core::PriceBar> get_daily_bars(const Core::DailyBarRequest& request) const override;
    std::string get_provider_name() const override { return "memory"; }

    std::set<std::string> get_requested_symbols() const;

private:
    std::map<std::string, std::vector<Core::PriceBar>> bars_by_symbol;
    std::map<std::string, std::string> failures_by_symbol;
    mutable std::mutex requested_mutex;
    mutable std::set<std::string> requested_symbols;
};

} // namespace Testing
} // namespace SwingScanner

#endif // TEST_FIXTURES_HPP
