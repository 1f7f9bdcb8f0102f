#ifndef MARKET_DATA_PROVIDER_INTERFACE_HPP
#define MARKET_DATA_PROVIDER_INTERFACE_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <vector>
#include <string>
#include <memory>

namespace SwingScanner {
namespace API {

/**
 * Source of daily OHLCV history.
 * Implementations return bars ascending by date; an empty sequence means no data for the symbol.
 * Transport or format failures throw std::runtime_error.
 * get_daily_bars is called from several scan workers at once and must be thread-safe.
 */
class MarketDataProviderInterface {
public:
    virtual ~MarketDataProviderInterface() = default;

    virtual std::vector<Core::PriceBar> get_daily_bars(const Core::DailyBarRequest& request) const = 0;
    virtual std::string get_provider_name() const = 0;
};

using MarketDataProviderPtr = std::unique_ptr<MarketDataProviderInterface>;

} // namespace API
} // namespace SwingScanner

#endif // MARKET_DATA_PROVIDER_INTERFACE_HPP
