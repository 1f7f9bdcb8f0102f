#include "market_data_provider_factory.hpp"
#include "api/alpaca/alpaca_daily_bars_client.hpp"
#include "api/csv/csv_market_data_provider.hpp"
#include <stdexcept>

namespace SwingScanner {
namespace API {

MarketDataProviderPtr create_market_data_provider(const Config::DataSourceConfig& data_source_config) {
    if (data_source_config.provider == "csv") {
        return std::make_unique<CsvMarketDataProvider>(data_source_config.csv_directory);
    }
    if (data_source_config.provider == "alpaca") {
        return std::make_unique<AlpacaDailyBarsClient>(data_source_config);
    }
    throw std::runtime_error("Unknown market data provider: " + data_source_config.provider);
}

} // namespace API
} // namespace SwingScanner
