#ifndef MARKET_DATA_PROVIDER_FACTORY_HPP
#define MARKET_DATA_PROVIDER_FACTORY_HPP

#include "market_data_provider_interface.hpp"
#include "configs/data_source_config.hpp"

namespace SwingScanner {
namespace API {

// Selects the provider named by data_source.provider; throws on an unknown name
MarketDataProviderPtr create_market_data_provider(const Config::DataSourceConfig& data_source_config);

} // namespace API
} // namespace SwingScanner

#endif // MARKET_DATA_PROVIDER_FACTORY_HPP
