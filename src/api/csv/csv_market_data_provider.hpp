#ifndef CSV_MARKET_DATA_PROVIDER_HPP
#define CSV_MARKET_DATA_PROVIDER_HPP

#include "api/general/market_data_provider_interface.hpp"
#include <string>
#include <vector>

namespace SwingScanner {
namespace API {

/**
 * End-of-day bars from <directory>/<SYMBOL>.csv.
 * Header: Date,Open,High,Low,Close[,Adj Close],Volume in any column order.
 * Unparseable rows are skipped; a missing file yields no bars.
 */
class CsvMarketDataProvider : public MarketDataProviderInterface {
private:
    std::string data_directory;

public:
    explicit CsvMarketDataProvider(const std::string& directory);

    std::vector<Core::PriceBar> get_daily_bars(const Core::DailyBarRequest& request) const override;
    std::string get_provider_name() const override;

    // Parses a whole CSV file; exposed for tests
    static std::vector<Core::PriceBar> read_bars_file(const std::string& file_path);
};

} // namespace API
} // namespace SwingScanner

#endif // CSV_MARKET_DATA_PROVIDER_HPP
