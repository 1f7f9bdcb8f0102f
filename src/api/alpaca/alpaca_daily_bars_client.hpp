#ifndef ALPACA_DAILY_BARS_CLIENT_HPP
#define ALPACA_DAILY_BARS_CLIENT_HPP

#include "api/general/market_data_provider_interface.hpp"
#include "configs/data_source_config.hpp"
#include <string>
#include <vector>

namespace SwingScanner {
namespace API {

/**
 * Split- and dividend-adjusted daily bars from the Alpaca market data REST API.
 * Follows next_page_token until the requested window is complete.
 */
class AlpacaDailyBarsClient : public MarketDataProviderInterface {
private:
    Config::DataSourceConfig config;

    std::string build_bars_url(const Core::DailyBarRequest& request, const std::string& page_token) const;
    std::string make_authenticated_request(const std::string& url) const;

public:
    explicit AlpacaDailyBarsClient(const Config::DataSourceConfig& data_source_config);

    std::vector<Core::PriceBar> get_daily_bars(const Core::DailyBarRequest& request) const override;
    std::string get_provider_name() const override;

    // Appends the bars of one response page and returns its next_page_token (empty on the last page)
    static std::string parse_bars_page(const std::string& response, std::vector<Core::PriceBar>& bars);
};

} // namespace API
} // namespace SwingScanner

#endif // ALPACA_DAILY_BARS_CLIENT_HPP
