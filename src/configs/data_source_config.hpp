#ifndef DATA_SOURCE_CONFIG_HPP
#define DATA_SOURCE_CONFIG_HPP

#include <string>

namespace SwingScanner {
namespace Config {

struct DataSourceConfig {
    std::string provider;                            // "csv" or "alpaca"
    int lookback_calendar_days;                      // History requested per symbol (2 years)

    // CSV provider
    std::string csv_directory;                       // Directory holding <SYMBOL>.csv files

    // Alpaca market data provider
    std::string base_url;                            // Market data base URL
    std::string bars_endpoint;                       // Bars path, {symbol} is substituted
    std::string api_key;                             // API key id
    std::string api_secret;                          // API secret key
    std::string feed;                                // Data feed (iex or sip)
    int page_limit;                                  // Bars per page
    int retry_count;                                 // HTTP attempts per request
    int timeout_seconds;                             // HTTP timeout
    int rate_limit_delay_ms;                         // Delay between retries
    bool enable_ssl_verification;                    // Verify TLS peer and host

    DataSourceConfig()
        : provider("csv"), lookback_calendar_days(730), csv_directory("data"),
          base_url("https://data.alpaca.markets"), bars_endpoint("/v2/stocks/{symbol}/bars"),
          api_key(""), api_secret(""), feed("iex"), page_limit(10000), retry_count(3),
          timeout_seconds(30), rate_limit_delay_ms(250), enable_ssl_verification(true) {}
};

} // namespace Config
} // namespace SwingScanner

#endif // DATA_SOURCE_CONFIG_HPP
