#ifndef SCANNER_CONFIG_HPP
#define SCANNER_CONFIG_HPP

#include <string>

namespace SwingScanner {
namespace Config {

struct ScannerConfig {
    std::string benchmark_symbol;                    // Broad-market benchmark (SPY)
    std::string universe_file;                       // symbol,sector list
    std::string output_directory;                    // JSON result directory (empty = run folder)
    int concurrency_limit;                           // Tickers analyzed at the same time
    int max_tickers_per_scan;                        // Universe safety cap
    int minimum_ticker_bars;                         // Skip tickers with fewer bars (60)
    std::string default_sector;                      // Sector label when the universe has none
    int sector_highlight_threshold;                  // Sectors with at least this many setups are flagged (3)

    ScannerConfig()
        : benchmark_symbol("SPY"), universe_file("config/universe.csv"), output_directory(""),
          concurrency_limit(15), max_tickers_per_scan(2000), minimum_ticker_bars(60),
          default_sector("Unknown"), sector_highlight_threshold(3) {}
};

} // namespace Config
} // namespace SwingScanner

#endif // SCANNER_CONFIG_HPP
