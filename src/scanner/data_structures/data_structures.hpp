#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>
#include <map>
#include <cmath>
#include <limits>

namespace SwingScanner {
namespace Core {

// Undefined indicator values are quiet NaN and never zero.
constexpr double UNDEFINED_VALUE = std::numeric_limits<double>::quiet_NaN();

inline bool is_defined(double value) {
    return !std::isnan(value);
}

struct PriceBar {
    std::string date;          // YYYY-MM-DD
    double open_price;
    double high_price;
    double low_price;
    double close_price;
    double adjusted_close;
    double volume;

    PriceBar() : date(""), open_price(0.0), high_price(0.0), low_price(0.0), close_price(0.0), adjusted_close(0.0), volume(0.0) {}
};

// Aligned one-to-one with the bar sequence it was computed from.
using IndicatorSeries = std::vector<double>;

// Bar request wrapper to avoid multi-parameter functions
struct DailyBarRequest {
    std::string symbol;
    int lookback_calendar_days;

    DailyBarRequest(const std::string& requested_symbol, int lookback_days)
        : symbol(requested_symbol), lookback_calendar_days(lookback_days) {}
};

struct UniverseEntry {
    std::string symbol;
    std::string sector;

    UniverseEntry() : symbol(""), sector("") {}
    UniverseEntry(const std::string& entry_symbol, const std::string& entry_sector)
        : symbol(entry_symbol), sector(entry_sector) {}
};

// ========================================================================
// ZONES, REGIME AND RELATIVE STRENGTH
// ========================================================================

enum class ZoneType { SUPPORT, RESISTANCE };

struct Zone {
    double level;
    double upper;
    double lower;
    ZoneType type;
    double atr;

    Zone() : level(0.0), upper(0.0), lower(0.0), type(ZoneType::SUPPORT), atr(0.0) {}
    Zone(double zone_level, double zone_upper, double zone_lower, ZoneType zone_type, double zone_atr)
        : level(zone_level), upper(zone_upper), lower(zone_lower), type(zone_type), atr(zone_atr) {}
};

struct RegimeSnapshot {
    bool is_bullish;
    double benchmark_close;
    double benchmark_ema20;
    std::string label;                 // BULLISH, BEARISH or "ERROR: ..."

    RegimeSnapshot() : is_bullish(false), benchmark_close(0.0), benchmark_ema20(0.0), label("ERROR: not evaluated") {}
};

struct RSLine {
    std::vector<std::string> dates;
    std::vector<double> ratios;
};

enum class RSTrend { UP, DOWN, FLAT, UNKNOWN };

struct RSStats {
    bool available;
    double rs_today;
    double rs_52w_high;
    RSTrend trend;
    bool is_blue_dot;

    RSStats() : available(false), rs_today(0.0), rs_52w_high(0.0), trend(RSTrend::UNKNOWN), is_blue_dot(false) {}
};

struct TrendlineFit {
    int window_start_index;            // Absolute bar index where the fitted window starts
    int first_anchor_index;            // Absolute bar indices of the two anchor peaks
    int second_anchor_index;
    std::string first_anchor_date;
    std::string second_anchor_date;
    double first_anchor_price;
    double second_anchor_price;
    double slope_per_bar;              // Negative for a descending line
    int touch_count;
    double current_value;              // Line value projected to the latest bar

    TrendlineFit()
        : window_start_index(0), first_anchor_index(0), second_anchor_index(0), first_anchor_date(""),
          second_anchor_date(""), first_anchor_price(0.0), second_anchor_price(0.0), slope_per_bar(0.0),
          touch_count(0), current_value(0.0) {}

    double value_at(int bar_index) const {
        return first_anchor_price + slope_per_bar * static_cast<double>(bar_index - first_anchor_index);
    }
};

// ========================================================================
// SETUP RECORDS
// ========================================================================

enum class SetupType { BREAKOUT, PULLBACK, BASE, WATCHLIST };
enum class BreakoutPath { CONFIRMED_BREAKOUT, TRENDLINE_BREAKOUT, LEVEL_BREAKOUT, RS_LEAD, DRY_BASE };
enum class BaseType { CUP_HANDLE, FLAT_BASE };
enum class BaseSignal { BRK, DRY };
enum class WatchLevelType { ZONE, TRENDLINE };

struct BreakoutMetadata {
    BreakoutPath path;
    bool is_breakout;
    double resistance_level;           // Zone level or trendline value that defined the trigger
    double volume_ratio;
    double tr_contraction_pct;         // Only filled by the dry base path
    double trendline_value;            // Only filled by the trendline path
    double rs_vs_benchmark;
    bool is_rs_lead;

    BreakoutMetadata()
        : path(BreakoutPath::DRY_BASE), is_breakout(false), resistance_level(0.0), volume_ratio(0.0),
          tr_contraction_pct(0.0), trendline_value(0.0), rs_vs_benchmark(0.0), is_rs_lead(false) {}
};

struct PullbackMetadata {
    double cci_today;
    double cci_yesterday;
    double support_level;
    double ema8;
    double ema20;
    bool is_relaxed;

    PullbackMetadata() : cci_today(0.0), cci_yesterday(0.0), support_level(0.0), ema8(0.0), ema20(0.0), is_relaxed(false) {}
};

struct CupGeometry {
    std::string left_peak_date;
    double left_peak_price;
    std::string cup_bottom_date;
    double cup_bottom_price;
    std::string right_rim_date;
    double right_rim_price;
    double handle_high;
    double handle_low;

    CupGeometry()
        : left_peak_date(""), left_peak_price(0.0), cup_bottom_date(""), cup_bottom_price(0.0),
          right_rim_date(""), right_rim_price(0.0), handle_high(0.0), handle_low(0.0) {}
};

struct FlatGeometry {
    std::string start_date;
    std::string end_date;
    double base_high;
    double base_low;

    FlatGeometry() : start_date(""), end_date(""), base_high(0.0), base_low(0.0) {}
};

struct BaseMetadata {
    BaseType base_type;
    BaseSignal signal;
    int quality_score;
    double base_depth_pct;
    int base_length_days;
    double volume_dry_pct;
    double rs_vs_benchmark;
    std::optional<CupGeometry> cup_geometry;
    std::optional<FlatGeometry> flat_geometry;

    BaseMetadata()
        : base_type(BaseType::CUP_HANDLE), signal(BaseSignal::DRY), quality_score(0), base_depth_pct(0.0),
          base_length_days(0), volume_dry_pct(0.0), rs_vs_benchmark(0.0) {}
};

struct WatchlistMetadata {
    WatchLevelType level_type;
    double trigger_level;
    double distance_pct;
    bool rs_blue_dot;

    WatchlistMetadata() : level_type(WatchLevelType::ZONE), trigger_level(0.0), distance_pct(0.0), rs_blue_dot(false) {}
};

/**
 * One trade candidate produced by exactly one engine invocation.
 * Exactly one of the metadata members is filled, matching setup_type.
 */
struct Setup {
    std::string ticker;
    std::string sector;
    SetupType setup_type;
    double entry;
    double stop_loss;
    double take_profit;
    double risk_reward;
    std::string setup_date;

    std::optional<BreakoutMetadata> breakout;
    std::optional<PullbackMetadata> pullback;
    std::optional<BaseMetadata> base;
    std::optional<WatchlistMetadata> watchlist;

    Setup()
        : ticker(""), sector(""), setup_type(SetupType::WATCHLIST), entry(0.0), stop_loss(0.0),
          take_profit(0.0), risk_reward(0.0), setup_date("") {}

    Setup with_sector(const std::string& sector_label) const {
        Setup labelled_setup = *this;
        labelled_setup.sector = sector_label;
        return labelled_setup;
    }
};

// Pattern scan request wrapper to avoid multi-parameter functions.
// Holds references only; the referenced data must outlive the engine call.
struct PatternScanRequest {
    const std::string& ticker;
    const std::vector<PriceBar>& bars;
    const std::vector<Zone>& zones;
    const RSStats& rs_stats;
    double benchmark_3m_return;

    PatternScanRequest(const std::string& request_ticker, const std::vector<PriceBar>& request_bars,
                       const std::vector<Zone>& request_zones, const RSStats& request_rs_stats, double benchmark_return)
        : ticker(request_ticker), bars(request_bars), zones(request_zones), rs_stats(request_rs_stats),
          benchmark_3m_return(benchmark_return) {}
};

// ========================================================================
// ENGINE OUTCOMES
// ========================================================================

enum class OutcomeReason { SIGNAL_FOUND, NO_SIGNAL, INSUFFICIENT_DATA, COMPUTATION_ERROR };

/**
 * Result of one engine invocation: the value when a signal was found,
 * otherwise the reason nothing was produced.
 */
template<typename ResultType>
struct EngineOutcome {
    std::optional<ResultType> value;
    OutcomeReason reason;
    std::string detail;

    EngineOutcome() : value(), reason(OutcomeReason::NO_SIGNAL), detail("") {}

    bool has_value() const { return value.has_value(); }

    static EngineOutcome found(ResultType result) {
        EngineOutcome outcome;
        outcome.value = std::move(result);
        outcome.reason = OutcomeReason::SIGNAL_FOUND;
        return outcome;
    }

    static EngineOutcome rejected(OutcomeReason rejection_reason, const std::string& rejection_detail) {
        EngineOutcome outcome;
        outcome.reason = rejection_reason;
        outcome.detail = rejection_detail;
        return outcome;
    }

    static EngineOutcome no_signal(const std::string& rejection_detail) {
        return rejected(OutcomeReason::NO_SIGNAL, rejection_detail);
    }

    static EngineOutcome insufficient_data(const std::string& rejection_detail) {
        return rejected(OutcomeReason::INSUFFICIENT_DATA, rejection_detail);
    }

    static EngineOutcome computation_error(const std::string& rejection_detail) {
        return rejected(OutcomeReason::COMPUTATION_ERROR, rejection_detail);
    }
};

using SetupOutcome = EngineOutcome<Setup>;
using ZoneOutcome = EngineOutcome<std::vector<Zone>>;

// ========================================================================
// SCAN RECORDS
// ========================================================================

// Built once per scan, read-only while tickers are analyzed.
struct ScanContext {
    std::string scan_id;
    std::string benchmark_symbol;
    std::vector<PriceBar> benchmark_bars;
    double benchmark_3m_return;
    RegimeSnapshot regime;

    ScanContext() : scan_id(""), benchmark_symbol(""), benchmark_bars(), benchmark_3m_return(0.0), regime() {}
};

// Why one engine produced nothing for a ticker
struct EngineRejection {
    std::string engine_name;
    OutcomeReason reason;
    std::string detail;

    EngineRejection(const std::string& rejected_engine, OutcomeReason rejection_reason, const std::string& rejection_detail)
        : engine_name(rejected_engine), reason(rejection_reason), detail(rejection_detail) {}
};

struct TickerScanResult {
    std::string ticker;
    std::string sector;
    bool analyzed;
    std::string skip_reason;           // Insufficient data or fetch failure
    std::string error_message;         // Exception raised while analyzing
    std::vector<Zone> zones;
    RSStats rs_stats;
    std::vector<Setup> setups;
    std::vector<EngineRejection> rejections;

    TickerScanResult() : ticker(""), sector(""), analyzed(false), skip_reason(""), error_message(""), zones(), rs_stats(), setups(), rejections() {}
};

struct ScanReport {
    std::string scan_id;
    std::string started_at;
    std::string completed_at;
    RegimeSnapshot regime;
    double benchmark_3m_return;
    bool cancelled;
    std::vector<TickerScanResult> ticker_results;   // Universe order
    std::vector<Setup> setups;                      // Universe order, engine order within a ticker
    std::map<std::string, int> setup_type_counts;
    std::vector<std::pair<std::string, int>> sector_counts;   // Descending by count
    std::vector<std::string> hot_sectors;                     // Sectors at or above the highlight threshold

    ScanReport() : scan_id(""), started_at(""), completed_at(""), regime(), benchmark_3m_return(0.0), cancelled(false) {}
};

// ========================================================================
// STRING CONVERSIONS
// ========================================================================

inline std::string to_string(ZoneType zone_type) {
    return zone_type == ZoneType::RESISTANCE ? "RESISTANCE" : "SUPPORT";
}

inline std::string to_string(RSTrend rs_trend) {
    switch (rs_trend) {
        case RSTrend::UP: return "UP";
        case RSTrend::DOWN: return "DOWN";
        case RSTrend::FLAT: return "FLAT";
        default: return "UNKNOWN";
    }
}

inline std::string to_string(SetupType setup_type) {
    switch (setup_type) {
        case SetupType::BREAKOUT: return "BREAKOUT";
        case SetupType::PULLBACK: return "PULLBACK";
        case SetupType::BASE: return "BASE";
        default: return "WATCHLIST";
    }
}

inline std::string to_string(BreakoutPath breakout_path) {
    switch (breakout_path) {
        case BreakoutPath::CONFIRMED_BREAKOUT: return "CONFIRMED_BREAKOUT";
        case BreakoutPath::TRENDLINE_BREAKOUT: return "TRENDLINE_BREAKOUT";
        case BreakoutPath::LEVEL_BREAKOUT: return "LEVEL_BREAKOUT";
        case BreakoutPath::RS_LEAD: return "RS_LEAD";
        default: return "DRY_BASE";
    }
}

inline std::string to_string(BaseType base_type) {
    return base_type == BaseType::CUP_HANDLE ? "CUP_HANDLE" : "FLAT_BASE";
}

inline std::string to_string(BaseSignal base_signal) {
    return base_signal == BaseSignal::BRK ? "BRK" : "DRY";
}

inline std::string to_string(WatchLevelType level_type) {
    return level_type == WatchLevelType::TRENDLINE ? "TRENDLINE" : "ZONE";
}

inline std::string to_string(OutcomeReason outcome_reason) {
    switch (outcome_reason) {
        case OutcomeReason::SIGNAL_FOUND: return "SIGNAL_FOUND";
        case OutcomeReason::NO_SIGNAL: return "NO_SIGNAL";
        case OutcomeReason::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        default: return "COMPUTATION_ERROR";
    }
}

} // namespace Core
} // namespace SwingScanner

#endif // DATA_STRUCTURES_HPP
