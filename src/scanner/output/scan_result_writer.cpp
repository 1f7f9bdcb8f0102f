#include "scan_result_writer.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace SwingScanner {
namespace Core {

double round_to_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

namespace {

// Undefined values serialize as null
json price_or_null(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return round_to_cents(value);
}

json zone_to_json(const Zone& zone) {
    return json{
        {"level", price_or_null(zone.level)},
        {"upper", price_or_null(zone.upper)},
        {"lower", price_or_null(zone.lower)},
        {"type", to_string(zone.type)},
        {"atr", price_or_null(zone.atr)}
    };
}

json rs_stats_to_json(const RSStats& rs_stats) {
    if (!rs_stats.available) {
        return nullptr;
    }
    return json{
        {"rs_today", rs_stats.rs_today},
        {"rs_52w_high", rs_stats.rs_52w_high},
        {"trend", to_string(rs_stats.trend)},
        {"is_blue_dot", rs_stats.is_blue_dot}
    };
}

json breakout_metadata_to_json(const BreakoutMetadata& metadata) {
    json metadata_json{
        {"path", to_string(metadata.path)},
        {"is_breakout", metadata.is_breakout},
        {"resistance_level", price_or_null(metadata.resistance_level)},
        {"volume_ratio", price_or_null(metadata.volume_ratio)},
        {"rs_vs_benchmark", price_or_null(metadata.rs_vs_benchmark * 100.0)},
        {"is_rs_lead", metadata.is_rs_lead}
    };
    if (metadata.path == BreakoutPath::DRY_BASE) {
        metadata_json["tr_contraction_pct"] = price_or_null(metadata.tr_contraction_pct);
    }
    if (metadata.path == BreakoutPath::TRENDLINE_BREAKOUT) {
        metadata_json["trendline_value"] = price_or_null(metadata.trendline_value);
    }
    return metadata_json;
}

json pullback_metadata_to_json(const PullbackMetadata& metadata) {
    return json{
        {"cci_today", price_or_null(metadata.cci_today)},
        {"cci_yesterday", price_or_null(metadata.cci_yesterday)},
        {"support_level", price_or_null(metadata.support_level)},
        {"ema8", price_or_null(metadata.ema8)},
        {"ema20", price_or_null(metadata.ema20)},
        {"is_relaxed", metadata.is_relaxed}
    };
}

json base_metadata_to_json(const BaseMetadata& metadata) {
    json metadata_json{
        {"base_type", to_string(metadata.base_type)},
        {"signal", to_string(metadata.signal)},
        {"quality_score", metadata.quality_score},
        {"base_depth_pct", price_or_null(metadata.base_depth_pct)},
        {"base_length_days", metadata.base_length_days},
        {"volume_dry_pct", price_or_null(metadata.volume_dry_pct)},
        {"rs_vs_benchmark", price_or_null(metadata.rs_vs_benchmark * 100.0)}
    };
    if (metadata.cup_geometry) {
        const CupGeometry& cup = *metadata.cup_geometry;
        metadata_json["geometry"] = json{
            {"left_peak", {{"date", cup.left_peak_date}, {"price", price_or_null(cup.left_peak_price)}}},
            {"cup_bottom", {{"date", cup.cup_bottom_date}, {"price", price_or_null(cup.cup_bottom_price)}}},
            {"right_rim", {{"date", cup.right_rim_date}, {"price", price_or_null(cup.right_rim_price)}}},
            {"handle_high", price_or_null(cup.handle_high)},
            {"handle_low", price_or_null(cup.handle_low)}
        };
    }
    if (metadata.flat_geometry) {
        const FlatGeometry& flat = *metadata.flat_geometry;
        metadata_json["geometry"] = json{
            {"start_date", flat.start_date},
            {"end_date", flat.end_date},
            {"base_high", price_or_null(flat.base_high)},
            {"base_low", price_or_null(flat.base_low)}
        };
    }
    return metadata_json;
}

json watchlist_metadata_to_json(const WatchlistMetadata& metadata) {
    return json{
        {"level_type", to_string(metadata.level_type)},
        {"trigger_level", price_or_null(metadata.trigger_level)},
        {"distance_pct", price_or_null(metadata.distance_pct)},
        {"rs_blue_dot", metadata.rs_blue_dot}
    };
}

} // anonymous namespace

json ScanResultWriter::setup_to_json(const Setup& setup) {
    json setup_json{
        {"ticker", setup.ticker},
        {"sector", setup.sector},
        {"setup_type", to_string(setup.setup_type)},
        {"entry", price_or_null(setup.entry)},
        {"stop_loss", price_or_null(setup.stop_loss)},
        {"take_profit", price_or_null(setup.take_profit)},
        {"risk_reward", price_or_null(setup.risk_reward)},
        {"setup_date", setup.setup_date}
    };
    if (setup.breakout) setup_json["metadata"] = breakout_metadata_to_json(*setup.breakout);
    else if (setup.pullback) setup_json["metadata"] = pullback_metadata_to_json(*setup.pullback);
    else if (setup.base) setup_json["metadata"] = base_metadata_to_json(*setup.base);
    else if (setup.watchlist) setup_json["metadata"] = watchlist_metadata_to_json(*setup.watchlist);
    return setup_json;
}

json ScanResultWriter::report_to_json(const ScanReport& report) {
    json report_json;
    report_json["scan_id"] = report.scan_id;
    report_json["started_at"] = report.started_at;
    report_json["completed_at"] = report.completed_at;
    report_json["cancelled"] = report.cancelled;
    report_json["regime"] = json{
        {"is_bullish", report.regime.is_bullish},
        {"label", report.regime.label},
        {"benchmark_close", price_or_null(report.regime.benchmark_close)},
        {"benchmark_ema20", price_or_null(report.regime.benchmark_ema20)}
    };
    report_json["benchmark_3m_return"] = price_or_null(report.benchmark_3m_return * 100.0);

    json tickers_json = json::array();
    for (const TickerScanResult& ticker_result : report.ticker_results) {
        json ticker_json{
            {"ticker", ticker_result.ticker},
            {"sector", ticker_result.sector},
            {"analyzed", ticker_result.analyzed},
            {"setup_count", ticker_result.setups.size()}
        };
        if (!ticker_result.skip_reason.empty()) ticker_json["skip_reason"] = ticker_result.skip_reason;
        if (!ticker_result.error_message.empty()) ticker_json["error"] = ticker_result.error_message;
        if (ticker_result.analyzed) {
            json zones_json = json::array();
            for (const Zone& zone : ticker_result.zones) {
                zones_json.push_back(zone_to_json(zone));
            }
            ticker_json["zones"] = zones_json;
            ticker_json["rs"] = rs_stats_to_json(ticker_result.rs_stats);
        }
        tickers_json.push_back(ticker_json);
    }
    report_json["tickers"] = tickers_json;

    json setups_json = json::array();
    for (const Setup& setup : report.setups) {
        setups_json.push_back(setup_to_json(setup));
    }
    report_json["setups"] = setups_json;

    report_json["setup_type_counts"] = report.setup_type_counts;

    json sectors_json = json::array();
    for (const auto& sector_count : report.sector_counts) {
        bool is_hot_sector = false;
        for (const std::string& hot_sector : report.hot_sectors) {
            if (hot_sector == sector_count.first) is_hot_sector = true;
        }
        sectors_json.push_back(json{{"sector", sector_count.first}, {"count", sector_count.second}, {"hot", is_hot_sector}});
    }
    report_json["sector_summary"] = sectors_json;
    return report_json;
}

void ScanResultWriter::write_json(const ScanReport& report, const std::string& output_path) {
    std::ofstream output_stream(output_path, std::ios::out | std::ios::trunc);
    if (!output_stream.is_open()) {
        throw std::runtime_error("Failed to open scan result file: " + output_path);
    }
    output_stream << report_to_json(report).dump(2) << "\n";
    if (!output_stream.good()) {
        throw std::runtime_error("Failed to write scan result file: " + output_path);
    }
}

} // namespace Core
} // namespace SwingScanner
