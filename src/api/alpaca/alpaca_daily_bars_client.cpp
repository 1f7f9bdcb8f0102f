#include "alpaca_daily_bars_client.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace SwingScanner {
namespace API {

AlpacaDailyBarsClient::AlpacaDailyBarsClient(const Config::DataSourceConfig& data_source_config)
    : config(data_source_config) {
    if (config.api_key.empty()) {
        throw std::runtime_error("Alpaca API key is required but not provided");
    }
    if (config.api_secret.empty()) {
        throw std::runtime_error("Alpaca API secret is required but not provided");
    }
    if (config.base_url.empty() || config.bars_endpoint.empty()) {
        throw std::runtime_error("Alpaca base URL and bars endpoint are required but not provided");
    }
    initialize_http_library();
}

std::string AlpacaDailyBarsClient::get_provider_name() const {
    return "alpaca";
}

std::string AlpacaDailyBarsClient::build_bars_url(const Core::DailyBarRequest& request, const std::string& page_token) const {
    std::string request_url = config.base_url + replace_url_placeholder(config.bars_endpoint, url_encode_query_value(request.symbol));
    request_url += "?timeframe=1Day";
    request_url += "&adjustment=all";
    request_url += "&start=" + TimeUtils::get_calendar_date_minus_days(request.lookback_calendar_days);
    request_url += "&limit=" + std::to_string(config.page_limit);
    if (!config.feed.empty()) {
        request_url += "&feed=" + url_encode_query_value(config.feed);
    }
    if (!page_token.empty()) {
        request_url += "&page_token=" + url_encode_query_value(page_token);
    }
    return request_url;
}

std::string AlpacaDailyBarsClient::make_authenticated_request(const std::string& url) const {
    HttpRequest http_request(url);
    http_request.headers = {"APCA-API-KEY-ID: " + config.api_key,
                            "APCA-API-SECRET-KEY: " + config.api_secret,
                            "Accept: application/json"};
    http_request.attempts = config.retry_count;
    http_request.timeout_seconds = config.timeout_seconds;
    http_request.enable_ssl_verification = config.enable_ssl_verification;
    http_request.retry_delay_ms = config.rate_limit_delay_ms;
    return http_get(http_request);
}

std::string AlpacaDailyBarsClient::parse_bars_page(const std::string& response, std::vector<Core::PriceBar>& bars) {
    try {
        json response_json = json::parse(response);

        if (!response_json.contains("bars")) {
            throw std::runtime_error("Invalid response format from Alpaca bars API");
        }

        // A symbol without history answers with "bars": null
        if (response_json["bars"].is_array()) {
            for (const auto& bar_data : response_json["bars"]) {
                if (!bar_data.contains("o") || !bar_data.contains("h") ||
                    !bar_data.contains("l") || !bar_data.contains("c") ||
                    !bar_data.contains("v") || !bar_data.contains("t")) {
                    continue;
                }

                Core::PriceBar bar;
                bar.date = bar_data["t"].get<std::string>().substr(0, 10);
                bar.open_price = bar_data["o"].get<double>();
                bar.high_price = bar_data["h"].get<double>();
                bar.low_price = bar_data["l"].get<double>();
                bar.close_price = bar_data["c"].get<double>();
                bar.adjusted_close = bar.close_price;   // adjustment=all
                bar.volume = bar_data["v"].get<double>();

                bars.push_back(bar);
            }
        } else if (!response_json["bars"].is_null()) {
            throw std::runtime_error("Invalid response format from Alpaca bars API");
        }

        if (response_json.contains("next_page_token") && response_json["next_page_token"].is_string()) {
            return response_json["next_page_token"].get<std::string>();
        }
        return "";
    } catch (const json::exception& exception_error) {
        throw std::runtime_error("Failed to parse Alpaca bars response: " + std::string(exception_error.what()));
    }
}

std::vector<Core::PriceBar> AlpacaDailyBarsClient::get_daily_bars(const Core::DailyBarRequest& request) const {
    if (request.symbol.empty()) {
        throw std::runtime_error("Symbol is required for bar request");
    }
    if (request.lookback_calendar_days <= 0) {
        throw std::runtime_error("Lookback must be greater than 0 for bar request");
    }

    std::vector<Core::PriceBar> bars;
    std::string page_token;
    do {
        std::string response = make_authenticated_request(build_bars_url(request, page_token));
        page_token = parse_bars_page(response, bars);
    } while (!page_token.empty());

    return bars;
}

} // namespace API
} // namespace SwingScanner
