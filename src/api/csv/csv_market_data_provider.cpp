#include "csv_market_data_provider.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace SwingScanner {
namespace API {

namespace {

std::string trim_cell(const std::string& input_string) {
    const char* whitespace_chars = " \t\r\n\"";
    auto begin_position = input_string.find_first_not_of(whitespace_chars);
    auto end_position = input_string.find_last_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    return input_string.substr(begin_position, end_position - begin_position + 1);
}

std::string normalize_column_name(const std::string& column_name) {
    std::string normalized_name;
    for (unsigned char name_character : trim_cell(column_name)) {
        if (std::isalnum(name_character)) {
            normalized_name += static_cast<char>(std::tolower(name_character));
        }
    }
    return normalized_name;
}

std::vector<std::string> split_csv_line(const std::string& csv_line) {
    std::vector<std::string> cells;
    std::stringstream line_stream(csv_line);
    std::string cell;
    while (std::getline(line_stream, cell, ',')) {
        cells.push_back(trim_cell(cell));
    }
    if (!csv_line.empty() && csv_line.back() == ',') {
        cells.push_back("");
    }
    return cells;
}

// Strict numeric parse: the whole cell must be a finite number
bool parse_price_cell(const std::string& cell, double& parsed_value) {
    if (cell.empty()) {
        return false;
    }
    try {
        size_t parsed_length = 0;
        parsed_value = std::stod(cell, &parsed_length);
        return parsed_length == cell.size() && std::isfinite(parsed_value);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

struct ColumnLayout {
    int date_column;
    int open_column;
    int high_column;
    int low_column;
    int close_column;
    int adjusted_close_column;
    int volume_column;

    ColumnLayout() : date_column(-1), open_column(-1), high_column(-1), low_column(-1), close_column(-1),
                     adjusted_close_column(-1), volume_column(-1) {}
};

ColumnLayout parse_header(const std::string& header_line, const std::string& file_path) {
    ColumnLayout column_layout;
    std::vector<std::string> header_cells = split_csv_line(header_line);
    for (size_t column_index = 0; column_index < header_cells.size(); ++column_index) {
        std::string column_name = normalize_column_name(header_cells[column_index]);
        int column_position = static_cast<int>(column_index);
        if (column_name == "date" || column_name == "timestamp") column_layout.date_column = column_position;
        else if (column_name == "open") column_layout.open_column = column_position;
        else if (column_name == "high") column_layout.high_column = column_position;
        else if (column_name == "low") column_layout.low_column = column_position;
        else if (column_name == "close") column_layout.close_column = column_position;
        else if (column_name == "adjclose" || column_name == "adjustedclose") column_layout.adjusted_close_column = column_position;
        else if (column_name == "volume") column_layout.volume_column = column_position;
    }
    if (column_layout.date_column < 0 || column_layout.open_column < 0 || column_layout.high_column < 0 ||
        column_layout.low_column < 0 || column_layout.close_column < 0 || column_layout.volume_column < 0) {
        throw std::runtime_error("CSV bars file " + file_path + " is missing one of Date,Open,High,Low,Close,Volume");
    }
    return column_layout;
}

} // anonymous namespace

CsvMarketDataProvider::CsvMarketDataProvider(const std::string& directory) : data_directory(directory) {
    if (data_directory.empty()) {
        throw std::runtime_error("CSV market data directory is required but not provided");
    }
}

std::string CsvMarketDataProvider::get_provider_name() const {
    return "csv";
}

std::vector<Core::PriceBar> CsvMarketDataProvider::read_bars_file(const std::string& file_path) {
    std::ifstream bars_file_stream(file_path);
    if (!bars_file_stream.is_open()) {
        return {};
    }

    std::string csv_line;
    ColumnLayout column_layout;
    bool header_parsed = false;
    std::map<std::string, Core::PriceBar> bars_by_date;

    while (std::getline(bars_file_stream, csv_line)) {
        if (trim_cell(csv_line).empty()) continue;
        if (!header_parsed) {
            column_layout = parse_header(csv_line, file_path);
            header_parsed = true;
            continue;
        }

        std::vector<std::string> cells = split_csv_line(csv_line);
        int required_columns = std::max({column_layout.date_column, column_layout.open_column, column_layout.high_column,
                                         column_layout.low_column, column_layout.close_column, column_layout.volume_column}) + 1;
        if (static_cast<int>(cells.size()) < required_columns) continue;

        Core::PriceBar bar;
        bar.date = cells[column_layout.date_column].substr(0, 10);
        if (!TimeUtils::is_valid_calendar_date(bar.date)) continue;
        if (!parse_price_cell(cells[column_layout.open_column], bar.open_price) ||
            !parse_price_cell(cells[column_layout.high_column], bar.high_price) ||
            !parse_price_cell(cells[column_layout.low_column], bar.low_price) ||
            !parse_price_cell(cells[column_layout.close_column], bar.close_price) ||
            !parse_price_cell(cells[column_layout.volume_column], bar.volume)) {
            continue;
        }
        bar.adjusted_close = bar.close_price;
        if (column_layout.adjusted_close_column >= 0 && column_layout.adjusted_close_column < static_cast<int>(cells.size())) {
            double adjusted_close = 0.0;
            if (parse_price_cell(cells[column_layout.adjusted_close_column], adjusted_close)) {
                bar.adjusted_close = adjusted_close;
            }
        }

        // A repeated date replaces the earlier row
        bars_by_date[bar.date] = bar;
    }

    std::vector<Core::PriceBar> bars;
    bars.reserve(bars_by_date.size());
    for (const auto& dated_bar : bars_by_date) {
        bars.push_back(dated_bar.second);
    }
    return bars;
}

std::vector<Core::PriceBar> CsvMarketDataProvider::get_daily_bars(const Core::DailyBarRequest& request) const {
    if (request.symbol.empty()) {
        throw std::runtime_error("Symbol is required for bar request");
    }

    std::vector<Core::PriceBar> bars = read_bars_file(data_directory + "/" + request.symbol + ".csv");
    if (bars.empty() || request.lookback_calendar_days <= 0) {
        return bars;
    }

    // Lookback is counted back from the latest bar in the file
    long long first_kept_day = TimeUtils::days_since_epoch(bars.back().date) - request.lookback_calendar_days;
    auto first_kept_bar = std::find_if(bars.begin(), bars.end(), [first_kept_day](const Core::PriceBar& bar) {
        return TimeUtils::days_since_epoch(bar.date) >= first_kept_day;
    });
    return std::vector<Core::PriceBar>(first_kept_bar, bars.end());
}

} // namespace API
} // namespace SwingScanner
