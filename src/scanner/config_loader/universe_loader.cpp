#include "universe_loader.hpp"
#include "logging/logs/config_logs.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace SwingScanner {
namespace Core {

namespace {

std::string trim_field(const std::string& input_string) {
    const char* whitespace_chars = " \t\r\n";
    auto begin_position = input_string.find_first_not_of(whitespace_chars);
    auto end_position = input_string.find_last_not_of(whitespace_chars);
    if (begin_position == std::string::npos) return "";
    return input_string.substr(begin_position, end_position - begin_position + 1);
}

std::string to_upper_copy(const std::string& input_string) {
    std::string upper_string = input_string;
    std::transform(upper_string.begin(), upper_string.end(), upper_string.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return upper_string;
}

} // anonymous namespace

std::vector<UniverseEntry> load_universe(const std::string& universe_path) {
    std::ifstream universe_file_stream(universe_path);
    if (!universe_file_stream.is_open()) {
        throw std::runtime_error("Failed to open universe file: " + universe_path);
    }

    std::vector<UniverseEntry> universe_entries;
    std::unordered_set<std::string> seen_symbols;
    int duplicate_count = 0;
    bool first_row = true;

    std::string universe_line_string;
    while (std::getline(universe_file_stream, universe_line_string)) {
        universe_line_string = trim_field(universe_line_string);
        if (universe_line_string.empty() || universe_line_string[0] == '#') continue;

        std::stringstream universe_line_stream(universe_line_string);
        std::string symbol_field, sector_field;
        std::getline(universe_line_stream, symbol_field, ',');
        std::getline(universe_line_stream, sector_field);

        std::string symbol = to_upper_copy(trim_field(symbol_field));
        bool header_row = first_row && symbol == "SYMBOL";
        first_row = false;
        if (symbol.empty() || header_row) continue;

        if (!seen_symbols.insert(symbol).second) {
            duplicate_count++;
            continue;
        }
        universe_entries.emplace_back(symbol, trim_field(sector_field));
    }

    Logging::ConfigLogs::log_universe_loaded(universe_path, static_cast<int>(universe_entries.size()), duplicate_count);
    return universe_entries;
}

} // namespace Core
} // namespace SwingScanner
