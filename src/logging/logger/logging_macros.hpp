#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace SwingScanner {
namespace Logging {

// Label column of every two-column table
constexpr size_t TABLE_LABEL_WIDTH = 17;

// Pads or cuts text to exactly cell_width characters
inline std::string table_cell(const std::string& text, size_t cell_width) {
    std::string cell_text = text.substr(0, cell_width);
    cell_text.resize(cell_width, ' ');
    return cell_text;
}

inline std::string table_rule(const char* left_corner, const char* junction, const char* right_corner, size_t value_width) {
    std::string rule_line = left_corner;
    for (size_t column = 0; column < TABLE_LABEL_WIDTH + 2; ++column) rule_line += "─";
    rule_line += junction;
    for (size_t column = 0; column < value_width + 2; ++column) rule_line += "─";
    rule_line += right_corner;
    return rule_line;
}

inline std::string table_row(const std::string& label, const std::string& value, size_t value_width) {
    return "│ " + table_cell(label, TABLE_LABEL_WIDTH) + " │ " + table_cell(value, value_width) + " │";
}

} // namespace Logging
} // namespace SwingScanner

// Sections
#define LOG_THREAD_SECTION_HEADER(title) SwingScanner::Logging::log_message("+-- " + std::string(title), "")
#define LOG_THREAD_CONTENT(msg) SwingScanner::Logging::log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SECTION_FOOTER() SwingScanner::Logging::log_message("+-- ", "")

// Scan banner
#define LOG_SCAN_HEADER(scan_id) do { \
    SwingScanner::Logging::log_message("", ""); \
    SwingScanner::Logging::log_message(std::string(80, '='), ""); \
    SwingScanner::Logging::log_message(std::string(33, ' ') + "SCAN " + std::string(scan_id), ""); \
    SwingScanner::Logging::log_message(std::string(80, '='), ""); \
    SwingScanner::Logging::log_message("", ""); \
} while(0)

// Two-column tables, value column 48 or 30 wide
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("┌", "┬", "┐", 48)); \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_row(title, subtitle, 48)); \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("├", "┼", "┤", 48)); \
} while(0)

#define TABLE_HEADER_30(title, subtitle) do { \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("┌", "┬", "┐", 30)); \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_row(title, subtitle, 30)); \
    LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("├", "┼", "┤", 30)); \
} while(0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(SwingScanner::Logging::table_row(label, value, 48))
#define TABLE_ROW_30(label, value) LOG_THREAD_CONTENT(SwingScanner::Logging::table_row(label, value, 30))

#define TABLE_FOOTER_48() LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("└", "┴", "┘", 48))
#define TABLE_FOOTER_30() LOG_THREAD_CONTENT(SwingScanner::Logging::table_rule("└", "┴", "┘", 30))

#endif // LOGGING_MACROS_HPP
