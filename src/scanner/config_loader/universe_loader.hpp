#ifndef UNIVERSE_LOADER_HPP
#define UNIVERSE_LOADER_HPP

#include <string>
#include <vector>
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Reads symbol,sector rows (sector optional, '#' comments and a leading "symbol" header allowed).
 * Symbols are upper-cased and deduplicated keeping the first occurrence.
 * Throws std::runtime_error when the file cannot be opened.
 */
std::vector<UniverseEntry> load_universe(const std::string& universe_path);

} // namespace Core
} // namespace SwingScanner

#endif // UNIVERSE_LOADER_HPP
