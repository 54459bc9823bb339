#ifndef CHAINLIST_CONFIG_HPP
#define CHAINLIST_CONFIG_HPP

#include <cstddef>
#include <string>

namespace chainlist {

// Options for the diagnostic rendering in snapshot.hpp
struct DisplayConfig {
    std::string separator = " -> ";
    std::string empty_marker = "null";   // Shown for head/tail of an empty list
    std::string rule = "--------------------------------";
    std::string indent = "  ";
    bool framed = true;                  // Draw the rule above and below
    std::size_t max_values = 0;          // 0 = print every value
    std::string ellipsis = "...";        // Appended when max_values cuts the list
};

} // namespace chainlist

#endif // CHAINLIST_CONFIG_HPP
