#ifndef CHAINLIST_SNAPSHOT_HPP
#define CHAINLIST_SNAPSHOT_HPP

#include <chainlist/config.hpp>
#include <chainlist/linked_list.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace chainlist {

/**
 * Point-in-time view of a list: the values in order, the length and the
 * head/tail values (empty optionals for an empty list).
 */
template<typename T>
struct ListSnapshot {
    std::vector<T> values;
    std::size_t length = 0;
    std::optional<T> head;
    std::optional<T> tail;
};

template<typename T>
ListSnapshot<T> snapshot(const LinkedList<T>& list) {
    ListSnapshot<T> result;
    result.values = list.values();
    result.length = list.size();
    if (const auto* h = list.head()) result.head = h->value;
    if (const auto* t = list.tail()) result.tail = t->value;
    return result;
}

// Value printing hook; variants print their active alternative
template<typename T>
void write_value(std::ostream& os, const T& value) {
    os << value;
}

template<typename... Ts>
void write_value(std::ostream& os, const std::variant<Ts...>& value) {
    std::visit([&os](const auto& alternative) { write_value(os, alternative); }, value);
}

template<typename T>
void write_snapshot(std::ostream& os, const ListSnapshot<T>& snap,
                    const DisplayConfig& config = DisplayConfig()) {
    if (config.framed) {
        os << config.rule << "\n";
    }

    os << config.indent << "List: ";
    std::size_t shown = 0;
    for (const auto& value : snap.values) {
        if (config.max_values != 0 && shown == config.max_values) {
            os << config.separator << config.ellipsis;
            break;
        }
        if (shown > 0) os << config.separator;
        write_value(os, value);
        ++shown;
    }
    os << "\n";

    os << config.indent << "Length: " << snap.length << "\n";

    os << config.indent << "Head: ";
    if (snap.head) write_value(os, *snap.head); else os << config.empty_marker;
    os << "\n";

    os << config.indent << "Tail: ";
    if (snap.tail) write_value(os, *snap.tail); else os << config.empty_marker;
    os << "\n";

    if (config.framed) {
        os << config.rule << "\n";
    }
}

template<typename T>
void print_list(std::ostream& os, const LinkedList<T>& list,
                const DisplayConfig& config = DisplayConfig()) {
    write_snapshot(os, snapshot(list), config);
}

template<typename T>
std::string describe(const LinkedList<T>& list, const DisplayConfig& config = DisplayConfig()) {
    std::ostringstream oss;
    print_list(oss, list, config);
    return oss.str();
}

} // namespace chainlist

#endif // CHAINLIST_SNAPSHOT_HPP
