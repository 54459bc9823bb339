/**
 * Indexed Array Usage Example
 *
 * The map-backed array next to the linked list: O(1) push/pop/get,
 * O(n) shift because every key moves down by one.
 */

#include <chainlist/indexed_array.hpp>
#include <iostream>
#include <string>

using namespace chainlist;

static void print_array(const IndexedArray<std::string>& array) {
    std::cout << "  [";
    for (std::size_t i = 0; i < array.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << array.get(static_cast<std::ptrdiff_t>(i)).value();
    }
    std::cout << "] length=" << array.size() << "\n";
}

int main() {
    std::cout << "=== Indexed Array Usage Example ===\n\n";

    IndexedArray<std::string> array;
    array.push("mango").push("apple").push("banana").push("kiwi");
    print_array(array);

    auto index = array.find("banana");
    if (index) {
        std::cout << "  banana at index " << index.value() << "\n";
    }
    std::cout << "  durian: " << *array.find("durian").error() << "\n";

    auto first = array.shift();
    if (first) {
        std::cout << "\nShifted: " << first.value() << "\n";
    }
    print_array(array);

    auto last = array.pop();
    if (last) {
        std::cout << "\nPopped: " << last.value() << "\n";
    }
    print_array(array);

    return 0;
}
