/**
 * Linked List Walkthrough Example
 *
 * Demonstrates the list operations and their cost:
 * - push/unshift (O(1)) and pop (O(n)) / shift (O(1))
 * - indexed insert/remove splicing
 * - the diagnostic view after every step
 */

#include <chainlist/linked_list.hpp>
#include <chainlist/snapshot.hpp>
#include <iostream>
#include <string>
#include <variant>

using namespace chainlist;

using Payload = std::variant<int, std::string>;

int main() {
    std::cout << "=== Linked List Walkthrough ===\n\n";

    LinkedList<Payload> list;
    print_list(std::cout, list);

    std::cout << "\nPushing 21, 26, 29:\n";
    list.push(21).push(26).push(29);
    print_list(std::cout, list);

    auto popped = list.pop();
    if (popped) {
        std::cout << "\nPopping node: ";
        write_value(std::cout, popped.value()->value);
        std::cout << "\n";
    }
    print_list(std::cout, list);

    std::cout << "\nUnshifting 10:\n";
    list.unshift(10);
    print_list(std::cout, list);

    std::cout << "\nInserting \"INSERTED\" at index 1:\n";
    if (!list.insert(1, std::string("INSERTED"))) {
        std::cerr << "insert failed\n";
        return 1;
    }
    print_list(std::cout, list);

    std::cout << "\nRemoving index 2:\n";
    auto removed = list.remove(2);
    if (removed) {
        std::cout << "  Removed: ";
        write_value(std::cout, removed.value()->value);
        std::cout << "\n";
    }
    print_list(std::cout, list);

    // Failures come back as values, never as sentinels
    std::cout << "\nOut-of-range access:\n";
    auto missing = list.get(10);
    std::cout << "  get(10): " << *missing.error() << "\n";
    std::cout << "  insert(-1): " << *list.insert(-1, 0).error() << "\n";

    LinkedList<Payload> empty;
    std::cout << "  pop() on empty list: " << *empty.pop().error() << "\n";

    return 0;
}
