#ifndef CHAINLIST_NODE_HPP
#define CHAINLIST_NODE_HPP

#include <memory>
#include <utility>

namespace chainlist {

template<typename T>
class LinkedList;

/**
 * Single link of the chain: a value and the owning link to its successor.
 * Only LinkedList can rewire the link; everyone else gets next_node().
 * A node handed back by a removal has no successor.
 */
template<typename T>
class Node {
public:
    T value;

    explicit Node(const T& v) : value(v) {}
    explicit Node(T&& v) : value(std::move(v)) {}

    // Null for the tail and for detached nodes
    const Node* next_node() const noexcept { return next.get(); }

private:
    friend class LinkedList<T>;

    std::unique_ptr<Node> next;
};

template<typename T>
using NodePtr = std::unique_ptr<Node<T>>;

} // namespace chainlist

#endif // CHAINLIST_NODE_HPP
