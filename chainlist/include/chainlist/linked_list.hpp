#ifndef CHAINLIST_LINKED_LIST_HPP
#define CHAINLIST_LINKED_LIST_HPP

#include <chainlist/debug_log.hpp>
#include <chainlist/node.hpp>
#include <chainlist/result.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace chainlist {

/**
 * Singly linked list with head/tail/length tracking.
 *
 * head_ owns the first node and every node owns its successor; tail_ only
 * observes the last node so push() stays O(1). Removal hands the node back
 * to the caller fully detached.
 *
 * Not thread-safe: callers sharing a list across threads must serialize
 * every access themselves.
 */
template<typename T>
class LinkedList {
public:
    using value_type = T;
    using node_type = Node<T>;
    using index_type = std::ptrdiff_t;

    // Read-only walk from head to the terminal node
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator() = default;
        explicit const_iterator(const node_type* node) : node_(node) {}

        reference operator*() const { return node_->value; }
        pointer operator->() const { return &node_->value; }

        const_iterator& operator++() {
            node_ = node_->next_node();
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const const_iterator& other) const { return node_ == other.node_; }
        bool operator!=(const const_iterator& other) const { return node_ != other.node_; }

    private:
        const node_type* node_ = nullptr;
    };

    LinkedList() = default;

    ~LinkedList() {
        clear();
    }

    LinkedList(const LinkedList& other) {
        for (const node_type* n = other.head_.get(); n; n = n->next.get()) {
            push(n->value);
        }
    }

    LinkedList(LinkedList&& other) noexcept
        : head_(std::move(other.head_))
        , tail_(other.tail_)
        , length_(other.length_) {
        other.tail_ = nullptr;
        other.length_ = 0;
    }

    LinkedList& operator=(const LinkedList& other) {
        if (this != &other) {
            LinkedList copy(other);
            swap(copy);
        }
        return *this;
    }

    LinkedList& operator=(LinkedList&& other) noexcept {
        if (this != &other) {
            clear();
            head_ = std::move(other.head_);
            tail_ = other.tail_;
            length_ = other.length_;
            other.tail_ = nullptr;
            other.length_ = 0;
        }
        return *this;
    }

    // O(1) thanks to tail_
    LinkedList& push(T value) {
        auto node = std::make_unique<node_type>(std::move(value));
        node_type* raw = node.get();
        if (!head_) {
            head_ = std::move(node);
        } else {
            tail_->next = std::move(node);
        }
        tail_ = raw;
        ++length_;
        return *this;
    }

    /**
     * Remove the last node. O(n): without back links the second-to-last
     * node can only be found by walking from head with a trailing pointer.
     */
    Result<NodePtr<T>> pop() {
        if (!head_) {
            CHAINLIST_DEBUG_LOG("LinkedList::pop on empty list");
            return ListError::EmptyStructure;
        }

        node_type* pre = head_.get();
        node_type* temp = head_.get();
        while (temp->next) {
            pre = temp;
            temp = temp->next.get();
        }

        NodePtr<T> removed;
        if (pre == temp) {
            // Single node: head and tail both go away
            removed = std::move(head_);
            tail_ = nullptr;
        } else {
            removed = std::move(pre->next);
            tail_ = pre;
        }
        --length_;
        return std::move(removed);
    }

    LinkedList& unshift(T value) {
        auto node = std::make_unique<node_type>(std::move(value));
        node->next = std::move(head_);
        head_ = std::move(node);
        if (!tail_) {
            tail_ = head_.get();
        }
        ++length_;
        return *this;
    }

    Result<NodePtr<T>> shift() {
        if (!head_) {
            CHAINLIST_DEBUG_LOG("LinkedList::shift on empty list");
            return ListError::EmptyStructure;
        }

        NodePtr<T> removed = std::move(head_);
        head_ = std::move(removed->next);
        --length_;
        if (!head_) {
            tail_ = nullptr;
        }
        return std::move(removed);
    }

    Result<node_type*> get(index_type index) {
        if (!in_range(index)) {
            CHAINLIST_DEBUG_LOG("LinkedList::get index %td outside [0, %zu)", index, length_);
            return ListError::IndexOutOfRange;
        }
        return node_at(index);
    }

    Result<const node_type*> get(index_type index) const {
        if (!in_range(index)) {
            CHAINLIST_DEBUG_LOG("LinkedList::get index %td outside [0, %zu)", index, length_);
            return ListError::IndexOutOfRange;
        }
        return static_cast<const node_type*>(node_at(index));
    }

    Status set(index_type index, T value) {
        auto found = get(index);
        if (!found) {
            return *found.error();
        }
        found.value()->value = std::move(value);
        return Status::success();
    }

    // Valid positions are [0, length]; index == length appends
    Status insert(index_type index, T value) {
        if (index < 0 || static_cast<std::size_t>(index) > length_) {
            CHAINLIST_DEBUG_LOG("LinkedList::insert index %td outside [0, %zu]", index, length_);
            return ListError::IndexOutOfRange;
        }
        if (static_cast<std::size_t>(index) == length_) {
            push(std::move(value));
            return Status::success();
        }
        if (index == 0) {
            unshift(std::move(value));
            return Status::success();
        }

        node_type* pre = node_at(index - 1);
        auto node = std::make_unique<node_type>(std::move(value));
        node->next = std::move(pre->next);
        pre->next = std::move(node);
        ++length_;
        return Status::success();
    }

    Result<NodePtr<T>> remove(index_type index) {
        if (!in_range(index)) {
            CHAINLIST_DEBUG_LOG("LinkedList::remove index %td outside [0, %zu)", index, length_);
            return ListError::IndexOutOfRange;
        }
        if (index == 0) {
            return shift();
        }
        if (static_cast<std::size_t>(index) == length_ - 1) {
            return pop();
        }

        node_type* pre = node_at(index - 1);
        NodePtr<T> removed = std::move(pre->next);
        pre->next = std::move(removed->next);
        --length_;
        return std::move(removed);
    }

    std::size_t size() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

    // Null when the list is empty
    const node_type* head() const noexcept { return head_.get(); }
    const node_type* tail() const noexcept { return tail_; }

    const_iterator begin() const { return const_iterator(head_.get()); }
    const_iterator end() const { return const_iterator(); }

    template<typename Func>
    void for_each(Func&& func) const {
        for (const node_type* n = head_.get(); n; n = n->next.get()) {
            func(n->value);
        }
    }

    std::vector<T> values() const {
        std::vector<T> out;
        out.reserve(length_);
        for_each([&out](const T& v) { out.push_back(v); });
        return out;
    }

    // Releases nodes one at a time; a recursive unique_ptr teardown would
    // be as deep as the list is long.
    void clear() noexcept {
        NodePtr<T> current = std::move(head_);
        while (current) {
            current = std::move(current->next);
        }
        tail_ = nullptr;
        length_ = 0;
    }

    void swap(LinkedList& other) noexcept {
        std::swap(head_, other.head_);
        std::swap(tail_, other.tail_);
        std::swap(length_, other.length_);
    }

    /**
     * Walk the chain and check head/tail/length agree with it.
     * The walk is capped at length_ + 1 steps so a cycle can't hang it.
     *
     * Node links are private to LinkedList, so no public operation can
     * produce a list that fails these checks; the false branches only
     * guard changes to this class itself.
     */
    bool validate() const {
        if (length_ == 0) {
            if (head_ || tail_) {
                CHAINLIST_DEBUG_LOG("LinkedList::validate: empty list with head or tail set");
                return false;
            }
            return true;
        }
        if (!head_ || !tail_) {
            CHAINLIST_DEBUG_LOG("LinkedList::validate: length %zu but head or tail missing", length_);
            return false;
        }
        if (tail_->next) {
            CHAINLIST_DEBUG_LOG("LinkedList::validate: tail is not terminal");
            return false;
        }

        std::size_t count = 0;
        const node_type* last = nullptr;
        for (const node_type* n = head_.get(); n && count <= length_; n = n->next.get()) {
            last = n;
            ++count;
        }
        if (count != length_) {
            CHAINLIST_DEBUG_LOG("LinkedList::validate: walked %zu nodes, length is %zu", count, length_);
            return false;
        }
        if (last != tail_) {
            CHAINLIST_DEBUG_LOG("LinkedList::validate: tail is not the last reachable node");
            return false;
        }
        return true;
    }

private:
    bool in_range(index_type index) const noexcept {
        return index >= 0 && static_cast<std::size_t>(index) < length_;
    }

    // Caller guarantees 0 <= index < length_
    node_type* node_at(index_type index) const {
        node_type* temp = head_.get();
        for (index_type counter = 0; counter != index; ++counter) {
            temp = temp->next.get();
        }
        return temp;
    }

    NodePtr<T> head_;
    node_type* tail_ = nullptr;
    std::size_t length_ = 0;
};

template<typename T>
void swap(LinkedList<T>& a, LinkedList<T>& b) noexcept {
    a.swap(b);
}

} // namespace chainlist

#endif // CHAINLIST_LINKED_LIST_HPP
