#ifndef CHAINLIST_INDEXED_ARRAY_HPP
#define CHAINLIST_INDEXED_ARRAY_HPP

#include <chainlist/debug_log.hpp>
#include <chainlist/result.hpp>

#include <cstddef>
#include <unordered_map>
#include <utility>

namespace chainlist {

/**
 * Array-like container over an index-keyed map.
 * Keys are always exactly [0, length); shift() re-keys every element.
 * Independent of LinkedList.
 */
template<typename T>
class IndexedArray {
public:
    using index_type = std::ptrdiff_t;

    IndexedArray& push(T value) {
        data_.insert_or_assign(length_, std::move(value));
        ++length_;
        return *this;
    }

    Result<T> get(index_type index) const {
        if (index < 0 || static_cast<std::size_t>(index) >= length_) {
            CHAINLIST_DEBUG_LOG("IndexedArray::get index %td outside [0, %zu)", index, length_);
            return ListError::IndexOutOfRange;
        }
        return data_.at(static_cast<std::size_t>(index));
    }

    // First index holding a value equal to `value`
    Result<std::size_t> find(const T& value) const {
        for (std::size_t i = 0; i < length_; ++i) {
            if (data_.at(i) == value) {
                return i;
            }
        }
        return ListError::ValueNotFound;
    }

    Result<T> pop() {
        if (length_ == 0) {
            CHAINLIST_DEBUG_LOG("IndexedArray::pop on empty array");
            return ListError::EmptyStructure;
        }
        auto it = data_.find(length_ - 1);
        T last = std::move(it->second);
        data_.erase(it);
        --length_;
        return std::move(last);
    }

    // O(n): every later element moves down one key
    Result<T> shift() {
        if (length_ == 0) {
            CHAINLIST_DEBUG_LOG("IndexedArray::shift on empty array");
            return ListError::EmptyStructure;
        }
        T first = std::move(data_.at(0));
        for (std::size_t i = 0; i + 1 < length_; ++i) {
            data_.at(i) = std::move(data_.at(i + 1));
        }
        data_.erase(length_ - 1);
        --length_;
        return std::move(first);
    }

    std::size_t size() const noexcept { return length_; }
    bool empty() const noexcept { return length_ == 0; }

private:
    std::unordered_map<std::size_t, T> data_;
    std::size_t length_ = 0;
};

} // namespace chainlist

#endif // CHAINLIST_INDEXED_ARRAY_HPP
