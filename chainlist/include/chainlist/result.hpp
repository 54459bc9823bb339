#ifndef CHAINLIST_RESULT_HPP
#define CHAINLIST_RESULT_HPP

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace chainlist {

// Why an operation produced no value
enum class ListError {
    EmptyStructure,   // pop/shift on an empty container
    IndexOutOfRange,  // index outside the range the operation accepts
    ValueNotFound     // lookup by value found no equal element
};

const char* to_string(ListError error) noexcept;
std::ostream& operator<<(std::ostream& os, ListError error);

// Thrown only when a caller reads the value of a failed Result
class ListException : public std::runtime_error {
public:
    explicit ListException(ListError error);

    ListError error() const noexcept { return error_; }

private:
    ListError error_;
};

/**
 * Either a value or the ListError explaining its absence.
 * Never uses an in-band sentinel, so a stored value can't be mistaken
 * for "not found".
 */
template<typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(ListError error) : state_(std::in_place_index<1>, error) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & {
        ensure_value();
        return std::get<0>(state_);
    }

    const T& value() const& {
        ensure_value();
        return std::get<0>(state_);
    }

    T&& value() && {
        ensure_value();
        return std::get<0>(std::move(state_));
    }

    template<typename U>
    T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(state_) : static_cast<T>(std::forward<U>(fallback));
    }

    // Only meaningful when !has_value()
    std::optional<ListError> error() const noexcept {
        if (has_value()) return std::nullopt;
        return std::get<1>(state_);
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    void ensure_value() const {
        if (!has_value()) {
            throw ListException(std::get<1>(state_));
        }
    }

    std::variant<T, ListError> state_;
};

// Outcome of an operation with nothing to hand back (set, insert)
class Status {
public:
    Status() = default;
    Status(ListError error) : error_(error) {}

    static Status success() { return Status(); }

    bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    std::optional<ListError> error() const noexcept { return error_; }

private:
    std::optional<ListError> error_;
};

} // namespace chainlist

#endif // CHAINLIST_RESULT_HPP
