// error.cpp - Names and exception type for ListError

#include "chainlist/result.hpp"

namespace chainlist {

const char* to_string(ListError error) noexcept {
    switch (error) {
        case ListError::EmptyStructure:
            return "EmptyStructure";
        case ListError::IndexOutOfRange:
            return "IndexOutOfRange";
        case ListError::ValueNotFound:
            return "ValueNotFound";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ListError error) {
    return os << to_string(error);
}

ListException::ListException(ListError error)
    : std::runtime_error(std::string("chainlist: result holds no value (") + to_string(error) + ")")
    , error_(error) {}

} // namespace chainlist
