#include "util/error.hpp"

#include <cstring>

std::string TError::ErrorName(EError error) {
    return pwdb::EError_Name(error);
}

std::string TError::ToString() const {
    if (Errno)
        return fmt::format("{}:({}: {})", ErrorName(Error), strerror(Errno), Text);
    if (Text.length())
        return fmt::format("{}:({})", ErrorName(Error), Text);
    return ErrorName(Error);
}

std::ostream &operator<<(std::ostream &os, const TError &err) {
    os << err.ToString();
    return os;
}

const TError OK;
