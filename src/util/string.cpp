#include <cctype>
#include <climits>

#include "util/string.hpp"

TError StringToUint64(const std::string &str, uint64_t &value) {
    const char *ptr = str.c_str();
    char *end;

    if (!StringOnlyDigits(str) || str.empty())
        return TError(EError::InvalidValue, "Bad uint64 value: " + str);

    errno = 0;
    value = strtoull(ptr, &end, 10);
    if (errno || end == ptr)
        return TError(EError::InvalidValue, errno, "Bad uint64 value: " + str);
    if (*end)
        return TError(EError::InvalidValue, "Bad uint64 value: " + str);
    return OK;
}

TError StringToUint32(const std::string &str, uint32_t &value) {
    uint64_t val;
    if (StringToUint64(str, val) || val > UINT32_MAX)
        return TError(EError::InvalidValue, "Bad uint32 value: " + str);
    value = val;
    return OK;
}

TTuple SplitString(const std::string &str, const char sep, int max) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0, end;

    if (str.empty())
        return tokens;

    while (true) {
        end = str.find(sep, start);
        if (end == std::string::npos || (max && (int)tokens.size() + 1 == max)) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, end - start));
        start = end + 1;
    }

    return tokens;
}

std::string MergeString(const TTuple &tuple, const char sep) {
    std::string result;
    bool first = true;

    for (auto &str: tuple) {
        if (!first)
            result += sep;
        first = false;
        result += str;
    }

    return result;
}

TTuple SplitLines(const std::string &text) {
    TTuple lines;
    std::string::size_type start = 0, end;

    while (start < text.size()) {
        end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }

    return lines;
}

std::string StringTrim(const std::string& s, const std::string &what) {
    std::size_t first = s.find_first_not_of(what);
    std::size_t last  = s.find_last_not_of(what);

    if (first == std::string::npos || last == std::string::npos)
        return "";

    return s.substr(first, last - first + 1);
}

bool StringOnlyDigits(const std::string &s) {
    return s.find_first_not_of("0123456789") == std::string::npos;
}

bool StringStartsWith(const std::string &str, const std::string &prefix) {
    if (str.length() < prefix.length())
        return false;

    return !str.compare(0, prefix.length(), prefix);
}

bool StringEndsWith(const std::string &str, const std::string &sfx) {
    if (str.length() < sfx.length())
        return false;

    return !str.compare(str.length() - sfx.length(), sfx.length(), sfx);
}
