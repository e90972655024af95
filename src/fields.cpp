#include "fields.hpp"
#include "util/string.hpp"

#include <cctype>

extern "C" {
#include <time.h>
}

static bool IsNameChar(unsigned char c, bool first) {
    if (c >= 0x80)
        return true;
    if (isalpha(c) || c == '_')
        return true;
    if (first)
        return false;
    return isdigit(c) || c == '.' || c == '-';
}

static bool IsNameValid(const std::string &name) {
    size_t len = name.size();

    if (!len || len > NAME_LENGTH_MAX)
        return false;

    /* samba machine accounts */
    if (name[len - 1] == '$') {
        if (len == 1)
            return false;
        len--;
    }

    for (size_t i = 0; i < len; i++) {
        if (!IsNameChar(name[i], i == 0))
            return false;
    }

    return true;
}

bool IsUsernameValid(const std::string &name) {
    return IsNameValid(name);
}

bool IsGroupnameValid(const std::string &name) {
    return IsNameValid(name);
}

TError CheckTextField(const std::string &what, const std::string &value) {
    if (value.find_first_of(":\n") != std::string::npos)
        return TError(EError::Malformed, "Invalid {} field: '{}'", what, value);
    return OK;
}

TError TGecos::Parse(const std::string &text) {
    TError error = CheckTextField("comment", text);
    if (error)
        return error;

    Fields = SplitString(text, ',');
    return OK;
}

std::string TGecos::ToString() const {
    return MergeString(Fields, ',');
}

std::vector<std::string> TGecos::Other() const {
    if (Fields.size() <= 4)
        return {};
    return std::vector<std::string>(Fields.begin() + 4, Fields.end());
}

TError TShadowDays::Parse(const std::string &text) {
    Present = false;
    Days = 0;

    if (text.empty())
        return OK;

    uint64_t days;
    TError error = StringToUint64(text, days);
    if (error || days > INT32_MAX)
        return TError(EError::Malformed, "Invalid day count: '{}'", text);

    Present = true;
    Days = days;
    return OK;
}

std::string TShadowDays::ToString() const {
    return Present ? std::to_string(Days) : "";
}

std::string TShadowDays::FormatDate() const {
    if (!Present)
        return "";

    time_t t = Days * 86400;
    struct tm tm;
    char buf[32];

    if (!gmtime_r(&t, &tm) || !strftime(buf, sizeof(buf), "%d.%m.%Y", &tm))
        return "";

    return buf;
}
