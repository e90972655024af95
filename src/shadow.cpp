#include "shadow.hpp"
#include "util/string.hpp"

constexpr size_t SHADOW_FIELDS = 9;

TError TShadow::Parse(const std::string &line) {
    TError error;

    auto fields = SplitString(line, ':');
    if (fields.size() != SHADOW_FIELDS)
        return TError(EError::Malformed, "Shadow line has {} fields instead of {}: '{}'",
                      fields.size(), SHADOW_FIELDS, line);

    if (!IsUsernameValid(fields[0]))
        return TError(EError::Malformed, "Invalid username in shadow: '{}'", fields[0]);

    Source = line;
    Username = fields[0];
    Password = fields[1];

    TShadowDays *days[] = {
        &LastChange, &EarliestChange, &LatestChange,
        &WarnPeriod, &Deactivated, &DeactivatedSince,
    };

    for (size_t i = 0; i < 6; i++) {
        error = days[i]->Parse(fields[2 + i]);
        if (error)
            return TError(error, "Shadow entry {}", Username);
    }

    HasExtension = !fields[8].empty();
    Extension = 0;
    if (HasExtension) {
        error = StringToUint64(fields[8], Extension);
        if (error)
            return TError(EError::Malformed, "Shadow entry {} bad extension field: '{}'",
                          Username, fields[8]);
    }

    return OK;
}

std::string TShadow::ToString() const {
    return fmt::format("{}:{}:{}:{}:{}:{}:{}:{}:{}",
                       Username, Password,
                       LastChange.ToString(),
                       EarliestChange.ToString(),
                       LatestChange.ToString(),
                       WarnPeriod.ToString(),
                       Deactivated.ToString(),
                       DeactivatedSince.ToString(),
                       HasExtension ? std::to_string(Extension) : "");
}
