#pragma once

#include <string>

#include "fields.hpp"

/* One line of the shadow table */
class TShadow {
public:
    std::string Source;

    std::string Username;
    std::string Password;
    TShadowDays LastChange;
    TShadowDays EarliestChange;
    TShadowDays LatestChange;
    TShadowDays WarnPeriod;
    TShadowDays Deactivated;
    TShadowDays DeactivatedSince;
    bool HasExtension = false;
    uint64_t Extension = 0;

    TError Parse(const std::string &line);
    std::string ToString() const;

    void SetUsername(const std::string &name) {
        Username = name;
    }
};
