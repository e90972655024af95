#pragma once

#include <string>
#include <vector>

#include "common.hpp"

bool IsUsernameValid(const std::string &name);
bool IsGroupnameValid(const std::string &name);

/* Free-form field: anything except the separator and line breaks */
TError CheckTextField(const std::string &what, const std::string &value);

/*
 * Comment field of the user table, also known as GECOS.
 *
 * Without a comma it is a plain comment, otherwise the comma-separated
 * parts are full name, room, work phone, home phone and any number of
 * further fields. ToString() reproduces the parsed text exactly.
 */
class TGecos {
    std::vector<std::string> Fields;

    std::string Field(size_t index) const {
        return index < Fields.size() ? Fields[index] : "";
    }

public:
    TGecos() {}

    TError Parse(const std::string &text);
    std::string ToString() const;

    bool IsDetailed() const { return Fields.size() > 1; }

    std::string Comment() const { return IsDetailed() ? "" : Field(0); }
    std::string FullName() const { return IsDetailed() ? Field(0) : ""; }
    std::string Room() const { return Field(1); }
    std::string PhoneWork() const { return Field(2); }
    std::string PhoneHome() const { return Field(3); }
    std::vector<std::string> Other() const;
};

/* Optional day count of the shadow table: an empty field means absent */
class TShadowDays {
    bool Present = false;
    int64_t Days = 0;

public:
    TShadowDays() {}
    explicit TShadowDays(int64_t days) : Present(true), Days(days) {}

    TError Parse(const std::string &text);
    std::string ToString() const;

    /* Calendar day since the epoch in UTC, dd.mm.yyyy */
    std::string FormatDate() const;

    bool IsPresent() const { return Present; }
    int64_t Get() const { return Days; }

    friend bool operator==(const TShadowDays &a, const TShadowDays &b) {
        return a.Present == b.Present && (!a.Present || a.Days == b.Days);
    }
};
