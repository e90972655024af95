#pragma once

#include <string>
#include <vector>

#include "fields.hpp"

enum class EMembershipKind {
    Primary,    /* group gid equals user gid */
    Member,     /* user is listed in the group line */
};

std::string MembershipKindName(EMembershipKind kind);

/* One line of the group table */
class TGroup {
public:
    std::string Source;

    std::string Name;
    std::string Password;
    uint32_t Gid = 0;

    /* names written in the group line */
    std::vector<std::string> Members;

    /* users having this group as primary, never written back */
    std::vector<std::string> PrimaryMembers;

    TError Parse(const std::string &line);
    std::string ToString() const;

    void AppendUser(const std::string &name);
    void RemoveMember(EMembershipKind kind, const std::string &name);

    bool IsListed(const std::string &name) const;

    /* listed members followed by primary ones, without duplicates */
    std::vector<std::string> MemberNames() const;

    bool HasOtherMembers(const std::string &name) const;
};
