#include "group.hpp"
#include "util/string.hpp"

#include <algorithm>

constexpr size_t GROUP_FIELDS = 4;

std::string MembershipKindName(EMembershipKind kind) {
    switch (kind) {
    case EMembershipKind::Primary:
        return "primary";
    case EMembershipKind::Member:
        return "member";
    }
    return "unknown";
}

TError TGroup::Parse(const std::string &line) {
    TError error;

    auto fields = SplitString(line, ':');
    if (fields.size() != GROUP_FIELDS)
        return TError(EError::Malformed, "Group line has {} fields instead of {}: '{}'",
                      fields.size(), GROUP_FIELDS, line);

    if (!IsGroupnameValid(fields[0]))
        return TError(EError::Malformed, "Invalid group name: '{}'", fields[0]);

    error = StringToUint32(fields[2], Gid);
    if (error)
        return TError(EError::Malformed, "Group {} has invalid gid: '{}'", fields[0], fields[2]);

    Source = line;
    Name = fields[0];
    Password = fields[1];
    Members = SplitString(fields[3], ',');
    PrimaryMembers.clear();

    return OK;
}

std::string TGroup::ToString() const {
    return fmt::format("{}:{}:{}:{}", Name, Password, Gid, MergeString(Members, ','));
}

void TGroup::AppendUser(const std::string &name) {
    if (std::find(PrimaryMembers.begin(), PrimaryMembers.end(), name) == PrimaryMembers.end())
        PrimaryMembers.push_back(name);
}

void TGroup::RemoveMember(EMembershipKind kind, const std::string &name) {
    auto &list = kind == EMembershipKind::Primary ? PrimaryMembers : Members;
    list.erase(std::remove(list.begin(), list.end(), name), list.end());
}

bool TGroup::IsListed(const std::string &name) const {
    return std::find(Members.begin(), Members.end(), name) != Members.end();
}

std::vector<std::string> TGroup::MemberNames() const {
    std::vector<std::string> names;

    for (auto &list: { &Members, &PrimaryMembers }) {
        for (auto &name: *list) {
            if (!name.empty() && std::find(names.begin(), names.end(), name) == names.end())
                names.push_back(name);
        }
    }

    return names;
}

bool TGroup::HasOtherMembers(const std::string &name) const {
    for (auto &member: MemberNames())
        if (member != name)
            return true;
    return false;
}
