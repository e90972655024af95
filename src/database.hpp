#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common.hpp"
#include "files.hpp"
#include "user.hpp"
#include "group.hpp"

enum class EDeleteHome {
    Keep,
    Delete,
};

struct TDeleteUserArgs {
    std::string Username;
    EDeleteHome DeleteHome = EDeleteHome::Keep;
};

struct TCreateUserArgs {
    std::string Username;
};

/*
 * Users, shadow entries and groups cross-linked in memory.
 *
 * Groups live in an arena keyed by slot, users refer to them by slot.
 * Slots grow in table order, new groups get the next one. Without
 * backing files the database works in memory only.
 */
class TUserDatabase : public TNonCopyable {
    std::unique_ptr<TFiles> Files;
    std::map<std::string, TNumbered<TUser>> Users;
    std::map<TGroupSlot, TNumbered<TGroup>> Groups;
    TGroupSlot NextSlot = 0;

    TError Build(const std::string &passwd, const std::string &shadow, const std::string &group);

    static void LinkPrimary(TUser &user, std::map<TGroupSlot, TNumbered<TGroup>> &groups,
                            bool &found);
    void UnlinkGroup(TGroupSlot slot);

    TError DeleteFromPasswd(const TUser &user, TLockedFile &passwd);
    TError DeleteFromShadow(const TUser &user, TLockedFile &shadow);
    TError DeleteHome(const TUser &user);
    TError DeleteMemberships(const TUser &user, TLockedFile &group);
    TError WriteGroups(std::map<TGroupSlot, TNumbered<TGroup>> &groups, TLockedFile &locked);

public:
    TUserDatabase() {}

    TError ImportFromStrings(const std::string &passwd,
                             const std::string &shadow,
                             const std::string &group);
    TError LoadFiles(std::unique_ptr<TFiles> files);

    bool HasFiles() const { return Files && !Files->IsVirtual(); }

    std::vector<const TUser *> GetAllUsers() const;
    const TUser *GetUserByName(const std::string &name) const;
    const TUser *GetUserById(uint32_t uid) const;

    std::vector<const TGroup *> GetAllGroups() const;
    const TGroup *GetGroupByName(const std::string &name) const;
    const TGroup *GetGroupById(uint32_t gid) const;
    const TGroup *GetGroup(TGroupSlot slot) const;

    bool IsUidValidAndFree(uint32_t uid) const;
    bool IsUsernameValidAndFree(const std::string &name) const;
    bool IsGidValidAndFree(uint32_t gid) const;
    bool IsGroupnameValidAndFree(const std::string &name) const;

    TError DeleteUser(const TDeleteUserArgs &args, TNumbered<TUser> &removed);
    TError NewUser(const TCreateUserArgs &args, const TUser *&user);

    TError NewGroup(const std::string &name, uint32_t gid, const TGroup *&group);
    TError DeleteGroup(uint32_t gid);

    /* Forgets groups with this gid, tables are not touched */
    void DeleteGroupById(uint32_t gid);
};
