#include "database.hpp"
#include "oplog.hpp"
#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

#include <algorithm>

typedef std::map<TGroupSlot, TNumbered<TGroup>> TGroupArena;

constexpr uint32_t INVALID_ID = UINT32_MAX;

template <typename T>
static TError ParseLines(const std::string &text, const char *table,
                         std::vector<TNumbered<T>> &records) {
    auto lines = SplitLines(text);

    records.clear();
    for (size_t pos = 0; pos < lines.size(); pos++) {
        T value;
        TError error = value.Parse(lines[pos]);
        if (error)
            return TError(error, "{} line {}", table, pos + 1);
        records.emplace_back(pos, value);
    }

    return OK;
}

void TUserDatabase::LinkPrimary(TUser &user, TGroupArena &groups, bool &found) {
    std::vector<TGroupSlot> matches;

    for (auto &it: groups)
        if (it.second->Gid == user.Gid)
            matches.push_back(it.first);

    found = matches.size() == 1;
    if (!found) {
        L_WRN("Group with gid {} of user {} found {} times", user.Gid, user.Username, matches.size());
        return;
    }

    groups[matches[0]]->AppendUser(user.Username);
    user.AddGroup(EMembershipKind::Primary, matches[0]);
}

TError TUserDatabase::Build(const std::string &passwd,
                            const std::string &shadow,
                            const std::string &group) {
    std::vector<TNumbered<TShadow>> shadows;
    std::vector<TNumbered<TUser>> users;
    std::vector<TNumbered<TGroup>> groups;
    std::map<std::string, TNumbered<TUser>> userMap;
    TGroupArena groupArena;
    TGroupSlot slot = 0;
    TError error;

    error = ParseLines(shadow, "shadow", shadows);
    if (!error)
        error = ParseLines(passwd, "passwd", users);
    if (!error)
        error = ParseLines(group, "group", groups);
    if (error)
        return error;

    for (auto &user: users) {
        user->Position = TPosition(TPosition::At, user.Pos);
        if (!userMap.emplace(user->Username, user).second)
            return TError(EError::Malformed, "Duplicate user {} at passwd line {}",
                          user->Username, user.Pos + 1);
    }

    for (auto &grp: groups)
        groupArena[slot++] = grp;

    for (auto &entry: shadows) {
        auto it = userMap.find(entry->Username);
        if (it == userMap.end())
            return TError(EError::Inconsistent, "Shadow line {} belongs to unknown user {}",
                          entry.Pos + 1, entry->Username);
        it->second->Password.Kind = TPassword::Shadow;
        it->second->Password.ShadowEntry = entry;
    }

    for (auto &it: groupArena) {
        for (auto &name: it.second->Members) {
            auto user = userMap.find(name);
            if (user != userMap.end())
                user->second->AddGroup(EMembershipKind::Member, it.first);
        }
    }

    for (auto &it: userMap) {
        bool found;
        LinkPrimary(it.second.Value, groupArena, found);
        if (!found && config().database().strict_primary_group())
            return TError(EError::Inconsistent, "User {} has no unique primary group with gid {}",
                          it.first, it.second->Gid);
    }

    Users.swap(userMap);
    Groups.swap(groupArena);
    NextSlot = slot;

    L_VERBOSE("Loaded {} users and {} groups", Users.size(), Groups.size());
    return OK;
}

TError TUserDatabase::ImportFromStrings(const std::string &passwd,
                                        const std::string &shadow,
                                        const std::string &group) {
    TError error = Build(passwd, shadow, group);
    if (error)
        return error;
    Files.reset();
    return OK;
}

TError TUserDatabase::LoadFiles(std::unique_ptr<TFiles> files) {
    std::string passwd, shadow, group;
    TError error;

    if (!files || files->IsVirtual())
        return TError(EError::FilesRequired, "Cannot load database without files");

    {
        std::unique_ptr<TLockedFile> lp, ls, lg;

        error = files->LockAll(lp, ls, lg);
        if (error)
            return error;

        error = lp->ReadAll(passwd);
        if (!error)
            error = ls->ReadAll(shadow);
        if (!error)
            error = lg->ReadAll(group);
        if (error)
            return error;
    }

    error = Build(passwd, shadow, group);
    if (error)
        return error;

    Files = std::move(files);
    return OK;
}

std::vector<const TUser *> TUserDatabase::GetAllUsers() const {
    std::vector<const TUser *> result;

    for (auto &it: Users)
        result.push_back(&it.second.Value);

    std::stable_sort(result.begin(), result.end(),
                     [](const TUser *a, const TUser *b) { return *a < *b; });

    return result;
}

const TUser *TUserDatabase::GetUserByName(const std::string &name) const {
    auto it = Users.find(name);
    if (it == Users.end())
        return nullptr;
    return &it->second.Value;
}

const TUser *TUserDatabase::GetUserById(uint32_t uid) const {
    for (auto &it: Users)
        if (it.second->Uid == uid)
            return &it.second.Value;
    return nullptr;
}

std::vector<const TGroup *> TUserDatabase::GetAllGroups() const {
    std::vector<const TGroup *> result;
    for (auto &it: Groups)
        result.push_back(&it.second.Value);
    return result;
}

const TGroup *TUserDatabase::GetGroupByName(const std::string &name) const {
    for (auto &it: Groups)
        if (it.second->Name == name)
            return &it.second.Value;
    return nullptr;
}

const TGroup *TUserDatabase::GetGroupById(uint32_t gid) const {
    for (auto &it: Groups)
        if (it.second->Gid == gid)
            return &it.second.Value;
    return nullptr;
}

const TGroup *TUserDatabase::GetGroup(TGroupSlot slot) const {
    auto it = Groups.find(slot);
    if (it == Groups.end())
        return nullptr;
    return &it->second.Value;
}

bool TUserDatabase::IsUidValidAndFree(uint32_t uid) const {
    return uid != INVALID_ID && !GetUserById(uid);
}

bool TUserDatabase::IsUsernameValidAndFree(const std::string &name) const {
    return IsUsernameValid(name) && !GetUserByName(name);
}

bool TUserDatabase::IsGidValidAndFree(uint32_t gid) const {
    return gid != INVALID_ID && !GetGroupById(gid);
}

bool TUserDatabase::IsGroupnameValidAndFree(const std::string &name) const {
    return IsGroupnameValid(name) && !GetGroupByName(name);
}

void TUserDatabase::UnlinkGroup(TGroupSlot slot) {
    for (auto &it: Users) {
        auto &edges = it.second->Groups;
        edges.erase(std::remove_if(edges.begin(), edges.end(),
                    [slot](const std::pair<EMembershipKind, TGroupSlot> &edge) {
                        return edge.second == slot;
                    }), edges.end());
    }
}

TError TUserDatabase::DeleteFromPasswd(const TUser &user, TLockedFile &passwd) {
    std::string content;
    TError error;

    error = passwd.ReadAll(content);
    if (!error)
        error = TAtom(EAtomType::DeletePasswdLine, user.Source).Execute(content);
    if (!error)
        error = passwd.ReplaceContents(TableText(content));
    if (error)
        return TError(error, "Failed to write the passwd database");

    return OK;
}

TError TUserDatabase::DeleteFromShadow(const TUser &user, TLockedFile &shadow) {
    std::string content;
    TError error;

    auto entry = user.GetShadow();
    if (!entry)
        return OK;

    error = shadow.ReadAll(content);
    if (!error)
        error = TAtom(EAtomType::DeleteShadowLine, entry->Source).Execute(content);
    if (!error)
        error = shadow.ReplaceContents(TableText(content));
    if (error)
        return TError(error, "Error during write to the shadow database, "
                             "please double check as it could be corrupted");

    return OK;
}

static TError CheckHomeDir(const TUser &user) {
    TPath home(user.HomeDir);

    if (home.IsEmpty())
        return TError(EError::InvalidValue, "User {} has no home directory", user.Username);

    if (!home.IsAbsolute() || home.NormalPath().IsRoot())
        return TError(EError::InvalidValue, "Refuse to remove home directory {} of user {}",
                      home, user.Username);

    return OK;
}

TError TUserDatabase::DeleteHome(const TUser &user) {
    TPath home(user.HomeDir);
    TError error;

    error = CheckHomeDir(user);
    if (error)
        return error;

    if (!home.PathExists()) {
        L_WRN("Home directory {} of user {} does not exist", home, user.Username);
        return OK;
    }

    error = home.RemoveAll();
    if (error)
        return TError(error, "Cannot remove home directory {}", home);

    L_ACT("Removed home directory {} of user {}", home, user.Username);
    return OK;
}

TError TUserDatabase::WriteGroups(TGroupArena &groups, TLockedFile &locked) {
    TTuple lines;
    TError error;

    for (auto &it: groups)
        lines.push_back(it.second->ToString());

    error = locked.ReplaceContents(MergeString(lines, '\n'));
    if (error)
        return TError(error, "Error during write to the group database, "
                             "please double check as it could be corrupted");

    for (auto &it: groups)
        it.second->Source = it.second->ToString();

    return OK;
}

TError TUserDatabase::DeleteMemberships(const TUser &user, TLockedFile &locked) {
    TGroupArena groups = Groups;
    TError error;

    for (auto &edge: user.Groups) {
        auto it = groups.find(edge.second);
        if (it == groups.end()) {
            L_DBG("Group slot {} of user {} is already gone", edge.second, user.Username);
            continue;
        }

        TGroup &group = it->second.Value;

        L_DBG("Drop {} membership of {} in {}", MembershipKindName(edge.first),
              user.Username, group.Name);

        if (edge.first == EMembershipKind::Primary && !group.HasOtherMembers(user.Username)) {
            std::string content;

            error = locked.ReadAll(content);
            if (!error)
                error = TAtom(EAtomType::DeleteGroupLine, group.Source).Execute(content);
            if (!error)
                error = locked.ReplaceContents(TableText(content));
            if (error)
                return TError(error, "Error during write to the group database, "
                                     "please double check as it could be corrupted");

            L_ACT("Deleted group {} as user {} was its only member", group.Name, user.Username);
            Statistics.GroupsDeleted++;
            groups.erase(it);
            Groups = groups;
            UnlinkGroup(edge.second);
            continue;
        }

        group.RemoveMember(edge.first, user.Username);

        error = WriteGroups(groups, locked);
        if (error)
            return error;

        if (edge.first == EMembershipKind::Primary)
            L_WRN("Primary group {} (gid {}) is not empty, only the membership of {} was removed",
                  group.Name, group.Gid, user.Username);

        Groups = groups;
    }

    return OK;
}

TError TUserDatabase::DeleteUser(const TDeleteUserArgs &args, TNumbered<TUser> &removed) {
    TError error;

    auto it = Users.find(args.Username);
    if (it == Users.end())
        return TError(EError::NotFound, "User {} not found", args.Username);

    TNumbered<TUser> victim = it->second;

    if (!HasFiles()) {
        L_WRN("There are no backing files, removing user {} from memory only", args.Username);
        for (auto &edge: victim->Groups) {
            auto group = Groups.find(edge.second);
            if (group != Groups.end())
                group->second->RemoveMember(edge.first, args.Username);
        }
        Users.erase(it);
        Statistics.UsersDeleted++;
        removed = victim;
        return OK;
    }

    if (args.DeleteHome == EDeleteHome::Delete) {
        error = CheckHomeDir(*victim);
        if (error)
            return error;
    }

    std::unique_ptr<TLockedFile> lp, ls, lg;

    error = Files->LockAll(lp, ls, lg);
    if (error)
        return error;

    error = DeleteFromPasswd(*victim, *lp);
    if (error)
        return error;

    error = DeleteFromShadow(*victim, *ls);
    if (error)
        return error;

    if (args.DeleteHome == EDeleteHome::Delete) {
        error = DeleteHome(*victim);
        if (error)
            return error;
    }

    error = DeleteMemberships(*victim, *lg);
    if (error)
        return error;

    Users.erase(args.Username);

    L_ACT("Deleted user {}", args.Username);
    Statistics.UsersDeleted++;
    removed = victim;
    return OK;
}

TError TUserDatabase::NewUser(const TCreateUserArgs &args, const TUser *&user) {
    TError error;

    if (Users.count(args.Username))
        return TError(EError::AlreadyExists, "The username {} already exists", args.Username);

    if (!IsUsernameValid(args.Username))
        return TError(EError::InvalidValue, "Invalid username: '{}'", args.Username);

    TUser created = TUser::Default();
    created.SetUsername(args.Username);

    if (HasFiles()) {
        std::unique_ptr<TLockedFile> lp, ls, lg;

        error = Files->LockAll(lp, ls, lg);
        if (error)
            return error;

        error = lp->Append(created.ToString());
        if (error)
            return TError(error, "Failed to write the passwd database");

        auto shadow = created.GetShadow();
        if (shadow) {
            L_VERBOSE("Adding shadow entry {}", shadow->ToString());
            error = ls->Append(shadow->ToString());
            if (error)
                return TError(error, "Error during write to the shadow database, "
                                     "please double check as it could be corrupted");
            shadow->Source = shadow->ToString();
        } else {
            L_WRN("Omitting shadow entry of user {}", args.Username);
        }
    } else {
        L_WRN("Working without database files, user {} cannot be stored", args.Username);
        created.Position = TPosition(TPosition::NotInFile);
    }

    created.Source = created.ToString();

    for (auto &it: Groups)
        if (it.second->IsListed(args.Username))
            created.AddGroup(EMembershipKind::Member, it.first);

    bool found;
    LinkPrimary(created, Groups, found);

    auto ret = Users.emplace(args.Username, TNumbered<TUser>(POS_NEW, created));
    PWDB_ASSERT(ret.second);

    L_ACT("Created user {}", args.Username);
    Statistics.UsersCreated++;
    user = &ret.first->second.Value;
    return OK;
}

TError TUserDatabase::NewGroup(const std::string &name, uint32_t gid, const TGroup *&group) {
    TGroup created;
    TError error;

    created.Name = name;
    created.Password = "x";
    created.Gid = gid;
    created.Source = created.ToString();

    TAction action = TAction::AddGroupAction(created);

    error = action.Validate(*this);
    if (error)
        return error;

    if (HasFiles()) {
        std::unique_ptr<TLockedFile> lg;
        TFileContents contents;

        error = Files->LockGroup(lg);
        if (error)
            return error;

        error = lg->ReadAll(contents.Group);
        if (!error)
            error = action.Execute(contents);
        if (!error)
            error = lg->ReplaceContents(TableText(contents.Group));
        if (error)
            return TError(error, "Failed to write the group database");
    } else {
        L_WRN("Working without database files, group {} cannot be stored", name);
    }

    TGroupSlot slot = NextSlot++;
    Groups[slot] = TNumbered<TGroup>(POS_NEW, created);

    for (auto &it: Users) {
        TUser &user = it.second.Value;
        if (user.Gid != gid)
            continue;
        bool primary = std::any_of(user.Groups.begin(), user.Groups.end(),
                [](const std::pair<EMembershipKind, TGroupSlot> &edge) {
                    return edge.first == EMembershipKind::Primary;
                });
        bool found;
        if (!primary)
            LinkPrimary(user, Groups, found);
    }

    L_ACT("Created group {} with gid {}", name, gid);
    Statistics.GroupsCreated++;
    group = &Groups[slot].Value;
    return OK;
}

TError TUserDatabase::DeleteGroup(uint32_t gid) {
    TError error;

    auto it = std::find_if(Groups.begin(), Groups.end(),
            [gid](const std::pair<const TGroupSlot, TNumbered<TGroup>> &entry) {
                return entry.second->Gid == gid;
            });
    if (it == Groups.end())
        return TError(EError::NotFound, "Group with gid {} not found", gid);

    TGroupSlot slot = it->first;
    std::string name = it->second->Name;
    TAction action = TAction::DeleteGroupAction(it->second.Value);

    error = action.Validate(*this);
    if (error)
        return error;

    if (HasFiles()) {
        std::unique_ptr<TLockedFile> lg;
        TFileContents contents;

        error = Files->LockGroup(lg);
        if (error)
            return error;

        error = lg->ReadAll(contents.Group);
        if (!error)
            error = action.Execute(contents);
        if (!error)
            error = lg->ReplaceContents(TableText(contents.Group));
        if (error)
            return TError(error, "Failed to write the group database");
    } else {
        L_WRN("Working without database files, removing group {} from memory only", name);
    }

    UnlinkGroup(slot);
    Groups.erase(slot);

    L_ACT("Deleted group {} with gid {}", name, gid);
    Statistics.GroupsDeleted++;
    return OK;
}

void TUserDatabase::DeleteGroupById(uint32_t gid) {
    for (auto it = Groups.begin(); it != Groups.end(); ) {
        if (it->second->Gid == gid) {
            UnlinkGroup(it->first);
            it = Groups.erase(it);
        } else
            ++it;
    }
}
