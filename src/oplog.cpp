#include "oplog.hpp"
#include "database.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

std::string AtomTypeName(EAtomType type) {
    switch (type) {
    case EAtomType::AddPasswdLine:
        return "add-passwd-line";
    case EAtomType::AddShadowLine:
        return "add-shadow-line";
    case EAtomType::AddGroupLine:
        return "add-group-line";
    case EAtomType::DeletePasswdLine:
        return "delete-passwd-line";
    case EAtomType::DeleteShadowLine:
        return "delete-shadow-line";
    case EAtomType::DeleteGroupLine:
        return "delete-group-line";
    }
    return "unknown";
}

std::string &TFileContents::Get(EAtomType type) {
    switch (type) {
    case EAtomType::AddPasswdLine:
    case EAtomType::DeletePasswdLine:
        return Passwd;
    case EAtomType::AddShadowLine:
    case EAtomType::DeleteShadowLine:
        return Shadow;
    case EAtomType::AddGroupLine:
    case EAtomType::DeleteGroupLine:
        break;
    }
    return Group;
}

std::string TableText(const std::string &content) {
    auto end = content.find_last_not_of('\n');
    if (end == std::string::npos)
        return "";
    return content.substr(0, end + 1);
}

TAtom TAtom::AddPasswdLine(const TUser &user) {
    return TAtom(EAtomType::AddPasswdLine, user.ToString());
}

TAtom TAtom::AddShadowLine(const TShadow &shadow) {
    return TAtom(EAtomType::AddShadowLine, shadow.ToString());
}

TAtom TAtom::AddGroupLine(const TGroup &group) {
    return TAtom(EAtomType::AddGroupLine, group.ToString());
}

TAtom TAtom::DeletePasswdLine(const TUser &user) {
    return TAtom(EAtomType::DeletePasswdLine, user.Source.empty() ? user.ToString() : user.Source);
}

TAtom TAtom::DeleteShadowLine(const TShadow &shadow) {
    return TAtom(EAtomType::DeleteShadowLine, shadow.Source.empty() ? shadow.ToString() : shadow.Source);
}

TAtom TAtom::DeleteGroupLine(const TGroup &group) {
    return TAtom(EAtomType::DeleteGroupLine, group.Source.empty() ? group.ToString() : group.Source);
}

bool TAtom::IsDelete() const {
    return Type == EAtomType::DeletePasswdLine ||
           Type == EAtomType::DeleteShadowLine ||
           Type == EAtomType::DeleteGroupLine;
}

TError TAtom::Execute(std::string &content) const {
    if (!IsDelete()) {
        if (!content.empty() && content.back() != '\n')
            content += "\n";
        content += Line + "\n";
        return OK;
    }

    auto lines = SplitLines(content);
    TTuple kept;

    for (auto &line: lines)
        if (line != Line)
            kept.push_back(line);

    if (lines.size() - kept.size() != 1) {
        switch (Type) {
        case EAtomType::DeletePasswdLine:
            return TError(EError::Inconsistent, "Failed to delete the user");
        case EAtomType::DeleteShadowLine:
            return TError(EError::Inconsistent, "Failed to delete the users shadow");
        default:
            return TError(EError::Inconsistent, "Failed to delete the group");
        }
    }

    content = MergeString(kept, '\n');
    return OK;
}

std::string TAtom::ToString() const {
    return fmt::format("{} '{}'", AtomTypeName(Type), Line);
}

TError TAction::AddUserAction(const TUser &user, const TGroup &group, TAction &action) {
    auto shadow = user.GetShadow();
    if (!shadow)
        return TError(EError::InvalidValue, "User {} has no shadow entry", user.Username);

    action = TAction();
    action.Kind = AddUser;
    action.Username = user.Username;
    action.Groupname = group.Name;
    action.Gid = group.Gid;
    action.Atoms.push_back(TAtom::AddPasswdLine(user));
    action.Atoms.push_back(TAtom::AddShadowLine(*shadow));
    action.Atoms.push_back(TAtom::AddGroupLine(group));
    return OK;
}

TAction TAction::AddGroupAction(const TGroup &group) {
    TAction action;
    action.Kind = AddGroup;
    action.Groupname = group.Name;
    action.Gid = group.Gid;
    action.Atoms.push_back(TAtom::AddGroupLine(group));
    return action;
}

TAction TAction::DeleteGroupAction(const TGroup &group) {
    TAction action;
    action.Kind = DeleteGroup;
    action.Groupname = group.Name;
    action.Gid = group.Gid;
    action.Atoms.push_back(TAtom::DeleteGroupLine(group));
    return action;
}

TError TAction::Execute(TFileContents &contents) const {
    TFileContents result = contents;
    TError error;

    for (auto &atom: Atoms) {
        error = atom.Execute(result.Get(atom.Type));
        if (error)
            return TError(error, "{}", ToString());
        L_DBG("Applied {}", atom.ToString());
    }

    contents = result;
    return OK;
}

TError TAction::Validate(const TUserDatabase &db) const {
    switch (Kind) {
    case AddUser:
        if (!IsUsernameValid(Username))
            return TError(EError::InvalidValue, "Invalid username: '{}'", Username);
        if (!db.IsUsernameValidAndFree(Username))
            return TError(EError::AlreadyExists, "Username {} is taken", Username);
        // fall through
    case AddGroup:
        if (!IsGroupnameValid(Groupname))
            return TError(EError::InvalidValue, "Invalid group name: '{}'", Groupname);
        if (!db.IsGroupnameValidAndFree(Groupname))
            return TError(EError::AlreadyExists, "Group name {} is taken", Groupname);
        if (!db.IsGidValidAndFree(Gid))
            return TError(EError::AlreadyExists, "Gid {} is taken", Gid);
        break;
    case DeleteGroup:
    {
        auto group = db.GetGroupById(Gid);
        if (!group || group->Name != Groupname)
            return TError(EError::NotFound, "Group {} with gid {} not found", Groupname, Gid);
        for (auto user: db.GetAllUsers())
            if (user->Gid == Gid)
                return TError(EError::InvalidValue, "Group {} is the primary group of user {}",
                              Groupname, user->Username);
        break;
    }
    }

    return OK;
}

std::string TAction::ToString() const {
    switch (Kind) {
    case AddUser:
        return fmt::format("add user {} with group {}", Username, Groupname);
    case AddGroup:
        return fmt::format("add group {}", Groupname);
    case DeleteGroup:
        break;
    }
    return fmt::format("delete group {}", Groupname);
}
