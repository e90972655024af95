#include <csignal>

#include "cli.hpp"
#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"
#include "fmt/format.h"

using std::string;
using std::vector;

static std::string GroupList(const TUserDatabase &db, const TUser &user) {
    TTuple names;

    for (auto &edge: user.Groups) {
        auto group = db.GetGroup(edge.second);
        if (!group)
            continue;
        if (edge.first == EMembershipKind::Primary)
            names.push_back(group->Name + "*");
        else
            names.push_back(group->Name);
    }

    return MergeString(names, ',');
}

class TListCmd final : public ICmd {
public:
    TListCmd(TUserDatabase *db) : ICmd(db, "list", 0, "[-1]",
            "list users with their groups",
            "    -1        only names\n"
            "\n"
            "primary group is marked with '*'\n") {}

    int Execute(TCommandEnviroment *env) final override {
        bool details = true;
        env->GetOpts({
            { '1', false, [&](const char *) { details = false; } },
        });

        auto users = Db->GetAllUsers();

        if (!details) {
            for (auto user: users)
                fmt::print("{}\n", user->Username);
            return EXIT_SUCCESS;
        }

        vector<string> names;
        for (auto user: users)
            names.push_back(user->Username);
        size_t nameWidth = MaxFieldLength(names);

        fmt::print("{:<{}}{:>8} {:>8}  {:<24}{}\n", "USER", nameWidth, "UID", "GID", "HOME", "GROUPS");
        for (auto user: users)
            fmt::print("{:<{}}{:>8} {:>8}  {:<24}{}\n", user->Username, nameWidth,
                       user->Uid, user->Gid, user->HomeDir, GroupList(*Db, *user));

        return EXIT_SUCCESS;
    }
};

class TGroupsCmd final : public ICmd {
public:
    TGroupsCmd(TUserDatabase *db) : ICmd(db, "groups", 0, "", "list groups and members") {}

    int Execute(TCommandEnviroment *env) final override {
        auto groups = Db->GetAllGroups();

        vector<string> names;
        for (auto group: groups)
            names.push_back(group->Name);
        size_t nameWidth = MaxFieldLength(names);

        fmt::print("{:<{}}{:>8}  {}\n", "GROUP", nameWidth, "GID", "MEMBERS");
        for (auto group: groups)
            fmt::print("{:<{}}{:>8}  {}\n", group->Name, nameWidth, group->Gid,
                       MergeString(group->MemberNames(), ','));

        return EXIT_SUCCESS;
    }
};

class TShowCmd final : public ICmd {
public:
    TShowCmd(TUserDatabase *db) : ICmd(db, "show", 1, "<user>", "show user details") {}

    void PrintDays(const char *name, const TShadowDays &days, bool date) {
        if (!days.IsPresent())
            return;
        if (date)
            fmt::print("{:<20}{}\n", name, days.FormatDate());
        else
            fmt::print("{:<20}{}\n", name, days.Get());
    }

    int Execute(TCommandEnviroment *env) final override {
        const auto &name = env->GetArgs()[0];

        auto user = Db->GetUserByName(name);
        if (!user) {
            PrintError("Cannot show user", TError(EError::NotFound, "User {} not found", name));
            return EXIT_FAILURE;
        }

        fmt::print("{:<20}{}\n", "name", user->Username);
        fmt::print("{:<20}{}\n", "uid", user->Uid);
        fmt::print("{:<20}{}\n", "gid", user->Gid);

        if (user->Gecos.IsDetailed()) {
            fmt::print("{:<20}{}\n", "full name", user->Gecos.FullName());
            fmt::print("{:<20}{}\n", "room", user->Gecos.Room());
            fmt::print("{:<20}{}\n", "phone (work)", user->Gecos.PhoneWork());
            fmt::print("{:<20}{}\n", "phone (home)", user->Gecos.PhoneHome());
            for (auto &other: user->Gecos.Other())
                fmt::print("{:<20}{}\n", "other", other);
        } else if (!user->Gecos.Comment().empty()) {
            fmt::print("{:<20}{}\n", "comment", user->Gecos.Comment());
        }

        fmt::print("{:<20}{}\n", "home", user->HomeDir);
        fmt::print("{:<20}{}\n", "shell", user->Shell);
        fmt::print("{:<20}{}\n", "groups", GroupList(*Db, *user));
        fmt::print("{:<20}{}\n", "position", user->Position.ToString());

        auto shadow = user->GetShadow();
        if (shadow) {
            PrintDays("last change", shadow->LastChange, true);
            PrintDays("min days", shadow->EarliestChange, false);
            PrintDays("max days", shadow->LatestChange, false);
            PrintDays("warn days", shadow->WarnPeriod, false);
            PrintDays("inactive days", shadow->Deactivated, false);
            PrintDays("expires", shadow->DeactivatedSince, true);
        } else {
            fmt::print("{:<20}{}\n", "shadow", "none");
        }

        return EXIT_SUCCESS;
    }
};

class TUserAddCmd final : public ICmd {
public:
    TUserAddCmd(TUserDatabase *db) : ICmd(db, "useradd", 1, "<user>",
            "create user with defaults from new_user config") {}

    int Execute(TCommandEnviroment *env) final override {
        TCreateUserArgs args;
        const TUser *user;

        args.Username = env->GetArgs()[0];

        TError error = Db->NewUser(args, user);
        if (error) {
            PrintError("Cannot create user", error);
            return EXIT_FAILURE;
        }

        fmt::print("{}\n", user->ToString());
        return EXIT_SUCCESS;
    }
};

class TUserDelCmd final : public ICmd {
public:
    TUserDelCmd(TUserDatabase *db) : ICmd(db, "userdel", 1, "[-r] <user>",
            "delete user, its shadow entry and memberships",
            "    -r        remove home directory\n") {}

    int Execute(TCommandEnviroment *env) final override {
        TDeleteUserArgs args;
        TNumbered<TUser> removed;

        const auto &names = env->GetOpts({
            { 'r', false, [&](const char *) { args.DeleteHome = EDeleteHome::Delete; } },
        });

        int ret = EXIT_SUCCESS;
        for (auto &name: names) {
            args.Username = name;
            TError error = Db->DeleteUser(args, removed);
            if (error) {
                PrintError("Cannot delete user", error);
                ret = EXIT_FAILURE;
            }
        }

        return ret;
    }
};

class TGroupAddCmd final : public ICmd {
public:
    TGroupAddCmd(TUserDatabase *db) : ICmd(db, "groupadd", 2, "<group> <gid>", "create group") {}

    int Execute(TCommandEnviroment *env) final override {
        const auto &args = env->GetArgs();
        const TGroup *group;
        uint32_t gid;

        TError error = StringToUint32(args[1], gid);
        if (!error)
            error = Db->NewGroup(args[0], gid, group);
        if (error) {
            PrintError("Cannot create group", error);
            return EXIT_FAILURE;
        }

        fmt::print("{}\n", group->ToString());
        return EXIT_SUCCESS;
    }
};

class TGroupDelCmd final : public ICmd {
public:
    TGroupDelCmd(TUserDatabase *db) : ICmd(db, "groupdel", 1, "<group>",
            "delete group which is nobody's primary group") {}

    int Execute(TCommandEnviroment *env) final override {
        const auto &name = env->GetArgs()[0];
        TError error;

        auto group = Db->GetGroupByName(name);
        if (!group)
            error = TError(EError::NotFound, "Group {} not found", name);
        else
            error = Db->DeleteGroup(group->Gid);
        if (error) {
            PrintError("Cannot delete group", error);
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
};

int main(int argc, char *argv[]) {
    TUserDatabase db;

    ReadConfigs(true);
    if (config().log().has_path())
        OpenLog(TPath(config().log().path()));
    else
        OpenLog();

    signal(SIGPIPE, SIG_IGN);

    TCommandHandler handler(db);
    handler.RegisterCommand<TListCmd>();
    handler.RegisterCommand<TGroupsCmd>();
    handler.RegisterCommand<TShowCmd>();
    handler.RegisterCommand<TUserAddCmd>();
    handler.RegisterCommand<TUserDelCmd>();
    handler.RegisterCommand<TGroupAddCmd>();
    handler.RegisterCommand<TGroupDelCmd>();

    int ret = handler.HandleCommand(argc, argv);
    if (ret < 0)
        return EXIT_FAILURE;
    return ret;
}
