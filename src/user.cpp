#include "user.hpp"
#include "config.hpp"
#include "util/string.hpp"

constexpr size_t PASSWD_FIELDS = 7;

bool TPosition::Compare(const TPosition &other, int &result) const {
    if (Kind == At && other.Kind == At) {
        result = Line < other.Line ? -1 : Line > other.Line ? 1 : 0;
        return true;
    }
    if (Kind == NewToFile) {
        result = 1;
        return true;
    }
    if (Kind == At && other.Kind == NewToFile) {
        result = -1;
        return true;
    }
    return false;
}

std::string TPosition::ToString() const {
    switch (Kind) {
    case At:
        return fmt::format("line {}", Line);
    case NotInFile:
        return "not in file";
    case NewToFile:
        return "new";
    case NotAssignedYet:
        break;
    }
    return "unassigned";
}

TError TUser::Parse(const std::string &line) {
    TError error;

    auto fields = SplitString(line, ':');
    if (fields.size() != PASSWD_FIELDS)
        return TError(EError::Malformed, "Passwd line has {} fields instead of {}: '{}'",
                      fields.size(), PASSWD_FIELDS, line);

    if (!IsUsernameValid(fields[0]))
        return TError(EError::Malformed, "Invalid username: '{}'", fields[0]);

    error = StringToUint32(fields[2], Uid);
    if (error)
        return TError(EError::Malformed, "User {} has invalid uid: '{}'", fields[0], fields[2]);

    error = StringToUint32(fields[3], Gid);
    if (error)
        return TError(EError::Malformed, "User {} has invalid gid: '{}'", fields[0], fields[3]);

    error = Gecos.Parse(fields[4]);
    if (error)
        return TError(error, "User {}", fields[0]);

    Source = line;
    Position = TPosition();
    Username = fields[0];
    Password = TPassword();
    Password.Text = fields[1];
    HomeDir = fields[5];
    Shell = fields[6];
    Groups.clear();

    return OK;
}

std::string TUser::ToString() const {
    return fmt::format("{}:{}:{}:{}:{}:{}:{}", Username, Password.ToString(),
                       Uid, Gid, Gecos.ToString(), HomeDir, Shell);
}

TUser TUser::Default() {
    auto &cfg = config().new_user();
    TUser user;

    user.Position = TPosition(TPosition::NewToFile);
    user.Username = "defaultusername";
    user.Uid = cfg.uid();
    user.Gid = cfg.gid();
    user.HomeDir = cfg.home();
    user.Shell = cfg.shell();

    TShadow &shadow = user.Password.ShadowEntry.Value;
    shadow.Username = user.Username;
    shadow.Password = cfg.password();
    shadow.LastChange = TShadowDays(cfg.last_change());
    shadow.EarliestChange = TShadowDays(cfg.earliest_change());
    shadow.LatestChange = TShadowDays(cfg.latest_change());
    shadow.WarnPeriod = TShadowDays(cfg.warn_period());

    user.Password.Kind = TPassword::Shadow;
    user.Password.ShadowEntry.Pos = POS_NEW;

    return user;
}

void TUser::SetUsername(const std::string &name) {
    Username = name;
    if (Password.Kind == TPassword::Shadow)
        Password.ShadowEntry->SetUsername(name);
}

const TShadow *TUser::GetShadow() const {
    if (Password.Kind != TPassword::Shadow)
        return nullptr;
    return &Password.ShadowEntry.Value;
}

TShadow *TUser::GetShadow() {
    if (Password.Kind != TPassword::Shadow)
        return nullptr;
    return &Password.ShadowEntry.Value;
}

std::string TUser::GetPassword() const {
    switch (Password.Kind) {
    case TPassword::Encrypted:
        return Password.Text;
    case TPassword::Shadow:
        return Password.ShadowEntry->Password;
    case TPassword::Disabled:
        break;
    }
    return "";
}
