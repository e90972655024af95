#include "files.hpp"
#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"
#include "util/unix.hpp"

constexpr const char *TRIM_CHARS = " \t\n\r\v\f";

static uint64_t MaxFileSize() {
    return config().files().max_file_size();
}

/* Claim file holding our pid, gone once the link attempt is over */
class TTempLockFile : public TNonCopyable {
public:
    TPath Path;

    TTempLockFile(const TPath &path) : Path(path) {}

    ~TTempLockFile() {
        L_LCK("Remove temporary lock {}", Path);
        TError error = Path.Unlink();
        if (error && error.Errno != ENOENT)
            L_ERR("Cannot remove temporary lock {}: {}", Path, error);
    }
};

TError TChangeTrackingPath::Open() {
    std::unique_ptr<TLockedFile> locked;
    std::string content;
    TError error;

    L_DBG("Track changes of {}", Path);

    error = TFiles::LockTable(*this, locked);
    if (error)
        return error;

    error = locked->ReadAll(content);
    if (error)
        return error;

    Update(content);
    return OK;
}

bool TChangeTrackingPath::IsDirty(const std::string &content) const {
    return StringTrim(content, TRIM_CHARS) != Snapshot;
}

void TChangeTrackingPath::Update(const std::string &content) {
    Snapshot = StringTrim(content, TRIM_CHARS);
}

TLockedFile::~TLockedFile() {
    File.Close();
    L_LCK("Unlock {}", LockPath);
    TError error = LockPath.Unlink();
    if (error)
        FatalError(fmt::format("Cannot remove lock {}", LockPath), error);
}

TError TLockedFile::ReadAll(std::string &text) const {
    TError error = File.Seek(0);
    if (!error)
        error = File.ReadAll(text, MaxFileSize());
    if (error)
        return TError(error, "Cannot read {}", Tracked.Path);
    return OK;
}

TError TLockedFile::ReplaceContents(const std::string &content) {
    TError error;

    error = File.Truncate(0);
    if (!error)
        error = File.Seek(0);
    /* a table without records stays empty, a lone newline is a blank record */
    if (!error && !content.empty())
        error = File.WriteAll(content + "\n");
    if (!error)
        error = File.Sync();
    if (error)
        return TError(error, "Cannot rewrite {}", Tracked.Path);

    Tracked.Update(content);
    return OK;
}

TError TLockedFile::Append(const std::string &line) {
    std::string text, last;
    struct stat st;
    TError error;

    error = File.Stat(st);
    if (error)
        return TError(error, "Cannot append to {}", Tracked.Path);

    if (st.st_size > 0) {
        error = File.ReadAt(last, 1, st.st_size - 1);
        if (error)
            return TError(error, "Cannot append to {}", Tracked.Path);
        if (last != "\n")
            text = "\n";
    }

    text += line + "\n";

    error = File.Seek(0, SEEK_END);
    if (!error)
        error = File.WriteAll(text);
    if (!error)
        error = File.Sync();
    if (error)
        return TError(error, "Cannot append to {}", Tracked.Path);

    error = ReadAll(text);
    if (error)
        return error;

    Tracked.Update(text);
    return OK;
}

TError TFiles::Open(const TPath &passwd, const TPath &shadow, const TPath &group) {
    std::unique_ptr<TChangeTrackingPath> p(new TChangeTrackingPath(passwd));
    std::unique_ptr<TChangeTrackingPath> s(new TChangeTrackingPath(shadow));
    std::unique_ptr<TChangeTrackingPath> g(new TChangeTrackingPath(group));
    TError error;

    for (auto tracked: { p.get(), s.get(), g.get() }) {
        error = tracked->Open();
        if (error)
            return error;
    }

    Passwd = std::move(p);
    Shadow = std::move(s);
    Group = std::move(g);

    return OK;
}

TError TFiles::Default() {
    auto &files = config().files();
    return Open(files.passwd(), files.shadow(), files.group());
}

TError TFiles::Lock(TChangeTrackingPath *tracked, std::unique_ptr<TLockedFile> &locked) {
    std::string content;
    TError error;

    if (!tracked)
        return TError(EError::FilesRequired, "Database has no backing files");

    error = LockTable(*tracked, locked);
    if (error)
        return error;

    error = locked->ReadAll(content);
    if (error) {
        locked.reset();
        return TError(error, "Cannot prove {} is unchanged", tracked->Path);
    }

    if (tracked->IsDirty(content)) {
        Statistics.DirtyFiles++;
        locked.reset();
        return TError(EError::Dirty, "{} has been modified by another process, abort to avoid corruption",
                      tracked->Path);
    }

    error = locked->File.Seek(0);
    if (error)
        locked.reset();

    return error;
}

TError TFiles::LockPasswd(std::unique_ptr<TLockedFile> &locked) {
    return Lock(Passwd.get(), locked);
}

TError TFiles::LockShadow(std::unique_ptr<TLockedFile> &locked) {
    return Lock(Shadow.get(), locked);
}

TError TFiles::LockGroup(std::unique_ptr<TLockedFile> &locked) {
    return Lock(Group.get(), locked);
}

TError TFiles::LockAll(std::unique_ptr<TLockedFile> &passwd,
                       std::unique_ptr<TLockedFile> &shadow,
                       std::unique_ptr<TLockedFile> &group) {
    TError error;

    if (IsVirtual())
        return TError(EError::FilesRequired, "Database has no backing files");

    error = LockPasswd(passwd);
    if (!error)
        error = LockShadow(shadow);
    if (!error)
        error = LockGroup(group);

    if (error) {
        group.reset();
        shadow.reset();
        passwd.reset();
    }

    return error;
}

TError TFiles::LockTable(TChangeTrackingPath &tracked, std::unique_ptr<TLockedFile> &locked) {
    TPath path = tracked.Path;
    TPath lock = path + LOCK_SUFFIX;
    pid_t pid = GetPid();
    TError error;

    L_LCK("Lock {}", path);

    {
        TTempLockFile temp(fmt::format("{}.{}", path, pid));
        TFile file;

        error = file.CreateTrunc(temp.Path, 0600);
        if (!error)
            error = file.WriteAll(std::to_string(pid));
        if (error) {
            Statistics.LockFailures++;
            return TError(error, "Cannot write pid into {}", temp.Path);
        }
        file.Close();

        error = lock.Hardlink(temp.Path);
    }

    if (error) {
        Statistics.LockFailures++;

        if (error.Errno != EEXIST)
            return TError(error, "Cannot lock {}", path);

        std::string content;
        error = lock.ReadAll(content, 64);
        if (error)
            return TError(EError::Locked, "{} is locked, cannot read lock owner: {}", path, error);

        content = StringTrim(content, std::string(TRIM_CHARS) + std::string(1, '\0'));

        uint64_t owner;
        if (StringToUint64(content, owner) || owner > INT32_MAX) {
            L_ERR("Lock file {} holds invalid pid '{}'", lock, content);
            return TError(EError::Locked, "{} is locked, lock file holds invalid pid '{}'", path, content);
        }

        /* TODO reclaim lock after checking that owner is gone */
        L_WRN("{} is locked by pid {}", path, owner);
        return TError(EError::NotImplemented, "{} is locked by pid {}, stale lock validation is not implemented",
                      path, owner);
    }

    locked.reset(new TLockedFile(tracked, lock));

    error = locked->File.OpenReadWrite(path);
    if (error) {
        locked.reset();
        Statistics.LockFailures++;
        return TError(error, "Cannot open locked {}", path);
    }

    Statistics.LocksTaken++;
    L_LCK("Locked {}", path);
    return OK;
}
