#pragma once

#include <memory>
#include <string>

#include "common.hpp"
#include "util/path.hpp"

/*
 * Table path plus the last content this process has seen in it.
 * Whitespace around the content is ignored for comparison.
 */
class TChangeTrackingPath : public TNonCopyable {
public:
    TPath Path;
    std::string Snapshot;

    TChangeTrackingPath(const TPath &path) : Path(path) {}

    /* Takes the initial snapshot under the lock */
    TError Open();

    bool IsDirty(const std::string &content) const;
    void Update(const std::string &content);
};

/*
 * Exclusive lock on one table, see TFiles::LockPasswd() and friends.
 * The table is open read-write, destruction removes the lock file.
 */
class TLockedFile : public TNonCopyable {
    TChangeTrackingPath &Tracked;
    TPath LockPath;

public:
    TFile File;

    TLockedFile(TChangeTrackingPath &tracked, const TPath &lock) :
        Tracked(tracked), LockPath(lock) {}
    ~TLockedFile();

    const TPath &GetPath() const { return Tracked.Path; }
    const TPath &GetLockPath() const { return LockPath; }

    TError ReadAll(std::string &text) const;

    /* Rewrites the table with content and a final newline */
    TError ReplaceContents(const std::string &content);

    /* Adds one line, fixing up a missing newline at the end first */
    TError Append(const std::string &line);
};

/* The user, shadow and group tables of one database */
class TFiles {
    std::unique_ptr<TChangeTrackingPath> Passwd;
    std::unique_ptr<TChangeTrackingPath> Shadow;
    std::unique_ptr<TChangeTrackingPath> Group;

    TError Lock(TChangeTrackingPath *tracked, std::unique_ptr<TLockedFile> &locked);

public:
    TFiles() {}

    TError Open(const TPath &passwd, const TPath &shadow, const TPath &group);

    /* Tables listed in the files section of config */
    TError Default();

    bool IsVirtual() const {
        return !Passwd || !Shadow || !Group;
    }

    TPath PasswdPath() const { return Passwd ? Passwd->Path : TPath(); }
    TPath ShadowPath() const { return Shadow ? Shadow->Path : TPath(); }
    TPath GroupPath() const { return Group ? Group->Path : TPath(); }

    TError LockPasswd(std::unique_ptr<TLockedFile> &locked);
    TError LockShadow(std::unique_ptr<TLockedFile> &locked);
    TError LockGroup(std::unique_ptr<TLockedFile> &locked);

    /* Always in order passwd, shadow, group */
    TError LockAll(std::unique_ptr<TLockedFile> &passwd,
                   std::unique_ptr<TLockedFile> &shadow,
                   std::unique_ptr<TLockedFile> &group);

    /*
     * Passwd style locking: pid goes into <path>.<pid> which is then
     * hardlinked to <path>.lock. Link exists only for one owner.
     */
    static TError LockTable(TChangeTrackingPath &tracked,
                            std::unique_ptr<TLockedFile> &locked);
};
