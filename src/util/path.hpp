#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

extern "C" {
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fts.h>
}

class TPath {
private:
    std::string Path;
    friend class TFile;

    TPath AddComponent(const TPath &component) const;

public:
    TPath(const std::string &path) : Path(path) {}
    TPath(const char *path) : Path(path) {}
    TPath() : Path("") {}

    bool IsAbsolute() const { return !Path.empty() && Path[0] == '/'; }

    bool IsRoot() const { return Path == "/"; }

    bool IsEmpty() const { return Path.empty(); }

    explicit operator bool() const { return !Path.empty(); }

    const char *c_str() const noexcept { return Path.c_str(); }

    TPath operator+(const TPath &p) const {
        return TPath(Path + p.ToString());
    }

    friend bool operator==(const TPath& a, const TPath& b) {
        return a.ToString() == b.ToString();
    }

    friend bool operator!=(const TPath& a, const TPath& b) {
        return a.ToString() != b.ToString();
    }

    friend bool operator<(const TPath& a, const TPath& b) {
        return a.ToString() < b.ToString();
    }

    friend std::ostream& operator<<(std::ostream& os, const TPath& path) {
        return os << path.ToString();
    }

    friend TPath operator/(const TPath& a, const TPath &b) {
        return a.AddComponent(b);
    }

    TPath NormalPath() const;


    std::string ToString() const;
    bool Exists() const;
    bool PathExists() const; /* or dangling symlink */


    bool IsDirectoryStrict() const;

    TError Chmod(const int mode) const;
    TError Hardlink(const TPath &target) const;
    TError Mkdir(unsigned int mode) const;
    TError MkdirTmp(const TPath &parent, const std::string &prefix, unsigned int mode);
    TError Rmdir() const;
    TError Unlink() const;
    TError RemoveAll() const;
    TError ReadDirectory(std::vector<std::string> &result) const;
    TError ClearDirectory() const;

    TError ReadAll(std::string &text, size_t max = 1048576) const;
};

namespace fmt {
template <> struct formatter<TPath> : ostream_formatter {};
}

class TFile {
private:
    TFile(const TFile&) = delete;
    TFile& operator=(const TFile&) = delete;

public:
    union {
        const int Fd;
        int SetFd;
    };
    TFile() : Fd(-1) { }
    TFile(int fd) : Fd(fd) { }
    ~TFile() { Close(); }
    explicit operator bool() const { return Fd >= 0; }
    TError Open(const TPath &path, int flags);
    TError OpenRead(const TPath &path);
    TError OpenReadWrite(const TPath &path);
    TError Create(const TPath &path, int flags, int mode);
    TError CreateTrunc(const TPath &path, int mode);
    void Close(void);
    TError ReadAll(std::string &text, size_t max) const;
    TError ReadAt(std::string &text, size_t size, off_t offset) const;
    TError Seek(off_t offset, int whence = SEEK_SET) const;
    TError Sync() const;
    TError Truncate(off_t size) const;
    TError WriteAll(const std::string &text) const;
    TError Stat(struct stat &st) const;
};

class TPathWalk {
private:
    TPathWalk(const TPathWalk&) = delete;
    TPathWalk& operator=(const TPathWalk&) = delete;

public:
    FTS *Fts = nullptr;
    FTSENT *Ent = nullptr;
    TPath Path;
    bool Directory = false;
    bool Postorder = false;

    TPathWalk() {}
    ~TPathWalk() { Close(); }
    TError Open(const TPath &path, int fts_flags = FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV | FTS_NOSTAT);
    TError Next();
    void Close();
};
