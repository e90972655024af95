#include "util/path.hpp"
#include "util/string.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <string.h>
#include <stdlib.h>
}

TPath TPath::NormalPath() const {
    std::vector<std::string> parts;
    bool absolute = IsAbsolute();
    std::string result;

    if (Path.empty())
        return TPath();

    for (auto &part: SplitString(Path, '/')) {
        if (part.empty() || part == ".")
            continue;
        if (part == ".." && !parts.empty() && parts.back() != "..") {
            parts.pop_back();
            continue;
        }
        if (part == ".." && absolute)
            continue;
        parts.push_back(part);
    }

    result = MergeString(parts, '/');
    if (absolute)
        return TPath("/" + result);
    if (result.empty())
        return TPath(".");
    return TPath(result);
}

bool TPath::IsDirectoryStrict() const {
    struct stat st;
    return !lstat(c_str(), &st) && S_ISDIR(st.st_mode);
}

bool TPath::Exists() const {
    return access(Path.c_str(), F_OK) == 0;
}

bool TPath::PathExists() const {
    struct stat st;
    return lstat(Path.c_str(), &st) == 0;
}

std::string TPath::ToString() const {
    return Path;
}

TPath TPath::AddComponent(const TPath &component) const {
    if (component.IsAbsolute()) {
        if (IsRoot())
            return TPath(component.Path);
        if (component.IsRoot())
            return TPath(Path);
        return TPath(Path + component.Path);
    }
    if (IsRoot())
        return TPath("/" + component.Path);
    if (component.IsEmpty())
        return TPath(Path);
    return TPath(Path + "/" + component.Path);
}

TError TPath::Chmod(const int mode) const {
    if (chmod(Path.c_str(), mode))
        return TError::System("chmod({}, {:#o})", Path, mode);
    return OK;
}

/* Creates this path as a new name for target */
TError TPath::Hardlink(const TPath &target) const {
    if (link(target.c_str(), Path.c_str()))
        return TError::System("link(" + target.ToString() + ", " + Path + ")");
    return OK;
}

TError TPath::Unlink() const {
    if (unlink(c_str()))
        return TError::System("unlink(" + Path + ")");
    return OK;
}

TError TPath::Mkdir(unsigned int mode) const {
    if (mkdir(Path.c_str(), mode) < 0)
        return TError::System("mkdir({}, {:#o})", Path, mode);
    return OK;
}

TError TPath::MkdirTmp(const TPath &parent, const std::string &prefix, unsigned int mode) {
    Path = (parent / (prefix + "XXXXXX")).Path;
    if (!mkdtemp(&Path[0]))
        return TError::System("mkdtemp(" + Path + ")");
    if (mode != 0700)
        return Chmod(mode);
    return OK;
}

TError TPath::Rmdir() const {
    if (rmdir(Path.c_str()) < 0)
        return TError::System("rmdir(" + Path + ")");
    return OK;
}

/*
 * Removes everything in the directory but not directory itself.
 * Stays on one filesystem and never follows symlinks.
 */
TError TPath::ClearDirectory() const {
    TPathWalk walk;
    TError error;

    error = walk.Open(*this);
    while (!error) {
        error = walk.Next();
        if (error || !walk.Path)
            break;
        if (walk.Directory) {
            if (!walk.Postorder || walk.Path == *this)
                continue;
            error = walk.Path.Rmdir();
        } else
            error = walk.Path.Unlink();
    }

    return error;
}

TError TPath::RemoveAll() const {
    if (IsDirectoryStrict()) {
        TError error = ClearDirectory();
        if (error)
            return error;
        return Rmdir();
    }
    return Unlink();
}

TError TPath::ReadDirectory(std::vector<std::string> &result) const {
    struct dirent *de;
    DIR *dir;

    result.clear();
    dir = opendir(c_str());
    if (!dir)
        return TError::System("Cannot open directory " + Path);

    while ((de = readdir(dir))) {
        if (strcmp(de->d_name, ".") && strcmp(de->d_name, ".."))
            result.push_back(std::string(de->d_name));
    }
    closedir(dir);
    return OK;
}

TError TPath::ReadAll(std::string &text, size_t max) const {
    TError error;
    TFile file;

    error = file.OpenRead(*this);
    if (error)
        return error;

    error = file.ReadAll(text, max);
    if (error)
        return TError(error, "Cannot read {}", Path);

    return OK;
}

TError TFile::Open(const TPath &path, int flags) {
    if (Fd >= 0)
        close(Fd);
    SetFd = open(path.c_str(), flags);
    if (Fd < 0)
        return TError::System("Cannot open " + path.ToString());
    return OK;
}

TError TFile::OpenRead(const TPath &path) {
    return Open(path, O_RDONLY | O_CLOEXEC | O_NOCTTY);
}

TError TFile::OpenReadWrite(const TPath &path) {
    return Open(path, O_RDWR | O_CLOEXEC | O_NOCTTY);
}

TError TFile::Create(const TPath &path, int flags, int mode) {
    if (Fd >= 0)
        close(Fd);
    SetFd = open(path.c_str(), flags, mode);
    if (Fd < 0)
        return TError::System("Cannot create " + path.ToString());
    return OK;
}

TError TFile::CreateTrunc(const TPath &path, int mode) {
    return Create(path, O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
}

void TFile::Close(void) {
    if (Fd >= 0)
        close(Fd);
    SetFd = -1;
}

/* Reads from the current offset up to the end */
TError TFile::ReadAll(std::string &text, size_t max) const {
    struct stat st;
    if (fstat(Fd, &st) < 0)
        return TError::System("fstat");

    if (st.st_size > (off_t)max)
        return TError("File too large: {}", st.st_size);

    size_t size = st.st_size;
    if (st.st_size < 4096)
        size = 4096;
    text.resize(size);

    size_t off = 0;
    ssize_t ret;
    do {
        if (size - off < 1024) {
            size += 16384;
            if (size > max)
                return TError("File too large: {}", size);
            text.resize(size);
        }
        ret = read(Fd, &text[off], size - off);
        if (ret < 0)
            return TError::System("read");
        off += ret;
    } while (ret > 0);

    text.resize(off);

    return OK;
}

TError TFile::ReadAt(std::string &text, size_t size, off_t offset) const {
    text.resize(size);
    ssize_t ret = pread(Fd, &text[0], size, offset);
    if (ret < 0)
        return TError::System("pread");
    text.resize(ret);
    return OK;
}

TError TFile::Seek(off_t offset, int whence) const {
    if (lseek(Fd, offset, whence) < 0)
        return TError::System("lseek");
    return OK;
}

TError TFile::Sync() const {
    if (fsync(Fd))
        return TError::System("fsync");
    return OK;
}

TError TFile::Truncate(off_t size) const {
    if (ftruncate(Fd, size))
        return TError::System("ftruncate");
    return OK;
}

TError TFile::WriteAll(const std::string &text) const {
    size_t len = text.length(), off = 0;
    while (off < len) {
        ssize_t ret = write(Fd, &text[off], len - off);
        if (ret < 0)
            return TError::System("write");
        off += ret;
    }

    return OK;
}

TError TFile::Stat(struct stat &st) const {
    if (fstat(Fd, &st))
        return TError::System("Cannot fstat: {}", Fd);
    return OK;
}

TError TPathWalk::Open(const TPath &path, int fts_flags) {
    Close();
    char* paths[] = { (char *)path.c_str(), nullptr };
    Fts = fts_open(paths, fts_flags, nullptr);
    if (!Fts)
        return TError::System("fts_open");
    return OK;
}

TError TPathWalk::Next() {
next:
    errno = 0;
    Ent = fts_read(Fts);
    if (!Ent) {
        if (errno)
            return TError(EError::Unknown, errno, "fts_read");
        Path = "";
        return OK;
    }
    switch (Ent->fts_info) {
    case FTS_DNR:
        if (Ent->fts_errno == ENOTDIR)
            goto next;
        // fall through
    case FTS_ERR:
    case FTS_NS:
        if (Ent->fts_errno == ENOENT)
            goto next;
        return TError(EError::Unknown, Ent->fts_errno, "fts_read {}", Ent->fts_path);
    case FTS_D:
    case FTS_DC:
        Directory = true;
        Postorder = false;
        break;
    case FTS_DP:
        Directory = true;
        Postorder = true;
        break;
    default:
        Directory = false;
        Postorder = false;
        break;
    }
    Path = Ent->fts_path;
    return OK;
}

void TPathWalk::Close() {
    if (Fts)
        fts_close(Fts);
    Fts = nullptr;
}
