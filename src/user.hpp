#pragma once

#include <string>
#include <vector>
#include <utility>

#include "fields.hpp"
#include "shadow.hpp"
#include "group.hpp"

/* Where a user record lives in the user table */
class TPosition {
public:
    enum EKind {
        At,             /* parsed from a known line */
        NotInFile,      /* no backing table at all */
        NewToFile,      /* will be appended */
        NotAssignedYet,
    };

    EKind Kind = NotAssignedYet;
    size_t Line = 0;

    TPosition() {}
    TPosition(EKind kind, size_t line = 0) : Kind(kind), Line(line) {}

    /*
     * Partial order: lines compare between two At positions, new records
     * sort after everything. Returns false when the pair is unordered.
     */
    bool Compare(const TPosition &other, int &result) const;

    std::string ToString() const;

    friend bool operator==(const TPosition &a, const TPosition &b) {
        return a.Kind == b.Kind && (a.Kind != At || a.Line == b.Line);
    }
};

/* A record tagged with its line index, ordered by that index only */
template <typename T>
struct TNumbered {
    size_t Pos = 0;
    T Value;

    TNumbered() {}
    TNumbered(size_t pos, const T &value) : Pos(pos), Value(value) {}

    T *operator->() { return &Value; }
    const T *operator->() const { return &Value; }
    T &operator*() { return Value; }
    const T &operator*() const { return Value; }

    friend bool operator<(const TNumbered &a, const TNumbered &b) {
        return a.Pos < b.Pos;
    }
};

constexpr size_t POS_NEW = SIZE_MAX;

class TPassword {
public:
    enum EKind {
        Encrypted,      /* stored in the user table */
        Shadow,         /* stored in the shadow table */
        Disabled,
    };

    EKind Kind = Encrypted;
    std::string Text;
    TNumbered<TShadow> ShadowEntry;

    /* field text of the user table */
    std::string ToString() const {
        return Kind == Encrypted ? Text : "x";
    }
};

typedef uint64_t TGroupSlot;

/* One line of the user table with links into the group arena */
class TUser {
public:
    std::string Source;
    TPosition Position;

    std::string Username;
    TPassword Password;
    uint32_t Uid = 0;
    uint32_t Gid = 0;
    TGecos Gecos;
    std::string HomeDir;
    std::string Shell;

    std::vector<std::pair<EMembershipKind, TGroupSlot>> Groups;

    TError Parse(const std::string &line);
    std::string ToString() const;

    /* Template for a new account, see new_user section of config */
    static TUser Default();

    void SetUsername(const std::string &name);

    const TShadow *GetShadow() const;
    TShadow *GetShadow();

    /* Encrypted password from whichever table holds it */
    std::string GetPassword() const;

    void AddGroup(EMembershipKind kind, TGroupSlot slot) {
        Groups.emplace_back(kind, slot);
    }

    /* uid order for listings */
    friend bool operator<(const TUser &a, const TUser &b) {
        return a.Uid < b.Uid;
    }
};
