#pragma once

#include <string>
#include <vector>

#include "user.hpp"
#include "group.hpp"

class TUserDatabase;

enum class EAtomType {
    AddPasswdLine,
    AddShadowLine,
    AddGroupLine,
    DeletePasswdLine,
    DeleteShadowLine,
    DeleteGroupLine,
};

std::string AtomTypeName(EAtomType type);

/* In-memory text of all three tables */
struct TFileContents {
    std::string Passwd;
    std::string Shadow;
    std::string Group;

    std::string &Get(EAtomType type);
};

/* Strips the final newlines, ready for TLockedFile::ReplaceContents() */
std::string TableText(const std::string &content);

/* Single line transform of one table */
class TAtom {
public:
    EAtomType Type;
    std::string Line;

    TAtom(EAtomType type, const std::string &line) : Type(type), Line(line) {}

    static TAtom AddPasswdLine(const TUser &user);
    static TAtom AddShadowLine(const TShadow &shadow);
    static TAtom AddGroupLine(const TGroup &group);
    static TAtom DeletePasswdLine(const TUser &user);
    static TAtom DeleteShadowLine(const TShadow &shadow);
    static TAtom DeleteGroupLine(const TGroup &group);

    bool IsDelete() const;

    /*
     * Add appends the line, delete removes exactly one matching line.
     * Content stays untouched on failure.
     */
    TError Execute(std::string &content) const;

    std::string ToString() const;
};

/* Atoms of one logical change applied together */
class TAction {
public:
    enum EKind {
        AddUser,
        AddGroup,
        DeleteGroup,
    };

    EKind Kind;
    std::vector<TAtom> Atoms;

    std::string Username;
    std::string Groupname;
    uint32_t Gid = 0;

    static TError AddUserAction(const TUser &user, const TGroup &group, TAction &action);
    static TAction AddGroupAction(const TGroup &group);
    static TAction DeleteGroupAction(const TGroup &group);

    /* Either every atom succeeds or contents are left as they were */
    TError Execute(TFileContents &contents) const;

    /* Checks the change against the live database before applying it */
    TError Validate(const TUserDatabase &db) const;

    std::string ToString() const;
};
