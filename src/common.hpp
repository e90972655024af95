#pragma once

#include "util/error.hpp"

#define __STDC_LIMIT_MACROS
#include <cstdint>
#undef __STDC_LIMIT_MACROS

class TNonCopyable {
protected:
    TNonCopyable() = default;
    ~TNonCopyable() = default;
private:
    TNonCopyable(TNonCopyable const&) = delete;
    TNonCopyable& operator= (TNonCopyable const&) = delete;
    TNonCopyable(TNonCopyable const&&) = delete;
    TNonCopyable& operator= (TNonCopyable const&&) = delete;
};

constexpr const char *PWDB_CONFIG = "/etc/pwdb.conf";
constexpr const char *PWDB_CONFIG_DIR = "/etc/pwdb.conf.d";

constexpr const char *DEFAULT_PASSWD_PATH = "/etc/passwd";
constexpr const char *DEFAULT_SHADOW_PATH = "/etc/shadow";
constexpr const char *DEFAULT_GROUP_PATH = "/etc/group";

constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 16 << 20;

constexpr const char *LOCK_SUFFIX = ".lock";

constexpr size_t NAME_LENGTH_MAX = 32;
