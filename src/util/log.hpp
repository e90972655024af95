#pragma once

#include <atomic>
#include <string>
#include "util/path.hpp"
#include "fmt/format.h"

extern bool Verbose;
extern bool Debug;
extern TFile LogFile;

void OpenLog();
void OpenLog(const TPath &path);
void CloseLog();
void WriteLog(const char *prefix, const std::string &log_msg);
void Stacktrace();

struct TStatistics {
    std::atomic<uint64_t> Errors;
    std::atomic<uint64_t> Warns;
    std::atomic<uint64_t> LogLines;
    std::atomic<uint64_t> LogLinesLost;
    std::atomic<uint64_t> LocksTaken;
    std::atomic<uint64_t> LockFailures;
    std::atomic<uint64_t> DirtyFiles;
    std::atomic<uint64_t> UsersCreated;
    std::atomic<uint64_t> UsersDeleted;
    std::atomic<uint64_t> GroupsCreated;
    std::atomic<uint64_t> GroupsDeleted;
};

extern TStatistics Statistics;

template <typename... Args> inline void L_DBG(const char* fmt, const Args&... args) {
    if (Debug)
        WriteLog("DBG", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_VERBOSE(const char* fmt, const Args&... args) {
    if (Verbose)
        WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L(const char* fmt, const Args&... args) {
    WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_WRN(const char* fmt, const Args&... args) {
    Statistics.Warns++;
    WriteLog("WRN", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_ERR(const char* fmt, const Args&... args) {
    Statistics.Errors++;
    WriteLog("ERR", fmt::format(fmt, args...));
    if (Verbose)
        Stacktrace();
}

template <typename... Args> inline void L_ACT(const char* fmt, const Args&... args) {
    WriteLog("ACT", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_LCK(const char* fmt, const Args&... args) {
    if (Verbose)
        WriteLog("LCK", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_STK(const char* fmt, const Args&... args) {
    WriteLog("STK", fmt::format(fmt, args...));
}

void pwdb_assert(const char *msg, const char *file, size_t line);
void FatalError(const std::string &text, const TError &error);

#define PWDB_ASSERT(EXPR) do { if (!(EXPR)) pwdb_assert(#EXPR, __FILE__, __LINE__); } while (0)
