#include "util/log.hpp"
#include "util/unix.hpp"

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <execinfo.h>
#include <cxxabi.h>
#include <time.h>
}

bool Verbose = false;
bool Debug = false;

TStatistics Statistics;

TFile LogFile;

void OpenLog() {
    CloseLog();
    LogFile.SetFd = fcntl(STDERR_FILENO, F_DUPFD_CLOEXEC, 3);
}

void OpenLog(const TPath &path) {
    CloseLog();
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_NOCTTY | O_CLOEXEC, 0644);
    if (fd < 0) {
        OpenLog();
        L_WRN("Cannot open log {}: {}", path, TError::System("open"));
        return;
    }
    LogFile.SetFd = fcntl(fd, F_DUPFD_CLOEXEC, 3);
    if (LogFile.Fd != fd)
        close(fd);
}

void CloseLog() {
    LogFile.Close();
}

void WriteLog(const char *prefix, const std::string &log_msg) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    std::string currentTimeMs = fmt::format("{}.{:03}", FormatTime(ts.tv_sec), ts.tv_nsec / 1000000);

    std::string msg = fmt::format("{} {}[{}]: {} {}\n",
            currentTimeMs, GetTaskName(), GetTid(), prefix, log_msg);

    Statistics.LogLines++;

    if (!LogFile)
        return;

    TError error = LogFile.WriteAll(msg);
    if (error)
        Statistics.LogLinesLost++;
}

void pwdb_assert(const char *msg, const char *file, size_t line) {
    L_ERR("Assertion failed: {} at {}:{}", msg, file, line);
    Stacktrace();
    abort();
}

void FatalError(const std::string &text, const TError &error) {
    L_ERR("{}: {}", text, error);
    Stacktrace();
    _exit(EXIT_FAILURE);
}

// https://panthema.net/2008/0901-stacktrace-demangled/
// stacktrace.h (c) 2008, Timo Bingmann from http://idlebox.net/
// published under the WTFPL v2.0

void Stacktrace() {
    L_STK("Stacktrace:");

    void* addrlist[64];

    int addrlen = backtrace(addrlist, sizeof(addrlist) / sizeof(void*));

    if (addrlen == 0) {
        L_STK("  <empty, possibly corrupt>");
        return;
    }

    char** symbollist = backtrace_symbols(addrlist, addrlen);

    size_t funcnamesize = 256;
    char* funcname = (char*)malloc(funcnamesize);

    // skip the first frame, it is this function
    for (int i = 1; i < addrlen; i++) {
        char *begin_name = 0, *begin_offset = 0, *end_offset = 0;
        char *begin_addr = 0;

        // ./module(function+0x15c) [0x8048a6d]
        for (char *p = symbollist[i]; *p; ++p) {
            if (*p == '(')
                begin_name = p;
            else if (*p == '+')
                begin_offset = p;
            else if (*p == ')' && begin_offset)
                end_offset = p;
            else if (*p == '[') {
                begin_addr = p;
                break;
            }
        }

        if (begin_name && begin_offset && end_offset && begin_name < begin_offset) {
            *begin_name++ = '\0';
            *begin_offset++ = '\0';
            *end_offset = '\0';

            int status;
            char* ret = abi::__cxa_demangle(begin_name, funcname, &funcnamesize, &status);
            if (status == 0) {
                funcname = ret;
                L_STK("{}: {} {}", symbollist[i], funcname, begin_addr ? begin_addr : "");
            } else {
                L_STK("{}: {}()+{} {}", symbollist[i], begin_name, begin_offset, begin_addr ? begin_addr : "");
            }
        } else {
            L_STK("{}", symbollist[i]);
        }
    }

    free(funcname);
    free(symbollist);
}
