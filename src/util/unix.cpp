#include "util/unix.hpp"
#include "util/path.hpp"

extern "C" {
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <sys/syscall.h>
#include <sys/prctl.h>
}

static std::string *processName;

pid_t GetPid() {
    return syscall(SYS_getpid);
}

pid_t GetTid() {
    return syscall(SYS_gettid);
}

std::string GetTaskName(pid_t pid) {
    if (pid) {
        std::string name;
        if (TPath("/proc/" + std::to_string(pid) + "/comm").ReadAll(name, 32))
            return "???";
        return name.substr(0, name.length() - 1);
    }

    if (!processName) {
        char name[17];

        memset(name, 0, sizeof(name));

        /* prctl returns 16 bytes string */

        if (prctl(PR_GET_NAME, (void *)name) < 0)
            strncpy(name, program_invocation_short_name, sizeof(name) - 1);

        processName = new std::string(name);
    }

    return *processName;
}

std::string FormatTime(time_t t, const char *fmt) {
    struct tm tm;
    char buf[256];

    localtime_r(&t, &tm);
    if (!strftime(buf, sizeof(buf), fmt, &tm))
        return "";

    return buf;
}
