#pragma once

#include <string>

extern "C" {
#include <sys/types.h>
#include <time.h>
}

pid_t GetPid();
pid_t GetTid();
std::string GetTaskName(pid_t pid = 0);

std::string FormatTime(time_t t, const char *fmt = "%F %T");
