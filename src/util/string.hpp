#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"

typedef std::vector<std::string> TTuple;

TError StringToUint64(const std::string &string, uint64_t &value);
TError StringToUint32(const std::string &string, uint32_t &value);

TTuple SplitString(const std::string &str, const char sep, int max = 0);
std::string MergeString(const TTuple &tuple, const char sep);

/* Table lines: no empty tail after the final newline, empty text has none */
TTuple SplitLines(const std::string &text);

std::string StringTrim(const std::string& s, const std::string &what = " \t\n");
bool StringOnlyDigits(const std::string &s);
bool StringStartsWith(const std::string &str, const std::string &prefix);
bool StringEndsWith(const std::string &str, const std::string &suffix);
