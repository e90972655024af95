#include <cstdlib>
#include <sstream>

#include "test.hpp"

namespace test {

std::basic_ostream<char> &Say(std::basic_ostream<char> &stream) {
    return stream << "- ";
}

void ExpectReturn(int ret, int exp, int line, const char *func) {
    if (ret == exp)
        return;
    throw std::string("Got " + std::to_string(ret) + ", but expected " + std::to_string(exp) + " at " + func + ":" + std::to_string(line));
}

void ExpectError(const TError &ret, EError exp, int line, const char *func) {
    std::stringstream ss;

    if (ret == exp)
        return;

    ss << "Got " << ret << ", but expected " << TError::ErrorName(exp) << " at " << func << ":" << line;

    throw ss.str();
}

std::string ReadFile(const TPath &path) {
    std::string text;

    TError error = path.ReadAll(text);
    if (error)
        throw error.ToString();

    return text;
}

void WriteFile(const TPath &path, const std::string &text) {
    TFile file;

    TError error = file.CreateTrunc(path, 0644);
    if (!error)
        error = file.WriteAll(text);
    if (error)
        throw error.ToString();
}

TFixture::TFixture(const std::string &passwd,
                   const std::string &shadow,
                   const std::string &group) {
    TPath tmp = getenv("TMPDIR") ? getenv("TMPDIR") : "/tmp";

    TError error = Dir.MkdirTmp(tmp, "pwtest-", 0700);
    if (error)
        throw error.ToString();

    Passwd = Dir / "passwd";
    Shadow = Dir / "shadow";
    Group = Dir / "group";

    WriteFile(Passwd, passwd);
    WriteFile(Shadow, shadow);
    WriteFile(Group, group);
}

TFixture::~TFixture() {
    TError error = Dir.RemoveAll();
    if (error)
        Say(std::cerr) << "Cannot remove " << Dir << ": " << error << std::endl;
}

std::string TFixture::Read(const TPath &path) const {
    return ReadFile(path);
}

void TFixture::Write(const TPath &path, const std::string &text) const {
    WriteFile(path, text);
}

template<typename T>
static inline void ExpectEqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret != exp) {
        std::stringstream ss;
        ss << "Unexpected '" << ret << "' != '" << exp << "' at " << func << ":" << line;
        throw ss.str();
    }
}

template<typename T>
static inline void ExpectNeqTemplate(T ret, T exp, size_t line, const char *func) {
    if (ret == exp) {
        std::stringstream ss;
        ss << "Unexpected '" << ret << "' == '" << exp << "' at " << func << ":" << line;
        throw ss.str();
    }
}

void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectEqTemplate(ret, exp, line, func);
}

void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func) {
    ExpectNeqTemplate(ret, exp, line, func);
}

}
