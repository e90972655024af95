#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "util/path.hpp"

namespace test {
    std::basic_ostream<char> &Say(std::basic_ostream<char> &stream = std::cout);
    void ExpectReturn(int ret, int exp, int line, const char *func);
    void ExpectError(const TError &ret, EError exp, int line, const char *func);

    /* Scratch directory with passwd, shadow and group tables */
    class TFixture {
    public:
        TPath Dir;
        TPath Passwd, Shadow, Group;

        TFixture(const std::string &passwd,
                 const std::string &shadow,
                 const std::string &group);
        ~TFixture();

        std::string Read(const TPath &path) const;
        void Write(const TPath &path, const std::string &text) const;
    };

    std::string ReadFile(const TPath &path);
    void WriteFile(const TPath &path, const std::string &text);

    int SelfTest(std::vector<std::string> name);

    void _ExpectEq(size_t ret, size_t exp, size_t line, const char *func);
    void _ExpectEq(const std::string &ret, const std::string &exp, size_t line, const char *func);
    void _ExpectNeq(size_t ret, size_t exp, size_t line, const char *func);
    void _ExpectNeq(const std::string &ret, const std::string &exp, size_t line, const char *func);
}

#define Expect(ret) ExpectReturn(ret, true, __LINE__, __func__)

#define ExpectSuccess(ret) ExpectError(ret, EError::Success, __LINE__, __func__)
#define ExpectFailure(ret, exp) ExpectError(ret, exp, __LINE__, __func__)

#define ExpectEq(ret, exp) _ExpectEq(ret, exp, __LINE__, __func__)
#define ExpectNeq(ret, exp) _ExpectNeq(ret, exp, __LINE__, __func__)
