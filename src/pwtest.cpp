#include <iostream>
#include <csignal>
#include <cstdlib>

#include "util/log.hpp"
#include "test/test.hpp"

extern "C" {
#include <errno.h>
#include <sys/types.h>
#include <sys/stat.h>
}

static void Usage() {
    std::cout << "usage: " << program_invocation_short_name << " [-v] [test]..." << std::endl;
}

int main(int argc, char *argv[])
{
    std::vector<std::string> names;

    signal(SIGPIPE, SIG_IGN);

    umask(0022);

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            Usage();
            return EXIT_FAILURE;
        }

        if (arg == "-v") {
            Verbose = true;
            Debug = true;
            OpenLog();
            continue;
        }

        names.push_back(arg);
    }

    try {
        return test::SelfTest(names);
    } catch (const std::exception &exc) {
        std::cerr << "Exception: " << exc.what() << std::endl;
    }

    return EXIT_FAILURE;
}
