#include <algorithm>
#include <climits>

#include "cli.hpp"
#include "config.hpp"
#include "util/log.hpp"
#include "fmt/format.h"

extern "C" {
#include <errno.h>
#include <unistd.h>
#include <sys/ioctl.h>
}

using std::string;
using std::vector;

namespace {

void PrintAligned(const std::string &name, const std::string &desc,
                         const size_t nameWidth, const size_t termWidth) {
    std::vector<std::string> v;
    size_t descWidth = termWidth - nameWidth - 4;

    size_t start = 0;
    for (size_t i = 0; i < desc.length(); i++) {
        if (i - start > descWidth) {
            v.push_back(std::string(desc, start, i - start));
            start = i;
        }
    }
    std::string last = std::string(desc, start, desc.length());
    if (last.length() || v.empty())
        v.push_back(last);

    fmt::print("  {:<{}}{}\n", name, nameWidth, v[0]);

    for (size_t i = 1; i < v.size(); i++)
        fmt::print("  {:<{}}{}\n", "", nameWidth, v[i]);
}

template <typename Collection, typename MapFunction>
size_t MaxFieldLength(const Collection &coll, MapFunction mapper, size_t min = MIN_FIELD_LENGTH) {
    size_t len = 0;
    for (const auto &i : coll) {
        const auto length = mapper(i).length();
        if (length > len)
            len  = length;
    }

    return std::max(len, min) + 2;
}

class THelpCmd final : public ICmd {
    TCommandHandler &Handler;

public:
    THelpCmd(TCommandHandler &handler, TUserDatabase *db)
        : ICmd(db, "help", 0,
               "[command]", "print help message for command"),
          Handler(handler) {}

    bool NeedDatabase() const override { return false; }

    void Usage();
    int Execute(TCommandEnviroment *env) final override;
};

void THelpCmd::Usage() {
    int termWidth = 80;

    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col)
        termWidth = w.ws_col;

    fmt::print("Usage: {} [option]... <command> [argument]...\n"
               "\n"
               "Options:\n"
               "  -p <path>     passwd table ({})\n"
               "  -s <path>     shadow table ({})\n"
               "  -g <path>     group table ({})\n"
               "  -v            verbose log to stderr\n"
               "  -h, --help\n"
               "  --version\n"
               "\n"
               "Commands:\n",
               program_invocation_short_name,
               config().files().passwd(),
               config().files().shadow(),
               config().files().group());

    using CmdPair = TCommandHandler::RegisteredCommands::value_type;
    int nameWidth = MaxFieldLength(Handler.GetCommands(), [](const CmdPair &p) { return p.first; });

    for (const auto &i : Handler.GetCommands())
        PrintAligned(i.second->GetName(), i.second->GetDescription(), nameWidth, termWidth);

    fmt::print("\n");
}

int THelpCmd::Execute(TCommandEnviroment *env) {
    int ret = EXIT_FAILURE;
    const auto &args = env->GetArgs();

    if (args.empty()) {
        Usage();
        return ret;
    }

    const std::string &name = args[0];
    const auto it = Handler.GetCommands().find(name);
    if (it == Handler.GetCommands().end()) {
        Usage();
    } else {
        it->second->PrintUsage();
        ret = EXIT_SUCCESS;
    }
    return ret;
}
}  // namespace

size_t MaxFieldLength(const std::vector<std::string> &vec, size_t min) {
    return MaxFieldLength(vec, [](const string &s) { return s; }, min);
}

ICmd::ICmd(TUserDatabase *db, const string &name, int args,
           const string &usage, const string &desc, const string &help) :
    Db(db), Name(name), Usage(usage), Desc(desc), Help(help), NeedArgs(args) {}

const string &ICmd::GetName() const { return Name; }
const string &ICmd::GetDescription() const { return Desc; }

void ICmd::PrintError(const string &prefix, const TError &error) {
    fmt::print(stderr, "{}: {}\n", prefix, error.ToString());
}

void ICmd::PrintUsage() {
    fmt::print("Usage: {} {} {}\n\n{}\n\n{}\n",
               program_invocation_short_name, Name, Usage,
               Desc,
               Help);
}

bool ICmd::ValidArgs(const std::vector<std::string> &args) {
    if ((int)args.size() < NeedArgs)
        return false;

    if (args.size() >= 1) {
        const string &arg = args[0];
        if (arg == "-h" || arg == "--help" || arg == "help")
            return false;
    }

    return true;
}

TCommandHandler::TCommandHandler(TUserDatabase &db) : Db(db) {
    RegisterCommand(std::unique_ptr<ICmd>(new THelpCmd(*this, &Db)));
}

TCommandHandler::~TCommandHandler() {
}

void TCommandHandler::RegisterCommand(std::unique_ptr<ICmd> cmd) {
    Commands[cmd->GetName()] = std::move(cmd);
}

TError TCommandHandler::LoadDatabase() {
    std::unique_ptr<TFiles> files(new TFiles());
    TError error;

    error = files->Open(PasswdPath.empty() ? TPath(config().files().passwd()) : TPath(PasswdPath),
                        ShadowPath.empty() ? TPath(config().files().shadow()) : TPath(ShadowPath),
                        GroupPath.empty() ? TPath(config().files().group()) : TPath(GroupPath));
    if (error)
        return error;

    return Db.LoadFiles(std::move(files));
}

int TCommandHandler::HandleCommand(int argc, char *argv[]) {
    while (argc > 1 && argv[1][0] == '-') {
        const std::string opt(argv[1]);

        if (opt == "-v") {
            Verbose = true;
            argc -= 1;
            argv += 1;
            continue;
        }

        if (argc > 2 && (opt == "-p" || opt == "-s" || opt == "-g")) {
            if (opt == "-p")
                PasswdPath = argv[2];
            else if (opt == "-s")
                ShadowPath = argv[2];
            else
                GroupPath = argv[2];
            argc -= 2;
            argv += 2;
            continue;
        }

        break;
    }

    setvbuf(stdout, nullptr, _IOLBF, 0);

    if (argc <= 1) {
        Usage(nullptr);
        return EXIT_FAILURE;
    }

    const std::string name(argv[1]);
    if (name == "-h" || name == "--help") {
        Usage(nullptr);
        return EXIT_FAILURE;
    }

    if (name == "--version") {
        fmt::print("{}\n", PWDB_VERSION);
        return EXIT_SUCCESS;
    }

    const auto it = Commands.find(name);
    if (it == Commands.end()) {
        fmt::print(stderr, "Invalid command: {}\n", name);
        return EXIT_FAILURE;
    }

    const std::vector<std::string> commandArgs(argv + 2, argv + argc);
    ICmd *cmd = it->second.get();
    if (!cmd->ValidArgs(commandArgs)) {
        Usage(cmd->GetName().c_str());
        return EXIT_FAILURE;
    }

    if (cmd->NeedDatabase()) {
        TError error = LoadDatabase();
        if (error) {
            cmd->PrintError("Cannot load database", error);
            return EXIT_FAILURE;
        }
    }

    TCommandEnviroment commandEnv{*this, commandArgs};
    commandEnv.NeedArgs = cmd->NeedArgs;
    return cmd->Execute(&commandEnv);
}

void TCommandHandler::Usage(const char *command) {
    ICmd *cmd = Commands["help"].get();

    std::vector<std::string> args;
    if (command)
        args.push_back(command);
    TCommandEnviroment commandEnv{*this, args};
    cmd->Execute(&commandEnv);
}

vector<string> TCommandEnviroment::GetOpts(const vector<Option> &options) {
    std::string optstring = "+";
    for (const auto &o : options) {
        optstring += o.key;
        if (o.hasArg)
            optstring += ":";
    }

    int opt;
    vector<string> mutableBuffer = Arguments;
    vector<const char*> rawArgs;
    rawArgs.reserve(mutableBuffer.size() + 2);
    std::string fakeCmd = "pwctl";
    rawArgs.push_back(fakeCmd.c_str());
    for (auto &arg : mutableBuffer)
        rawArgs.push_back(arg.c_str());
    rawArgs.push_back(nullptr);
    optind = 0;
    while ((opt = getopt(rawArgs.size() - 1, (char* const*)rawArgs.data(), optstring.c_str())) != -1) {
        bool found = false;
        for (const auto &o : options) {
            if (o.key == opt) {
                o.handler(optarg);
                found = true;
                break;
            }
        }

        if (!found) {
            Handler.Usage(nullptr);
            exit(EXIT_FAILURE);
        }
    }

    if ((int)Arguments.size() - optind + 1 < NeedArgs) {
            Handler.Usage(nullptr);
            exit(EXIT_FAILURE);
    }

    return vector<string>(Arguments.begin() + optind - 1, Arguments.end());
}
