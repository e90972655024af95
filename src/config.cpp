#include "config.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

#include <algorithm>

class TProtobufLogger : public google::protobuf::io::ErrorCollector {
public:
    std::string Path;
    TProtobufLogger(const std::string &path) : Path(path) {}
    ~TProtobufLogger() {}

    void AddError(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }

    void AddWarning(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }
};

static cfg::TConfig Config;
static bool ConfigReady = false;

static void DefaultConfig();

/* Library users that never read configs still get the defaults */
cfg::TConfig &config() {
    if (!ConfigReady) {
        ConfigReady = true;
        DefaultConfig();
    }
    return Config;
}

static void DefaultConfig() {
    config().mutable_files()->set_passwd(DEFAULT_PASSWD_PATH);
    config().mutable_files()->set_shadow(DEFAULT_SHADOW_PATH);
    config().mutable_files()->set_group(DEFAULT_GROUP_PATH);
    config().mutable_files()->set_max_file_size(DEFAULT_MAX_FILE_SIZE);

    config().mutable_log()->set_verbose(false);
    config().mutable_log()->set_debug(false);

    config().mutable_new_user()->set_uid(1001);
    config().mutable_new_user()->set_gid(1001);
    config().mutable_new_user()->set_home("/");
    config().mutable_new_user()->set_shell("/bin/nologin");
    config().mutable_new_user()->set_password("!!");
    config().mutable_new_user()->set_last_change(0);
    config().mutable_new_user()->set_earliest_change(0);
    config().mutable_new_user()->set_latest_change(99999);
    config().mutable_new_user()->set_warn_period(7);

    config().mutable_database()->set_strict_primary_group(false);
}

TError ReadConfig(const TPath &path, bool silent) {
    TError error;
    TFile file;

    error = file.OpenRead(path);
    if (error) {
        if (!silent && error.Errno != ENOENT)
            L_WRN("Cannot read config {} {}", path, error);
        return error;
    }

    google::protobuf::io::FileInputStream stream(file.Fd);
    google::protobuf::TextFormat::Parser parser;
    TProtobufLogger logger(path.ToString());

    if (!silent) {
        L_VERBOSE("Read config {}", path);
        parser.RecordErrorsTo(&logger);
    }

    bool ok = parser.Merge(&stream, &Config);
    if (!ok) {
        if (!silent)
            L_WRN("Cannot parse config {} the rest is skipped", path);
        return TError(EError::InvalidValue, "Cannot parse config {}", path);
    }

    return OK;
}

void ReadConfigs(bool silent) {
    Config.Clear();
    ConfigReady = true;
    DefaultConfig();

    (void)ReadConfig(PWDB_CONFIG, silent);

    TPath config_dir = PWDB_CONFIG_DIR;
    std::vector<std::string> config_names;
    if (!config_dir.ReadDirectory(config_names)) {
        std::sort(config_names.begin(), config_names.end());
        for (auto &name: config_names) {
            if (StringEndsWith(name, ".conf"))
                (void)ReadConfig(config_dir / name, silent);
        }
    }

    Debug |= config().log().debug();
    Verbose |= Debug | config().log().verbose();
}
