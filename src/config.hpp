#pragma once

#include <string>

#include "common.hpp"
#include "util/path.hpp"

#include "config.pb.h"

extern cfg::TConfig &config();
void ReadConfigs(bool silent = false);
TError ReadConfig(const TPath &path, bool silent);
