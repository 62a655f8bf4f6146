// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <boost/program_options.hpp>
#include <boost/optional.hpp>
#include "utility/logger.h"

namespace wasmverify
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* DEPLOYMENT_TX;
        extern const char* ENDPOINT;
        extern const char* RUST_STABLE;
        extern const char* OPT_LEVEL;
        extern const char* DEBUG_INFO;
        extern const char* PROJECT_DIR;
        extern const char* SOURCE_FILES;
        extern const char* RPC_TIMEOUT;
        extern const char* VERBOSE;
        extern const char* LOG_LEVEL;
        extern const char* CONFIG_FILE_PATH;
        // log level values
        extern const char* LOG_ERROR;
        extern const char* LOG_WARNING;
        extern const char* INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
    }

    po::options_description createVerifyOptionsDescription();

    // Parses the command line, then the config file. Values stored first are preferred,
    // so the command line overrides the file.
    po::variables_map getOptions(int argc, const char* const argv[], const po::options_description& options);

    boost::optional<std::string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc);
    boost::optional<std::string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile);

    int getLogLevel(const std::string& dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);
}
