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

#include "options.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <iostream>
#include <map>

using namespace std;

namespace wasmverify
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* DEPLOYMENT_TX = "deployment_tx";
        const char* ENDPOINT = "endpoint";
        const char* RUST_STABLE = "rust_stable";
        const char* OPT_LEVEL = "opt_level";
        const char* DEBUG_INFO = "debug_info";
        const char* PROJECT_DIR = "project_dir";
        const char* SOURCE_FILES = "source_files_for_project_hash";
        const char* RPC_TIMEOUT = "rpc_timeout";
        const char* VERBOSE = "verbose";
        const char* LOG_LEVEL = "log_level";
        const char* CONFIG_FILE_PATH = "config_file";
        // values
        const char* LOG_ERROR = "error";
        const char* LOG_WARNING = "warning";
        const char* INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
    }

    po::options_description createVerifyOptionsDescription()
    {
        po::options_description general("General options");
        general.add_options()
            (cli::HELP_FULL, "list all available options")
            (cli::LOG_LEVEL, po::value<string>(), "set log level [error|warning|info(default)|debug|verbose]")
            (cli::VERBOSE, po::bool_switch()->default_value(false), "print debug output, same as --log_level=debug")
            (cli::CONFIG_FILE_PATH, po::value<string>()->default_value("wasm-verify.cfg"), "path to the config file");

        po::options_description verify("Verification options");
        verify.add_options()
            (cli::DEPLOYMENT_TX, po::value<string>()->required(), "hash of the contract deployment transaction (0x-prefixed hex)")
            (cli::ENDPOINT, po::value<string>()->default_value("https://sepolia-rollup.arbitrum.io/rpc"), "JSON-RPC endpoint of the chain node")
            (cli::RPC_TIMEOUT, po::value<uint32_t>()->default_value(30000), "network operation timeout in milliseconds")
            (cli::PROJECT_DIR, po::value<string>()->default_value("."), "path to the contract project")
            (cli::SOURCE_FILES, po::value<vector<string>>()->multitoken(), "files to include in the project hash, default: *.rs, Cargo.toml and Cargo.lock of the project")
            (cli::RUST_STABLE, po::bool_switch()->default_value(false), "build with the stable toolchain instead of nightly")
            (cli::OPT_LEVEL, po::value<string>()->default_value("s"), "optimization level [s|z]")
            (cli::DEBUG_INFO, po::bool_switch()->default_value(false), "keep debug info in the build");

        po::options_description options{ "Allowed options" };
        options.add(general).add(verify);
        return options;
    }

    boost::optional<string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc)
    {
        return ReadCfgFromFile(vm, desc, vm[cli::CONFIG_FILE_PATH].as<string>().c_str());
    }

    boost::optional<string> ReadCfgFromFile(po::variables_map& vm, const po::options_description& desc, const char* szFile)
    {
        const auto fullPath = boost::filesystem::system_complete(szFile).string();
        ifstream cfg(fullPath);
        if (!cfg)
            return boost::none;

        cout << "Reading config from " << fullPath << endl;
        po::store(po::parse_config_file(cfg, desc), vm);
        return fullPath;
    }

    po::variables_map getOptions(int argc, const char* const argv[], const po::options_description& options)
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv) // value stored first is preferred
            .options(options)
            .style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing)
            .run(), vm);

        ReadCfgFromFile(vm, options);
        return vm;
    }

    int getLogLevel(const string& dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<string, int> logLevels
        {
            { cli::LOG_ERROR, LOG_LEVEL_ERROR },
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }
}
