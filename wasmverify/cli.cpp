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

#include "utility/cli/options.h"
#include "utility/logger.h"
#include "core/errors.h"
#include "rpc/http_rpc_client.h"
#include "toolchain/cargo_compiler.h"
#include "verify/verifier.h"

#include <iostream>

using namespace wasmverify;
using namespace std;

namespace
{
    enum ExitCode
    {
        Matched = 0,
        Mismatched = 1,
        Failed = 2,
        BadArguments = 3,
        Unexpected = 255
    };

    VerifyConfig makeVerifyConfig(const po::variables_map& vm)
    {
        VerifyConfig config;
        config.deploymentTx = vm[cli::DEPLOYMENT_TX].as<string>();
        config.projectRoot = vm[cli::PROJECT_DIR].as<string>();

        if (vm.count(cli::SOURCE_FILES))
        {
            config.sourceFiles = vm[cli::SOURCE_FILES].as<vector<string>>();
        }

        auto& build = config.buildConfig;
        build.m_Channel = vm[cli::RUST_STABLE].as<bool>() ? Channel::Stable : Channel::Nightly;
        build.m_DebugInfo = vm[cli::DEBUG_INFO].as<bool>();

        const auto& optLevel = vm[cli::OPT_LEVEL].as<string>();
        if (!FromString(build.m_OptLevel, optLevel))
        {
            throw InvalidArgumentError("Invalid optimization level: " + optLevel);
        }

        return config;
    }

    RpcSettings makeRpcSettings(const po::variables_map& vm)
    {
        RpcSettings settings;
        settings.endpoint = vm[cli::ENDPOINT].as<string>();
        settings.timeoutMsec = vm[cli::RPC_TIMEOUT].as<uint32_t>();
        return settings;
    }
}

int main(int argc, char* argv[])
{
    auto options = createVerifyOptionsDescription();
    po::variables_map vm;

    try
    {
        vm = getOptions(argc, argv, options);

        if (vm.count(cli::HELP))
        {
            cout << options << endl;
            return ExitCode::Matched;
        }

        vm.notify();
    }
    catch (const po::error& e)
    {
        cerr << e.what() << endl << options << endl;
        return ExitCode::BadArguments;
    }

    int logLevel = getLogLevel(cli::LOG_LEVEL, vm, vm[cli::VERBOSE].as<bool>() ? LOG_LEVEL_DEBUG : LOG_LEVEL_INFO);
    auto logger = Logger::create(LOG_LEVEL_WARNING, logLevel);

    try
    {
        auto config = makeVerifyConfig(vm);
        auto rpcSettings = makeRpcSettings(vm);

        CargoCompiler compiler(CargoCompiler::Settings{});
        HttpRpcClient rpc(rpcSettings);

        Verifier verifier(compiler, rpc, config);
        auto outcome = verifier.run();

        cout << outcome << endl;
        return outcome.matched ? ExitCode::Matched : ExitCode::Mismatched;
    }
    catch (const Exception& e)
    {
        LOG_ERROR() << format_error(e);
        return e.code == ErrorCode::InvalidArgument ? ExitCode::BadArguments : ExitCode::Failed;
    }
    catch (const std::exception& e)
    {
        LOG_ERROR() << "EXCEPTION: " << e.what();
        return ExitCode::Unexpected;
    }
}
