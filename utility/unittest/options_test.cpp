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

#include "utility/test_helpers.h"
#include "utility/cli/options.h"
#include "utility/hex.h"
#include "utility/common.h"

WASMVERIFY_TEST_INIT

using namespace wasmverify;
using namespace std;

namespace
{
    const char* kTx = "0x6b1a0b5f8c3c1d5d2e0b3c9f4a7e8d1c2b3a4f5e6d7c8b9a0f1e2d3c4b5a6978";

    void testDefaults()
    {
        helpers::TempDir dir("options");
        auto cfgPath = (dir.path() / "none.cfg").string();

        const char* argv[] = { "wasm-verify", "--deployment_tx", kTx, "--config_file", cfgPath.c_str() };
        auto desc = createVerifyOptionsDescription();
        auto vm = getOptions(_countof(argv), argv, desc);
        vm.notify();

        WASMVERIFY_CHECK(vm[cli::DEPLOYMENT_TX].as<string>() == kTx);
        WASMVERIFY_CHECK(vm[cli::ENDPOINT].as<string>() == "https://sepolia-rollup.arbitrum.io/rpc");
        WASMVERIFY_CHECK(vm[cli::OPT_LEVEL].as<string>() == "s");
        WASMVERIFY_CHECK(vm[cli::PROJECT_DIR].as<string>() == ".");
        WASMVERIFY_CHECK(vm[cli::RPC_TIMEOUT].as<uint32_t>() == 30000);
        WASMVERIFY_CHECK(!vm[cli::RUST_STABLE].as<bool>());
        WASMVERIFY_CHECK(!vm[cli::DEBUG_INFO].as<bool>());
        WASMVERIFY_CHECK(!vm.count(cli::SOURCE_FILES));
        WASMVERIFY_CHECK(getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO) == LOG_LEVEL_INFO);
    }

    void testCommandLine()
    {
        helpers::TempDir dir("options");
        auto cfgPath = (dir.path() / "none.cfg").string();

        const char* argv[] = {
            "wasm-verify", "--deployment_tx", kTx, "--rust_stable", "--opt_level", "z", "--debug_info",
            "--source_files_for_project_hash", "src/lib.rs", "Cargo.toml", "--log_level", "debug",
            "--config_file", cfgPath.c_str()
        };
        auto desc = createVerifyOptionsDescription();
        auto vm = getOptions(_countof(argv), argv, desc);
        vm.notify();

        WASMVERIFY_CHECK(vm[cli::RUST_STABLE].as<bool>());
        WASMVERIFY_CHECK(vm[cli::DEBUG_INFO].as<bool>());
        WASMVERIFY_CHECK(vm[cli::OPT_LEVEL].as<string>() == "z");
        WASMVERIFY_CHECK((vm[cli::SOURCE_FILES].as<vector<string>>() == vector<string>{ "src/lib.rs", "Cargo.toml" }));
        WASMVERIFY_CHECK(getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_INFO) == LOG_LEVEL_DEBUG);
    }

    void testConfigFile()
    {
        helpers::TempDir dir("options");
        dir.write("verify.cfg",
            "endpoint=http://127.0.0.1:8547\n"
            "opt_level=z\n"
            "rpc_timeout=500\n");
        auto cfgPath = (dir.path() / "verify.cfg").string();

        const char* argv[] = { "wasm-verify", "--deployment_tx", kTx, "--opt_level", "s", "--config_file", cfgPath.c_str() };
        auto desc = createVerifyOptionsDescription();
        auto vm = getOptions(_countof(argv), argv, desc);
        vm.notify();

        // the command line wins over the file
        WASMVERIFY_CHECK(vm[cli::OPT_LEVEL].as<string>() == "s");
        WASMVERIFY_CHECK(vm[cli::ENDPOINT].as<string>() == "http://127.0.0.1:8547");
        WASMVERIFY_CHECK(vm[cli::RPC_TIMEOUT].as<uint32_t>() == 500);
    }

    void testRequired()
    {
        helpers::TempDir dir("options");
        auto cfgPath = (dir.path() / "none.cfg").string();

        const char* argv[] = { "wasm-verify", "--config_file", cfgPath.c_str() };
        auto desc = createVerifyOptionsDescription();
        auto vm = getOptions(_countof(argv), argv, desc);
        WASMVERIFY_CHECK_THROW(vm.notify());

        const char* argvBad[] = { "wasm-verify", "--no_such_option" };
        WASMVERIFY_CHECK_THROW(getOptions(_countof(argvBad), argvBad, desc));
    }

    void testHex()
    {
        uint8_t p[] = { 0x00, 0xab, 0xcd, 0xef };
        WASMVERIFY_CHECK(to_hex(p, sizeof(p)) == "00abcdef");
        WASMVERIFY_CHECK(to_hex0x(p, sizeof(p)) == "0x00abcdef");
        WASMVERIFY_CHECK(RemoveHexPrefix("0xab") == "ab");

        bool ok = false;
        auto v = from_hex("00ABcdef", &ok);
        WASMVERIFY_CHECK(ok && v == vector<uint8_t>(p, p + sizeof(p)));

        from_hex("0g", &ok);
        WASMVERIFY_CHECK(!ok);
    }

    void testLogger()
    {
        WASMVERIFY_CHECK(!Logger::will_log(LOG_LEVEL_CRITICAL));
        {
            auto logger = Logger::create(LOG_LEVEL_ERROR, LOG_LEVEL_WARNING);
            WASMVERIFY_CHECK(Logger::will_log(LOG_LEVEL_ERROR));
            WASMVERIFY_CHECK(Logger::will_log(LOG_LEVEL_WARNING));
            WASMVERIFY_CHECK(!Logger::will_log(LOG_LEVEL_INFO));
            WASMVERIFY_CHECK_THROW(Logger::create());

            LOG_WARNING() << "logger test message " << 42;
        }
        // released owner uninstalls the logger
        WASMVERIFY_CHECK(!Logger::will_log(LOG_LEVEL_CRITICAL));
        WASMVERIFY_CHECK_THROW(Logger::create(LOG_LEVEL_WARNING, 0));
        WASMVERIFY_CHECK(!Logger::will_log(LOG_LEVEL_CRITICAL));

        WASMVERIFY_CHECK(loglevel_tag(LOG_LEVEL_ERROR) == 'E');
        WASMVERIFY_CHECK(loglevel_tag(100) == '~');
    }
}

int main()
{
    testDefaults();
    testCommandLine();
    testConfigFile();
    testRequired();
    testHex();
    testLogger();

    return WASMVERIFY_CHECK_RESULT;
}
