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
#include "compiler.h"
#include <vector>
#include <map>

namespace wasmverify
{
    inline constexpr const char* kWasmTarget = "wasm32-unknown-unknown";

    /// Deterministic cargo invocation for the wasm target
    class CargoCompiler : public ICompiler
    {
    public:
        struct Settings
        {
            std::string m_Cargo = "cargo";
            bool m_CleanFirst = true; // never reuse stale artifacts
        };

        struct ProcessResult
        {
            int m_ExitCode = -1;
            std::string m_Out;
            std::string m_Err;
        };

        explicit CargoCompiler(const Settings& settings);

        std::string getToolchainVersion(Channel channel) override;
        WasmModule compile(const BuildConfig& cfg, const boost::filesystem::path& projectRoot) override;

        /// cargo arguments with every output-affecting option pinned
        static std::vector<std::string> getBuildArgs(const BuildConfig& cfg);

        /// environment overrides for the build
        static std::map<std::string, std::string> getBuildEnv(const BuildConfig& cfg);

        /// artifact file name stem from Cargo.toml text: [lib] name, else [package] name, '-' replaced by '_'
        static std::string getArtifactName(const std::string& cargoToml);

        /// target/wasm32-unknown-unknown/release/<name>.wasm
        static boost::filesystem::path getArtifactPath(const boost::filesystem::path& projectRoot, const std::string& name);

    private:
        ProcessResult run(const std::vector<std::string>& args, const boost::filesystem::path& dir, const std::map<std::string, std::string>& env);

        Settings m_settings;
    };
}
