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

#include "cargo_compiler.h"
#include "../core/errors.h"
#include "../utility/fsutils.h"
#include "../utility/logger.h"

#include <boost/algorithm/string.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <future>
#include <sstream>

namespace wasmverify
{
    namespace fs = boost::filesystem;
    namespace bp = boost::process;

    namespace
    {
        std::string channelArg(Channel channel)
        {
            return std::string("+") + to_string(channel);
        }

        std::string joinArgs(const std::vector<std::string>& args)
        {
            return boost::algorithm::join(args, " ");
        }

        // value of `name = "..."`, empty if the line is something else
        std::string parseNameValue(const std::string& line)
        {
            auto eq = line.find('=');
            if (eq == std::string::npos)
                return {};

            auto key = boost::algorithm::trim_copy(line.substr(0, eq));
            if (key != "name")
                return {};

            auto value = boost::algorithm::trim_copy(line.substr(eq + 1));
            if (value.size() < 2 || value.front() != '"')
                return {};

            auto end = value.find('"', 1);
            if (end == std::string::npos)
                return {};

            return value.substr(1, end - 1);
        }
    }

    CargoCompiler::CargoCompiler(const Settings& settings)
        : m_settings(settings)
    {
    }

    std::vector<std::string> CargoCompiler::getBuildArgs(const BuildConfig& cfg)
    {
        std::vector<std::string> args =
        {
            channelArg(cfg.m_Channel),
            "build",
            "--lib",
            "--locked",
            "--release",
            "--target=" + std::string(kWasmTarget)
        };

        if (cfg.m_Channel == Channel::Nightly)
        {
            args.insert(args.end(),
            {
                "-Z", "build-std=std,panic_abort",
                "-Z", "build-std-features=panic_immediate_abort"
            });
        }

        args.push_back("--config");
        args.push_back(std::string("profile.release.opt-level='") + to_string(cfg.m_OptLevel) + "'");
        return args;
    }

    std::map<std::string, std::string> CargoCompiler::getBuildEnv(const BuildConfig& cfg)
    {
        return
        {
            { "CARGO_PROFILE_RELEASE_DEBUG", cfg.m_DebugInfo ? "true" : "false" },
            { "CARGO_INCREMENTAL", "0" }
        };
    }

    std::string CargoCompiler::getArtifactName(const std::string& cargoToml)
    {
        std::istringstream ss(cargoToml);
        std::string line, section, libName, packageName;

        while (std::getline(ss, line))
        {
            auto comment = line.find('#');
            if (comment != std::string::npos)
                line.resize(comment);
            boost::algorithm::trim(line);
            if (line.empty())
                continue;

            if (line.front() == '[')
            {
                section = line;
                continue;
            }

            auto name = parseNameValue(line);
            if (name.empty())
                continue;

            if (section == "[lib]" && libName.empty())
                libName = name;
            else if (section == "[package]" && packageName.empty())
                packageName = name;
        }

        std::string res = libName.empty() ? packageName : libName;
        if (res.empty())
            throw BuildError("Cargo.toml declares no package name");

        boost::algorithm::replace_all(res, "-", "_");
        return res;
    }

    fs::path CargoCompiler::getArtifactPath(const fs::path& projectRoot, const std::string& name)
    {
        return projectRoot / "target" / kWasmTarget / "release" / (name + ".wasm");
    }

    CargoCompiler::ProcessResult CargoCompiler::run(const std::vector<std::string>& args, const fs::path& dir, const std::map<std::string, std::string>& env)
    {
        auto exe = bp::search_path(m_settings.m_Cargo);
        if (exe.empty())
            throw BuildError("toolchain not found: " + m_settings.m_Cargo);

        LOG_DEBUG() << "Running " << m_settings.m_Cargo << " " << joinArgs(args) << " in " << dir.string();

        bp::environment procEnv = boost::this_process::environment();
        for (const auto& [key, value] : env)
            procEnv[key] = value;

        ProcessResult res;
        try
        {
            boost::asio::io_context io;
            std::future<std::string> out, err;

            bp::child child(exe, bp::args(args), bp::start_dir(dir.string()), procEnv,
                bp::std_in.close(), bp::std_out > out, bp::std_err > err, io);

            // drains both pipes until the child closes them
            io.run();
            child.wait();

            res.m_ExitCode = child.exit_code();
            res.m_Out = out.get();
            res.m_Err = err.get();
        }
        catch (const bp::process_error& e)
        {
            throw BuildError(std::string("failed to run ") + m_settings.m_Cargo + ": " + e.what());
        }

        return res;
    }

    std::string CargoCompiler::getToolchainVersion(Channel channel)
    {
        auto res = run({ channelArg(channel), "--version" }, fs::current_path(), {});
        if (res.m_ExitCode != 0)
            throw BuildError(std::string("toolchain for channel ") + to_string(channel) + " is unavailable", res.m_Err);

        auto version = boost::algorithm::trim_copy(res.m_Out);
        LOG_INFO() << "Toolchain: " << version;
        return version;
    }

    WasmModule CargoCompiler::compile(const BuildConfig& cfg, const fs::path& projectRoot)
    {
        auto manifest = projectRoot / "Cargo.toml";
        std::string name;
        try
        {
            auto toml = fsutils::fread(manifest);
            name = getArtifactName(std::string(toml.begin(), toml.end()));
        }
        catch (const BuildError&)
        {
            throw;
        }
        catch (const std::runtime_error& e)
        {
            throw BuildError(std::string("cannot read manifest: ") + e.what());
        }

        if (m_settings.m_CleanFirst)
        {
            auto res = run({ "clean" }, projectRoot, {});
            if (res.m_ExitCode != 0)
                throw BuildError("cargo clean failed", res.m_Err);
        }

        LOG_INFO() << "Compiling " << name << " (" << cfg << ")";

        auto res = run(getBuildArgs(cfg), projectRoot, getBuildEnv(cfg));
        if (res.m_ExitCode != 0)
        {
            LOG_ERROR() << "Build failed with exit code " << res.m_ExitCode << ":\n" << res.m_Err;
            throw BuildError("compilation failed", res.m_Out + res.m_Err);
        }

        auto artifact = getArtifactPath(projectRoot, name);
        boost::system::error_code ec;
        if (!fs::is_regular_file(artifact, ec))
            throw BuildError("build produced no artifact at " + artifact.string(), res.m_Err);

        WasmModule module;
        try
        {
            module = fsutils::fread(artifact);
        }
        catch (const std::runtime_error& e)
        {
            throw BuildError(std::string("cannot read artifact: ") + e.what());
        }

        LOG_DEBUG() << "Artifact " << artifact.string() << ", " << module.size() << " bytes";
        return module;
    }
}
