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

#include "outcome.h"
#include "toolchain/compiler.h"
#include "rpc/eth_rpc.h"
#include <boost/filesystem/path.hpp>

namespace wasmverify
{
    struct VerifyConfig
    {
        boost::filesystem::path projectRoot = ".";
        std::vector<std::string> sourceFiles; // empty: default patterns
        BuildConfig buildConfig;
        std::string deploymentTx; // 0x-prefixed hex
    };

    /// One verification run: fetch the deployment transaction, rebuild the calldata locally
    /// without looking at the remote side, then compare byte by byte.
    /// Any Exception escaping run() is tagged with the stage it was thrown in.
    class Verifier
    {
    public:
        enum class State
        {
            Init,
            FetchRemote,
            RebuildLocal,
            Compare,
            Done
        };

        struct LocalBuild
        {
            BuildConfig config; // with the toolchain version filled in
            size_t fileCount = 0;
            ProjectHash projectHash = {};
            WasmModule module;
            ByteBuffer payload;
            ByteBuffer calldata;
        };

        Verifier(ICompiler& compiler, IRpcClient& rpc, VerifyConfig config);

        VerificationOutcome run();

        State state() const { return _state; }

        /// resolve, hash, compile, compress and construct over the project tree
        LocalBuild rebuildLocal();

        static VerificationOutcome compare(const LocalBuild& local, const ByteBuffer& remote);

    private:
        ByteBuffer fetchRemote(const TxHash& hash);

        ICompiler& _compiler;
        IRpcClient& _rpc;
        VerifyConfig _config;
        State _state = State::Init;
    };
}
