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
#include "../project/build_config.h"
#include <boost/filesystem/path.hpp>

namespace wasmverify
{
    // raw module bytes of one compiler invocation
    typedef ByteBuffer WasmModule;

    /// Build toolchain capability. Implementations must be blocking: the returned
    /// module is the complete artifact of a finished compiler run.
    struct ICompiler
    {
        virtual ~ICompiler() = default;

        /// Toolchain identity for the channel, folded into the build config before hashing
        virtual std::string getToolchainVersion(Channel channel) = 0;

        /// Compiles the project at projectRoot. Throws BuildError with the captured diagnostics.
        virtual WasmModule compile(const BuildConfig& cfg, const boost::filesystem::path& projectRoot) = 0;
    };
}
