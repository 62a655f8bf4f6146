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

#include "project/project_hash.h"
#include <boost/optional.hpp>
#include <ostream>

namespace wasmverify
{
    enum class MismatchLocation
    {
        Prelude, // toolchain or template drift
        Body     // source or content drift
    };

    const char* location_str(MismatchLocation location);

    struct VerificationOutcome
    {
        bool matched = false;

        // mismatches only
        MismatchLocation location = MismatchLocation::Body;
        std::string expected; // local side summary
        std::string actual;   // remote side summary

        size_t localPayloadSize = 0;
        size_t remotePayloadSize = 0;

        // body mismatches with a decodable remote header
        boost::optional<ProjectHash> remoteProjectHash;
        ProjectHash localProjectHash = {};

        static VerificationOutcome makeMatched(size_t payloadSize, const ProjectHash& projectHash);
        static VerificationOutcome makeMismatched(MismatchLocation location, std::string expected, std::string actual);

        /// same embedded project hash but different bytes: sources and config agree, the build environment does not
        bool isToolchainDrift() const;
    };

    std::ostream& operator<<(std::ostream& os, const VerificationOutcome& outcome);
}
