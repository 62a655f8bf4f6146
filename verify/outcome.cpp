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

#include "outcome.h"
#include "utility/hex.h"

namespace wasmverify
{
    const char* location_str(MismatchLocation location)
    {
        return location == MismatchLocation::Prelude ? "prelude" : "body";
    }

    VerificationOutcome VerificationOutcome::makeMatched(size_t payloadSize, const ProjectHash& projectHash)
    {
        VerificationOutcome res;
        res.matched = true;
        res.localPayloadSize = payloadSize;
        res.remotePayloadSize = payloadSize;
        res.localProjectHash = projectHash;
        return res;
    }

    VerificationOutcome VerificationOutcome::makeMismatched(MismatchLocation location, std::string expected, std::string actual)
    {
        VerificationOutcome res;
        res.location = location;
        res.expected = std::move(expected);
        res.actual = std::move(actual);
        return res;
    }

    bool VerificationOutcome::isToolchainDrift() const
    {
        return !matched
            && location == MismatchLocation::Body
            && remoteProjectHash
            && *remoteProjectHash == localProjectHash;
    }

    std::ostream& operator<<(std::ostream& os, const VerificationOutcome& outcome)
    {
        if (outcome.matched)
        {
            return os << "Verified - contract matches local project, project hash "
                << to_hex0x(outcome.localProjectHash.data(), outcome.localProjectHash.size())
                << ", compressed payload " << outcome.localPayloadSize << " bytes";
        }

        os << "Mismatch in " << location_str(outcome.location)
            << ": expected " << outcome.expected
            << ", actual " << outcome.actual
            << ". Compressed payload: local " << outcome.localPayloadSize << " bytes, remote " << outcome.remotePayloadSize << " bytes";

        if (outcome.location == MismatchLocation::Body && outcome.remoteProjectHash)
        {
            if (outcome.isToolchainDrift())
                os << ". Project hashes agree, the build environment differs";
            else
                os << ". Project hashes differ, the sources or the build config differ";
        }

        return os;
    }
}
