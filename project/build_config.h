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
#include "../utility/common.h"
#include <ostream>

namespace wasmverify {

	enum struct OptLevel : uint8_t
	{
		S, // size, the default
		Z, // aggressive size
	};

	enum struct Channel : uint8_t
	{
		Stable,
		Nightly,
	};

	const char* to_string(OptLevel);
	const char* to_string(Channel);

	// parse user input, return false if unrecognized
	bool FromString(OptLevel&, const std::string&);
	bool FromString(Channel&, const std::string&);

	// Settings that must be identical between the deployer and the verifier
	// for a byte-identical module.
	struct BuildConfig
	{
		OptLevel m_OptLevel = OptLevel::S;
		Channel m_Channel = Channel::Nightly;
		bool m_DebugInfo = false;

		// as reported by the toolchain, e.g. "cargo 1.80.0 (376290515 2024-07-16)"
		std::string m_ToolchainVersion;

		// canonical byte form folded into the project hash
		void Serialize(ByteBuffer&) const;

		bool operator == (const BuildConfig&) const;
		bool operator != (const BuildConfig& x) const { return !(*this == x); }
	};

	std::ostream& operator << (std::ostream&, const BuildConfig&);

} // namespace wasmverify
