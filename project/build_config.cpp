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

#include "build_config.h"
#include "../utility/byteorder.h"

namespace wasmverify {

	const char* to_string(OptLevel x)
	{
		return (OptLevel::Z == x) ? "z" : "s";
	}

	const char* to_string(Channel x)
	{
		return (Channel::Stable == x) ? "stable" : "nightly";
	}

	bool FromString(OptLevel& x, const std::string& s)
	{
		if ("s" == s)
			x = OptLevel::S;
		else if ("z" == s)
			x = OptLevel::Z;
		else
			return false;
		return true;
	}

	bool FromString(Channel& x, const std::string& s)
	{
		if ("stable" == s)
			x = Channel::Stable;
		else if ("nightly" == s)
			x = Channel::Nightly;
		else
			return false;
		return true;
	}

	void BuildConfig::Serialize(ByteBuffer& res) const
	{
		res.push_back(static_cast<uint8_t>(m_Channel));
		res.push_back(static_cast<uint8_t>(*to_string(m_OptLevel)));
		res.push_back(m_DebugInfo ? 1 : 0);

		ByteOrder::AppendBE<uint64_t>(res, m_ToolchainVersion.size());
		Append(res, m_ToolchainVersion);
	}

	bool BuildConfig::operator == (const BuildConfig& x) const
	{
		return
			(m_OptLevel == x.m_OptLevel) &&
			(m_Channel == x.m_Channel) &&
			(m_DebugInfo == x.m_DebugInfo) &&
			(m_ToolchainVersion == x.m_ToolchainVersion);
	}

	std::ostream& operator << (std::ostream& s, const BuildConfig& cfg)
	{
		s << "opt-level=" << to_string(cfg.m_OptLevel)
			<< " channel=" << to_string(cfg.m_Channel)
			<< " debug=" << (cfg.m_DebugInfo ? "yes" : "no");

		if (!cfg.m_ToolchainVersion.empty())
			s << " toolchain=\"" << cfg.m_ToolchainVersion << "\"";

		return s;
	}

} // namespace wasmverify
