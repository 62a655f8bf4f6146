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

#include "project_hash.h"
#include "../core/keccak.h"
#include "../utility/hex.h"
#include "../utility/logger.h"
#include <algorithm>

namespace wasmverify {

	namespace
	{
		void HashFile(Keccak256& hp, const SourceFile& sf)
		{
			hp.WriteBE(sf.m_Path.size());
			hp << sf.m_Path;
			hp.WriteBE(sf.m_Content.size());
			hp << sf.m_Content;
		}
	}

	ProjectHash HashProject(const SourceFileSet& v, const BuildConfig& cfg)
	{
		auto pred = [](const SourceFile& a, const SourceFile& b) { return a.m_Path < b.m_Path; };

		std::vector<const SourceFile*> vSorted;
		vSorted.reserve(v.size());
		for (const auto& sf : v)
			vSorted.push_back(&sf);

		if (!std::is_sorted(v.begin(), v.end(), pred))
			std::sort(vSorted.begin(), vSorted.end(), [&pred](const SourceFile* a, const SourceFile* b) { return pred(*a, *b); });

		Keccak256 hp;
		for (const auto* pSf : vSorted)
			HashFile(hp, *pSf);

		ByteBuffer bufCfg;
		cfg.Serialize(bufCfg);
		hp.WriteBE(bufCfg.size());
		hp << bufCfg;

		ProjectHash res;
		hp >> res;

		LOG_INFO() << "Project hash " << to_hex0x(res.data(), res.size()) << " over " << v.size() << " files, " << cfg;
		return res;
	}

} // namespace wasmverify
