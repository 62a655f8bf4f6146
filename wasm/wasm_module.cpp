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

#include "wasm_module.h"
#include "../core/errors.h"
#include "../utility/logger.h"
#include <algorithm>
#include <limits>

namespace wasmverify {
namespace Wasm {

	void Fail(const char* sz)
	{
		throw BuildError(sz);
	}

	void Test(bool b, const char* sz)
	{
		if (!b)
			Fail(sz);
	}

	/////////////////////////////////////////////
	// Reader

	void Reader::Ensure(uint32_t n)
	{
		Test(static_cast<size_t>(m_p1 - m_p0) >= n, "invalid wasm: unexpected end");
	}

	const uint8_t* Reader::Consume(uint32_t n)
	{
		Ensure(n);

		const uint8_t* pRet = m_p0;
		m_p0 += n;

		return pRet;
	}

	template <typename T>
	T Reader::ReadInternal()
	{
		static_assert(!std::numeric_limits<T>::is_signed);

		T ret = 0;
		constexpr unsigned int nBitsMax = sizeof(ret) * 8;

		for (unsigned int nShift = 0; ; )
		{
			Test(nShift < nBitsMax, "invalid wasm: LEB128 overflow");

			uint8_t n = Read1();
			bool bEnd = !(0x80 & n);
			if (!bEnd)
				n &= ~0x80;

			// the last byte may only carry the bits that fit
			if (nBitsMax - nShift < 7)
				Test(!(n >> (nBitsMax - nShift)), "invalid wasm: LEB128 overflow");

			ret |= T(n) << nShift;
			nShift += 7;

			if (bEnd)
				break;
		}

		return ret;
	}

	template uint32_t Reader::ReadInternal<uint32_t>();

	void WriteLeb(ByteBuffer& buf, uint32_t x)
	{
		while (true)
		{
			uint8_t n = static_cast<uint8_t>(x & 0x7f);
			x >>= 7;

			if (!x)
			{
				buf.push_back(n);
				break;
			}

			buf.push_back(n | 0x80);
		}
	}

	/////////////////////////////////////////////
	// Module

	const uint8_t Module::s_pMagic[4] = { 0, 'a', 's', 'm' };
	const uint8_t Module::s_pVersion[4] = { 1, 0, 0, 0 };

	void Module::Parse(const Blob& x)
	{
		Reader inp(x);
		m_vSections.clear();

		Test(!memcmp(s_pMagic, inp.Consume(sizeof(s_pMagic)), sizeof(s_pMagic)), "invalid wasm: bad magic");
		Test(!memcmp(s_pVersion, inp.Consume(sizeof(s_pVersion)), sizeof(s_pVersion)), "invalid wasm: unsupported version");

		for (uint8_t nPrevSection = 0; !inp.IsEnd(); )
		{
			auto nSection = inp.Read1();
			Test(nSection <= SectionType::Max, "invalid wasm: unknown section");

			bool bIgnoreOrder = (SectionType::Custom == nSection) || (SectionType::DataCount == nSection);
			Test(!nPrevSection || bIgnoreOrder || (nSection > nPrevSection), "invalid wasm: section order");

			auto nLen = inp.Read<uint32_t>();

			Reader inpSection;
			inpSection.m_p0 = inp.Consume(nLen);
			inpSection.m_p1 = inpSection.m_p0 + nLen;

			auto& s = m_vSections.emplace_back();
			s.m_Type = nSection;

			if (SectionType::Custom == nSection)
			{
				auto nName = inpSection.Read<uint32_t>();
				auto pName = inpSection.Consume(nName);
				s.m_Name.assign(reinterpret_cast<const char*>(pName), nName);
			}

			s.m_Body.assign(inpSection.m_p0, inpSection.m_p1);

			if (!bIgnoreOrder)
				nPrevSection = nSection;
		}
	}

	void Module::Write(ByteBuffer& buf) const
	{
		buf.insert(buf.end(), s_pMagic, s_pMagic + sizeof(s_pMagic));
		buf.insert(buf.end(), s_pVersion, s_pVersion + sizeof(s_pVersion));

		ByteBuffer bufName;
		for (const auto& s : m_vSections)
		{
			buf.push_back(s.m_Type);

			bufName.clear();
			if (SectionType::Custom == s.m_Type)
			{
				WriteLeb(bufName, static_cast<uint32_t>(s.m_Name.size()));
				Append(bufName, s.m_Name);
			}

			WriteLeb(buf, static_cast<uint32_t>(bufName.size() + s.m_Body.size()));
			Append(buf, bufName);
			Append(buf, s.m_Body);
		}
	}

	void Module::StripCustomSections()
	{
		auto it = std::remove_if(m_vSections.begin(), m_vSections.end(), [](const Section& s) {
			return SectionType::Custom == s.m_Type;
		});
		m_vSections.erase(it, m_vSections.end());
	}

	void Module::AddCustomSection(const std::string& sName, const Blob& body)
	{
		auto& s = m_vSections.emplace_back();
		s.m_Type = SectionType::Custom;
		s.m_Name = sName;
		body.Export(s.m_Body);
	}

	const Section* Module::FindCustomSection(const std::string& sName) const
	{
		for (const auto& s : m_vSections)
			if ((SectionType::Custom == s.m_Type) && (s.m_Name == sName))
				return &s;
		return nullptr;
	}

	ByteBuffer EmbedProjectHash(const Blob& wasm, const ProjectHash& hv)
	{
		Module m;
		m.Parse(wasm);

		size_t nSections = m.m_vSections.size();
		m.StripCustomSections();
		size_t nStripped = nSections - m.m_vSections.size();
		m.AddCustomSection(s_szProjectHashSection, hv);

		ByteBuffer res;
		m.Write(res);

		LOG_DEBUG() << "Stripped " << nStripped << " custom sections, module " << wasm.n << " -> " << res.size() << " bytes";
		return res;
	}

} // namespace Wasm
} // namespace wasmverify
