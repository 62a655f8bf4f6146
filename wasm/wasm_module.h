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
#include "../project/project_hash.h"

namespace wasmverify {
namespace Wasm {

	// invalid module, throws BuildError
	[[noreturn]] void Fail(const char*);
	void Test(bool b, const char* sz = "invalid wasm");

	class Reader
	{
		template <typename T>
		T ReadInternal();
	public:

		const uint8_t* m_p0;
		const uint8_t* m_p1;

		Reader() :m_p0(nullptr), m_p1(nullptr) {}
		Reader(const Blob& x)
			:m_p0(reinterpret_cast<const uint8_t*>(x.p))
			,m_p1(m_p0 + x.n)
		{
		}

		bool IsEnd() const { return m_p0 == m_p1; }

		void Ensure(uint32_t n);
		const uint8_t* Consume(uint32_t n);

		uint8_t Read1() { return *Consume(1); }

		// unsigned LEB128
		template <typename T>
		T Read() { return ReadInternal<T>(); }

		template <typename T>
		void Read(T& x) {
			x = Read<T>();
		}
	};

	void WriteLeb(ByteBuffer&, uint32_t);

	struct SectionType
	{
		static const uint8_t Custom = 0;
		static const uint8_t DataCount = 12;
		static const uint8_t Max = 12;
	};

	struct Section
	{
		uint8_t m_Type;
		std::string m_Name; // custom sections only
		ByteBuffer m_Body; // custom sections: the part after the name
	};

	// Section-level view of a module. Sections are kept opaque, only the framing is validated.
	struct Module
	{
		static const uint8_t s_pMagic[4];
		static const uint8_t s_pVersion[4];

		std::vector<Section> m_vSections;

		void Parse(const Blob&);
		void Write(ByteBuffer&) const;

		void StripCustomSections();
		void AddCustomSection(const std::string& sName, const Blob& body);
		const Section* FindCustomSection(const std::string& sName) const;
	};

	static const char s_szProjectHashSection[] = "project_hash";

	// Removes custom sections (names, producers, debug info) and appends the project hash
	// as a "project_hash" custom section.
	ByteBuffer EmbedProjectHash(const Blob& wasm, const ProjectHash&);

} // namespace Wasm
} // namespace wasmverify
