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
#include "../utility/byteorder.h"
#include <ethash/keccak.h>

namespace wasmverify
{
	// Keccak-256 processor that accepts input in several partial writes

	struct KeccakProcessorBase
	{
		static const uint32_t nSizeWord = sizeof(uint64_t);

	protected:

		KeccakProcessorBase();

		void WriteInternal(const uint8_t* pSrc, uint32_t nSrc, uint32_t nWordsBlock);
		void ReadInternal(uint8_t* pRes, uint32_t nWordsBlock, uint32_t nBytes);

		uint64_t m_pState[25];

		union {
			uint64_t m_LastWord;
			uint8_t m_pLastWordAsBytes[nSizeWord];
		};

		uint32_t m_iWord;
		uint32_t m_LastWordBytes;

		void AddLastWordRawInternal();
		void AddLastWordInternal(uint32_t nWordsBlock);
	};

	template <uint32_t nBits_>
	struct KeccakProcessor
		:public KeccakProcessorBase
	{
		static const uint32_t nBits = nBits_;
		static const uint32_t nBytes = nBits / 8;

		static const uint32_t nSizeBlock = (1600 - nBits * 2) / 8;
		static const uint32_t nWordsBlock = nSizeBlock / nSizeWord;

		typedef std::array<uint8_t, nBytes> Value;

		KeccakProcessor()
		{
			static_assert(nWordsBlock <= _countof(m_pState), "");
		}

		void Write(const uint8_t* pSrc, uint32_t nSrc)
		{
			WriteInternal(pSrc, nSrc, nWordsBlock);
		}

		void Write(const void* pSrc, uint32_t nSrc)
		{
			Write(reinterpret_cast<const uint8_t*>(pSrc), nSrc);
		}

		void Write(const Blob& x) { Write(x.p, x.n); }
		void Write(const ByteBuffer& x) { Write(Blob(x)); }
		void Write(const std::string& s) { Write(s.data(), static_cast<uint32_t>(s.size())); }
		void Write(uint8_t x) { Write(&x, 1); }

		// big-endian framing of integers, as used for length prefixes
		void WriteBE(uint64_t x)
		{
			uint8_t p[sizeof(x)];
			ByteOrder::PutBE(p, x);
			Write(p, sizeof(p));
		}

		template <typename T>
		KeccakProcessor& operator << (const T& t) { Write(t); return *this; }

		void Read(uint8_t* pRes)
		{
			ReadInternal(pRes, nWordsBlock, nBytes);
		}

		void operator >> (Value& hv)
		{
			Read(hv.data());
		}
	};

	typedef KeccakProcessor<256> Keccak256;

} // namespace wasmverify
