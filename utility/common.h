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

#include <assert.h>
#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <stdint.h>
#include <string.h>
#include <type_traits>

#ifndef _countof
#	define _countof(_Array) (sizeof(_Array) / sizeof(_Array[0]))
#endif // _countof

inline void memset0(void* p, size_t n) { memset(p, 0, n); }
bool memis0(const void* p, size_t n);

template <typename T>
inline void ZeroObject(T& x)
{
	static_assert(std::is_trivially_destructible_v<T>);
	memset0(&x, sizeof(x));
}

namespace wasmverify
{
	typedef std::vector<uint8_t> ByteBuffer;

	// 32-byte digests: project hash, transaction hash
	static const uint32_t nHashBytes = 32;
	typedef std::array<uint8_t, nHashBytes> Hash32;

	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob() = default;
		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb);

		template <size_t nBytes_>
		Blob(const std::array<uint8_t, nBytes_>& x) : p(x.data()), n(static_cast<uint32_t>(x.size())) {}

		void Export(ByteBuffer&) const;
	};

	// append helpers for building byte layouts
	inline void Append(ByteBuffer& dst, const Blob& src)
	{
		const uint8_t* p = reinterpret_cast<const uint8_t*>(src.p);
		dst.insert(dst.end(), p, p + src.n);
	}

	inline void Append(ByteBuffer& dst, const std::string& s)
	{
		dst.insert(dst.end(), s.begin(), s.end());
	}
}

