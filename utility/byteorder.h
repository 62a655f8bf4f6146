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
#include "common.h"

// compile-time endian-ness detection. Remove this when we switch to c++20, better use std::endian.
#if !defined(__LITTLE_ENDIAN__) && !defined(__BIG_ENDIAN__)
#  if (defined(__BYTE_ORDER__)  && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__) || \
     (defined(__BYTE_ORDER) && __BYTE_ORDER == __BIG_ENDIAN) || \
     defined(__ARMEB__) || defined(__THUMBEB__) || defined(__AARCH64EB__)
#        define __BIG_ENDIAN__
#  elif (defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__) || \
     (defined(__BYTE_ORDER) && __BYTE_ORDER == __LITTLE_ENDIAN) || \
     defined(__ARMEL__) || defined(__THUMBEL__) || defined(__AARCH64EL__) || \
     defined(_M_IX86) || defined(_M_X64) || defined(_M_ARM)
#        define __LITTLE_ENDIAN__
#  else
#    error can not detect endian-ness
#  endif
#endif

namespace wasmverify
{
	namespace ByteOrder
	{
		inline uint8_t bswap(uint8_t x) {
			return x;
		}

		inline uint16_t bswap(uint16_t x) {
#ifdef _MSC_VER
			return _byteswap_ushort(x);
#else
			return __builtin_bswap16(x);
#endif // _MSC_VER
		}

		inline uint32_t bswap(uint32_t x) {
#ifdef _MSC_VER
			return _byteswap_ulong(x);
#else
			return __builtin_bswap32(x);
#endif // _MSC_VER
		}

		inline uint64_t bswap(uint64_t x) {
#ifdef _MSC_VER
			return _byteswap_uint64(x);
#else
			return __builtin_bswap64(x);
#endif // _MSC_VER
		}

		template <typename T, bool bLE>
		inline T Convert(T x)
		{
#ifdef __LITTLE_ENDIAN__
			constexpr bool bNativeLE = true;
#else // __LITTLE_ENDIAN__
			constexpr bool bNativeLE = false;
#endif // __LITTLE_ENDIAN__

			// for big/little endian the to/from direction doesn't matter
			if constexpr (bNativeLE == bLE)
				return x;
			else
				return bswap(x);
		}

		template <typename T> inline T to_le(T x) { return Convert<T, true>(x); }
		template <typename T> inline T to_be(T x) { return Convert<T, false>(x); }
		template <typename T> inline T from_le(T x) { return Convert<T, true>(x); }
		template <typename T> inline T from_be(T x) { return Convert<T, false>(x); }

		// serialized (unaligned) big-endian access, used by the fixed protocol layouts
		template <typename T>
		inline void PutBE(uint8_t* p, T x)
		{
			x = to_be(x);
			memcpy(p, &x, sizeof(x));
		}

		template <typename T>
		inline T GetBE(const uint8_t* p)
		{
			T x;
			memcpy(&x, p, sizeof(x)); // fix alignment
			return from_be(x);
		}

		template <typename T>
		inline void AppendBE(ByteBuffer& dst, T x)
		{
			size_t n = dst.size();
			dst.resize(n + sizeof(T));
			PutBE(&dst[n], x);
		}
	}
}
