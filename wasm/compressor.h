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

	// Compressed payload layout:
	//	EF F0 00	program marker
	//	00		dictionary id (none)
	//	32 bytes	project hash
	//	be32		uncompressed module length
	//	...		brotli stream
	struct PayloadCompressor
	{
		static const uint8_t s_pMarker[3];
		static constexpr uint8_t s_Dictionary = 0;

		static constexpr uint32_t s_HeaderSize = sizeof(s_pMarker) + 1 + nHashBytes + sizeof(uint32_t);
		static constexpr uint32_t s_MaxPayloadSize = 24 * 1024;
		static constexpr uint32_t s_MaxModuleSize = 128 * 1024; // uncompressed

		// fixed encoder parameters, never taken from the environment
		static constexpr int s_Quality = 11;
		static constexpr int s_WindowBits = 22;

		struct Header
		{
			ProjectHash m_ProjectHash;
			uint32_t m_Size;
		};

		// Throws CompressionError if the result exceeds s_MaxPayloadSize
		static ByteBuffer Compress(const Blob& wasm, const ProjectHash&);

		// Validates the header only. Throws CompressionError
		static Header ReadHeader(const Blob& payload);

		// Validates the header, inflates the body and checks the length.
		// Throws CompressionError, also if the declared length exceeds s_MaxModuleSize
		static ByteBuffer Decompress(const Blob& payload, Header* pHdr = nullptr);
	};

} // namespace wasmverify
