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

#include "compressor.h"
#include "../core/errors.h"
#include "../utility/byteorder.h"
#include "../utility/logger.h"
#include <brotli/encode.h>
#include <brotli/decode.h>

namespace wasmverify {

	const uint8_t PayloadCompressor::s_pMarker[3] = { 0xEF, 0xF0, 0x00 };

	ByteBuffer PayloadCompressor::Compress(const Blob& wasm, const ProjectHash& hv)
	{
		size_t nMax = BrotliEncoderMaxCompressedSize(wasm.n);
		if (!nMax)
			throw CompressionError("module too large to compress");

		ByteBuffer res(s_HeaderSize + nMax);

		uint8_t* p = &res.front();
		memcpy(p, s_pMarker, sizeof(s_pMarker));
		p += sizeof(s_pMarker);
		*p++ = s_Dictionary;
		memcpy(p, hv.data(), hv.size());
		p += hv.size();
		ByteOrder::PutBE<uint32_t>(p, wasm.n);

		size_t nOut = nMax;
		auto bOk = BrotliEncoderCompress(
			s_Quality,
			s_WindowBits,
			BROTLI_MODE_GENERIC,
			wasm.n,
			reinterpret_cast<const uint8_t*>(wasm.p),
			&nOut,
			&res.front() + s_HeaderSize);

		if (!bOk)
			throw CompressionError("brotli encoder failed");

		res.resize(s_HeaderSize + nOut);

		LOG_INFO() << "Compressed module " << wasm.n << " -> " << res.size() << " bytes";

		if (res.size() > s_MaxPayloadSize)
			throw CompressionError("compressed payload of " + std::to_string(res.size()) + " bytes exceeds the limit of " + std::to_string(s_MaxPayloadSize));

		return res;
	}

	PayloadCompressor::Header PayloadCompressor::ReadHeader(const Blob& payload)
	{
		if (payload.n < s_HeaderSize)
			throw CompressionError("payload shorter than its header");

		const uint8_t* p = reinterpret_cast<const uint8_t*>(payload.p);
		if (memcmp(p, s_pMarker, sizeof(s_pMarker)))
			throw CompressionError("payload marker mismatch");
		p += sizeof(s_pMarker);

		if (s_Dictionary != *p++)
			throw CompressionError("unsupported compression dictionary");

		Header hdr;
		memcpy(hdr.m_ProjectHash.data(), p, hdr.m_ProjectHash.size());
		p += hdr.m_ProjectHash.size();
		hdr.m_Size = ByteOrder::GetBE<uint32_t>(p);

		return hdr;
	}

	ByteBuffer PayloadCompressor::Decompress(const Blob& payload, Header* pHdr)
	{
		Header hdr = ReadHeader(payload);
		if (hdr.m_Size > s_MaxModuleSize)
			throw CompressionError("declared module length " + std::to_string(hdr.m_Size) + " exceeds the limit of " + std::to_string(s_MaxModuleSize));

		ByteBuffer res(hdr.m_Size);
		size_t nOut = res.size();

		auto eRes = BrotliDecoderDecompress(
			payload.n - s_HeaderSize,
			reinterpret_cast<const uint8_t*>(payload.p) + s_HeaderSize,
			&nOut,
			res.data());

		if (BROTLI_DECODER_RESULT_SUCCESS != eRes)
			throw CompressionError("corrupted brotli stream");
		if (nOut != hdr.m_Size)
			throw CompressionError("uncompressed length mismatch");

		if (pHdr)
			*pHdr = hdr;
		return res;
	}

} // namespace wasmverify
