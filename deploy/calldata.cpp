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

#include "calldata.h"
#include "../core/errors.h"
#include "../utility/byteorder.h"
#include "../utility/logger.h"

namespace wasmverify {

	ByteBuffer Calldata::BuildPrelude(uint64_t nPayload)
	{
		ByteBuffer res;
		res.reserve(s_PreludeSize);

		res.push_back(Opcode::push32);
		res.resize(res.size() + s_LengthSize - sizeof(uint64_t), 0);
		ByteOrder::AppendBE<uint64_t>(res, nPayload);

		res.push_back(Opcode::dup1);

		res.push_back(Opcode::push1);
		res.push_back(static_cast<uint8_t>(s_PreludeSize));

		res.push_back(Opcode::push1);
		res.push_back(0);

		res.push_back(Opcode::codecopy);

		res.push_back(Opcode::push1);
		res.push_back(0);

		res.push_back(Opcode::Return);

		res.push_back(s_Version);

		assert(res.size() == s_PreludeSize);
		return res;
	}

	ByteBuffer Calldata::Construct(const Blob& payload)
	{
		ByteBuffer res = BuildPrelude(payload.n);
		Append(res, payload);

		LOG_DEBUG() << "Calldata " << res.size() << " bytes";
		return res;
	}

	Calldata::Parts Calldata::Extract(const Blob& x)
	{
		if (x.n < s_PreludeSize)
			throw MalformedCalldataError("calldata of " + std::to_string(x.n) + " bytes is shorter than the prelude");

		const uint8_t* p = reinterpret_cast<const uint8_t*>(x.p);
		uint32_t nPayload = x.n - s_PreludeSize;

		// everything except the length field must match the template
		ByteBuffer bufTemplate = BuildPrelude(nPayload);
		if (memcmp(p, bufTemplate.data(), s_LengthOffset) ||
			memcmp(p + s_LengthOffset + s_LengthSize, bufTemplate.data() + s_LengthOffset + s_LengthSize, s_PreludeSize - s_LengthOffset - s_LengthSize))
			throw MalformedCalldataError("unrecognized prelude pattern");

		const uint8_t* pLen = p + s_LengthOffset;
		if (!memis0(pLen, s_LengthSize - sizeof(uint64_t)))
			throw MalformedCalldataError("prelude length field out of range");

		uint64_t nEncoded = ByteOrder::GetBE<uint64_t>(pLen + s_LengthSize - sizeof(uint64_t));
		if (nEncoded != nPayload)
			throw MalformedCalldataError("prelude declares " + std::to_string(nEncoded) + " payload bytes, found " + std::to_string(nPayload));

		Parts res;
		res.m_Prelude.assign(p, p + s_PreludeSize);
		res.m_Payload.assign(p + s_PreludeSize, p + x.n);
		return res;
	}

} // namespace wasmverify
