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

#define PreludeOpcodes(macro) \
	macro(0x39, codecopy) \
	macro(0x60, push1) \
	macro(0x7f, push32) \
	macro(0x80, dup1) \
	macro(0xf3, Return) \

namespace wasmverify {

	struct Opcode
	{
#define THE_MACRO(code, name) static constexpr uint8_t name = code;
		PreludeOpcodes(THE_MACRO)
#undef THE_MACRO
	};

	// Contract-creation payload: a fixed init-code prelude followed by the compressed module.
	// The prelude copies everything after itself into memory and returns it as the runtime code:
	//
	//	push32 <payload length>
	//	dup1
	//	push1 <prelude size>
	//	push1 0
	//	codecopy
	//	push1 0
	//	return
	//	<version byte>
	struct Calldata
	{
		static constexpr uint32_t s_PreludeSize = 43;
		static constexpr uint8_t s_Version = 0;

		// the only length-dependent part
		static constexpr uint32_t s_LengthOffset = 1;
		static constexpr uint32_t s_LengthSize = 32;

		static ByteBuffer BuildPrelude(uint64_t nPayload);
		static ByteBuffer Construct(const Blob& payload);

		struct Parts
		{
			ByteBuffer m_Prelude;
			ByteBuffer m_Payload;
		};

		// Splits the blob, throws MalformedCalldataError if it's too short, the opcode pattern differs,
		// or the encoded length disagrees with the actual payload size.
		static Parts Extract(const Blob&);
	};

} // namespace wasmverify
