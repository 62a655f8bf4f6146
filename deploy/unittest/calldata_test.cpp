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

#include "utility/test_helpers.h"
#include "utility/logger.h"
#include "utility/hex.h"
#include "deploy/calldata.h"
#include "core/errors.h"

WASMVERIFY_TEST_INIT

using namespace wasmverify;

namespace
{
	void TestPreludeLayout()
	{
		auto prelude = Calldata::BuildPrelude(0x1234);
		WASMVERIFY_CHECK(prelude.size() == Calldata::s_PreludeSize);
		WASMVERIFY_CHECK(to_hex(prelude) ==
			"7f"
			"0000000000000000000000000000000000000000000000000000000000001234"
			"80602b6000396000f300");

		// only the length field depends on the payload size
		auto prelude2 = Calldata::BuildPrelude(7);
		WASMVERIFY_CHECK(prelude2.size() == prelude.size());
		WASMVERIFY_CHECK(!memcmp(prelude.data() + 33, prelude2.data() + 33, 10));
		WASMVERIFY_CHECK(prelude != prelude2);
	}

	void TestRoundTrip()
	{
		for (uint32_t n : { 0u, 1u, 40u, 1000u })
		{
			ByteBuffer payload(n);
			for (uint32_t i = 0; i < n; i++)
				payload[i] = static_cast<uint8_t>(i * 13);

			auto calldata = Calldata::Construct(payload);
			WASMVERIFY_CHECK(calldata.size() == Calldata::s_PreludeSize + n);

			Calldata::Parts parts;
			WASMVERIFY_CHECK_NO_THROW(parts = Calldata::Extract(calldata));
			WASMVERIFY_CHECK(parts.m_Prelude == Calldata::BuildPrelude(n));
			WASMVERIFY_CHECK(parts.m_Payload == payload);
		}
	}

	void TestBoundary()
	{
		auto calldata = Calldata::Construct(ByteBuffer());

		for (uint32_t n = 0; n < Calldata::s_PreludeSize; n++)
		{
			ByteBuffer cut(calldata.begin(), calldata.begin() + n);
			WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(cut), MalformedCalldataError);
		}

		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(Blob()), MalformedCalldataError);
	}

	void TestBadPattern()
	{
		ByteBuffer payload(16, 0x5a);
		auto calldata = Calldata::Construct(payload);

		// opcode byte
		auto bad = calldata;
		bad[33] = 0x81;
		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(bad), MalformedCalldataError);

		// version byte
		bad = calldata;
		bad[42] = 1;
		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(bad), MalformedCalldataError);

		// length field beyond 64 bits
		bad = calldata;
		bad[1] = 1;
		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(bad), MalformedCalldataError);

		// trailing garbage makes the declared length wrong
		bad = calldata;
		bad.push_back(0);
		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(bad), MalformedCalldataError);

		// arbitrary non-prelude blob
		ByteBuffer junk(100, 0xff);
		WASMVERIFY_CHECK_THROW_AS(Calldata::Extract(junk), MalformedCalldataError);
	}
}

int main()
{
	auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

	TestPreludeLayout();
	TestRoundTrip();
	TestBoundary();
	TestBadPattern();

	return WASMVERIFY_CHECK_RESULT;
}
