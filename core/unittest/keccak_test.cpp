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
#include "utility/hex.h"
#include "core/keccak.h"
#include "core/errors.h"
#include <algorithm>

WASMVERIFY_TEST_INIT

using namespace wasmverify;

namespace
{
	Keccak256::Value HashOf(const Blob& x)
	{
		Keccak256 hp;
		hp << x;

		Keccak256::Value hv;
		hp >> hv;
		return hv;
	}

	std::string HashHex(const std::string& s)
	{
		auto hv = HashOf(Blob(s.data(), static_cast<uint32_t>(s.size())));
		return to_hex(hv.data(), hv.size());
	}

	void TestVectors()
	{
		WASMVERIFY_CHECK(HashHex("") == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
		WASMVERIFY_CHECK(HashHex("abc") == "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
	}

	void TestPartialWrites()
	{
		// spans several 136-byte blocks
		ByteBuffer buf(1000);
		for (size_t i = 0; i < buf.size(); i++)
			buf[i] = static_cast<uint8_t>(i * 7 + 3);

		auto hvRef = HashOf(buf);

		for (uint32_t nChunk : { 1u, 3u, 8u, 13u, 136u, 137u })
		{
			Keccak256 hp;
			for (uint32_t i = 0; i < buf.size(); i += nChunk)
				hp.Write(&buf[i], std::min<uint32_t>(nChunk, static_cast<uint32_t>(buf.size()) - i));

			Keccak256::Value hv;
			hp >> hv;
			WASMVERIFY_CHECK(hv == hvRef);
		}
	}

	void TestFraming()
	{
		Keccak256 hp1, hp2;
		hp1.WriteBE(3);
		hp1 << std::string("abc");

		uint8_t pLen[8] = { 0, 0, 0, 0, 0, 0, 0, 3 };
		hp2.Write(pLen, sizeof(pLen));
		hp2.Write("abc", 3);

		Keccak256::Value hv1, hv2;
		hp1 >> hv1;
		hp2 >> hv2;
		WASMVERIFY_CHECK(hv1 == hv2);
	}

	void TestErrors()
	{
		IOError e("disk gone");
		WASMVERIFY_CHECK(e.code == ErrorCode::IOError);
		WASMVERIFY_CHECK(e.stage == Stage::None);

		e.set_stage(Stage::ResolveFiles);
		e.set_stage(Stage::Compare); // the first tag sticks
		WASMVERIFY_CHECK(e.stage == Stage::ResolveFiles);
		WASMVERIFY_CHECK(format_error(e) == "ResolveFiles: IOError: disk gone");
	}
}

int main()
{
	TestVectors();
	TestPartialWrites();
	TestFraming();
	TestErrors();

	return WASMVERIFY_CHECK_RESULT;
}
