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
#include "verify/verifier.h"
#include "deploy/calldata.h"
#include "wasm/compressor.h"
#include "wasm/wasm_module.h"
#include "core/errors.h"

WASMVERIFY_TEST_INIT

using namespace wasmverify;

namespace
{
    const char* kTxHash = "0x6b1a0b5f8c3c1d5d2e0b3c9f4a7e8d1c2b3a4f5e6d7c8b9a0f1e2d3c4b5a6978";

    // header, one "() -> ()" type, a data section with the given body, a "name" custom section
    ByteBuffer makeModule(const ByteBuffer& data)
    {
        ByteBuffer res{
            0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00,
            0x01, 0x04, 0x01, 0x60, 0x00, 0x00,
            0x0b
        };
        Wasm::WriteLeb(res, static_cast<uint32_t>(data.size()));
        res.insert(res.end(), data.begin(), data.end());

        ByteBuffer custom{ 0x00, 0x07, 0x04, 'n', 'a', 'm', 'e', 0x01, 0x02 };
        res.insert(res.end(), custom.begin(), custom.end());
        return res;
    }

    struct FakeCompiler : public ICompiler
    {
        WasmModule module = makeModule(ByteBuffer(32, 'A'));
        std::string version = "cargo 1.80.0 (376290515 2024-07-16)";
        int compileCount = 0;
        bool fail = false;

        std::string getToolchainVersion(Channel) override
        {
            return version;
        }

        WasmModule compile(const BuildConfig&, const boost::filesystem::path&) override
        {
            ++compileCount;
            if (fail)
                throw BuildError("compilation failed", "error[E0425]: cannot find value `x` in this scope");
            return module;
        }
    };

    struct FakeRpc : public IRpcClient
    {
        boost::optional<Transaction> tx;
        bool fail = false;
        int callCount = 0;

        boost::optional<Transaction> getTransactionByHash(const TxHash&) override
        {
            ++callCount;
            if (fail)
                throw RpcError("connect failed: Connection refused");
            return tx;
        }

        void setInput(const ByteBuffer& input)
        {
            tx = Transaction();
            tx->input = input;
        }
    };

    struct Fixture
    {
        helpers::TempDir dir{ "verifier" };
        FakeCompiler compiler;
        FakeRpc rpc;
        VerifyConfig config;

        Fixture()
        {
            dir.write("Cargo.toml", "[package]\nname = \"noop\"\nversion = \"0.1.0\"\n");
            dir.write("src/lib.rs", "#[no_mangle]\npub extern \"C\" fn user_entrypoint(_len: usize) -> usize { 0 }\n");

            config.projectRoot = dir.path();
            config.deploymentTx = kTxHash;
        }

        Verifier::LocalBuild build()
        {
            Verifier v(compiler, rpc, config);
            return v.rebuildLocal();
        }

        VerificationOutcome run()
        {
            Verifier v(compiler, rpc, config);
            return v.run();
        }
    };

    template <typename Func>
    void checkStage(Func&& func, ErrorCode code, Stage stage)
    {
        try
        {
            func();
            WASMVERIFY_CHECK(!"exception expected");
        }
        catch (const Exception& e)
        {
            WASMVERIFY_CHECK(e.code == code);
            WASMVERIFY_CHECK(e.stage == stage);
        }
    }

    void testLocalPipeline()
    {
        Fixture f;
        auto local = f.build();

        WASMVERIFY_CHECK(local.fileCount == 2);
        WASMVERIFY_CHECK(local.config.m_ToolchainVersion == f.compiler.version);

        // the embedded hash replaces the custom sections
        Wasm::Module m;
        m.Parse(local.module);
        WASMVERIFY_CHECK(m.FindCustomSection("name") == nullptr);
        const auto* pSection = m.FindCustomSection(Wasm::s_szProjectHashSection);
        WASMVERIFY_CHECK(pSection && pSection->m_Body == ByteBuffer(local.projectHash.begin(), local.projectHash.end()));

        WASMVERIFY_CHECK(local.payload == PayloadCompressor::Compress(local.module, local.projectHash));

        auto expected = Calldata::BuildPrelude(local.payload.size());
        expected.insert(expected.end(), local.payload.begin(), local.payload.end());
        WASMVERIFY_CHECK(local.calldata == expected);

        auto parts = Calldata::Extract(local.calldata);
        WASMVERIFY_CHECK(parts.m_Prelude == Calldata::BuildPrelude(local.payload.size()));
        WASMVERIFY_CHECK(parts.m_Payload == local.payload);

        // repeated runs agree
        auto again = f.build();
        WASMVERIFY_CHECK(again.projectHash == local.projectHash);
        WASMVERIFY_CHECK(again.calldata == local.calldata);

        // toolchain identity is part of the hash
        f.compiler.version = "cargo 1.81.0 (2dbb1af80 2024-08-20)";
        WASMVERIFY_CHECK(f.build().projectHash != local.projectHash);
    }

    void testMatched()
    {
        Fixture f;
        f.rpc.setInput(f.build().calldata);

        Verifier v(f.compiler, f.rpc, f.config);
        auto outcome = v.run();
        WASMVERIFY_CHECK(outcome.matched);
        WASMVERIFY_CHECK(v.state() == Verifier::State::Done);
        WASMVERIFY_CHECK(f.rpc.callCount == 1);
    }

    void testBodyMismatch()
    {
        Fixture f;
        auto local = f.build();

        // same size, the remote embeds another project hash
        auto remote = local.calldata;
        remote[Calldata::s_PreludeSize + 4] ^= 0xff;
        f.rpc.setInput(remote);

        auto outcome = f.run();
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Body);
        WASMVERIFY_CHECK(outcome.remoteProjectHash.is_initialized());
        WASMVERIFY_CHECK(!outcome.isToolchainDrift());
        WASMVERIFY_CHECK(outcome.localPayloadSize == outcome.remotePayloadSize);

        // corrupted stream, header still readable
        remote = local.calldata;
        remote.back() ^= 0xff;
        f.rpc.setInput(remote);
        outcome = f.run();
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Body);
    }

    void testToolchainDrift()
    {
        Fixture f;
        auto local = f.build();

        // same sources and config, different module bytes of the same compressed size
        ByteBuffer remote;
        for (uint8_t c = 'B'; c <= 'Z'; c++)
        {
            auto other = Wasm::EmbedProjectHash(makeModule(ByteBuffer(32, c)), local.projectHash);
            auto calldata = Calldata::Construct(PayloadCompressor::Compress(other, local.projectHash));
            if (calldata.size() == local.calldata.size())
            {
                remote = std::move(calldata);
                break;
            }
        }
        WASMVERIFY_CHECK(!remote.empty());
        WASMVERIFY_CHECK(remote != local.calldata);

        auto outcome = Verifier::compare(local, remote);
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Body);
        WASMVERIFY_CHECK(outcome.isToolchainDrift());
        WASMVERIFY_CHECK(outcome.localPayloadSize == outcome.remotePayloadSize);

        // the same through the whole pipeline
        f.rpc.setInput(remote);
        outcome = f.run();
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Body);
        WASMVERIFY_CHECK(outcome.isToolchainDrift());
    }

    void testOversizedRemoteHeader()
    {
        Fixture f;
        auto local = f.build();

        // remote payload claims a 4 GiB module, comparison still completes
        auto remote = local.calldata;
        for (size_t i = 36; i < PayloadCompressor::s_HeaderSize; i++)
            remote[Calldata::s_PreludeSize + i] = 0xFF;
        f.rpc.setInput(remote);

        auto outcome = f.run();
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Body);
        WASMVERIFY_CHECK(outcome.remoteProjectHash && *outcome.remoteProjectHash == local.projectHash);
        WASMVERIFY_CHECK(outcome.actual.find("not a valid compressed module") != std::string::npos);
    }

    void testPreludeMismatch()
    {
        Fixture f;
        auto local = f.build();

        // one more payload byte changes the length field
        auto payload = local.payload;
        payload.push_back(0);
        f.rpc.setInput(Calldata::Construct(payload));

        auto outcome = f.run();
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Prelude);
        WASMVERIFY_CHECK(outcome.localPayloadSize == local.payload.size());
        WASMVERIFY_CHECK(outcome.remotePayloadSize == local.payload.size() + 1);
        WASMVERIFY_CHECK(outcome.expected != outcome.actual);

        // not a deployment at all
        f.rpc.setInput(ByteBuffer{ 0xa9, 0x05, 0x9c, 0xbb });
        outcome = f.run();
        WASMVERIFY_CHECK(!outcome.matched);
        WASMVERIFY_CHECK(outcome.location == MismatchLocation::Prelude);
    }

    void testErrors()
    {
        {
            Fixture f;
            checkStage([&] { f.run(); }, ErrorCode::NotFound, Stage::FetchRemote);
            WASMVERIFY_CHECK(f.compiler.compileCount == 0);
        }
        {
            Fixture f;
            f.rpc.fail = true;
            checkStage([&] { f.run(); }, ErrorCode::RpcError, Stage::FetchRemote);
        }
        {
            Fixture f;
            f.config.deploymentTx = "0x1234";
            checkStage([&] { f.run(); }, ErrorCode::InvalidArgument, Stage::None);
            WASMVERIFY_CHECK(f.rpc.callCount == 0);
        }
        {
            Fixture f;
            f.rpc.setInput(ByteBuffer());
            f.compiler.fail = true;
            try
            {
                f.run();
                WASMVERIFY_CHECK(!"exception expected");
            }
            catch (const BuildError& e)
            {
                WASMVERIFY_CHECK(e.stage == Stage::Compile);
                WASMVERIFY_CHECK(e.diagnostics.find("E0425") != std::string::npos);
            }
        }
        {
            Fixture f;
            f.rpc.setInput(ByteBuffer());
            f.compiler.module = ByteBuffer{ 'n', 'o', 't', ' ', 'w', 'a', 's', 'm' };
            checkStage([&] { f.run(); }, ErrorCode::BuildError, Stage::Compile);
        }
        {
            Fixture f;
            f.rpc.setInput(ByteBuffer());
            f.config.sourceFiles = { "src/missing.rs" };
            checkStage([&] { f.run(); }, ErrorCode::IOError, Stage::ResolveFiles);
        }
        {
            Fixture f;
            f.rpc.setInput(ByteBuffer());

            ByteBuffer noise(64 * 1024);
            uint32_t x = 1;
            for (auto& b : noise)
            {
                x = x * 1103515245 + 12345;
                b = static_cast<uint8_t>(x >> 16);
            }
            f.compiler.module = makeModule(noise);
            checkStage([&] { f.run(); }, ErrorCode::CompressionError, Stage::Compress);
        }
    }
}

int main()
{
    auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_WARNING);

    testLocalPipeline();
    testMatched();
    testBodyMismatch();
    testToolchainDrift();
    testOversizedRemoteHeader();
    testPreludeMismatch();
    testErrors();

    return WASMVERIFY_CHECK_RESULT;
}
