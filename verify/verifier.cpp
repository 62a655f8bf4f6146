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

#include "verifier.h"
#include "core/errors.h"
#include "deploy/calldata.h"
#include "project/source_files.h"
#include "wasm/compressor.h"
#include "wasm/wasm_module.h"
#include "utility/hex.h"
#include "utility/logger.h"

namespace wasmverify
{
    namespace
    {
        template <typename Func>
        auto runStage(Stage stage, Func&& func) -> decltype(func())
        {
            try
            {
                return func();
            }
            catch (Exception& e)
            {
                e.set_stage(stage);
                throw;
            }
        }

        std::string hashStr(const ProjectHash& hash)
        {
            return to_hex0x(hash.data(), hash.size());
        }

        std::string payloadSummary(size_t size, const ProjectHash& hash)
        {
            return std::to_string(size) + " bytes with project hash " + hashStr(hash);
        }
    }

    Verifier::Verifier(ICompiler& compiler, IRpcClient& rpc, VerifyConfig config)
        : _compiler(compiler)
        , _rpc(rpc)
        , _config(std::move(config))
    {
    }

    VerificationOutcome Verifier::run()
    {
        auto txHash = ethrpc::parseTxHash(_config.deploymentTx);

        _state = State::FetchRemote;
        auto remote = runStage(Stage::FetchRemote, [&] { return fetchRemote(txHash); });

        _state = State::RebuildLocal;
        auto local = rebuildLocal();

        _state = State::Compare;
        auto outcome = runStage(Stage::Compare, [&] { return compare(local, remote); });

        _state = State::Done;
        if (outcome.matched)
            LOG_INFO() << outcome;
        else
            LOG_WARNING() << outcome;

        return outcome;
    }

    ByteBuffer Verifier::fetchRemote(const TxHash& hash)
    {
        auto tx = _rpc.getTransactionByHash(hash);
        if (!tx)
            throw NotFoundError("No transaction found with hash " + to_hex0x(hash.data(), hash.size()));

        LOG_INFO() << "Deployment transaction input: " << tx->input.size() << " bytes";
        return std::move(tx->input);
    }

    Verifier::LocalBuild Verifier::rebuildLocal()
    {
        LocalBuild res;
        res.config = _config.buildConfig;

        LOG_INFO() << "Resolving source files in " << _config.projectRoot.string();
        auto files = runStage(Stage::ResolveFiles, [&]
        {
            return SourceFileResolver::Resolve(_config.projectRoot, _config.sourceFiles);
        });
        res.fileCount = files.size();

        res.projectHash = runStage(Stage::HashProject, [&]
        {
            res.config.m_ToolchainVersion = _compiler.getToolchainVersion(res.config.m_Channel);
            return HashProject(files, res.config);
        });

        LOG_INFO() << "Compiling project";
        res.module = runStage(Stage::Compile, [&]
        {
            auto raw = _compiler.compile(res.config, _config.projectRoot);
            return Wasm::EmbedProjectHash(raw, res.projectHash);
        });

        res.payload = runStage(Stage::Compress, [&]
        {
            return PayloadCompressor::Compress(res.module, res.projectHash);
        });

        res.calldata = runStage(Stage::ConstructCalldata, [&]
        {
            return Calldata::Construct(res.payload);
        });

        LOG_INFO() << "Local calldata " << res.calldata.size() << " bytes, project hash " << hashStr(res.projectHash);
        return res;
    }

    VerificationOutcome Verifier::compare(const LocalBuild& local, const ByteBuffer& remote)
    {
        if (local.calldata == remote)
            return VerificationOutcome::makeMatched(local.payload.size(), local.projectHash);

        auto localParts = Calldata::Extract(local.calldata);

        Calldata::Parts remoteParts;
        try
        {
            remoteParts = Calldata::Extract(remote);
        }
        catch (const MalformedCalldataError& e)
        {
            // nothing recognizable on the remote side, the divergence starts in the prelude
            auto outcome = VerificationOutcome::makeMismatched(MismatchLocation::Prelude,
                to_hex(localParts.m_Prelude),
                std::string("unrecognized calldata (") + e.what() + ")");
            outcome.localPayloadSize = localParts.m_Payload.size();
            outcome.remotePayloadSize = remote.size();
            outcome.localProjectHash = local.projectHash;
            return outcome;
        }

        VerificationOutcome outcome;
        if (localParts.m_Prelude != remoteParts.m_Prelude)
        {
            outcome = VerificationOutcome::makeMismatched(MismatchLocation::Prelude,
                to_hex(localParts.m_Prelude),
                to_hex(remoteParts.m_Prelude));
        }
        else
        {
            std::string actual;
            boost::optional<ProjectHash> remoteHash;
            try
            {
                // the header hash is reported even when the body doesn't inflate
                auto hdr = PayloadCompressor::ReadHeader(remoteParts.m_Payload);
                remoteHash = hdr.m_ProjectHash;
                actual = payloadSummary(remoteParts.m_Payload.size(), hdr.m_ProjectHash);

                auto module = PayloadCompressor::Decompress(remoteParts.m_Payload);
                actual += ", module " + std::to_string(module.size()) + " bytes";
            }
            catch (const CompressionError& e)
            {
                if (actual.empty())
                    actual = std::to_string(remoteParts.m_Payload.size()) + " bytes";
                actual += std::string(", not a valid compressed module (") + e.what() + ")";
            }

            outcome = VerificationOutcome::makeMismatched(MismatchLocation::Body,
                payloadSummary(localParts.m_Payload.size(), local.projectHash) + ", module " + std::to_string(local.module.size()) + " bytes",
                actual);
            outcome.remoteProjectHash = remoteHash;
        }

        outcome.localPayloadSize = localParts.m_Payload.size();
        outcome.remotePayloadSize = remoteParts.m_Payload.size();
        outcome.localProjectHash = local.projectHash;
        return outcome;
    }
}
