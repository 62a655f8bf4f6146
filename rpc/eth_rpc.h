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

#include "utility/common.h"
#include <boost/optional.hpp>

namespace wasmverify
{
    typedef Hash32 TxHash;

    struct Transaction
    {
        TxHash hash = {};
        std::string from;
        boost::optional<std::string> to; // none for contract creation
        ByteBuffer input;
    };

    /// Chain node access. Implementations are read-only.
    struct IRpcClient
    {
        virtual ~IRpcClient() = default;

        /// none if the node doesn't know the transaction, throws RpcError on transport or protocol failure
        virtual boost::optional<Transaction> getTransactionByHash(const TxHash& hash) = 0;
    };

    namespace ethrpc
    {
        /// JSON-RPC 2.0 request body, params is the already formatted array contents
        std::string makeRequest(const std::string& method, const std::string& params);

        std::string makeGetTransactionByHashRequest(const TxHash& hash);

        /// Parses an eth_getTransactionByHash reply. "result": null yields none,
        /// an "error" member or malformed content throws RpcError
        boost::optional<Transaction> parseTransactionReply(const std::string& body);

        /// 0x-prefixed (or bare) hex of exactly 32 bytes, throws InvalidArgumentError("Invalid hash")
        TxHash parseTxHash(const std::string& str);
    }
}
