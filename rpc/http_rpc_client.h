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

#include "eth_rpc.h"

namespace wasmverify
{
    struct RpcSettings
    {
        std::string endpoint = "https://sepolia-rollup.arbitrum.io/rpc";
        uint32_t timeoutMsec = 30000; // per network operation
    };

    /// Blocking JSON-RPC client over HTTP or HTTPS
    class HttpRpcClient : public IRpcClient
    {
    public:
        struct Url
        {
            bool secure = false;
            std::string host;
            std::string port;
            std::string target;
        };

        /// throws InvalidArgumentError if the endpoint is not an http(s) url
        explicit HttpRpcClient(const RpcSettings& settings);

        boost::optional<Transaction> getTransactionByHash(const TxHash& hash) override;

        static Url parseUrl(const std::string& url);

    private:
        std::string post(const std::string& body);

        RpcSettings _settings;
        Url _url;
    };
}
