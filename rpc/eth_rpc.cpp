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

#include "eth_rpc.h"
#include "core/errors.h"
#include "utility/hex.h"
#include "utility/logger.h"

#include <boost/format.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace wasmverify::ethrpc
{
    namespace
    {
        bool decodeHex(const std::string& str, ByteBuffer& res)
        {
            auto s = RemoveHexPrefix(str);
            if (s.size() % 2)
                return false;

            bool ok = false;
            res = from_hex(s, &ok);
            return ok;
        }

        std::string getString(const json& obj, const char* name)
        {
            auto it = obj.find(name);
            if (it == obj.end() || !it->is_string())
                throw RpcError(std::string("transaction has no \"") + name + "\" field");
            return it->get<std::string>();
        }
    }

    std::string makeRequest(const std::string& method, const std::string& params)
    {
        return (boost::format(R"({"jsonrpc":"2.0","method":"%1%","params":[%2%],"id":1})") % method % params).str();
    }

    std::string makeGetTransactionByHashRequest(const TxHash& hash)
    {
        std::string params = (boost::format(R"("%1%")") % to_hex0x(hash.data(), hash.size())).str();
        return makeRequest("eth_getTransactionByHash", params);
    }

    boost::optional<Transaction> parseTransactionReply(const std::string& body)
    {
        json reply;
        try
        {
            reply = json::parse(body);
        }
        catch (const json::exception& ex)
        {
            throw RpcError(std::string("invalid JSON reply: ") + ex.what());
        }

        if (!reply.is_object())
            throw RpcError("JSON reply is not an object");

        auto itErr = reply.find("error");
        if (itErr != reply.end() && !itErr->is_null())
        {
            std::string message;
            if (itErr->is_object() && itErr->contains("message") && (*itErr)["message"].is_string())
                message = (*itErr)["message"].get<std::string>();
            else
                message = itErr->dump();

            throw RpcError("node error: " + message);
        }

        auto it = reply.find("result");
        if (it == reply.end())
            throw RpcError("JSON has no \"result\" value");

        if (it->is_null())
            return boost::none;

        if (!it->is_object())
            throw RpcError("\"result\" is not a transaction object");

        const json& result = *it;
        Transaction tx;

        ByteBuffer buf;
        if (!decodeHex(getString(result, "input"), buf))
            throw RpcError("transaction input is not hex");
        tx.input = std::move(buf);

        auto itHash = result.find("hash");
        if (itHash != result.end() && itHash->is_string())
        {
            if (!decodeHex(itHash->get<std::string>(), buf) || buf.size() != tx.hash.size())
                throw RpcError("transaction hash is malformed");
            std::copy(buf.begin(), buf.end(), tx.hash.begin());
        }

        auto itFrom = result.find("from");
        if (itFrom != result.end() && itFrom->is_string())
            tx.from = itFrom->get<std::string>();

        auto itTo = result.find("to");
        if (itTo != result.end() && itTo->is_string())
            tx.to = itTo->get<std::string>();

        LOG_DEBUG() << "Transaction input " << tx.input.size() << " bytes";
        return tx;
    }

    TxHash parseTxHash(const std::string& str)
    {
        ByteBuffer buf;
        TxHash res;
        if (!decodeHex(str, buf) || buf.size() != res.size())
            throw InvalidArgumentError("Invalid hash");

        std::copy(buf.begin(), buf.end(), res.begin());
        return res;
    }
}
