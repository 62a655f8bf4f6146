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

#include "http_rpc_client.h"
#include "core/errors.h"
#include "utility/hex.h"
#include "utility/logger.h"

#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <openssl/err.h>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace wasmverify
{
    namespace
    {
        using Request = http::request<http::string_body>;
        using Response = http::response<http::string_body>;

        // Runs resolve, connect, handshake, write and read on the io_context.
        // Resolve is cancelled by a timer, the other steps are bounded by the timeout of the underlying tcp_stream.
        template <typename Stream, typename Handshake>
        void exchange(net::io_context& ioc, Stream& stream, Handshake&& handshake,
            const HttpRpcClient::Url& url, std::chrono::milliseconds timeout, Request& req, Response& res)
        {
            tcp::resolver resolver(ioc);
            net::steady_timer resolveTimer(ioc);
            bool resolveTimedOut = false;
            beast::flat_buffer buffer;
            beast::error_code error;
            const char* step = "";
            auto& lowest = beast::get_lowest_layer(stream);

            auto onFail = [&](const char* what, beast::error_code ec)
            {
                step = what;
                error = ec;
            };

            resolveTimer.expires_after(timeout);
            resolveTimer.async_wait([&](beast::error_code ec)
            {
                if (ec) return; // cancelled, resolve completed first
                resolveTimedOut = true;
                resolver.cancel();
            });

            resolver.async_resolve(url.host, url.port, [&](beast::error_code ec, tcp::resolver::results_type results)
            {
                resolveTimer.cancel();
                if (resolveTimedOut) return onFail("resolve", beast::error::timeout);
                if (ec) return onFail("resolve", ec);

                lowest.expires_after(timeout);
                lowest.async_connect(results, [&](beast::error_code ec, tcp::endpoint)
                {
                    if (ec) return onFail("connect", ec);

                    lowest.expires_after(timeout);
                    handshake([&](beast::error_code ec)
                    {
                        if (ec) return onFail("handshake", ec);

                        lowest.expires_after(timeout);
                        http::async_write(stream, req, [&](beast::error_code ec, size_t)
                        {
                            if (ec) return onFail("write", ec);

                            lowest.expires_after(timeout);
                            http::async_read(stream, buffer, res, [&](beast::error_code ec, size_t)
                            {
                                if (ec) return onFail("read", ec);
                            });
                        });
                    });
                });
            });

            ioc.run();

            if (error)
                throw RpcError(std::string(step) + " failed: " + error.message());
        }
    }

    HttpRpcClient::HttpRpcClient(const RpcSettings& settings)
        : _settings(settings)
        , _url(parseUrl(settings.endpoint))
    {
    }

    HttpRpcClient::Url HttpRpcClient::parseUrl(const std::string& url)
    {
        Url res;
        std::string rest;

        static const std::string kHttp = "http://";
        static const std::string kHttps = "https://";

        if (url.compare(0, kHttps.size(), kHttps) == 0)
        {
            res.secure = true;
            rest = url.substr(kHttps.size());
        }
        else if (url.compare(0, kHttp.size(), kHttp) == 0)
        {
            rest = url.substr(kHttp.size());
        }
        else
        {
            throw InvalidArgumentError("Invalid endpoint url: " + url);
        }

        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        res.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

        auto colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            res.host = authority.substr(0, colon);
            res.port = authority.substr(colon + 1);
            if (res.port.empty() || res.port.find_first_not_of("0123456789") != std::string::npos)
                throw InvalidArgumentError("Invalid endpoint port: " + url);
        }
        else
        {
            res.host = authority;
            res.port = res.secure ? "443" : "80";
        }

        if (res.host.empty())
            throw InvalidArgumentError("Invalid endpoint host: " + url);

        return res;
    }

    boost::optional<Transaction> HttpRpcClient::getTransactionByHash(const TxHash& hash)
    {
        LOG_INFO() << "Fetching transaction " << to_hex0x(hash.data(), hash.size()) << " from " << _settings.endpoint;

        auto reply = post(ethrpc::makeGetTransactionByHashRequest(hash));
        return ethrpc::parseTransactionReply(reply);
    }

    std::string HttpRpcClient::post(const std::string& body)
    {
        LOG_DEBUG() << "sendRequest: " << body;

        Request req{ http::verb::post, _url.target, 11 };
        req.set(http::field::host, _url.host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();

        Response res;
        std::chrono::milliseconds timeout(_settings.timeoutMsec);
        net::io_context ioc;

        try
        {
            if (_url.secure)
            {
                ssl::context ctx(ssl::context::tls_client);
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);

                beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
                if (!SSL_set_tlsext_host_name(stream.native_handle(), _url.host.c_str()))
                {
                    beast::error_code ec{ static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
                    throw RpcError("cannot set TLS server name: " + ec.message());
                }
                stream.set_verify_callback(ssl::host_name_verification(_url.host));

                exchange(ioc, stream, [&stream](auto next)
                {
                    stream.async_handshake(ssl::stream_base::client, std::move(next));
                }, _url, timeout, req, res);

                // the node may drop the connection without close_notify, a failed shutdown is not an error
                beast::error_code ec;
                beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
            }
            else
            {
                beast::tcp_stream stream(ioc);

                exchange(ioc, stream, [](auto next)
                {
                    next(beast::error_code{});
                }, _url, timeout, req, res);

                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            }
        }
        catch (const boost::system::system_error& ex)
        {
            throw RpcError(std::string("transport failure: ") + ex.what());
        }

        LOG_DEBUG() << "strResponse = " << res.body();

        if (res.result() != http::status::ok)
        {
            throw RpcError("HTTP " + std::to_string(res.result_int()) + " from " + _settings.endpoint
                + (res.body().empty() ? std::string() : ": " + res.body().substr(0, 256)));
        }

        return res.body();
    }
}
