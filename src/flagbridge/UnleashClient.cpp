//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: src/flagbridge/UnleashClient.cpp
// Purpose: Unleash Admin API client using Boost.Beast coroutines over HTTP/HTTPS
//==========================================================================================================

//==========================================================================================================
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "flagbridge/UnleashClient.hpp"
#include "flagbridge/async/FutureAwaitable.h"
#include "flagbridge/async/Task.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/version.h"
#include "logging/Logger.h"

namespace flagbridge {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string basePath;  // without trailing slash; "" for the root
    std::string serverName;
};

UrlParts parseBaseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }

    std::size_t slash = url.find('/', pos);
    std::string hostPort = slash == std::string::npos ? url.substr(pos) : url.substr(pos, slash - pos);
    parts.basePath = slash == std::string::npos ? std::string() : url.substr(slash);
    while (!parts.basePath.empty() && parts.basePath.back() == '/') {
        parts.basePath.pop_back();
    }

    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    parts.serverName = parts.host;
    return parts;
}

struct HttpResult {
    int status{0};
    std::string reason;
    std::string body;
};

JSONValue str(const std::string& s) { return JSONValue(s); }

// Builds a RemoteApiError from an Unleash error document ({name, message, details:[{message}]}).
errors::RemoteApiError remoteErrorFromResponse(const HttpResult& res) {
    std::optional<std::string> code;
    std::string message;
    try {
        JSONValue doc = ParseJson(res.body);
        code = GetStringField(doc, "name");
        if (auto m = GetStringField(doc, "message")) {
            message = m.value();
        } else if (const JSONValue* details = doc.find("details"); details && details->isArray()) {
            const auto& arr = std::get<JSONValue::Array>(details->value);
            if (!arr.empty() && arr.front()) {
                message = GetStringField(*arr.front(), "message").value_or("");
            }
        }
    } catch (const JsonParseError&) {
        message = res.body.substr(0, 200);
    }
    if (message.empty()) {
        message = res.reason.empty() ? std::string("Request failed") : res.reason;
    }
    return errors::RemoteApiError(message, res.status, code);
}

} // namespace

class UnleashClient::Impl {
public:
    UnleashClient::Options opts;
    UrlParts url;
    std::shared_ptr<Logger> logger;

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx;  // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::string userAgent;

    Impl(const UnleashClient::Options& o, std::shared_ptr<Logger> log)
        : opts(o), url(parseBaseUrl(o.baseUrl)), logger(log ? std::move(log) : MakeNullLogger()) {
        userAgent = "flagbridge/" + getVersionString();
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            if (!opts.caFile.empty() || !opts.caPath.empty()) {
                if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
            } else {
                try {
                    sslCtx->set_default_verify_paths();
                } catch (const std::exception& e) {
                    FLAGBRIDGE_LOG_WARN(*logger, "HTTPS: set_default_verify_paths failed: {}", e.what());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                FLAGBRIDGE_LOG_ERROR(*logger, "Unleash client io thread stopped: {}", e.what());
            }
        });
    }

    ~Impl() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    http::request<http::string_body> buildRequest(http::verb verb, const std::string& target,
                                                  const std::optional<std::string>& body) const {
        http::request<http::string_body> req{verb, url.basePath + target, 11};
        req.set(http::field::host, url.serverName);
        req.set(http::field::authorization, opts.accessToken);
        req.set(http::field::accept, "application/json");
        req.set(http::field::user_agent, userAgent);
        req.set(http::field::connection, "close");
        if (body.has_value()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body.value();
        }
        req.prepare_payload();
        return req;
    }

    template <typename Stream>
    net::awaitable<HttpResult> coExchange(Stream& stream, http::request<http::string_body>& req) {
        boost::beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        HttpResult out;
        out.status = static_cast<int>(res.result_int());
        out.reason = std::string(res.reason());
        out.body = std::move(res.body());
        co_return out;
    }

    // Coroutine: one request per connection; throws boost::system::system_error on I/O failure.
    net::awaitable<HttpResult> coRequest(http::verb verb, std::string target, std::optional<std::string> body) {
        auto req = buildRequest(verb, target, body);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);

        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.serverName.c_str())) {
                FLAGBRIDGE_LOG_WARN(*logger, "HTTPS: failed to set SNI hostname {}", url.serverName);
            }
            (void)::SSL_set1_host(stream.native_handle(), url.serverName.c_str());
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            HttpResult res = co_await coExchange(stream, req);
            boost::system::error_code ec;
            stream.shutdown(ec);
            co_return res;
        }

        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);
        HttpResult res = co_await coExchange(stream, req);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    //==========================================================================================================
    // Sends one request and resolves to the parsed JSON body (null for an empty body).
    // Args:
    //   verb: HTTP method.
    //   target: Path relative to the base URL, starting with "/api/admin".
    //   body: Optional JSON request body.
    // Returns:
    //   Future carrying the document or errors::RemoteApiError.
    //==========================================================================================================
    std::future<JSONValue> request(http::verb verb, const std::string& target,
                                   std::optional<std::string> body = std::nullopt) {
        auto promise = std::make_shared<std::promise<JSONValue>>();
        auto fut = promise->get_future();
        FLAGBRIDGE_LOG_DEBUG(*logger, "Unleash {} {}", std::string(http::to_string(verb)), target);

        net::co_spawn(ioc, coRequest(verb, target, std::move(body)),
            [promise, target, log = logger, host = url.host](std::exception_ptr eptr, HttpResult res) {
                if (eptr) {
                    std::string reason;
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const boost::system::system_error& e) {
                        reason = e.code().message();
                    } catch (const std::exception& e) {
                        reason = e.what();
                    }
                    FLAGBRIDGE_LOG_DEBUG(*log, "Unleash request {} failed: {}", target, reason);
                    promise->set_exception(std::make_exception_ptr(
                        errors::RemoteApiError("Failed to reach Unleash at " + host + ": " + reason)));
                    return;
                }
                if (res.status < 200 || res.status >= 300) {
                    promise->set_exception(std::make_exception_ptr(remoteErrorFromResponse(res)));
                    return;
                }
                if (res.body.empty()) {
                    promise->set_value(JSONValue{});
                    return;
                }
                try {
                    promise->set_value(ParseJson(res.body));
                } catch (const JsonParseError& e) {
                    promise->set_exception(std::make_exception_ptr(
                        errors::RemoteApiError(std::string("Invalid JSON in Unleash response: ") + e.what(), res.status)));
                }
            });
        return fut;
    }
};

namespace {
std::string enc(const std::string& s) { return resources::percentEncode(s); }

async::Task<JSONValue> extractCollection(std::future<JSONValue> raw, std::string key, resources::QueryOptions options) {
    JSONValue doc = co_await async::makeFutureAwaitable(std::move(raw));
    const JSONValue* items = doc.find(key);
    if (!items || !items->isArray()) {
        throw errors::RemoteApiError("Unexpected Unleash response: missing '" + key + "' array");
    }
    co_return JSONValue{resources::applyQueryOptions(std::get<JSONValue::Array>(items->value), options)};
}

// Toggle endpoints answer without a body; the updated feature is fetched afterwards.
async::Task<JSONValue> toggleThenFetch(std::future<JSONValue> toggled, std::function<std::future<JSONValue>()> refetch) {
    co_await async::makeFutureAwaitable(std::move(toggled));
    JSONValue feature = co_await async::makeFutureAwaitable(refetch());
    co_return feature;
}

std::future<JSONValue> ready(JSONValue value) {
    std::promise<JSONValue> p;
    p.set_value(std::move(value));
    return p.get_future();
}
} // namespace

UnleashClient::UnleashClient(const Options& opts, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(opts, std::move(logger))) {}

UnleashClient::~UnleashClient() = default;

std::string UnleashClient::FeaturePath(const std::string& projectId, const std::string& featureName) {
    return "/api/admin/projects/" + enc(projectId) + "/features/" + enc(featureName);
}

std::future<JSONValue> UnleashClient::FetchProjects(const resources::QueryOptions& options) {
    return extractCollection(pImpl->request(http::verb::get, "/api/admin/projects"), "projects", options).toFuture();
}

std::future<JSONValue> UnleashClient::FetchFeatures(const std::string& projectId,
                                                    const resources::QueryOptions& options) {
    auto raw = pImpl->request(http::verb::get, "/api/admin/projects/" + enc(projectId) + "/features");
    return extractCollection(std::move(raw), "features", options).toFuture();
}

std::future<JSONValue> UnleashClient::FetchFeature(const std::string& projectId, const std::string& featureName) {
    return pImpl->request(http::verb::get, FeaturePath(projectId, featureName));
}

std::future<JSONValue> UnleashClient::CreateFeature(const std::string& projectId, const FeatureCreateRequest& request) {
    JSONValue::Object body;
    body["name"] = std::make_shared<JSONValue>(str(request.name));
    body["type"] = std::make_shared<JSONValue>(str(request.type));
    body["description"] = std::make_shared<JSONValue>(str(request.description));
    if (request.impressionData.has_value()) {
        body["impressionData"] = std::make_shared<JSONValue>(request.impressionData.value());
    }

    if (pImpl->opts.dryRun) {
        FLAGBRIDGE_LOG_INFO(*pImpl->logger, "[dry-run] Would create feature flag {} in project {}", request.name, projectId);
        body["project"] = std::make_shared<JSONValue>(str(projectId));
        body["enabled"] = std::make_shared<JSONValue>(false);
        body["stale"] = std::make_shared<JSONValue>(false);
        body["environments"] = std::make_shared<JSONValue>(JSONValue::Array{});
        body["dryRun"] = std::make_shared<JSONValue>(true);
        return ready(JSONValue{body});
    }
    return pImpl->request(http::verb::post, "/api/admin/projects/" + enc(projectId) + "/features",
                          SerializeJson(JSONValue{body}));
}

std::future<JSONValue> UnleashClient::ToggleFeatureEnvironment(const std::string& projectId,
                                                               const std::string& featureName,
                                                               const std::string& environment,
                                                               bool enabled) {
    if (pImpl->opts.dryRun) {
        FLAGBRIDGE_LOG_INFO(*pImpl->logger, "[dry-run] Would {} {} in {} (project {})",
                            enabled ? "enable" : "disable", featureName, environment, projectId);
        JSONValue::Object env;
        env["name"] = std::make_shared<JSONValue>(str(environment));
        env["environment"] = std::make_shared<JSONValue>(str(environment));
        env["enabled"] = std::make_shared<JSONValue>(enabled);
        env["strategies"] = std::make_shared<JSONValue>(JSONValue::Array{});
        JSONValue::Object feature;
        feature["name"] = std::make_shared<JSONValue>(str(featureName));
        feature["project"] = std::make_shared<JSONValue>(str(projectId));
        feature["environments"] = std::make_shared<JSONValue>(JSONValue::Array{std::make_shared<JSONValue>(env)});
        feature["dryRun"] = std::make_shared<JSONValue>(true);
        return ready(JSONValue{feature});
    }

    const std::string target = FeaturePath(projectId, featureName) + "/environments/" + enc(environment) +
                               (enabled ? "/on" : "/off");
    auto toggled = pImpl->request(http::verb::post, target);
    Impl* impl = pImpl.get();
    return toggleThenFetch(std::move(toggled), [impl, projectId, featureName]() {
               return impl->request(http::verb::get, FeaturePath(projectId, featureName));
           }).toFuture();
}

} // namespace flagbridge
