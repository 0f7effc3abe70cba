//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: UnleashClient.hpp
// Purpose: Coroutine-based Unleash Admin API client using Boost.Beast (HTTPS with peer verification)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "flagbridge/RemoteClient.h"

namespace flagbridge {

class Logger;

//==========================================================================================================
// UnleashClient
// Purpose: IRemoteClient over the Unleash Admin API. Requests run on a private io_context thread.
// Notes:
//   - Non-2xx responses fail with errors::RemoteApiError carrying the status and, when the body is an
//     Unleash error document, its name as code and its message.
//   - Resolve/connect/TLS failures fail with errors::RemoteApiError without a status.
//   - In dry-run mode mutations are logged and answered with a simulated feature object.
//==========================================================================================================
class UnleashClient : public IRemoteClient {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   baseUrl: Normalized Unleash base URL, e.g. https://app.unleash-hosted.com/demo
    //   accessToken: Personal access token sent verbatim in the Authorization header
    //   dryRun: Simulate mutations instead of sending them
    //   caFile/caPath: Optional trust store override (HTTPS)
    //   connectTimeoutMs/readTimeoutMs: Per-request socket timeouts
    //==========================================================================================================
    struct Options {
        std::string baseUrl;
        std::string accessToken;
        bool dryRun{false};
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
    };

    UnleashClient(const Options& opts, std::shared_ptr<Logger> logger);
    ~UnleashClient() override;

    UnleashClient(const UnleashClient&) = delete;
    UnleashClient& operator=(const UnleashClient&) = delete;

    std::future<JSONValue> FetchProjects(const resources::QueryOptions& options) override;
    std::future<JSONValue> FetchFeatures(const std::string& projectId,
                                         const resources::QueryOptions& options) override;
    std::future<JSONValue> FetchFeature(const std::string& projectId, const std::string& featureName) override;
    std::future<JSONValue> CreateFeature(const std::string& projectId, const FeatureCreateRequest& request) override;
    std::future<JSONValue> ToggleFeatureEnvironment(const std::string& projectId,
                                                    const std::string& featureName,
                                                    const std::string& environment,
                                                    bool enabled) override;

    // "/api/admin/projects/<p>/features/<f>" style path with encoded segments, relative to the base URL.
    static std::string FeaturePath(const std::string& projectId, const std::string& featureName);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace flagbridge
