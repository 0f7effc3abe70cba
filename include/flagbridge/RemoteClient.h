//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: RemoteClient.h
// Purpose: Remote feature-flag API contract consumed by tools and resource readers
//==========================================================================================================

#pragma once

#include <future>
#include <optional>
#include <string>

#include "flagbridge/JSONRPCTypes.h"
#include "flagbridge/resources/QueryOptions.h"

namespace flagbridge {

// Payload of a feature flag creation.
struct FeatureCreateRequest {
    std::string name;
    std::string type;
    std::string description;
    std::optional<bool> impressionData;
};

//==========================================================================================================
// IRemoteClient
// Purpose: Asynchronous access to the Unleash Admin API. Every future may carry
//          errors::RemoteApiError (status present for HTTP failures, absent for connection failures).
//==========================================================================================================
class IRemoteClient {
public:
    virtual ~IRemoteClient() = default;

    ////////////////////////////////////////////// Reads //////////////////////////////////////////////
    //==========================================================================================================
    // Lists projects with options applied.
    // Returns:
    //   Future resolving to a JSON array of project objects.
    //==========================================================================================================
    virtual std::future<JSONValue> FetchProjects(const resources::QueryOptions& options) = 0;

    //==========================================================================================================
    // Lists feature flags of one project with options applied.
    // Args:
    //   projectId: Parent project identifier.
    // Returns:
    //   Future resolving to a JSON array of feature objects.
    //==========================================================================================================
    virtual std::future<JSONValue> FetchFeatures(const std::string& projectId,
                                                 const resources::QueryOptions& options) = 0;

    //==========================================================================================================
    // Fetches a single feature flag with its environments.
    // Returns:
    //   Future resolving to the feature object.
    //==========================================================================================================
    virtual std::future<JSONValue> FetchFeature(const std::string& projectId, const std::string& featureName) = 0;

    ////////////////////////////////////////////// Mutations //////////////////////////////////////////////
    // Creates a feature flag; resolves to the created feature object.
    virtual std::future<JSONValue> CreateFeature(const std::string& projectId, const FeatureCreateRequest& request) = 0;

    // Turns a feature on/off in one environment; resolves to the updated feature object.
    virtual std::future<JSONValue> ToggleFeatureEnvironment(const std::string& projectId,
                                                            const std::string& featureName,
                                                            const std::string& environment,
                                                            bool enabled) = 0;
};

} // namespace flagbridge
