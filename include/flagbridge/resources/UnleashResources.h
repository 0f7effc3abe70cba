//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: UnleashResources.h
// Purpose: Unleash project and feature flag resource templates
//==========================================================================================================

#pragma once

#include "flagbridge/resources/ResourceTemplates.h"

namespace flagbridge {
namespace resources {

constexpr const char* PROJECTS_TEMPLATE = "unleash://projects{?limit,order,offset}";
constexpr const char* FEATURE_FLAGS_TEMPLATE = "unleash://projects/{projectId}/feature-flags{?limit,order,offset}";
constexpr const char* FEATURE_FLAG_TEMPLATE = "unleash://projects/{projectId}/feature-flags/{flagName}";

//==========================================================================================================
// RegisterUnleashResources
// Purpose: Registers the projects collection, the per-project flag collection and the single flag.
//          Collection bodies are {<items key>: [...], count, limit?, order, offset}; the single flag body
//          is the feature object as returned by the Admin API.
//==========================================================================================================
void RegisterUnleashResources(ResourceRouter& router);

} // namespace resources
} // namespace flagbridge
