//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ResourceTemplates.h
// Purpose: URI templates, template matching and the resource router behind resources/read
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "flagbridge/Protocol.h"
#include "flagbridge/resources/QueryOptions.h"

namespace flagbridge {

class ExecutionContext;

namespace resources {

// Ordered by ascending specificity.
enum class TemplateShape {
    Collection,
    NestedCollection,
    SingleItem
};

using PlaceholderMap = std::map<std::string, std::string>;

//==========================================================================================================
// UriTemplate
// Purpose: Level-1 URI template restricted to whole-segment placeholders ("{projectId}") and an optional
//          trailing query expansion ("{?limit,order,offset}").
// Notes:
//   - The shape is derived: query expansion without placeholders is a Collection, with placeholders a
//     NestedCollection; placeholders without query expansion make a SingleItem.
//   - Constructor throws std::invalid_argument on a malformed template.
//==========================================================================================================
class UriTemplate {
public:
    explicit UriTemplate(std::string text);

    const std::string& text() const { return source; }
    TemplateShape shape() const;
    bool acceptsQuery() const { return !queryNames.empty(); }
    std::size_t segmentCount() const { return segments.size(); }

    //==========================================================================================================
    // Matches uri against the template.
    // Returns:
    //   Decoded placeholder values, or std::nullopt when the scheme, segment count or a literal differs.
    // Throws:
    //   errors::InputValidationError when a placeholder is empty or badly percent-encoded.
    //==========================================================================================================
    std::optional<PlaceholderMap> Match(const std::string& uri) const;

    // Substitutes percent-encoded values; throws std::invalid_argument when one is missing.
    std::string Expand(const PlaceholderMap& values) const;

    // True when some URI could match both templates.
    bool Overlaps(const UriTemplate& other) const;

private:
    struct Segment {
        bool placeholder{false};
        std::string text;
    };

    std::string source;
    std::string scheme;
    std::vector<Segment> segments;
    std::vector<std::string> queryNames;
};

// Reader body: fresh remote fetch returning the JSON document for the matched URI.
using ResourceReader = std::function<std::future<JSONValue>(const ExecutionContext& ctx,
                                                            const PlaceholderMap& placeholders,
                                                            const QueryOptions& options)>;

struct ResourceTemplateDefinition {
    std::string name;
    std::string uriTemplate;
    std::string description;
    ResourceReader reader;
};

//==========================================================================================================
// ResourceRouter
// Purpose: Maps a resource URI to exactly one registered template and runs its reader.
// Notes:
//   - Register throws errors::RegistrationConflictError when the template overlaps a registered one,
//     std::invalid_argument on a malformed template or missing reader.
//   - Read tries templates from most to least specific and returns one application/json block.
//==========================================================================================================
class ResourceRouter {
public:
    void Register(ResourceTemplateDefinition definition);

    // Template advertised by resources/templates/list, in registration order.
    std::vector<ResourceTemplate> ListTemplates() const;

    //==========================================================================================================
    // Reads one resource.
    // Args:
    //   uri: Concrete resource URI.
    //   ctx: Execution context handed to the reader.
    // Returns:
    //   ReadResourceResult with a single content block.
    // Throws:
    //   errors::InputValidationError for unmatched URIs, empty placeholders and bad query options;
    //   whatever the reader's future carries (typically errors::RemoteApiError).
    //==========================================================================================================
    ReadResourceResult Read(const std::string& uri, const ExecutionContext& ctx) const;

    std::size_t Size() const { return entries.size(); }

private:
    struct Entry {
        ResourceTemplateDefinition definition;
        UriTemplate pattern;
    };

    std::vector<Entry> entries;
};

// unleash://projects/{projectId}/feature-flags/{flagName} with both segments percent-encoded.
std::string BuildFeatureFlagUri(const std::string& projectId, const std::string& flagName);

} // namespace resources
} // namespace flagbridge
