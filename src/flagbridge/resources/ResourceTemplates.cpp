//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2026 flagbridge contributors
// File: ResourceTemplates.cpp
// Purpose: URI template matching and resource routing
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "flagbridge/ExecutionContext.h"
#include "flagbridge/errors/Errors.h"
#include "flagbridge/resources/ResourceTemplates.h"

namespace flagbridge {
namespace resources {

namespace {
constexpr const char* kFeatureFlagTemplate = "unleash://projects/{projectId}/feature-flags/{flagName}";

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) {
            out.push_back(path.substr(start));
            break;
        }
        out.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return out;
}

// Splits "scheme://rest" into its parts; false when no scheme separator exists.
bool splitScheme(const std::string& uri, std::string& scheme, std::string& rest) {
    auto pos = uri.find("://");
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    scheme = uri.substr(0, pos);
    rest = uri.substr(pos + 3);
    return true;
}

int specificity(const UriTemplate& t) {
    return static_cast<int>(t.shape()) * 1000 + static_cast<int>(t.segmentCount());
}
} // namespace

//////////////////////////////////////////// UriTemplate ////////////////////////////////////////////

UriTemplate::UriTemplate(std::string text) : source(std::move(text)) {
    std::string body = source;
    auto q = body.find("{?");
    if (q != std::string::npos) {
        if (body.back() != '}') {
            throw std::invalid_argument("UriTemplate: query expansion must close the template: " + source);
        }
        std::string names = body.substr(q + 2, body.size() - q - 3);
        body.resize(q);
        std::size_t start = 0;
        while (start <= names.size()) {
            auto comma = names.find(',', start);
            std::string n = names.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
            if (n.empty()) {
                throw std::invalid_argument("UriTemplate: empty query variable in " + source);
            }
            queryNames.push_back(n);
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
    }

    std::string rest;
    if (!splitScheme(body, scheme, rest) || rest.empty()) {
        throw std::invalid_argument("UriTemplate: expected scheme://path, got " + source);
    }
    for (auto& raw : splitSegments(rest)) {
        Segment seg;
        if (raw.size() >= 2 && raw.front() == '{' && raw.back() == '}') {
            seg.placeholder = true;
            seg.text = raw.substr(1, raw.size() - 2);
            if (seg.text.empty() || seg.text.find_first_of("{}") != std::string::npos) {
                throw std::invalid_argument("UriTemplate: bad placeholder in " + source);
            }
        } else {
            if (raw.empty() || raw.find_first_of("{}") != std::string::npos) {
                throw std::invalid_argument("UriTemplate: bad literal segment in " + source);
            }
            seg.text = raw;
        }
        segments.push_back(std::move(seg));
    }
}

TemplateShape UriTemplate::shape() const {
    bool hasPlaceholders = std::any_of(segments.begin(), segments.end(), [](const Segment& s) { return s.placeholder; });
    if (acceptsQuery()) {
        return hasPlaceholders ? TemplateShape::NestedCollection : TemplateShape::Collection;
    }
    return hasPlaceholders ? TemplateShape::SingleItem : TemplateShape::Collection;
}

std::optional<PlaceholderMap> UriTemplate::Match(const std::string& uri) const {
    std::string path = uri.substr(0, uri.find_first_of("?#"));
    std::string uriScheme;
    std::string rest;
    if (!splitScheme(path, uriScheme, rest) || uriScheme != scheme) {
        return std::nullopt;
    }
    auto parts = splitSegments(rest);
    if (parts.size() != segments.size()) {
        return std::nullopt;
    }

    // Literals first so a placeholder error is only reported for a structural match.
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (!segments[i].placeholder && segments[i].text != parts[i]) {
            return std::nullopt;
        }
    }

    PlaceholderMap values;
    std::vector<errors::FieldViolation> violations;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (!segments[i].placeholder) continue;
        std::string decoded = percentDecode(parts[i]);
        if (decoded.empty()) {
            violations.push_back({segments[i].text, "must not be empty"});
            continue;
        }
        values[segments[i].text] = std::move(decoded);
    }
    if (!violations.empty()) {
        throw errors::InputValidationError(std::move(violations));
    }
    return values;
}

std::string UriTemplate::Expand(const PlaceholderMap& values) const {
    std::string out = scheme + "://";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        if (!segments[i].placeholder) {
            out += segments[i].text;
            continue;
        }
        auto it = values.find(segments[i].text);
        if (it == values.end()) {
            throw std::invalid_argument("UriTemplate: missing value for " + segments[i].text);
        }
        out += percentEncode(it->second);
    }
    return out;
}

bool UriTemplate::Overlaps(const UriTemplate& other) const {
    if (scheme != other.scheme || segments.size() != other.segments.size()) {
        return false;
    }
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& a = segments[i];
        const auto& b = other.segments[i];
        if (!a.placeholder && !b.placeholder && a.text != b.text) {
            return false;
        }
    }
    return true;
}

//////////////////////////////////////////// ResourceRouter ////////////////////////////////////////////

void ResourceRouter::Register(ResourceTemplateDefinition definition) {
    if (!definition.reader) {
        throw std::invalid_argument("ResourceRouter: template '" + definition.name + "' has no reader");
    }
    UriTemplate pattern(definition.uriTemplate);
    for (const auto& e : entries) {
        if (e.pattern.Overlaps(pattern)) {
            throw errors::RegistrationConflictError("Resource template " + definition.uriTemplate +
                                                    " overlaps " + e.definition.uriTemplate);
        }
    }
    entries.push_back(Entry{std::move(definition), std::move(pattern)});
}

std::vector<ResourceTemplate> ResourceRouter::ListTemplates() const {
    std::vector<ResourceTemplate> out;
    out.reserve(entries.size());
    for (const auto& e : entries) {
        std::optional<std::string> description;
        if (!e.definition.description.empty()) description = e.definition.description;
        out.emplace_back(e.definition.uriTemplate, e.definition.name, description, std::string(JSON_MIME_TYPE));
    }
    return out;
}

ReadResourceResult ResourceRouter::Read(const std::string& uri, const ExecutionContext& ctx) const {
    std::vector<const Entry*> ordered;
    ordered.reserve(entries.size());
    for (const auto& e : entries) ordered.push_back(&e);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Entry* a, const Entry* b) {
        return specificity(a->pattern) > specificity(b->pattern);
    });

    for (const Entry* e : ordered) {
        auto placeholders = e->pattern.Match(uri);
        if (!placeholders.has_value()) {
            continue;
        }
        QueryOptions options;
        if (e->pattern.acceptsQuery()) {
            options = parseQueryOptions(uri);
        }
        FLAGBRIDGE_LOG_DEBUG(ctx.logger(), "Resource {} matched template {}", uri, e->definition.name);

        auto body = e->definition.reader(ctx, placeholders.value(), options).get();
        ReadResourceResult result;
        result.contents.push_back(ResourceContent{uri, JSON_MIME_TYPE, SerializeJson(body)});
        return result;
    }
    throw errors::InputValidationError("No resource matches " + uri);
}

std::string BuildFeatureFlagUri(const std::string& projectId, const std::string& flagName) {
    static const UriTemplate featureFlag(kFeatureFlagTemplate);
    return featureFlag.Expand({{"projectId", projectId}, {"flagName", flagName}});
}

} // namespace resources
} // namespace flagbridge
