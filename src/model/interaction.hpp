#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace mirage::model {

/// Snapshot of a proxied request
/// url holds the full target the proxy forwarded to, not the inbound path
struct RecordedRequest {
    std::string method;
    std::string url;
    Headers headers;
    Bytes body;

    /// Lookup key for playback: hex SHA-256 of method, url and body
    /// Headers are excluded so recordings do not depend on client defaults
    [[nodiscard]] Fingerprint fingerprint() const;

    /// Build the canonical request used by both record and playback
    /// @param method Inbound HTTP method
    /// @param headers Inbound headers (Host is dropped, names canonicalized)
    /// @param body Inbound body, fully buffered
    /// @param target Decoded value of the `target` parameter
    [[nodiscard]] static RecordedRequest from_inbound(
        std::string_view method,
        const Headers& headers,
        Bytes body,
        std::string_view target
    );
};

/// Snapshot of the real target's response
struct RecordedResponse {
    int status_code = 0;
    Headers headers;
    Bytes body;
};

struct InteractionMetadata {
    std::string target;
    DurationMs duration_ms = 0;
};

/// One persisted request/response exchange
/// Never mutated after it has been stored
struct Interaction {
    std::string id;
    WallTime timestamp;
    RecordedRequest request;
    RecordedResponse response;
    InteractionMetadata metadata;
};

/// New random identifier (UUID v4 string)
[[nodiscard]] std::string generate_interaction_id();

// JSON mapping (nlohmann ADL hooks); bodies are base64 strings
void to_json(nlohmann::json& j, const RecordedRequest& request);
void from_json(const nlohmann::json& j, RecordedRequest& request);
void to_json(nlohmann::json& j, const RecordedResponse& response);
void from_json(const nlohmann::json& j, RecordedResponse& response);
void to_json(nlohmann::json& j, const InteractionMetadata& metadata);
void from_json(const nlohmann::json& j, InteractionMetadata& metadata);
void to_json(nlohmann::json& j, const Interaction& interaction);
void from_json(const nlohmann::json& j, Interaction& interaction);

}  // namespace mirage::model
