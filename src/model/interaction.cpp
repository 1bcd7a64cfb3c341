#include "model/interaction.hpp"
#include "core/encoding.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

namespace mirage::model {

using json = nlohmann::json;

namespace {

json headers_to_json(const Headers& headers) {
    json j = json::object();
    for (const auto& [name, values] : headers) {
        j[name] = values;
    }
    return j;
}

Headers headers_from_json(const json& j) {
    Headers headers;
    if (j.is_null()) {
        return headers;
    }
    for (const auto& [name, values] : j.items()) {
        auto& list = headers[name];
        if (values.is_null()) {
            continue;
        }
        for (const auto& v : values) {
            list.push_back(v.get<std::string>());
        }
    }
    return headers;
}

Bytes body_from_json(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    auto decoded = base64_decode(it->get<std::string>());
    if (!decoded) {
        throw std::invalid_argument(std::string("invalid base64 in ") + field);
    }
    return std::move(*decoded);
}

}  // namespace

Fingerprint RecordedRequest::fingerprint() const {
    Sha256 hash;
    hash.update(method);
    hash.update(url);
    hash.update(body);
    return hash.hex_digest();
}

RecordedRequest RecordedRequest::from_inbound(
    std::string_view method,
    const Headers& headers,
    Bytes body,
    std::string_view target
) {
    RecordedRequest recorded;
    recorded.method = std::string(method);
    recorded.url = std::string(target);
    recorded.body = std::move(body);

    for (const auto& [name, values] : headers) {
        std::string key = canonical_header_key(name);
        if (key == "Host") {
            continue;
        }
        auto& list = recorded.headers[key];
        list.insert(list.end(), values.begin(), values.end());
    }
    return recorded;
}

std::string generate_interaction_id() {
    // random_generator is not thread-safe; keep one per thread
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

void to_json(json& j, const RecordedRequest& request) {
    j = json{
        {"method", request.method},
        {"url", request.url},
        {"headers", headers_to_json(request.headers)}
    };
    if (!request.body.empty()) {
        j["body"] = base64_encode(request.body);
    }
}

void from_json(const json& j, RecordedRequest& request) {
    request.method = j.at("method").get<std::string>();
    request.url = j.at("url").get<std::string>();
    request.headers = headers_from_json(j.value("headers", json()));
    request.body = body_from_json(j, "body");
}

void to_json(json& j, const RecordedResponse& response) {
    j = json{
        {"status_code", response.status_code},
        {"headers", headers_to_json(response.headers)}
    };
    if (!response.body.empty()) {
        j["body"] = base64_encode(response.body);
    }
}

void from_json(const json& j, RecordedResponse& response) {
    response.status_code = j.at("status_code").get<int>();
    response.headers = headers_from_json(j.value("headers", json()));
    response.body = body_from_json(j, "body");
}

void to_json(json& j, const InteractionMetadata& metadata) {
    j = json{
        {"target", metadata.target},
        {"duration_ms", metadata.duration_ms}
    };
}

void from_json(const json& j, InteractionMetadata& metadata) {
    metadata.target = j.value("target", std::string{});
    metadata.duration_ms = j.value("duration_ms", DurationMs{0});
}

void to_json(json& j, const Interaction& interaction) {
    j = json{
        {"id", interaction.id},
        {"timestamp", format_rfc3339(interaction.timestamp)},
        {"request", interaction.request},
        {"response", interaction.response},
        {"metadata", interaction.metadata}
    };
}

void from_json(const json& j, Interaction& interaction) {
    interaction.id = j.at("id").get<std::string>();

    auto ts = parse_rfc3339(j.at("timestamp").get<std::string>());
    if (ts.is_err()) {
        throw std::invalid_argument(ts.error());
    }
    interaction.timestamp = ts.value();

    interaction.request = j.at("request").get<RecordedRequest>();
    interaction.response = j.at("response").get<RecordedResponse>();
    if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        interaction.metadata = it->get<InteractionMetadata>();
    }
}

}  // namespace mirage::model
