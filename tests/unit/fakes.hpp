#pragma once

#include "network/http_client.hpp"
#include "storage/repository.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace mirage::test_support {

/// In-memory repository keyed by fingerprint
class InMemoryRepository : public storage::Repository {
public:
    Status store(const model::Interaction& interaction) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++store_calls;
        if (fail_store) {
            return Status::Err(Error::storage("disk full"));
        }
        interactions_[interaction.request.fingerprint()] = interaction;
        return ok_status();
    }

    Result<model::Interaction, Error> find(const Fingerprint& fingerprint) const override {
        using R = Result<model::Interaction, Error>;
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_find) {
            return R::Err(Error::storage("permission denied"));
        }
        if (auto it = interactions_.find(fingerprint); it != interactions_.end()) {
            return R::Ok(it->second);
        }
        return R::Err(Error::not_found("interaction not found for hash: " + fingerprint));
    }

    Result<model::Interaction, Error> find_by_key(const std::string& key) const override {
        using R = Result<model::Interaction, Error>;
        auto by_fingerprint = find(key);
        if (by_fingerprint.is_ok() || by_fingerprint.error().kind != ErrorKind::NotFound) {
            return by_fingerprint;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [fingerprint, interaction] : interactions_) {
            if (interaction.id == key) {
                return R::Ok(interaction);
            }
        }
        return R::Err(Error::not_found("interaction not found for id: " + key));
    }

    Result<std::vector<model::Interaction>, Error> find_all() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<model::Interaction> all;
        for (const auto& [fingerprint, interaction] : interactions_) {
            all.push_back(interaction);
        }
        std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) {
            return a.timestamp > b.timestamp;
        });
        return Result<std::vector<model::Interaction>, Error>::Ok(std::move(all));
    }

    Result<std::size_t, Error> count() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Result<std::size_t, Error>::Ok(interactions_.size());
    }

    Status clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        interactions_.clear();
        return ok_status();
    }

    bool fail_store = false;
    bool fail_find = false;
    int store_calls = 0;

private:
    mutable std::mutex mutex_;
    std::map<Fingerprint, model::Interaction> interactions_;
};

/// Transport returning canned responses and remembering what it was sent
class FakeTransport : public network::HttpTransport {
public:
    Result<model::RecordedResponse, Error> send(const model::RecordedRequest& request) override {
        using R = Result<model::RecordedResponse, Error>;
        sent.push_back(request);
        if (failure) {
            return R::Err(Error::upstream(*failure));
        }
        if (!responses.empty()) {
            auto next = responses.front();
            responses.pop_front();
            return R::Ok(std::move(next));
        }
        return R::Ok(default_response);
    }

    static model::RecordedResponse json_response(int status, std::string body) {
        model::RecordedResponse response;
        response.status_code = status;
        response.headers["Content-Type"] = {"application/json"};
        response.body = std::move(body);
        return response;
    }

    model::RecordedResponse default_response = json_response(200, "{}");
    std::deque<model::RecordedResponse> responses;
    std::optional<std::string> failure;
    std::vector<model::RecordedRequest> sent;
};

}  // namespace mirage::test_support
