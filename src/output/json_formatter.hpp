#pragma once

#include "model/interaction.hpp"
#include "proxy/mode_controller.hpp"
#include "proxy/session_stats.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mirage::output {

/// Formats admin and error payloads as JSON
class JsonFormatter {
public:
    /// {"error": message}
    [[nodiscard]] static nlohmann::json format_error(const std::string& message);

    /// Mode, counters, stored recording count and uptime
    [[nodiscard]] static nlohmann::json format_status(
        proxy::Mode mode,
        const proxy::StatisticsSnapshot& stats,
        std::size_t total_recordings,
        std::chrono::seconds uptime
    );

    /// Current mode, with a message after a switch
    [[nodiscard]] static nlohmann::json format_mode(
        proxy::Mode mode,
        const std::optional<std::string>& message = std::nullopt
    );

    [[nodiscard]] static nlohmann::json format_history_entry(const proxy::HistoryEntry& entry);

    /// {"count": n, "history": [...]}, newest first
    [[nodiscard]] static nlohmann::json format_history(const std::vector<proxy::HistoryEntry>& entries);

    /// {"count": n, "recordings": [...]} with one summary per interaction
    [[nodiscard]] static nlohmann::json format_recordings(const std::vector<model::Interaction>& interactions);

    [[nodiscard]] static nlohmann::json format_health();

    /// "1h2m3s", "2m3s" or "3s"
    [[nodiscard]] static std::string format_uptime(std::chrono::seconds uptime);

    /// Get current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace mirage::output
