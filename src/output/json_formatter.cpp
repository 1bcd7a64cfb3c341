#include "output/json_formatter.hpp"
#include "core/encoding.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mirage::output {

namespace {

// RFC 3339 without the fractional part
std::string seconds_timestamp(WallTime time) {
    return format_rfc3339(std::chrono::floor<std::chrono::seconds>(time));
}

}  // namespace

nlohmann::json JsonFormatter::format_error(const std::string& message) {
    return nlohmann::json{{"error", message}};
}

nlohmann::json JsonFormatter::format_status(
    proxy::Mode mode,
    const proxy::StatisticsSnapshot& stats,
    std::size_t total_recordings,
    std::chrono::seconds uptime
) {
    return nlohmann::json{
        {"mode", proxy::to_string(mode)},
        {"record_count", stats.record_count},
        {"playback_hits", stats.playback_hits},
        {"playback_misses", stats.playback_misses},
        {"total_recordings", total_recordings},
        {"uptime", format_uptime(uptime)}
    };
}

nlohmann::json JsonFormatter::format_mode(
    proxy::Mode mode,
    const std::optional<std::string>& message
) {
    nlohmann::json j{{"mode", proxy::to_string(mode)}};
    if (message) {
        j["message"] = *message;
    }
    return j;
}

nlohmann::json JsonFormatter::format_history_entry(const proxy::HistoryEntry& entry) {
    return nlohmann::json{
        {"id", entry.id},
        {"timestamp", seconds_timestamp(entry.timestamp)},
        {"method", entry.method},
        {"url", entry.url},
        {"target", entry.target},
        {"status", entry.status},
        {"duration", entry.duration_ms},
        {"saved", entry.saved}
    };
}

nlohmann::json JsonFormatter::format_history(const std::vector<proxy::HistoryEntry>& entries) {
    auto history = nlohmann::json::array();
    for (const auto& entry : entries) {
        history.push_back(format_history_entry(entry));
    }
    return nlohmann::json{
        {"count", entries.size()},
        {"history", std::move(history)}
    };
}

nlohmann::json JsonFormatter::format_recordings(const std::vector<model::Interaction>& interactions) {
    auto recordings = nlohmann::json::array();
    for (const auto& interaction : interactions) {
        recordings.push_back(nlohmann::json{
            {"id", interaction.request.fingerprint()},  // retrieval key
            {"uuid", interaction.id},
            {"timestamp", format_rfc3339(interaction.timestamp)},
            {"method", interaction.request.method},
            {"url", interaction.request.url},
            {"target", interaction.metadata.target},
            {"status", interaction.response.status_code},
            {"duration", interaction.metadata.duration_ms}
        });
    }
    return nlohmann::json{
        {"count", interactions.size()},
        {"recordings", std::move(recordings)}
    };
}

nlohmann::json JsonFormatter::format_health() {
    return nlohmann::json{
        {"status", "healthy"},
        {"time", iso_timestamp()}
    };
}

std::string JsonFormatter::format_uptime(std::chrono::seconds uptime) {
    auto total = uptime.count();
    auto h = total / 3600;
    auto m = (total % 3600) / 60;
    auto s = total % 60;

    std::ostringstream oss;
    if (h > 0) {
        oss << h << 'h' << m << 'm' << s << 's';
    } else if (m > 0) {
        oss << m << 'm' << s << 's';
    } else {
        oss << s << 's';
    }
    return oss.str();
}

std::string JsonFormatter::iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm{};
    gmtime_r(&time_t_now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace mirage::output
