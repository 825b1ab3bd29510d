#include "fetchd/json.hpp"

namespace fetchd {

void to_json(json& j, const DownloadId& id) { j = id.str(); }

void to_json(json& j, const DownloadMetadata& metadata) {
    j = json{{"id", metadata.id}, {"url", metadata.url}, {"file_path", metadata.file_path}};
    if (metadata.size_hint) {
        j["size_hint"] = *metadata.size_hint;
    } else {
        j["size_hint"] = nullptr;
    }
}

void to_json(json& j, const DownloadUpdate& update) {
    j = json{{"id", update.id}};
    if (update.removed) {
        j["removed"] = true;
    } else {
        j["state"] = update.state;
    }
}

namespace state {

void to_json(json& j, const Paused& s) { j = json{{"state", "paused"}, {"bytes", s.bytes_downloaded}}; }

void to_json(json& j, const Downloading& s) {
    j = json{{"state", "downloading"}, {"bytes", s.bytes_downloaded}};
    if (s.total_size) {
        j["total"] = *s.total_size;
    } else {
        j["total"] = nullptr;
    }
}

void to_json(json& j, const Completed& s) { j = json{{"state", "completed"}, {"bytes", s.total_bytes}}; }

void to_json(json& j, const Failed& s) { j = json{{"state", "failed"}, {"reason", s.reason}}; }

} // namespace state

std::string dumpJson(const json& j) { return j.dump(-1, ' ', false, json::error_handler_t::replace); }

} // namespace fetchd
