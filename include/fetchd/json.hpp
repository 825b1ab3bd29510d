#pragma once

#include "download_id.hpp"
#include "download_state.hpp"
#include "download_update.hpp"
#include "http_transfer.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace fetchd {

using json = nlohmann::json;

// Wire shapes of the serializable records:
//   state:    {"state":"paused","bytes":42}
//             {"state":"downloading","bytes":5,"total":10|null}
//             {"state":"completed","bytes":7}
//             {"state":"failed","reason":"..."}
//   metadata: {"id":"...","url":"...","file_path":"...","size_hint":12|null}
//   update:   {"id":"...","state":{...}} or {"id":"...","removed":true}
void to_json(json& j, const DownloadId& id);
void to_json(json& j, const DownloadMetadata& metadata);
void to_json(json& j, const DownloadUpdate& update);

namespace state {
void to_json(json& j, const Paused& s);
void to_json(json& j, const Downloading& s);
void to_json(json& j, const Completed& s);
void to_json(json& j, const Failed& s);
} // namespace state

// Compact text. Invalid UTF-8 in strings (reasons, urls, paths) is replaced
// with U+FFFD instead of throwing.
[[nodiscard]] std::string dumpJson(const json& j);

} // namespace fetchd

// DownloadState is a std::variant, so ADL cannot find a to_json in fetchd.
namespace nlohmann {
template <>
struct adl_serializer<fetchd::DownloadState> {
    static void to_json(json& j, const fetchd::DownloadState& value) {
        std::visit([&j](const auto& s) { j = s; }, value);
    }
};
} // namespace nlohmann
