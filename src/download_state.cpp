#include "fetchd/download_state.hpp"

namespace fetchd {

std::uint64_t bytesDownloaded(const DownloadState& state) noexcept {
    return std::visit(Overloaded{
                          [](const state::Paused& s) { return s.bytes_downloaded; },
                          [](const state::Downloading& s) { return s.bytes_downloaded; },
                          [](const state::Completed& s) { return s.total_bytes; },
                          [](const state::Failed&) { return std::uint64_t{0}; },
                      },
                      state);
}

const char* stateName(const DownloadState& state) noexcept {
    return std::visit(Overloaded{
                          [](const state::Paused&) { return "paused"; },
                          [](const state::Downloading&) { return "downloading"; },
                          [](const state::Completed&) { return "completed"; },
                          [](const state::Failed&) { return "failed"; },
                      },
                      state);
}

} // namespace fetchd
