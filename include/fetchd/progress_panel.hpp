#pragma once

#include "download_observer.hpp"
#include "http_transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fetchd {

// Terminal progress view for the CLI. Redraws in place using ANSI cursor
// movement.
class ProgressPanel {
public:
    struct Row {
        std::string name;
        DownloadState state;
        std::optional<std::uint64_t> size_hint;
    };

    [[nodiscard]] static std::vector<Row> collect(const std::vector<DownloadMetadata>& downloads,
                                                  const DownloadObserver& observer);

    [[nodiscard]] static std::string build(const std::vector<Row>& rows);
    [[nodiscard]] static std::string formatRow(const Row& row);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

    void redraw(const std::string& panel);

private:
    std::size_t previous_lines_{0};
};

} // namespace fetchd
