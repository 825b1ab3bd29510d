#include "fetchd/progress_panel.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>

namespace fetchd {

std::vector<ProgressPanel::Row> ProgressPanel::collect(const std::vector<DownloadMetadata>& downloads,
                                                       const DownloadObserver& observer) {
    std::vector<Row> rows;
    rows.reserve(downloads.size());
    for (const auto& download : downloads) {
        auto current = observer.state(download.id);
        rows.push_back(Row{std::filesystem::path{download.file_path}.filename().string(),
                           current ? *current : DownloadState{state::Paused{0}}, download.size_hint});
    }
    return rows;
}

std::string ProgressPanel::build(const std::vector<Row>& rows) {
    std::string panel;
    panel.reserve(rows.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("fetchd ({} downloads)\n", rows.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;

    for (const auto& row : rows) {
        panel += formatRow(row);
        panel.push_back('\n');

        if (row.size_hint) {
            total_all += *row.size_hint;
            downloaded_all += std::min(bytesDownloaded(row.state), *row.size_hint);
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatRow(const Row& row) {
    std::string display_name = row.name;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    const std::uint64_t downloaded = bytesDownloaded(row.state);
    std::optional<std::uint64_t> total = row.size_hint;
    if (const auto* downloading = std::get_if<state::Downloading>(&row.state)) {
        if (downloading->total_size) {
            total = downloading->total_size;
        }
    } else if (std::holds_alternative<state::Completed>(row.state)) {
        total = downloaded;
    }

    std::string line;
    if (total && *total > 0) {
        const double ratio = std::min(1.0, static_cast<double>(downloaded) / static_cast<double>(*total));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "#" : "-";
        }

        line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent, formatSize(downloaded),
                           formatSize(*total));
    } else {
        line = fmt::format("{:<20} [{:^30}] ({})", display_name, "size unknown", formatSize(downloaded));
    }

    std::visit(Overloaded{
                   [&](const state::Paused&) { line.append("  paused"); },
                   [&](const state::Downloading&) {},
                   [&](const state::Completed&) { line.append("  done"); },
                   [&](const state::Failed& s) { line += fmt::format("  failed: {}", s.reason); },
               },
               row.state);
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ProgressPanel::redraw(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        std::cout << "\033[" << previous_lines_ << "F\033[J";
    }
    std::cout << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace fetchd
