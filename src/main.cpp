#include "fetchd/detail/curl_utils.hpp"
#include "fetchd/error.hpp"
#include "fetchd/http_client.hpp"
#include "fetchd/http_transfer.hpp"
#include "fetchd/log.hpp"
#include "fetchd/progress_panel.hpp"
#include "fetchd/service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url> [<url> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>      Set download directory (default: current directory)\n"
              << "  -i <milliseconds>   Progress update interval (default: 250)\n"
              << "  -c <seconds>        Connect timeout (default: 15)\n"
              << "  -r                  Resume files that already exist instead of renaming\n"
              << "  --log-level <lvl>   debug, info, warn, error or off (default: info)\n"
              << "  -h, --help          Show this message" << std::endl;
}

int parsePositive(const std::string& text, const char* what) {
    int value = 0;
    try {
        value = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid ") + what + ": " + text);
    }
    if (value <= 0) {
        throw std::runtime_error(std::string(what) + " must be positive");
    }
    return value;
}

// Last path segment of the url, without query or fragment.
std::string fileNameFromUrl(const std::string& url) {
    fetchd::detail::CurlUrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    char* path = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_PATH, &path, CURLU_URLDECODE) != CURLUE_OK || !path) {
        return {};
    }
    const std::string full{path};
    curl_free(path);

    const auto slash = full.rfind('/');
    return slash == std::string::npos ? full : full.substr(slash + 1);
}

// Also reaps finished tasks, so a crashed one is reported as failed.
bool anyRunning(fetchd::DownloadManager& manager, const std::vector<fetchd::DownloadMetadata>& downloads) {
    bool running = false;
    for (const auto& download : downloads) {
        if (manager.status(download.id) == fetchd::EntryStatus::Running) {
            running = true;
        }
    }
    return running;
}

} // namespace

int main(int argc, char** argv) {
    try {
        fetchd::detail::ensureCurlInitialized();
        fetchd::initLogLevelFromEnv();

        fetchd::ClientOptions client_options;
        fetchd::TransferOptions transfer_options;
        std::filesystem::path download_dir = std::filesystem::current_path();
        bool resume_existing = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d" || option == "-i" || option == "-c" || option == "--log-level") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];

                if (option == "-d") {
                    download_dir = value;
                    std::error_code ec;
                    std::filesystem::create_directories(download_dir, ec);
                    if (ec) {
                        throw std::runtime_error("Failed to create download directory: " + download_dir.string() +
                                                 " - " + ec.message());
                    }
                } else if (option == "-i") {
                    transfer_options.progress_interval = std::chrono::milliseconds(parsePositive(value, "interval"));
                } else if (option == "-c") {
                    client_options.connect_timeout = std::chrono::seconds(parsePositive(value, "connect timeout"));
                } else {
                    fetchd::LogLevel level = fetchd::LogLevel::Info;
                    if (!fetchd::parseLogLevel(value, level)) {
                        throw std::runtime_error("Invalid log level: " + value);
                    }
                    fetchd::setLogLevel(level);
                }
                arg_index += 2;
            } else if (option == "-r") {
                resume_existing = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }

        auto client = std::make_shared<fetchd::HttpClient>(client_options);
        auto service = fetchd::makeDownloadService(fetchd::logLevel() == fetchd::LogLevel::Debug);

        for (int i = arg_index; i < argc; ++i) {
            const std::string url = argv[i];
            std::string file_name = fileNameFromUrl(url);
            if (file_name.empty()) {
                fetchd::logError("cannot derive a file name from {}", url);
                continue;
            }

            std::optional<std::uint64_t> resume_offset;
            std::error_code ec;
            if (std::filesystem::exists(download_dir / file_name, ec)) {
                if (resume_existing) {
                    resume_offset = std::filesystem::file_size(download_dir / file_name, ec);
                } else {
                    file_name = fmt::format("{}-{}", fetchd::DownloadId::generate(), file_name);
                }
            }

            try {
                auto transfer = fetchd::HttpTransfer::create(url, download_dir, file_name, client, resume_offset,
                                                             transfer_options);
                service.manager->add(std::move(transfer));
            } catch (const fetchd::Error& e) {
                fetchd::logError("skipping {}: {}", url, e.what());
            }
        }

        if (service.manager->size() == 0) {
            return 1;
        }

        std::signal(SIGINT, [](int) { g_interrupted.store(true); });

        service.manager->startAll();

        fetchd::ProgressPanel panel;
        bool stopping = false;
        while (true) {
            const auto downloads = service.manager->metadataAll();
            const bool running = anyRunning(*service.manager, downloads);
            panel.redraw(fetchd::ProgressPanel::build(fetchd::ProgressPanel::collect(downloads, *service.observer)));

            if (g_interrupted.load() && !stopping) {
                stopping = true;
                fetchd::logInfo("interrupted, pausing all downloads");
                service.manager->stopAll();
                continue;
            }
            if (!running) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        int exit_code = 0;
        for (const auto& [id, state] : service.observer->stateAll()) {
            if (const auto* failed = std::get_if<fetchd::state::Failed>(&state)) {
                std::cerr << id.str() << ": " << failed->reason << std::endl;
                exit_code = 1;
            }
        }
        return exit_code;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
