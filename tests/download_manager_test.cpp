#include "fetchd/download_manager.hpp"
#include "fetchd/download_observer.hpp"
#include "fetchd/error.hpp"
#include "fetchd/json.hpp"

#include "support/test_helpers.hpp"
#include "support/test_http_server.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <gtest/gtest.h>

namespace fetchd {
namespace {

using namespace std::chrono_literals;
using testing::RecordingConsumer;
using testing::TempDir;
using testing::TestHttpServer;

ErrorCode codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    throw std::logic_error("operation did not fail");
}

// Throws from inside the transfer loop once real progress is reported.
class ExplodingConsumer final : public UpdateConsumer {
public:
    void consume(const DownloadUpdate& update) override {
        const auto* downloading = std::get_if<state::Downloading>(&update.state);
        if (downloading && downloading->bytes_downloaded > 0) {
            exploded = true;
            throw std::logic_error("consumer exploded");
        }
    }

    std::atomic<bool> exploded{false};
};

class DownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<HttpClient>();
        observer_ = std::make_shared<DownloadObserver>();
        recorder_ = std::make_shared<RecordingConsumer>();
        manager_ = std::make_unique<DownloadManager>(
            std::make_shared<UpdateBroadcaster>(std::vector<UpdateConsumerPtr>{observer_, recorder_}));

        fast_ = testing::makePayload(256 * 1024, 11);
        server_.serve("/fast", {fast_});

        TestHttpServer::Resource slow{testing::makePayload(1024 * 1024, 12)};
        slow.chunk_size = 16 * 1024;
        slow.chunk_delay = 5ms;
        slow_ = slow.body;
        server_.serve("/slow", slow);
    }

    void TearDown() override { manager_.reset(); }

    HttpTransferPtr transfer(const std::string& path, const std::string& file_name) {
        TransferOptions options;
        options.progress_interval = 10ms;
        return HttpTransfer::create(server_.url(path), dir_.path(), file_name, client_, std::nullopt, options);
    }

    std::optional<DownloadState> stateOf(const DownloadId& id) const { return observer_->state(id); }

    template <typename State>
    bool waitForState(const DownloadId& id, std::chrono::milliseconds timeout = 20s) {
        return testing::waitFor(
            [&] {
                const auto current = stateOf(id);
                return current && std::holds_alternative<State>(*current);
            },
            timeout);
    }

    bool waitForProgress(const DownloadId& id) {
        return testing::waitFor([&] {
            const auto current = stateOf(id);
            return current && std::holds_alternative<state::Downloading>(*current) && bytesDownloaded(*current) > 0;
        });
    }

    TestHttpServer server_;
    TempDir dir_;
    HttpClientPtr client_;
    std::shared_ptr<DownloadObserver> observer_;
    std::shared_ptr<RecordingConsumer> recorder_;
    std::unique_ptr<DownloadManager> manager_;
    std::string fast_;
    std::string slow_;
};

TEST_F(DownloadManagerTest, AddRegistersWithoutStarting) {
    const auto id = manager_->add(transfer("/fast", "a.bin"));

    EXPECT_EQ(manager_->size(), 1u);
    EXPECT_EQ(manager_->status(id), EntryStatus::Registered);
    EXPECT_EQ(stateOf(id), DownloadState{state::Paused{0}});
    EXPECT_TRUE(server_.rangeHeaders("/fast").empty());

    const auto metadata = manager_->metadata(id);
    EXPECT_EQ(metadata.id, id);
    EXPECT_EQ(metadata.url, server_.url("/fast"));
    EXPECT_EQ(metadata.file_path, (dir_.path() / "a.bin").string());
}

TEST_F(DownloadManagerTest, AddAssignsDistinctIds) {
    const auto a = manager_->add(transfer("/fast", "a.bin"));
    const auto b = manager_->add(transfer("/fast", "b.bin"));
    EXPECT_NE(a, b);
    EXPECT_EQ(manager_->metadataAll().size(), 2u);
}

TEST_F(DownloadManagerTest, AddRejectsEmptyTransfer) {
    EXPECT_EQ(codeOf([&] { manager_->add(nullptr); }), ErrorCode::InvalidArgument);
}

TEST_F(DownloadManagerTest, UnknownIdIsNotFound) {
    const DownloadId unknown{"unknown"};
    EXPECT_EQ(codeOf([&] { manager_->start(unknown); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { manager_->stop(unknown); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { manager_->resume(unknown); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { manager_->remove(unknown, false); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { (void)manager_->metadata(unknown); }), ErrorCode::NotFound);
    EXPECT_EQ(codeOf([&] { (void)manager_->status(unknown); }), ErrorCode::NotFound);
}

TEST_F(DownloadManagerTest, DownloadsTenMegabytesToCompletion) {
    const auto payload = testing::makePayload(10 * 1024 * 1024, 99);
    server_.serve("/ten", {payload});

    const auto id = manager_->add(transfer("/ten", "ten.bin"));
    manager_->start(id);

    ASSERT_TRUE(waitForState<state::Completed>(id, 60s));
    EXPECT_EQ(stateOf(id), DownloadState{state::Completed{payload.size()}});
    EXPECT_EQ(std::filesystem::file_size(dir_.path() / "ten.bin"), 10u * 1024 * 1024);
    EXPECT_EQ(testing::readFile(dir_.path() / "ten.bin"), payload);
    EXPECT_EQ(manager_->status(id), EntryStatus::Completed);
    EXPECT_EQ(manager_->metadata(id).size_hint, payload.size());
}

TEST_F(DownloadManagerTest, SecondStartIsAlreadyRunning) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);
    EXPECT_EQ(codeOf([&] { manager_->start(id); }), ErrorCode::AlreadyRunning);
    EXPECT_EQ(codeOf([&] { manager_->resume(id); }), ErrorCode::AlreadyRunning);
    manager_->stop(id);
}

TEST_F(DownloadManagerTest, ConcurrentStartsSpawnOneTask) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));

    std::atomic<int> started{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&] {
            try {
                manager_->start(id);
                ++started;
            } catch (const Error& e) {
                if (e.code() == ErrorCode::AlreadyRunning) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    ASSERT_TRUE(waitForProgress(id));
    manager_->stop(id);
    EXPECT_EQ(server_.rangeHeaders("/slow").size(), 1u);
}

TEST_F(DownloadManagerTest, StopWithoutTaskIsDownloadNotRunning) {
    const auto id = manager_->add(transfer("/fast", "a.bin"));
    EXPECT_EQ(codeOf([&] { manager_->stop(id); }), ErrorCode::DownloadNotRunning);
    EXPECT_EQ(stateOf(id), DownloadState{state::Paused{0}});
    EXPECT_EQ(manager_->status(id), EntryStatus::Registered);
}

TEST_F(DownloadManagerTest, StopReportsBytesOnDisk) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForProgress(id));

    manager_->stop(id);

    const auto current = stateOf(id);
    ASSERT_TRUE(current && std::holds_alternative<state::Paused>(*current));
    const auto bytes = std::get<state::Paused>(*current).bytes_downloaded;
    EXPECT_GT(bytes, 0u);
    EXPECT_EQ(std::filesystem::file_size(dir_.path() / "slow.bin"), bytes);
    EXPECT_EQ(manager_->status(id), EntryStatus::Paused);
    EXPECT_EQ(codeOf([&] { manager_->stop(id); }), ErrorCode::DownloadNotRunning);
}

TEST_F(DownloadManagerTest, PauseAndResumeMatchesSingleShotDownload) {
    const auto id = manager_->add(transfer("/slow", "resumed.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForProgress(id));
    manager_->stop(id);

    const auto paused_at = bytesDownloaded(*stateOf(id));
    ASSERT_GT(paused_at, 0u);
    ASSERT_LT(paused_at, slow_.size());

    manager_->resume(id);
    ASSERT_TRUE(waitForState<state::Completed>(id, 60s));

    EXPECT_EQ(testing::readFile(dir_.path() / "resumed.bin"), slow_);

    const auto ranges = server_.rangeHeaders("/slow");
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], "");
    EXPECT_EQ(ranges[1], fmt::format("bytes={}-", paused_at));

    std::uint64_t previous = 0;
    for (const auto& s : recorder_->statesFor(id)) {
        EXPECT_GE(bytesDownloaded(s), previous) << dumpJson(s);
        previous = bytesDownloaded(s);
    }
}

TEST_F(DownloadManagerTest, ResumeRequiresUnfinishedDownload) {
    const auto id = manager_->add(transfer("/fast", "a.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForState<state::Completed>(id));

    EXPECT_EQ(codeOf([&] { manager_->resume(id); }), ErrorCode::NotPaused);
    EXPECT_EQ(codeOf([&] { manager_->stop(id); }), ErrorCode::DownloadNotRunning);
}

TEST_F(DownloadManagerTest, FinishedTaskDoesNotBlockRestart) {
    const auto id = manager_->add(transfer("/fast", "a.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForState<state::Completed>(id));

    manager_->start(id);
    ASSERT_TRUE(testing::waitFor([&] { return manager_->status(id) == EntryStatus::Completed; }));
    EXPECT_EQ(testing::readFile(dir_.path() / "a.bin"), fast_);
    EXPECT_EQ(server_.rangeHeaders("/fast").size(), 2u);
}

TEST_F(DownloadManagerTest, FailedTransferIsObservedAndRetryable) {
    TestHttpServer::Resource broken;
    broken.status_override = 500;
    server_.serve("/flaky", broken);

    const auto id = manager_->add(transfer("/flaky", "flaky.bin"));
    manager_->start(id);

    ASSERT_TRUE(waitForState<state::Failed>(id));
    EXPECT_NE(std::get<state::Failed>(*stateOf(id)).reason.find("500"), std::string::npos);
    EXPECT_EQ(manager_->status(id), EntryStatus::Failed);

    server_.serve("/flaky", {fast_});
    manager_->resume(id);
    ASSERT_TRUE(waitForState<state::Completed>(id));
    EXPECT_EQ(testing::readFile(dir_.path() / "flaky.bin"), fast_);
}

TEST_F(DownloadManagerTest, RemoveWhileRunningIsRefused) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForProgress(id));

    EXPECT_EQ(codeOf([&] { manager_->remove(id, true); }), ErrorCode::AlreadyRunning);
    EXPECT_EQ(manager_->size(), 1u);
    EXPECT_EQ(manager_->status(id), EntryStatus::Running);
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "slow.bin"));

    manager_->stop(id);
}

TEST_F(DownloadManagerTest, RemoveDropsEntryAndOptionallyFile) {
    const auto keep = manager_->add(transfer("/fast", "keep.bin"));
    const auto drop = manager_->add(transfer("/fast", "drop.bin"));
    manager_->start(keep);
    manager_->start(drop);
    ASSERT_TRUE(waitForState<state::Completed>(keep));
    ASSERT_TRUE(waitForState<state::Completed>(drop));

    manager_->remove(keep, false);
    manager_->remove(drop, true);

    EXPECT_EQ(manager_->size(), 0u);
    EXPECT_FALSE(stateOf(keep).has_value());
    EXPECT_FALSE(stateOf(drop).has_value());
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "keep.bin"));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "drop.bin"));
    EXPECT_EQ(codeOf([&] { manager_->start(keep); }), ErrorCode::NotFound);
}

TEST_F(DownloadManagerTest, StartAllIsolatesUnreachableDownload) {
    const auto a = manager_->add(transfer("/fast", "a.bin"));
    const auto b = manager_->add(transfer("/fast", "b.bin"));
    const auto unreachable =
        manager_->add(HttpTransfer::create("http://127.0.0.1:1/nothing", dir_.path(), "c.bin", client_));

    const auto outcomes = manager_->startAll();
    ASSERT_EQ(outcomes.size(), 3u);
    for (const auto& outcome : outcomes) {
        EXPECT_FALSE(outcome.error.has_value()) << outcome.error->what();
    }

    ASSERT_TRUE(waitForState<state::Completed>(a));
    ASSERT_TRUE(waitForState<state::Completed>(b));
    ASSERT_TRUE(waitForState<state::Failed>(unreachable));
    EXPECT_EQ(testing::readFile(dir_.path() / "a.bin"), fast_);
    EXPECT_EQ(testing::readFile(dir_.path() / "b.bin"), fast_);
}

TEST_F(DownloadManagerTest, StartAllReportsPerIdOutcomes) {
    const auto running = manager_->add(transfer("/slow", "running.bin"));
    const auto idle = manager_->add(transfer("/slow", "idle.bin"));
    manager_->start(running);

    const auto outcomes = manager_->startAll();
    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto& outcome : outcomes) {
        if (outcome.id == running) {
            ASSERT_TRUE(outcome.error.has_value());
            EXPECT_EQ(outcome.error->code(), ErrorCode::AlreadyRunning);
        } else {
            EXPECT_EQ(outcome.id, idle);
            EXPECT_FALSE(outcome.error.has_value());
        }
    }
    EXPECT_EQ(manager_->status(idle), EntryStatus::Running);
    manager_->stopAll();
}

TEST_F(DownloadManagerTest, StopAllPausesEveryRunningDownload) {
    const auto first = manager_->add(transfer("/slow", "first.bin"));
    const auto second = manager_->add(transfer("/slow", "second.bin"));
    const auto idle = manager_->add(transfer("/slow", "idle.bin"));
    manager_->start(first);
    manager_->start(second);
    ASSERT_TRUE(waitForProgress(first));
    ASSERT_TRUE(waitForProgress(second));

    const auto outcomes = manager_->stopAll();
    ASSERT_EQ(outcomes.size(), 3u);
    for (const auto& outcome : outcomes) {
        if (outcome.id == idle) {
            ASSERT_TRUE(outcome.error.has_value());
            EXPECT_EQ(outcome.error->code(), ErrorCode::DownloadNotRunning);
        } else {
            EXPECT_FALSE(outcome.error.has_value());
            const auto current = stateOf(outcome.id);
            ASSERT_TRUE(current && std::holds_alternative<state::Paused>(*current));
            const auto file = outcome.id == first ? "first.bin" : "second.bin";
            EXPECT_EQ(std::filesystem::file_size(dir_.path() / file), bytesDownloaded(*current));
        }
    }

    // startAll afterwards continues from the paused offsets.
    manager_->startAll();
    ASSERT_TRUE(waitForState<state::Completed>(first, 60s));
    ASSERT_TRUE(waitForState<state::Completed>(second, 60s));
    EXPECT_EQ(testing::readFile(dir_.path() / "first.bin"), slow_);
    EXPECT_EQ(testing::readFile(dir_.path() / "second.bin"), slow_);
    manager_->stopAll();
}

TEST_F(DownloadManagerTest, StopAllReportsSelfFinishedRunAsNotRunning) {
    const auto done = manager_->add(transfer("/fast", "done.bin"));
    const auto running = manager_->add(transfer("/slow", "running.bin"));
    manager_->start(done);
    ASSERT_TRUE(waitForState<state::Completed>(done));
    manager_->start(running);
    ASSERT_TRUE(waitForProgress(running));
    // Let the finished thread return; nothing has reaped it yet.
    std::this_thread::sleep_for(200ms);

    const auto outcomes = manager_->stopAll();
    ASSERT_EQ(outcomes.size(), 2u);
    for (const auto& outcome : outcomes) {
        if (outcome.id == done) {
            ASSERT_TRUE(outcome.error.has_value());
            EXPECT_EQ(outcome.error->code(), ErrorCode::DownloadNotRunning);
        } else {
            EXPECT_FALSE(outcome.error.has_value());
        }
    }
    EXPECT_EQ(manager_->status(done), EntryStatus::Completed);
    EXPECT_EQ(manager_->status(running), EntryStatus::Paused);
    EXPECT_EQ(testing::readFile(dir_.path() / "done.bin"), fast_);
}

TEST_F(DownloadManagerTest, CrashedTaskSurfacesAsTaskJoinError) {
    auto exploding = std::make_shared<ExplodingConsumer>();
    DownloadManager manager(exploding);

    const auto id = manager.add(transfer("/slow", "crash.bin"));
    manager.start(id);
    ASSERT_TRUE(testing::waitFor([&] { return exploding->exploded.load(); }));

    EXPECT_EQ(codeOf([&] { manager.stop(id); }), ErrorCode::TaskJoinError);
    EXPECT_EQ(manager.status(id), EntryStatus::Failed);

    // The entry is usable again.
    EXPECT_EQ(codeOf([&] { manager.stop(id); }), ErrorCode::DownloadNotRunning);
}

TEST_F(DownloadManagerTest, CrashedTaskIsReportedFailedWithoutReaping) {
    auto exploding = std::make_shared<ExplodingConsumer>();
    DownloadManager manager(std::make_shared<UpdateBroadcaster>(std::vector<UpdateConsumerPtr>{observer_, exploding}));

    const auto id = manager.add(transfer("/slow", "crash.bin"));
    manager.start(id);

    // Only the observer is read; nothing joins the task.
    ASSERT_TRUE(waitForState<state::Failed>(id));
    EXPECT_NE(std::get<state::Failed>(*stateOf(id)).reason.find("consumer exploded"), std::string::npos);
    EXPECT_TRUE(exploding->exploded.load());

    EXPECT_EQ(codeOf([&] { manager.stop(id); }), ErrorCode::TaskJoinError);
    EXPECT_TRUE(std::holds_alternative<state::Failed>(*stateOf(id)));
}

TEST_F(DownloadManagerTest, DestructorStopsRunningTasks) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);
    ASSERT_TRUE(waitForProgress(id));

    const auto start = std::chrono::steady_clock::now();
    manager_.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_TRUE(std::holds_alternative<state::Paused>(*stateOf(id)));
}

TEST_F(DownloadManagerTest, MetadataQueriesDoNotWaitForTransfers) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);

    std::atomic<bool> stop_readers{false};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop_readers.load()) {
                EXPECT_EQ(manager_->metadataAll().size(), 1u);
                EXPECT_EQ(manager_->metadata(id).id, id);
                ++reads;
            }
        });
    }

    ASSERT_TRUE(waitForProgress(id));
    manager_->stop(id);
    stop_readers = true;
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_GT(reads.load(), 0);
}

TEST_F(DownloadManagerTest, ConcurrentStatusReadersAllSeeCompletion) {
    const auto id = manager_->add(transfer("/slow", "slow.bin"));
    manager_->start(id);

    std::atomic<int> completed_readers{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            const bool seen = testing::waitFor([&] { return manager_->status(id) == EntryStatus::Completed; }, 60s);
            if (seen) {
                ++completed_readers;
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(completed_readers.load(), 4);
    EXPECT_EQ(testing::readFile(dir_.path() / "slow.bin"), slow_);
    EXPECT_EQ(codeOf([&] { manager_->stop(id); }), ErrorCode::DownloadNotRunning);
}

} // namespace
} // namespace fetchd
