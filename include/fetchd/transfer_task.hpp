#pragma once

#include "cancel_token.hpp"
#include "http_transfer.hpp"

#include <cstdint>
#include <exception>
#include <future>
#include <string>
#include <thread>

namespace fetchd {

// How a finished task ended.
struct TaskOutcome {
    enum class Kind {
        Completed,
        Paused,
        Failed,   // the transfer reported a TransferError
        Crashed,  // the task ended with an unexpected exception
    };

    Kind kind{Kind::Paused};
    std::uint64_t bytes{0};
    std::string message;
};

// Owns one in-flight execution of HttpTransfer::run on its own thread.
// Destroying a task that is still running cancels and joins it.
class TransferTask {
public:
    TransferTask(HttpTransferPtr transfer, std::uint64_t resume_offset, HttpTransfer::Emit emit);
    ~TransferTask();

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    void cancel() noexcept { cancel_.cancel(); }

    [[nodiscard]] bool isFinished() const;

    // Waits for the thread and classifies its result. May be called once.
    TaskOutcome join();

private:
    HttpTransferPtr transfer_;
    CancelToken cancel_;
    std::future<std::uint64_t> result_;
    std::thread thread_;
    bool joined_{false};
};

} // namespace fetchd
