#include "fetchd/transfer_task.hpp"

#include "fetchd/error.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace fetchd {

namespace {

void reportCrash(const HttpTransfer::Emit& emit, const std::exception& e) {
    emit(state::Failed{fmt::format("transfer task crashed: {}", e.what())});
}

} // namespace

TransferTask::TransferTask(HttpTransferPtr transfer, std::uint64_t resume_offset, HttpTransfer::Emit emit)
    : transfer_(std::move(transfer)) {
    std::packaged_task<std::uint64_t()> work(
        [transfer = transfer_, cancel = cancel_, resume_offset, emit = std::move(emit)]() {
            // A TransferError has already been reported as Failed by the run
            // itself. Anything else is reported here, before join() sees it.
            try {
                return transfer->run(cancel, resume_offset, emit);
            } catch (const Error& e) {
                if (e.code() != ErrorCode::TransferError) {
                    reportCrash(emit, e);
                }
                throw;
            } catch (const std::exception& e) {
                reportCrash(emit, e);
                throw;
            }
        });
    result_ = work.get_future();
    thread_ = std::thread(std::move(work));
}

TransferTask::~TransferTask() {
    if (joined_) {
        return;
    }
    cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool TransferTask::isFinished() const {
    return result_.valid() && result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

TaskOutcome TransferTask::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
    joined_ = true;

    TaskOutcome outcome;
    try {
        outcome.bytes = result_.get();
        outcome.kind = transfer_->isComplete() ? TaskOutcome::Kind::Completed : TaskOutcome::Kind::Paused;
    } catch (const Error& e) {
        outcome.bytes = transfer_->bytesWritten();
        if (e.code() == ErrorCode::TransferError) {
            outcome.kind = TaskOutcome::Kind::Failed;
        } else {
            outcome.kind = TaskOutcome::Kind::Crashed;
        }
        outcome.message = e.what();
    } catch (const std::exception& e) {
        outcome.bytes = transfer_->bytesWritten();
        outcome.kind = TaskOutcome::Kind::Crashed;
        outcome.message = e.what();
    }
    return outcome;
}

} // namespace fetchd
