#pragma once

/**
 * @file orchestrator.hpp
 * @brief Resumable upload engine: resume decision, chunk loop, verification
 *
 * ONE RUN:
 * 1. A stored session is validated (completed-but-not-cleared, age, folder,
 *    local file size, remote progress) and either resumed, recorded as done,
 *    or discarded.
 * 2. Without a usable session the newest local file is picked, checked against
 *    an identical remote object, and a new session is initiated and persisted
 *    before any byte is sent.
 * 3. Chunks are sent strictly in order. The offset only ever moves to what the
 *    server confirms; three consecutive non-advancing replies end the run.
 * 4. On completion the server checksum (if any) is compared with the local
 *    MD5, the remote id is persisted, the session cleared and history written,
 *    in that order. A session the server reports as already complete goes
 *    through the same checksum comparison, so a mismatch stays a failure on
 *    every later run.
 *
 * FAILURES:
 * Every failure leaves the stored session as it was, writes one FAILED history
 * row and returns UploadFailed. An authorization challenge returns
 * NeedsConsent without touching history. A cancelled run writes no history.
 *
 * Only one run may use a given SessionStore at a time; the caller ensures it.
 */

#include "cbu/events/event_bus.hpp"
#include "cbu/remote/endpoint.hpp"
#include "cbu/source/file_source.hpp"
#include "cbu/store/history.hpp"
#include "cbu/store/session_store.hpp"
#include "cbu/upload/progress_tracker.hpp"
#include "cbu/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace cbu::upload {

constexpr std::size_t kDefaultChunkSize = 5 * 1024 * 1024;
constexpr int kMaxStalledChunks = 3;

struct OrchestratorOptions {
    std::size_t chunk_size = kDefaultChunkSize;
    int max_stalled_chunks = kMaxStalledChunks;
    std::string mime_type = "application/octet-stream";
    std::chrono::system_clock::duration max_session_age = store::kMaxSessionAge;

    /// Wall clock for session ages and history timestamps; system_clock when empty.
    std::function<std::chrono::system_clock::time_point()> clock;

    /// Checked between chunks. Set it to stop a run with the session kept.
    const std::atomic<bool>* stop_flag = nullptr;
};

using ProgressCallback = std::function<void(const UploadProgress&)>;

class UploadOrchestrator {
public:
    UploadOrchestrator(store::SessionStore& sessions,
                       source::FileSource& files,
                       remote::RemoteUploadEndpoint& endpoint,
                       store::HistoryRecorder& history,
                       std::string destination_folder_id,
                       OrchestratorOptions options = {},
                       events::EventBus* bus = nullptr);

    UploadStatus run(const ProgressCallback& on_progress = {});

private:
    // Resume path result: a final status, or nullopt to continue with a fresh upload
    using ResumeOutcome = std::optional<UploadStatus>;

    UploadStatus run_attempt(const ProgressCallback& on_progress);
    ResumeOutcome try_resume(const store::ResumableUploadSession& session, const ProgressCallback& on_progress);
    ResumeOutcome discard(const store::ResumableUploadSession& session, const std::string& reason);
    UploadStatus start_fresh(const ProgressCallback& on_progress);

    UploadStatus transfer(const store::ResumableUploadSession& session,
                          std::uint64_t offset,
                          const ProgressCallback& on_progress);
    UploadStatus complete(const store::ResumableUploadSession& session,
                          const remote::UploadFinished& finished);
    UploadStatus finish_recovered(const store::ResumableUploadSession& session,
                                  const std::string& remote_file_id,
                                  const std::optional<std::string>& checksum);

    // true when a server checksum was present and matched the local file
    Result<bool> verify_checksum(const store::ResumableUploadSession& session,
                                 const std::optional<std::string>& checksum,
                                 const std::string& remote_file_id);

    UploadStatus fail(const Error& error);
    UploadStatus fail(ErrorKind kind, std::string message, std::string detail = {});
    void record_history(store::UploadRecord record);

    std::chrono::system_clock::time_point now() const;
    bool stop_requested() const;

    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    store::SessionStore& sessions_;
    source::FileSource& files_;
    remote::RemoteUploadEndpoint& endpoint_;
    store::HistoryRecorder& history_;
    std::string destination_folder_id_;
    OrchestratorOptions options_;
    events::EventBus* bus_;

    // File the current run is about, for history rows
    std::string current_file_name_;
    std::uint64_t current_file_size_ = 0;
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace cbu::upload
