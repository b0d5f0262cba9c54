#include "cbu/upload/orchestrator.hpp"

#include "cbu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>

namespace cbu::upload {
namespace {

bool same_digest(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

UploadOrchestrator::UploadOrchestrator(store::SessionStore& sessions,
                                       source::FileSource& files,
                                       remote::RemoteUploadEndpoint& endpoint,
                                       store::HistoryRecorder& history,
                                       std::string destination_folder_id,
                                       OrchestratorOptions options,
                                       events::EventBus* bus)
    : sessions_(sessions),
      files_(files),
      endpoint_(endpoint),
      history_(history),
      destination_folder_id_(std::move(destination_folder_id)),
      options_(std::move(options)),
      bus_(bus) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = kDefaultChunkSize;
    }
    if (options_.max_stalled_chunks < 1) {
        options_.max_stalled_chunks = kMaxStalledChunks;
    }
}

UploadStatus UploadOrchestrator::run(const ProgressCallback& on_progress) {
    current_file_name_.clear();
    current_file_size_ = 0;
    started_at_ = std::chrono::steady_clock::now();

    if (destination_folder_id_.empty()) {
        return fail(ErrorKind::ConfigurationIncomplete, "No destination folder configured");
    }

    try {
        return run_attempt(on_progress);
    } catch (const std::exception& e) {
        return fail(ErrorKind::TransientNetworkOrServer, "Unexpected error", e.what());
    }
}

UploadStatus UploadOrchestrator::run_attempt(const ProgressCallback& on_progress) {
    auto stored = sessions_.load();
    if (stored.is_error()) {
        return fail(stored.error());
    }

    if (stored.value()) {
        if (auto outcome = try_resume(*stored.value(), on_progress)) {
            return std::move(*outcome);
        }
        current_file_name_.clear();
        current_file_size_ = 0;
    }
    return start_fresh(on_progress);
}

UploadOrchestrator::ResumeOutcome UploadOrchestrator::try_resume(const store::ResumableUploadSession& session,
                                                                 const ProgressCallback& on_progress) {
    current_file_name_ = session.file_name;
    current_file_size_ = session.total_bytes;

    if (session.remote_file_id) {
        spdlog::info("Previous upload of {} finished before its session was cleared", session.file_name);
        // Checksum was verified before the remote id was stored
        return finish_recovered(session, *session.remote_file_id, std::nullopt);
    }
    if (session.is_expired(now(), options_.max_session_age)) {
        return discard(session, "session expired");
    }
    if (session.destination_folder_id != destination_folder_id_) {
        return discard(session, "destination folder changed");
    }

    const auto local_size = files_.size_of(session.local_file_ref);
    if (!local_size) {
        return discard(session, "local file no longer exists");
    }
    if (*local_size != session.total_bytes) {
        return discard(session, "local file changed size");
    }

    auto progress = endpoint_.query_progress(session.session_uri, session.total_bytes);
    if (progress.is_error()) {
        return fail(progress.error());
    }

    if (std::holds_alternative<remote::SessionExpired>(progress.value())) {
        return discard(session, "remote session no longer valid");
    }
    if (const auto* done = std::get_if<remote::SessionAlreadyComplete>(&progress.value())) {
        spdlog::info("Remote side already holds {} as {}", session.file_name, done->remote_file_id);
        return finish_recovered(session, done->remote_file_id, done->checksum);
    }

    const auto confirmed = std::get<remote::SessionInProgress>(progress.value()).confirmed_bytes;
    if (confirmed > session.total_bytes) {
        return fail(ErrorKind::ProtocolViolation, "Server confirmed more bytes than the file has",
                    std::to_string(confirmed) + " > " + std::to_string(session.total_bytes));
    }
    if (confirmed < session.bytes_uploaded) {
        spdlog::warn("Server confirms {} bytes, below the {} recorded locally; resuming from the server value",
                     confirmed, session.bytes_uploaded);
    }
    if (auto saved = sessions_.update_bytes_uploaded(confirmed); saved.is_error()) {
        return fail(saved.error());
    }

    spdlog::info("Resuming upload of {} at {}/{} bytes", session.file_name, confirmed, session.total_bytes);
    emit(events::UploadResumedEvent{session.file_name, confirmed, session.total_bytes});
    return transfer(session, confirmed, on_progress);
}

UploadOrchestrator::ResumeOutcome UploadOrchestrator::discard(const store::ResumableUploadSession& session,
                                                              const std::string& reason) {
    spdlog::info("Discarding upload session for {}: {}", session.file_name, reason);
    if (auto cleared = sessions_.clear(); cleared.is_error()) {
        return fail(cleared.error());
    }
    emit(events::SessionDiscardedEvent{session.file_name, reason});
    return std::nullopt;
}

UploadStatus UploadOrchestrator::start_fresh(const ProgressCallback& on_progress) {
    auto latest = files_.find_latest();
    if (latest.is_error()) {
        return fail(latest.error());
    }
    const auto& file = latest.value();
    current_file_name_ = file.name;
    current_file_size_ = file.size;

    if (file.size == 0) {
        return fail(ErrorKind::FileNotFound, "Backup file is empty", file.ref);
    }

    auto existing = endpoint_.find_by_name(destination_folder_id_, file.name);
    if (existing.is_error()) {
        return fail(existing.error());
    }
    if (existing.value() && existing.value()->size == file.size) {
        const auto& remote_id = existing.value()->id;
        spdlog::info("{} ({} bytes) already exists remotely as {}, skipping transfer", file.name, file.size, remote_id);

        store::UploadRecord record;
        record.timestamp = now();
        record.file_name = file.name;
        record.size = file.size;
        record.outcome = store::UploadOutcome::Success;
        record.destination_folder_id = destination_folder_id_;
        record.remote_file_id = remote_id;
        record_history(std::move(record));

        emit(events::DuplicateSkippedEvent{file.name, file.size, remote_id});
        return UploadSucceeded{file.name, file.size, remote_id, true};
    }

    auto session_uri = endpoint_.initiate(destination_folder_id_, file.name, options_.mime_type, file.size);
    if (session_uri.is_error()) {
        return fail(session_uri.error());
    }

    store::ResumableUploadSession session;
    session.session_uri = session_uri.value();
    session.local_file_ref = file.ref;
    session.file_name = file.name;
    session.total_bytes = file.size;
    session.bytes_uploaded = 0;
    session.destination_folder_id = destination_folder_id_;
    session.created_at = now();

    if (auto saved = sessions_.save(session); saved.is_error()) {
        return fail(saved.error());
    }

    spdlog::info("Started upload session for {} ({} bytes)", file.name, file.size);
    emit(events::UploadStartedEvent{file.name, file.size});
    return transfer(session, 0, on_progress);
}

UploadStatus UploadOrchestrator::transfer(const store::ResumableUploadSession& session,
                                          std::uint64_t offset,
                                          const ProgressCallback& on_progress) {
    constexpr auto kNoPosition = std::numeric_limits<std::uint64_t>::max();

    const auto total = session.total_bytes;
    std::uint64_t current = offset;
    int stalls = 0;

    ProgressTracker tracker;
    const auto initial = tracker.start(current, total, ProgressTracker::Clock::now());
    if (on_progress) {
        on_progress(initial);
    }

    std::unique_ptr<source::ChunkReader> reader;
    std::uint64_t reader_position = kNoPosition;
    auto reopen = [&]() -> Result<void> {
        auto opened = files_.open(session.local_file_ref, current);
        if (opened.is_error()) {
            return Err<void, Error>(opened.error());
        }
        reader = std::move(opened.value());
        reader_position = current;
        return Ok();
    };

    std::vector<std::uint8_t> buffer;
    while (current < total) {
        if (stop_requested()) {
            return fail(ErrorKind::Cancelled, "Upload cancelled",
                        "stopped at " + std::to_string(current) + "/" + std::to_string(total));
        }

        if (reader_position != current) {
            if (auto opened = reopen(); opened.is_error()) {
                return fail(opened.error());
            }
        }

        const auto expected = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, total - current));
        auto read = reader->read(buffer, expected);
        if (read < expected) {
            spdlog::warn("Short read of {} ({} of {} bytes at {}), reopening", session.file_name, read, expected,
                         current);
            if (auto opened = reopen(); opened.is_error()) {
                return fail(opened.error());
            }
            read = reader->read(buffer, expected);
            if (read < expected) {
                reader_position = kNoPosition;
                return fail(ErrorKind::FileNotFound, "Backup file became unreadable",
                            session.local_file_ref + ": read " + std::to_string(read) + " of " +
                                std::to_string(expected) + " bytes at " + std::to_string(current));
            }
        }
        reader_position = current + read;

        auto sent = endpoint_.upload_chunk(session.session_uri, buffer, current, total);
        if (sent.is_error()) {
            return fail(sent.error());
        }

        if (const auto* finished = std::get_if<remote::UploadFinished>(&sent.value())) {
            if (on_progress) {
                on_progress(tracker.record(total, ProgressTracker::Clock::now()));
            }
            return complete(session, *finished);
        }

        const auto confirmed = std::get<remote::ChunkAccepted>(sent.value()).confirmed_bytes;
        if (confirmed > total) {
            return fail(ErrorKind::ProtocolViolation, "Server confirmed more bytes than the file has",
                        std::to_string(confirmed) + " > " + std::to_string(total));
        }

        if (confirmed <= current) {
            ++stalls;
            spdlog::warn("Chunk at {} of {} not accepted ({} consecutive)", current, session.file_name, stalls);
            emit(events::ChunkRetriedEvent{session.file_name, current, stalls});
            if (stalls >= options_.max_stalled_chunks) {
                return fail(ErrorKind::ProtocolViolation, "Upload made no progress",
                            "server stayed at " + std::to_string(confirmed) + " bytes after " +
                                std::to_string(stalls) + " chunks");
            }
            reader_position = kNoPosition;
            continue;
        }

        stalls = 0;
        const auto accepted = confirmed - current;
        current = confirmed;
        if (auto saved = sessions_.update_bytes_uploaded(current); saved.is_error()) {
            return fail(saved.error());
        }

        emit(events::ChunkAcceptedEvent{session.file_name, accepted, current, total});
        if (on_progress) {
            on_progress(tracker.record(current, ProgressTracker::Clock::now()));
        }
    }

    return fail(ErrorKind::ProtocolViolation, "Upload ended without completion",
                "all " + std::to_string(total) + " bytes confirmed but no file id returned");
}

UploadStatus UploadOrchestrator::complete(const store::ResumableUploadSession& session,
                                          const remote::UploadFinished& finished) {
    auto verified = verify_checksum(session, finished.checksum, finished.remote_file_id);
    if (verified.is_error()) {
        return fail(verified.error());
    }

    // Remote id goes in before the clear so an interrupted cleanup is recoverable
    if (auto saved = sessions_.update_remote_file_id(finished.remote_file_id); saved.is_error()) {
        return fail(saved.error());
    }
    if (auto cleared = sessions_.clear(); cleared.is_error()) {
        return fail(cleared.error());
    }

    store::UploadRecord record;
    record.timestamp = now();
    record.file_name = session.file_name;
    record.size = session.total_bytes;
    record.outcome = store::UploadOutcome::Success;
    record.destination_folder_id = session.destination_folder_id;
    record.remote_file_id = finished.remote_file_id;
    record_history(std::move(record));

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    emit(events::UploadCompletedEvent{session.file_name, session.total_bytes, finished.remote_file_id,
                                      verified.value(), elapsed});
    return UploadSucceeded{session.file_name, session.total_bytes, finished.remote_file_id, false};
}

UploadStatus UploadOrchestrator::finish_recovered(const store::ResumableUploadSession& session,
                                                  const std::string& remote_file_id,
                                                  const std::optional<std::string>& checksum) {
    auto verified = checksum ? verify_checksum(session, checksum, remote_file_id) : Ok(false);
    if (verified.is_error()) {
        return fail(verified.error());
    }

    if (!session.remote_file_id) {
        if (auto saved = sessions_.update_remote_file_id(remote_file_id); saved.is_error()) {
            return fail(saved.error());
        }
    }
    if (auto cleared = sessions_.clear(); cleared.is_error()) {
        return fail(cleared.error());
    }

    store::UploadRecord record;
    record.timestamp = now();
    record.file_name = session.file_name;
    record.size = session.total_bytes;
    record.outcome = store::UploadOutcome::Success;
    record.destination_folder_id = session.destination_folder_id;
    record.remote_file_id = remote_file_id;
    record_history(std::move(record));

    emit(events::UploadCompletedEvent{session.file_name, session.total_bytes, remote_file_id, verified.value(),
                                      std::chrono::milliseconds{0}});
    return UploadSucceeded{session.file_name, session.total_bytes, remote_file_id, false};
}

Result<bool> UploadOrchestrator::verify_checksum(const store::ResumableUploadSession& session,
                                                 const std::optional<std::string>& checksum,
                                                 const std::string& remote_file_id) {
    if (!checksum || checksum->empty()) {
        spdlog::info("Server returned no checksum for {}, skipping verification", session.file_name);
        return Ok(false);
    }

    auto local = files_.md5_hex(session.local_file_ref);
    if (local.is_error()) {
        return Err<bool, Error>(local.error());
    }
    if (!same_digest(local.value(), *checksum)) {
        return Err<bool>(ErrorKind::IntegrityMismatch, "Checksum mismatch",
                         "local md5 " + local.value() + ", remote md5 " + *checksum + ", remote id " +
                             remote_file_id);
    }
    spdlog::info("Checksum verified for {}: {}", session.file_name, local.value());
    return Ok(true);
}

UploadStatus UploadOrchestrator::fail(const Error& error) {
    if (error.kind == ErrorKind::AuthConsentRequired) {
        const std::string challenge = error.detail.empty() ? error.message : error.detail;
        spdlog::warn("Authorization required: {}", challenge);
        emit(events::ConsentRequiredEvent{challenge});
        return NeedsConsent{challenge};
    }

    spdlog::error("Upload of {} failed: {} ({})",
                  current_file_name_.empty() ? "<none>" : current_file_name_, error.summary(), error.detail);

    if (error.kind != ErrorKind::Cancelled) {
        store::UploadRecord record;
        record.timestamp = now();
        record.file_name = current_file_name_;
        record.size = current_file_size_;
        record.outcome = store::UploadOutcome::Failed;
        record.error_message = error.summary();
        if (!error.detail.empty()) {
            record.error_detail = error.detail;
        }
        record.destination_folder_id = destination_folder_id_;
        record_history(std::move(record));
    }

    emit(events::UploadFailedEvent{current_file_name_, error});
    return UploadFailed{error};
}

UploadStatus UploadOrchestrator::fail(ErrorKind kind, std::string message, std::string detail) {
    return fail(make_error(kind, std::move(message), std::move(detail)));
}

void UploadOrchestrator::record_history(store::UploadRecord record) {
    auto inserted = history_.insert(record);
    if (inserted.is_error()) {
        spdlog::error("Could not record {} for {} in history: {} ({})",
                      store::to_string(record.outcome), record.file_name,
                      inserted.error().summary(), inserted.error().detail);
    }
}

std::chrono::system_clock::time_point UploadOrchestrator::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

bool UploadOrchestrator::stop_requested() const {
    return options_.stop_flag && options_.stop_flag->load();
}

} // namespace cbu::upload
