/**
 * @file components.hpp
 * @brief Ready-made subscribers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * orchestrator.run(...);   // emits on bus
 * metrics.get_stats().uploads_completed.load();
 */

#pragma once

#include "cbu/events/event_bus.hpp"
#include "cbu/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace cbu::events {

/**
 * @brief Logs every upload event through spdlog
 *
 * Chunk traffic goes to debug, lifecycle to info, failures to error and
 * consent prompts to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) { on_started(e); });
        bus_.subscribe<UploadResumedEvent>([this](const UploadResumedEvent& e) { on_resumed(e); });
        bus_.subscribe<SessionDiscardedEvent>([this](const SessionDiscardedEvent& e) { on_discarded(e); });
        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) { on_chunk(e); });
        bus_.subscribe<ChunkRetriedEvent>([this](const ChunkRetriedEvent& e) { on_chunk_retry(e); });
        bus_.subscribe<DuplicateSkippedEvent>([this](const DuplicateSkippedEvent& e) { on_duplicate(e); });
        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) { on_completed(e); });
        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) { on_failed(e); });
        bus_.subscribe<ConsentRequiredEvent>([this](const ConsentRequiredEvent& e) { on_consent(e); });
    }

private:
    void on_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] file={} bytes={}", e.file_name, e.total_bytes);
    }

    void on_resumed(const UploadResumedEvent& e) {
        spdlog::info("[UploadResumed] file={} confirmed={}/{}", e.file_name, e.confirmed_bytes, e.total_bytes);
    }

    void on_discarded(const SessionDiscardedEvent& e) {
        spdlog::info("[SessionDiscarded] file={} reason={}", e.file_name, e.reason);
    }

    void on_chunk(const ChunkAcceptedEvent& e) {
        spdlog::debug("[ChunkAccepted] file={} chunk={} confirmed={}/{}",
                      e.file_name, e.chunk_bytes, e.confirmed_bytes, e.total_bytes);
    }

    void on_chunk_retry(const ChunkRetriedEvent& e) {
        spdlog::warn("[ChunkRetried] file={} offset={} stalls={}", e.file_name, e.offset, e.consecutive_stalls);
    }

    void on_duplicate(const DuplicateSkippedEvent& e) {
        spdlog::info("[DuplicateSkipped] file={} bytes={} remote_id={}", e.file_name, e.size, e.remote_file_id);
    }

    void on_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] file={} bytes={} remote_id={} verified={} duration={}ms",
                     e.file_name, e.total_bytes, e.remote_file_id, e.checksum_verified, e.duration.count());
    }

    void on_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] file={} {} ({})", e.file_name, e.error.summary(), e.error.detail);
    }

    void on_consent(const ConsentRequiredEvent& e) {
        spdlog::warn("[ConsentRequired] {}", e.auth_challenge.empty() ? "sign-in required" : e.auth_challenge);
    }

    EventBus& bus_;
};

/**
 * @brief Counts upload activity for reporting
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_resumed{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_deduplicated{0};
        std::atomic<uint64_t> sessions_discarded{0};
        std::atomic<uint64_t> consent_prompts{0};
        std::atomic<uint64_t> chunks_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> chunk_retries{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) { stats_.uploads_started++; });
        bus_.subscribe<UploadResumedEvent>([this](const UploadResumedEvent&) { stats_.uploads_resumed++; });
        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) { stats_.uploads_completed++; });
        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) { stats_.uploads_failed++; });
        bus_.subscribe<DuplicateSkippedEvent>([this](const DuplicateSkippedEvent&) {
            stats_.uploads_deduplicated++;
        });
        bus_.subscribe<SessionDiscardedEvent>([this](const SessionDiscardedEvent&) { stats_.sessions_discarded++; });
        bus_.subscribe<ConsentRequiredEvent>([this](const ConsentRequiredEvent&) { stats_.consent_prompts++; });
        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_sent++;
            stats_.bytes_sent += e.chunk_bytes;
        });
        bus_.subscribe<ChunkRetriedEvent>([this](const ChunkRetriedEvent&) {
            stats_.chunks_sent++;
            stats_.chunk_retries++;
        });
    }

    const Stats& get_stats() const { return stats_; }

    void reset() {
        stats_.uploads_started = 0;
        stats_.uploads_resumed = 0;
        stats_.uploads_completed = 0;
        stats_.uploads_failed = 0;
        stats_.uploads_deduplicated = 0;
        stats_.sessions_discarded = 0;
        stats_.consent_prompts = 0;
        stats_.chunks_sent = 0;
        stats_.bytes_sent = 0;
        stats_.chunk_retries = 0;
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace cbu::events
