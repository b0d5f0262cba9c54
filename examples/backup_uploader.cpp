#include "cbu/config/config.hpp"
#include "cbu/events/components.hpp"
#include "cbu/events/event_bus.hpp"
#include "cbu/network/http_transport.hpp"
#include "cbu/remote/drive_client.hpp"
#include "cbu/remote/token_provider.hpp"
#include "cbu/source/file_source.hpp"
#include "cbu/store/sqlite_database.hpp"
#include "cbu/store/sqlite_history_recorder.hpp"
#include "cbu/store/sqlite_session_store.hpp"
#include "cbu/upload/attempt_policy.hpp"
#include "cbu/upload/orchestrator.hpp"
#include "cbu/util/format.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using cbu::upload::AttemptDecision;
using cbu::upload::AttemptPolicy;
using cbu::upload::UploadStatus;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <file>] [--once] [--history]\n"
              << "  --config <file>  JSON configuration (default: uploader.json)\n"
              << "  --once           run a single attempt and exit\n"
              << "  --history        print the upload history and exit\n";
}

std::tm local_now() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

/// Sleeps up to `delay`, waking early when a signal arrives.
void wait_for(std::chrono::minutes delay) {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!g_stop && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

int print_history(cbu::store::HistoryRecorder& history) {
    auto rows = history.all();
    if (rows.is_error()) {
        spdlog::error("Cannot read history: {} ({})", rows.error().summary(), rows.error().detail);
        return 1;
    }
    if (rows.value().empty()) {
        std::cout << "No uploads yet\n";
        return 0;
    }

    for (const auto& record : rows.value()) {
        const auto t = std::chrono::system_clock::to_time_t(record.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);

        std::cout << std::put_time(&tm, "%Y-%m-%d %H:%M") << "  "
                  << std::left << std::setw(8) << cbu::store::to_string(record.outcome)
                  << std::setw(10) << cbu::util::format_file_size(record.size) << "  "
                  << (record.file_name.empty() ? "-" : record.file_name);
        if (record.remote_file_id) {
            std::cout << "  id=" << *record.remote_file_id;
        }
        if (record.error_message) {
            std::cout << "  " << *record.error_message;
        }
        std::cout << "\n";
    }
    return 0;
}

int exit_code(const UploadStatus& status) {
    if (std::holds_alternative<cbu::upload::UploadSucceeded>(status)) {
        return 0;
    }
    if (std::holds_alternative<cbu::upload::NeedsConsent>(status)) {
        return 3;
    }
    if (const auto* failed = std::get_if<cbu::upload::UploadFailed>(&status)) {
        return failed->error.kind == cbu::ErrorKind::ConfigurationIncomplete ? 2 : 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path = "uploader.json";
    bool once = false;
    bool show_history = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--history") {
            show_history = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto loaded = cbu::config::UploaderConfig::load_file(config_path);
    if (loaded.is_error()) {
        spdlog::error("{} ({})", loaded.error().summary(), loaded.error().detail);
        return 2;
    }
    const auto& config = loaded.value();

    if (auto level = cbu::config::parse_log_level(config.log_level); level.is_ok()) {
        spdlog::set_level(level.value());
    }

    auto db = cbu::store::SqliteDatabase::open(config.state_db_path);
    if (db.is_error()) {
        spdlog::error("{} ({})", db.error().summary(), db.error().detail);
        return 1;
    }
    auto history = cbu::store::SqliteHistoryRecorder::create(db.value());
    if (history.is_error()) {
        spdlog::error("{} ({})", history.error().summary(), history.error().detail);
        return 1;
    }

    if (show_history) {
        return print_history(*history.value());
    }

    if (auto valid = config.validate(); valid.is_error()) {
        spdlog::error("{} ({})", valid.error().summary(), valid.error().detail);
        return 2;
    }

    auto sessions = cbu::store::SqliteSessionStore::create(db.value());
    if (sessions.is_error()) {
        spdlog::error("{} ({})", sessions.error().summary(), sessions.error().detail);
        return 1;
    }

    if (config.wifi_only) {
        spdlog::info("Uploads are restricted to unmetered networks; the host scheduler must enforce this");
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    cbu::events::EventBus bus;
    cbu::events::LoggerComponent logger(bus);
    cbu::events::MetricsComponent metrics(bus);

    cbu::network::BeastHttpTransport transport(std::chrono::seconds(config.http_timeout_seconds));
    cbu::remote::FileTokenProvider tokens(config.access_token_file);
    cbu::remote::DriveUploadClient endpoint(transport, tokens,
                                            cbu::remote::DriveEndpoints{config.upload_endpoint, config.api_endpoint});
    cbu::source::LocalFileSource files(config.source_dir, config.file_pattern);

    cbu::upload::OrchestratorOptions options;
    options.chunk_size = static_cast<std::size_t>(config.chunk_size_bytes);
    options.mime_type = config.mime_type;
    options.stop_flag = &g_stop;

    cbu::upload::UploadOrchestrator orchestrator(*sessions.value(), files, endpoint, *history.value(),
                                                 config.destination_folder_id, options, &bus);

    const cbu::upload::DailySchedule schedule{config.schedule_hour, config.schedule_minute};
    const AttemptPolicy policy(config.max_attempts, std::chrono::minutes(config.retry_delay_minutes), schedule);

    auto print_progress = [](const cbu::upload::UploadProgress& p) {
        std::cout << "\r" << std::setw(3) << p.percent_complete() << "%  "
                  << cbu::util::format_file_size(p.bytes_uploaded) << " / "
                  << cbu::util::format_file_size(p.total_bytes) << "  "
                  << cbu::util::format_file_size(static_cast<std::uint64_t>(p.speed_bytes_per_sec)) << "/s  ETA "
                  << cbu::util::format_duration(p.estimated_seconds_remaining) << "    " << std::flush;
    };

    int attempts = 0;
    bool extra_retry_used = false;
    int last_code = 0;
    while (!g_stop) {
        const auto status = orchestrator.run(print_progress);
        std::cout << "\n" << cbu::upload::describe(status) << std::endl;
        last_code = exit_code(status);

        const auto decision = policy.decide(status, attempts + 1);
        if (decision.consumes_attempt) {
            ++attempts;
        }
        if (once || g_stop) {
            break;
        }
        if (last_code == 2 || last_code == 3) {
            // Needs the user: fix the configuration or sign in again
            break;
        }

        std::chrono::minutes delay{0};
        if (decision.action == AttemptDecision::Action::RetryLater) {
            delay = decision.delay;
            spdlog::info("Attempt {}/{} failed, retrying in {} min", attempts, policy.max_attempts(), delay.count());
        } else {
            const auto now = local_now();
            std::optional<std::chrono::minutes> retry;
            if (decision.action == AttemptDecision::Action::GiveUp && !extra_retry_used) {
                retry = policy.manual_retry_delay(now);
            }
            if (retry) {
                // One more attempt only; a failure after it waits for the regular run
                extra_retry_used = true;
                attempts = policy.max_attempts() - 1;
                delay = *retry;
                spdlog::info("Automatic attempts exhausted, one more retry in {} min", delay.count());
            } else {
                extra_retry_used = false;
                attempts = 0;
                delay = AttemptPolicy::until_next_run(now, schedule);
                spdlog::info("Next regular run at {}", cbu::util::format_schedule_time(schedule.hour, schedule.minute));
            }
        }
        wait_for(delay);
    }

    const auto& stats = metrics.get_stats();
    spdlog::info("Completed={} deduplicated={} failed={} resumed={} chunks={} bytes={}",
                 stats.uploads_completed.load(), stats.uploads_deduplicated.load(), stats.uploads_failed.load(),
                 stats.uploads_resumed.load(), stats.chunks_sent.load(),
                 cbu::util::format_file_size(stats.bytes_sent.load()));
    return last_code;
}
