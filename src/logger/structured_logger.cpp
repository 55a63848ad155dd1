// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// 이벤트 한 건 = JSON 객체 한 줄. 앞부분은 spdlog 패턴(시각, 레벨)이 붙는다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_format.hpp"

#include <chrono>
#include <cstddef>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace {

constexpr std::size_t kMaxLogFileBytes = 100u * 1024u * 1024u;
constexpr std::size_t kMaxLogFiles     = 3;

// UTC, 밀리초 단위 ISO8601 (예: 2024-05-01T12:00:00.123Z)
std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto        millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
    const std::time_t secs   = system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&secs, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

spdlog::level::level_enum spdlog_level_of(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// stdout + 회전 파일. 부모 디렉터리가 없으면 만든다.
std::vector<spdlog::sink_ptr> make_sinks(const std::filesystem::path& log_path) {
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
    }
    return {
        std::make_shared<spdlog::sinks::stdout_sink_mt>(),
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path.string(), kMaxLogFileBytes, kMaxLogFiles),
    };
}

}  // namespace

LogLevel parse_log_level(std::string_view level_str) noexcept {
    if (level_str == "debug") { return LogLevel::kDebug; }
    if (level_str == "warn")  { return LogLevel::kWarn;  }
    if (level_str == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    std::vector<spdlog::sink_ptr> sinks;
    try {
        sinks = make_sinks(log_path_);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(fmt::format("cannot open event log {}: {}",
                                             log_path_.string(), ex.what()));
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(fmt::format("cannot create event log directory for {}: {}",
                                             log_path_.string(), ex.what()));
    }

    logger_ = std::make_shared<spdlog::logger>("surfacegate", sinks.begin(), sinks.end());
    logger_->set_level(spdlog_level_of(min_level_));
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger_->flush_on(spdlog::level::trace);
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::emit(LogLevel level, const std::string& line) {
    if (!logger_) {
        return;   // moved-from
    }
    logger_->log(spdlog_level_of(level), line);
}

void StructuredLogger::log_environment_load(const EnvironmentLoadLog& entry) {
    if (min_level_ > LogLevel::kInfo) {
        return;
    }
    emit(LogLevel::kInfo,
         fmt::format(R"({{"event":"environment_loaded","source_path":{},"vm_count":{},)"
                     R"("fw_rule_count":{},"timestamp":"{}","duration_us":{}}})",
                     json_quote(entry.source_path), entry.vm_count, entry.fw_rule_count,
                     iso8601_utc(entry.timestamp), entry.duration.count()));
}

// ---------------------------------------------------------------------------
// log_query
//   found 는 debug, not found 는 info.
//   조회마다 불리므로 레벨 확인을 직렬화보다 먼저 한다.
// ---------------------------------------------------------------------------
void StructuredLogger::log_query(const AttackQueryLog& entry) {
    const LogLevel level = entry.found ? LogLevel::kDebug : LogLevel::kInfo;
    if (min_level_ > level) {
        return;
    }
    emit(level,
         fmt::format(R"({{"event":"attack_query","vm_id":{},"found":{},"attacker_count":{},)"
                     R"("transport":{},"timestamp":"{}","duration_us":{}}})",
                     json_quote(entry.vm_id), entry.found, entry.attacker_count,
                     json_quote(entry.transport), iso8601_utc(entry.timestamp),
                     entry.duration.count()));
}

void StructuredLogger::debug(std::string_view msg) { emit(LogLevel::kDebug, std::string{msg}); }
void StructuredLogger::info(std::string_view msg)  { emit(LogLevel::kInfo,  std::string{msg}); }
void StructuredLogger::warn(std::string_view msg)  { emit(LogLevel::kWarn,  std::string{msg}); }
void StructuredLogger::error(std::string_view msg) { emit(LogLevel::kError, std::string{msg}); }
