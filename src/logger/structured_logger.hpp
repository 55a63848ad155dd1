#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 이벤트 로거 인터페이스.
//
// - 전역 레지스트리에 등록하지 않는다. 소유자가 인스턴스를 주입한다.
// - sink 는 _mt 계열이라 워커 스레드 여러 개가 동시에 호출해도 된다.
// - 이벤트 필드는 snake_case JSON 키로 한 줄에 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   EnvironmentLoadLog / AttackQueryLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   [예외] sink 생성 실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_environment_load
    //   환경 로드 완료 이벤트를 info 레벨로 기록한다.
    void log_environment_load(const EnvironmentLoadLog& entry);

    // log_query
    //   공격자 조회 결과를 기록한다.
    //   found == true  → debug 레벨
    //   found == false → info 레벨 (알 수 없는 vm_id 는 운영자가 볼 수 있어야 한다)
    void log_query(const AttackQueryLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

private:
    // 레벨 필터를 통과한 이벤트 한 줄을 기록한다.
    void emit(LogLevel level, const std::string& line);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ---------------------------------------------------------------------------
// parse_log_level
//   "debug" | "info" | "warn" | "error" 문자열 → LogLevel.
//   알 수 없는 값은 kInfo.
// ---------------------------------------------------------------------------
[[nodiscard]] LogLevel parse_log_level(std::string_view level_str) noexcept;
