#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - 입력 원문은 로그 구조체에 담지 않는다. 길이만 기록한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // Decision

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. 환경변수 LOG_LEVEL 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// DecisionLog
//   classify() 1회의 판정 로그.
//   duration: 정규화 + 규칙 평가 소요 시간
// ---------------------------------------------------------------------------
struct DecisionLog {
    Decision                                   decision{Decision::kEscalate};
    std::string                                rule_id{};
    std::string                                message{};
    std::size_t                                input_length{0};  // 원문 바이트 수
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};

// ---------------------------------------------------------------------------
// RuleLoadLog
//   규칙 로드/엔진 생성 결과 로그.
//   rejected_rules: BuildDiagnostic 개수 (소스 로드 실패 포함)
// ---------------------------------------------------------------------------
struct RuleLoadLog {
    std::string                                source{};
    std::size_t                                whitelist_rules{0};
    std::size_t                                blacklist_rules{0};
    std::size_t                                rejected_rules{0};
    std::chrono::system_clock::time_point      timestamp{};
};
