#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Decision
//   1차 필터 판정 결과.
//   kAllow    : 통과 (2차 평가 생략)
//   kBlock    : 즉시 거부
//   kEscalate : 2차(S2) 평가기로 전달
// ---------------------------------------------------------------------------
enum class Decision : std::uint8_t {
    kAllow    = 0,
    kBlock    = 1,
    kEscalate = 2,
};

// ---------------------------------------------------------------------------
// to_string
//   로그/출력용 대문자 표기 ("ALLOW" | "BLOCK" | "ESCALATE").
// ---------------------------------------------------------------------------
[[nodiscard]] constexpr std::string_view to_string(Decision decision) noexcept {
    switch (decision) {
        case Decision::kAllow:
            return "ALLOW";
        case Decision::kBlock:
            return "BLOCK";
        case Decision::kEscalate:
            return "ESCALATE";
    }
    return "ESCALATE";
}

// 규칙 매칭 없이 결정된 판정의 rule_id / message
inline constexpr std::string_view kNoRuleId               = "N/A";
inline constexpr std::string_view kDefaultRuleId          = "N/A_DEFAULT";
inline constexpr std::string_view kEmptyInputMessage      = "Empty input";
inline constexpr std::string_view kDefaultEscalateMessage = "Default escalate (Zero-Trust)";

// ---------------------------------------------------------------------------
// FilterResult
//   classify() 1회 호출의 결과. 엔진은 이 값을 보관하지 않는다.
//
//   rule_id : 매칭된 규칙 ID. 규칙 평가 없이 결정되면 "N/A",
//             어떤 규칙도 매칭되지 않으면 "N/A_DEFAULT".
//   message : 규칙에 설정된 설명 (또는 기본 메시지)
//   rule_matched : 설정된 규칙이 판정을 결정했으면 true.
//                  빈 입력 / default escalate 는 false. 규칙 id 는 자유
//                  형식이므로 통계는 이 값으로 기본 경로를 구분한다.
//
//   기본값은 kEscalate (zero-trust).
// ---------------------------------------------------------------------------
struct FilterResult {
    Decision    decision{Decision::kEscalate};
    std::string rule_id{};
    std::string message{};
    bool        rule_matched{false};
};
