#pragma once

// ---------------------------------------------------------------------------
// rule_engine.hpp
//
// 정규화된 입력 텍스트를 whitelist → blacklist 순서로 평가하여
// ALLOW / BLOCK / ESCALATE 를 판정하는 1차 필터 엔진.
//
// [평가 순서: 절대 변경 금지]
// 1. 빈 입력 (정규화 전 검사)  → kAllow, "N/A", "Empty input"
// 2. whitelist 순차 검사        → 첫 매칭 규칙으로 kAllow
// 3. blacklist 순차 검사        → 첫 매칭 규칙의 action 에 따라 kBlock / kEscalate
// 4. 일치 없음                  → kEscalate, "N/A_DEFAULT" (zero-trust)
//
// ❌ 금지: 일치 없음 → kAllow
// ❌ 금지: 규칙 목록 재정렬 (목록 내 위치가 곧 우선순위)
//
// [Best-effort 생성]
// build() 는 실패하지 않는다. 컴파일되지 않는 패턴, pattern 누락 규칙,
// 규칙 소스 로드 실패는 모두 BuildDiagnostic 으로 누적되고 해당 규칙만
// 제외된다. 규칙이 0개인 엔진도 유효하다 (모든 입력 → default escalate).
//
// [순환 의존성]
// rule_engine.hpp → rule.hpp, common/types.hpp (단방향)
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/uversion.h>

#include "common/types.hpp"  // Decision, FilterResult
#include "rule.hpp"          // RuleSetConfig

U_NAMESPACE_BEGIN
class UnicodeString;
U_NAMESPACE_END

// message 누락 시 목록별 기본값
inline constexpr std::string_view kWhitelistMessage = "Whitelist matched";
inline constexpr std::string_view kBlacklistMessage = "No message";

// ---------------------------------------------------------------------------
// RuleAction
//   blacklist 규칙의 동작. 규칙 소스의 자유 형식 문자열을 build 시점에
//   한 번만 변환한다.
// ---------------------------------------------------------------------------
enum class RuleAction : std::uint8_t {
    kBlock    = 0,
    kEscalate = 1,
};

// parse_rule_action
//   "block" (대소문자 무시) → kBlock, 그 외 모든 값 → kEscalate.
[[nodiscard]] RuleAction parse_rule_action(std::string_view action) noexcept;

// ---------------------------------------------------------------------------
// BuildDiagnostic
//   엔진 생성 중 발생한 비치명적 문제 하나.
//   list    : "whitelist" | "blacklist" | "" (소스 단위 문제)
//   detail  : 사람이 읽을 수 있는 설명 (regex 오류 메시지 등)
// ---------------------------------------------------------------------------
enum class DiagnosticKind : std::uint8_t {
    kSourceUnavailable = 0,  // 규칙 소스 로드 실패 → 빈 규칙 목록
    kMissingPattern    = 1,  // pattern 필드 없음 → 규칙 제외
    kInvalidPattern    = 2,  // regex 컴파일 실패 → 규칙 제외
};

struct BuildDiagnostic {
    DiagnosticKind kind{DiagnosticKind::kInvalidPattern};
    std::string    list{};
    std::string    rule_id{};
    std::string    pattern{};
    std::string    detail{};
};

struct BuildResult;

// ---------------------------------------------------------------------------
// RuleEngine
//
//   [스레드 안전성]
//   - 규칙 목록은 생성 후 불변. classify() 는 concurrent 호출 안전.
//
//   [성능 고려사항]
//   - O(R * N): 규칙 수 R, 입력 길이 N. whitelist 를 먼저 검사하므로
//     정상 입력은 blacklist 비용을 치르지 않는다.
// ---------------------------------------------------------------------------
class RuleEngine {
public:
    // build
    //   규칙 소스로부터 엔진을 만든다. 예외를 던지지 않는다.
    [[nodiscard]] static BuildResult build(const RuleSetConfig& config);

    // build (로드 결과 직접 수용)
    //   source 가 오류이면 빈 엔진 + kSourceUnavailable 진단 1개.
    [[nodiscard]] static BuildResult build(
        const std::expected<RuleSetConfig, std::string>& source);

    ~RuleEngine();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    RuleEngine(const RuleEngine&)            = delete;
    RuleEngine& operator=(const RuleEngine&) = delete;
    RuleEngine(RuleEngine&&) noexcept;
    RuleEngine& operator=(RuleEngine&&) noexcept;

    // classify
    //   text: 원문 입력 (UTF-8). 내부에서 normalize_text() 를 적용한다.
    //   모든 입력에 대해 유효한 FilterResult 를 반환한다.
    //   매칭은 정규화된 텍스트 전체에서의 부분 검색 (RegexMatcher::find).
    //   규칙별 매칭은 스택/시간 한도 안에서 수행되며, 한도를 넘은 규칙은
    //   불일치로 처리한다.
    [[nodiscard]] FilterResult classify(std::string_view text) const;

    [[nodiscard]] std::size_t whitelist_size() const noexcept;
    [[nodiscard]] std::size_t blacklist_size() const noexcept;

private:
    // 컴파일된 정규식과 원본 규칙 정보를 쌍으로 보관. 정의는 구현 파일.
    struct CompiledRule;

    RuleEngine(std::vector<CompiledRule> whitelist, std::vector<CompiledRule> blacklist);

    [[nodiscard]] static std::vector<CompiledRule> compile_rules(
        const std::vector<RuleRecord>& records,
        std::string_view               list_name,
        std::string_view               default_message,
        std::vector<BuildDiagnostic>&  diagnostics);

    [[nodiscard]] static const CompiledRule* first_match(
        const std::vector<CompiledRule>& rules,
        const icu::UnicodeString&        normalized);

    std::vector<CompiledRule> whitelist_;
    std::vector<CompiledRule> blacklist_;
};

// ---------------------------------------------------------------------------
// BuildResult
//   생성된 엔진 + 비치명적 진단 목록.
//   diagnostics 가 비어 있지 않으면 필터링 범위가 줄어든 상태이다.
// ---------------------------------------------------------------------------
struct BuildResult {
    RuleEngine                   engine;
    std::vector<BuildDiagnostic> diagnostics{};
};
