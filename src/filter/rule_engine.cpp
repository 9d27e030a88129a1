// ---------------------------------------------------------------------------
// rule_engine.cpp
//
// whitelist → blacklist → default escalate 규칙 평가 구현.
//
// [CompiledRule 구현 주의사항]
// RuleEngine 헤더는 CompiledRule 을 전방 선언만 하므로, vector<CompiledRule>
// 의 소멸/이동이 필요한 특수 멤버 함수는 CompiledRule 정의 이후인
// 이 파일에서 정의한다.
//
// [정규식 엔진]
// ICU RegexPattern / RegexMatcher 를 사용한다.
// - 코드포인트 단위 매칭 (\b, [a-z] 등이 UTF-8 바이트가 아닌 문자 기준)
// - 백트래킹 상태는 힙에 쌓이므로 입력 길이에 비례해 네이티브 스택을
//   소모하지 않는다. 스택/시간 한도 초과는 UErrorCode 로 보고된다.
// - RegexPattern 은 불변이며 여러 스레드에서 matcher() 호출이 안전하다.
//   RegexMatcher 는 스레드 안전하지 않으므로 classify 호출마다 생성한다.
// ---------------------------------------------------------------------------

#include "filter/rule_engine.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unicode/parseerr.h>
#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include "normalizer/text_normalizer.hpp"

namespace {

// 매칭 1회당 백트래킹 스택 한도 (바이트, 힙 할당)
constexpr int32_t kMatchStackLimitBytes = 8 * 1024 * 1024;

// 매칭 1회당 시간 한도 (ICU work unit, 대략 1ms 단위)
constexpr int32_t kMatchTimeLimit = 2000;

[[nodiscard]] icu::UnicodeString to_unicode(std::string_view text) {
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        text = text.substr(0, static_cast<std::size_t>(std::numeric_limits<int32_t>::max()));
    }
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

}  // namespace

struct RuleEngine::CompiledRule {
    std::string                              id;
    std::string                              source_pattern;  // 원본 패턴 (감사 로그용)
    std::string                              message;
    RuleAction                               action{RuleAction::kEscalate};
    std::shared_ptr<const icu::RegexPattern> compiled;
};

// ---------------------------------------------------------------------------
// parse_rule_action
// ---------------------------------------------------------------------------
RuleAction parse_rule_action(std::string_view action) noexcept {
    constexpr std::string_view kBlockKeyword = "block";
    const bool is_block = std::ranges::equal(
        action, kBlockKeyword,
        [](char lhs, char rhs) {
            return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
        });
    return is_block ? RuleAction::kBlock : RuleAction::kEscalate;
}

RuleEngine::RuleEngine(std::vector<CompiledRule> whitelist, std::vector<CompiledRule> blacklist)
    : whitelist_(std::move(whitelist))
    , blacklist_(std::move(blacklist))
{}

RuleEngine::~RuleEngine()                                = default;
RuleEngine::RuleEngine(RuleEngine&&) noexcept            = default;
RuleEngine& RuleEngine::operator=(RuleEngine&&) noexcept = default;

// ---------------------------------------------------------------------------
// compile_rules
//   소스 순서를 유지하며 규칙을 컴파일한다. 실패한 규칙은 진단에 기록 후 제외.
// ---------------------------------------------------------------------------
std::vector<RuleEngine::CompiledRule> RuleEngine::compile_rules(
    const std::vector<RuleRecord>& records,
    std::string_view               list_name,
    std::string_view               default_message,
    std::vector<BuildDiagnostic>&  diagnostics)
{
    std::vector<CompiledRule> compiled;
    compiled.reserve(records.size());

    for (const auto& record : records) {
        if (!record.pattern) {
            spdlog::warn("rule_engine: {} rule '{}' has no pattern, skipping",
                         list_name, record.id);
            diagnostics.push_back(BuildDiagnostic{
                .kind    = DiagnosticKind::kMissingPattern,
                .list    = std::string(list_name),
                .rule_id = record.id,
                .pattern = {},
                .detail  = "missing pattern",
            });
            continue;
        }

        // 정규화된 텍스트는 이미 소문자이므로 대소문자 무시 플래그를 쓰지 않는다.
        UErrorCode  status = U_ZERO_ERROR;
        UParseError parse_error{};
        std::unique_ptr<icu::RegexPattern> pattern(icu::RegexPattern::compile(
            to_unicode(*record.pattern), 0, parse_error, status));

        if (U_FAILURE(status) || !pattern) {
            // 잘못된 패턴은 제외. 나머지 규칙은 계속 적용된다.
            const std::string detail = fmt::format(
                "{} at offset {}", u_errorName(status), parse_error.offset);
            spdlog::warn("rule_engine: invalid {} regex '{}' for rule '{}', skipping: {}",
                         list_name, *record.pattern, record.id, detail);
            diagnostics.push_back(BuildDiagnostic{
                .kind    = DiagnosticKind::kInvalidPattern,
                .list    = std::string(list_name),
                .rule_id = record.id,
                .pattern = *record.pattern,
                .detail  = detail,
            });
            continue;
        }

        compiled.push_back(CompiledRule{
            .id             = record.id,
            .source_pattern = *record.pattern,
            .message        = record.message.value_or(std::string(default_message)),
            .action         = parse_rule_action(record.action),
            .compiled       = std::shared_ptr<const icu::RegexPattern>(std::move(pattern)),
        });
    }

    return compiled;
}

// ---------------------------------------------------------------------------
// build
// ---------------------------------------------------------------------------
BuildResult RuleEngine::build(const RuleSetConfig& config) {
    std::vector<BuildDiagnostic> diagnostics;

    auto whitelist = compile_rules(config.whitelist, "whitelist", kWhitelistMessage, diagnostics);
    auto blacklist = compile_rules(config.blacklist, "blacklist", kBlacklistMessage, diagnostics);

    spdlog::info("rule_engine: {} whitelist / {} blacklist rules active, {} rejected",
                 whitelist.size(), blacklist.size(), diagnostics.size());

    return BuildResult{
        .engine      = RuleEngine(std::move(whitelist), std::move(blacklist)),
        .diagnostics = std::move(diagnostics),
    };
}

BuildResult RuleEngine::build(const std::expected<RuleSetConfig, std::string>& source) {
    if (source) {
        return build(*source);
    }

    spdlog::warn("rule_engine: rule source unavailable, starting with no rules: {}",
                 source.error());

    std::vector<BuildDiagnostic> diagnostics;
    diagnostics.push_back(BuildDiagnostic{
        .kind    = DiagnosticKind::kSourceUnavailable,
        .list    = {},
        .rule_id = {},
        .pattern = {},
        .detail  = source.error(),
    });

    return BuildResult{
        .engine      = RuleEngine({}, {}),
        .diagnostics = std::move(diagnostics),
    };
}

// ---------------------------------------------------------------------------
// first_match
//   목록 순서대로 검사하여 첫 매칭 규칙을 반환한다 (없으면 nullptr).
//   매칭 중 ICU 오류(스택/시간 한도 초과 등)가 나면 해당 규칙은 불일치로
//   처리한다. classify 는 오류를 밖으로 내보내지 않는다.
// ---------------------------------------------------------------------------
const RuleEngine::CompiledRule* RuleEngine::first_match(
    const std::vector<CompiledRule>& rules,
    const icu::UnicodeString&        normalized)
{
    for (const auto& rule : rules) {
        if (!rule.compiled) {
            continue;
        }

        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexMatcher> matcher(rule.compiled->matcher(normalized, status));
        if (U_SUCCESS(status) && matcher) {
            matcher->setStackLimit(kMatchStackLimitBytes, status);
            matcher->setTimeLimit(kMatchTimeLimit, status);
        }
        if (U_FAILURE(status) || !matcher) {
            spdlog::warn("rule_engine: cannot create matcher for rule '{}', treating as no match: {}",
                         rule.id, u_errorName(status));
            continue;
        }

        const bool found = matcher->find(status);
        if (U_FAILURE(status)) {
            spdlog::warn("rule_engine: regex search failed for rule '{}', treating as no match: {}",
                         rule.id, u_errorName(status));
            continue;
        }
        if (found) {
            return &rule;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// classify
// ---------------------------------------------------------------------------
FilterResult RuleEngine::classify(std::string_view text) const {
    // 1. 빈 입력: 정규화/규칙 평가 없이 허용
    if (text.empty()) {
        return FilterResult{
            Decision::kAllow,
            std::string(kNoRuleId),
            std::string(kEmptyInputMessage),
        };
    }

    const icu::UnicodeString normalized = to_unicode(normalize_text(text));

    // 2. whitelist: 매칭 시 즉시 허용 (blacklist 생략)
    if (const CompiledRule* rule = first_match(whitelist_, normalized)) {
        return FilterResult{Decision::kAllow, rule->id, rule->message, true};
    }

    // 3. blacklist: BLOCK 외의 action 은 모두 2차 평가로 넘긴다
    if (const CompiledRule* rule = first_match(blacklist_, normalized)) {
        const Decision decision = (rule->action == RuleAction::kBlock)
            ? Decision::kBlock
            : Decision::kEscalate;
        return FilterResult{decision, rule->id, rule->message, true};
    }

    // 4. default escalate (zero-trust)
    return FilterResult{
        Decision::kEscalate,
        std::string(kDefaultRuleId),
        std::string(kDefaultEscalateMessage),
    };
}

std::size_t RuleEngine::whitelist_size() const noexcept {
    return whitelist_.size();
}

std::size_t RuleEngine::blacklist_size() const noexcept {
    return blacklist_.size();
}
