#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 규칙 소스(YAML) 에서 읽어 들인 원본 규칙 구조체 정의 (헤더만, 구현 없음).
// RuleLoader::load 가 채우고 RuleEngine::build 가 컴파일한다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 필드 기본값은 규칙 소스에서 해당 키가 누락됐을 때의 값이다.
// - message 기본값은 목록마다 다르므로 (whitelist / blacklist)
//   여기서는 std::nullopt 로 두고 RuleEngine 이 결정한다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RuleRecord
//   규칙 하나. 목록 내 위치가 우선순위이다 (앞쪽이 먼저 평가되고 이긴다).
//
//   id      : 규칙 식별자. 유일성은 강제하지 않는다.
//   pattern : 정규식 원문. 필수 항목이며 없으면 build 단계에서 제외된다.
//   action  : blacklist 전용. "block" 외의 모든 값은 escalate 로 취급.
//             whitelist 규칙에서는 무시된다 (매칭 = 항상 ALLOW).
// ---------------------------------------------------------------------------
struct RuleRecord {
    std::string                id{"N/A"};
    std::optional<std::string> pattern{};
    std::optional<std::string> message{};
    std::string                action{"escalate"};
};

// ---------------------------------------------------------------------------
// RuleSetConfig
//   규칙 소스 전체. RuleLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct RuleSetConfig {
    std::vector<RuleRecord> whitelist{};
    std::vector<RuleRecord> blacklist{};
};
