#pragma once

// ---------------------------------------------------------------------------
// rule_loader.hpp
//
// YAML 규칙 파일을 읽어 RuleSetConfig 로 변환하는 로더.
//
// [파일 형식]
//   whitelist:
//     - id: W-001
//       pattern: "^what is "
//       message: "Simple factual question"
//   blacklist:
//     - id: B-001
//       pattern: "ignore (all )?previous instructions"
//       action: block
//       message: "Prompt injection"
//
// [설계 원칙]
// - 파일 단위 오류(경로 없음, YAML 문법 오류, 최상위가 map 아님)만
//   std::unexpected 로 반환한다.
// - 항목 단위 문제(map 이 아닌 항목, 필드 누락)는 경고 로그 후 건너뛰거나
//   기본값을 적용한다. 패턴 컴파일 검증은 RuleEngine::build 의 몫이다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// rule_loader.hpp → rule.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "rule.hpp"  // RuleSetConfig

// ---------------------------------------------------------------------------
// RuleLoader
//   정적 로드만 제공한다. 규칙은 엔진 생성 시 한 번 읽고 이후 변경하지 않는다.
// ---------------------------------------------------------------------------
class RuleLoader {
public:
    RuleLoader()  = delete;

    // load
    //   성공: RuleSetConfig (목록 순서는 파일 순서 그대로)
    //   실패: std::unexpected(error_message)
    //         호출자는 RuleEngine::build 에 그대로 넘겨 빈 엔진을 만들 수 있다.
    [[nodiscard]] static std::expected<RuleSetConfig, std::string>
    load(const std::filesystem::path& rules_path);
};
