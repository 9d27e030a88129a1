#pragma once

// ---------------------------------------------------------------------------
// text_normalizer.hpp
//
// 규칙 매칭 전에 입력 텍스트를 비교용 정규형으로 변환한다.
// 대소문자, 공백, 보이지 않는 문자(zero-width 등)를 이용한 우회를 무력화한다.
//
// [처리 순서: 변경 금지]
// 1. 빈 입력 → 빈 문자열 즉시 반환
// 2. NFKC 정규화 (ICU 실패 시 원문 유지)
// 3. 소문자화 (root locale)
// 4. General Category Cf / Zs / Cc 코드포인트 → U+0020 (단, TAB, LF 제외)
// 5. 연속 공백 → 공백 1개, 앞뒤 공백 제거
//
// 입출력은 UTF-8. 잘못된 UTF-8 시퀀스는 U+FFFD 로 디코딩된다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

// normalize_text
//   순수 함수. ICU 오류로 실패하지 않으며 모든 입력에 대해 결과를 반환한다.
//   normalize_text(normalize_text(x)) == normalize_text(x)
[[nodiscard]] std::string normalize_text(std::string_view text);

// truncate_code_points
//   text 의 앞 max_code_points 개 코드포인트를 가리키는 view 를 반환한다.
//   UTF-8 시퀀스 중간에서 자르지 않는다. 잘못된 바이트는 1개 코드포인트로 센다.
[[nodiscard]] std::string_view truncate_code_points(std::string_view text,
                                                    std::size_t      max_code_points);
