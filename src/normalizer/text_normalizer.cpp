// ---------------------------------------------------------------------------
// text_normalizer.cpp
//
// ICU 기반 텍스트 정규화 구현.
//
// [구현 메모]
// - UTF-8 → icu::UnicodeString(UTF-16) 변환 후 코드포인트 단위로 처리한다.
// - 4단계(Cf/Zs/Cc 치환)와 5단계(공백 축약 + trim)는 한 번의 순회로 처리한다.
//   4단계에서 치환된 U+0020 은 5단계에서 White_Space 로 취급되므로
//   순차 적용과 결과가 같다.
// - 5단계의 공백 판정은 ICU White_Space 속성(u_isUWhiteSpace)을 사용한다.
//   TAB, LF, U+2028, U+2029 등도 여기서 공백 1개로 축약된다.
// ---------------------------------------------------------------------------

#include "normalizer/text_normalizer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <spdlog/spdlog.h>

namespace {

constexpr UChar32 kSpace = 0x20;
constexpr UChar32 kTab   = 0x09;
constexpr UChar32 kLf    = 0x0A;

// ---------------------------------------------------------------------------
// 내부 헬퍼: NFKC 정규화. 실패하면 입력을 그대로 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] icu::UnicodeString apply_nfkc(const icu::UnicodeString& src) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        spdlog::warn("text_normalizer: NFKC normalizer unavailable ({}), skipping NFKC step",
                     u_errorName(status));
        return src;
    }

    icu::UnicodeString normalized = nfkc->normalize(src, status);
    if (U_FAILURE(status)) {
        spdlog::debug("text_normalizer: NFKC failed ({}), using input as-is",
                      u_errorName(status));
        return src;
    }
    return normalized;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 4단계 치환 대상 여부.
// General Category Cf(format), Zs(space separator), Cc(control) 중
// TAB / LF 를 제외한 코드포인트.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_invisible_separator(UChar32 cp) {
    if (cp == kTab || cp == kLf) {
        return false;
    }
    const auto category = static_cast<UCharCategory>(u_charType(cp));
    return category == U_FORMAT_CHAR
        || category == U_SPACE_SEPARATOR
        || category == U_CONTROL_CHAR;
}

}  // namespace

// ---------------------------------------------------------------------------
// normalize_text 구현
// ---------------------------------------------------------------------------
std::string normalize_text(std::string_view text) {
    // 1. 빈 입력
    if (text.empty()) {
        return {};
    }

    // icu::StringPiece 는 int32_t 길이만 지원한다.
    if (text.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        spdlog::warn("text_normalizer: input of {} bytes exceeds ICU limit, truncating",
                     text.size());
        text = text.substr(0, static_cast<std::size_t>(std::numeric_limits<int32_t>::max()));
    }

    icu::UnicodeString work = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    // 2. NFKC
    work = apply_nfkc(work);

    // 3. 소문자화 (locale 비의존)
    work.toLower(icu::Locale::getRoot());

    // 4 + 5. 보이지 않는 구분 문자 치환, 공백 축약, trim
    icu::UnicodeString collapsed;
    bool pending_space = false;

    for (int32_t i = 0; i < work.length();) {
        UChar32 cp = work.char32At(i);
        i += U16_LENGTH(cp);

        if (is_invisible_separator(cp)) {
            cp = kSpace;
        }
        if (u_isUWhiteSpace(cp)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !collapsed.isEmpty()) {
            collapsed.append(kSpace);
        }
        pending_space = false;
        collapsed.append(cp);
    }

    std::string result;
    collapsed.toUTF8String(result);
    return result;
}

// ---------------------------------------------------------------------------
// truncate_code_points 구현
// ---------------------------------------------------------------------------
std::string_view truncate_code_points(std::string_view text, std::size_t max_code_points) {
    // 바이트 수 <= 코드포인트 한도이면 자를 필요가 없다.
    if (text.size() <= max_code_points) {
        return text;
    }

    constexpr auto kMaxLength = static_cast<std::size_t>(std::numeric_limits<int32_t>::max());
    const auto length = static_cast<int32_t>(std::min(text.size(), kMaxLength));
    const auto count  = static_cast<int32_t>(std::min(max_code_points, kMaxLength));

    const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
    int32_t     offset = 0;
    U8_FWD_N(bytes, offset, length, count);

    return text.substr(0, static_cast<std::size_t>(offset));
}
