// ---------------------------------------------------------------------------
// rule_loader.cpp
//
// YAML 규칙 파일을 로드하여 RuleSetConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - 파일 단위 오류만 실패로 처리한다. whitelist / blacklist 키가 없거나
//   sequence 가 아니면 빈 목록으로 처리한다 (경고 로그).
// - 필드 누락 시 RuleRecord 기본값을 적용한다.
// - pattern 누락 항목도 그대로 넘긴다. RuleEngine::build 가 진단으로 보고한다.
// ---------------------------------------------------------------------------

#include "filter/rule_loader.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 선택 string 필드. 없거나 scalar 가 아니면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> read_optional_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: RuleRecord 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] RuleRecord parse_rule(const YAML::Node& rule_node) {
    RuleRecord rule{};
    rule.id      = read_string(rule_node["id"], rule.id);
    rule.pattern = read_optional_string(rule_node["pattern"]);
    rule.message = read_optional_string(rule_node["message"]);
    rule.action  = read_string(rule_node["action"], rule.action);
    return rule;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 규칙 목록 파싱.
// 키가 없으면 빈 목록. sequence 가 아니면 경고 후 빈 목록.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<RuleRecord> parse_rule_list(const YAML::Node& list_node,
                                                      std::string_view  list_name) {
    std::vector<RuleRecord> rules;
    if (!list_node || list_node.IsNull()) {
        return rules;
    }
    if (!list_node.IsSequence()) {
        spdlog::warn("rule_loader: '{}' is not a sequence, treating as empty", list_name);
        return rules;
    }

    rules.reserve(list_node.size());
    std::size_t index = 0;
    for (const auto& rule_node : list_node) {
        if (!rule_node.IsMap()) {
            spdlog::warn("rule_loader: {}[{}] is not a map, skipping", list_name, index);
        } else {
            rules.push_back(parse_rule(rule_node));
        }
        ++index;
    }
    return rules;
}

}  // namespace

// ---------------------------------------------------------------------------
// RuleLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<RuleSetConfig, std::string>
RuleLoader::load(const std::filesystem::path& rules_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(rules_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "rule_loader: cannot resolve rules path '{}': {}",
            rules_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("rule_loader: loading rules from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "rule_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "rule_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "rule_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "rule_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 목록 파싱
    RuleSetConfig cfg{};
    try {
        cfg.whitelist = parse_rule_list(root["whitelist"], "whitelist");
        cfg.blacklist = parse_rule_list(root["blacklist"], "blacklist");
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "rule_loader: error parsing rule lists in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "rule_loader: rules loaded, whitelist={}, blacklist={}",
        cfg.whitelist.size(),
        cfg.blacklist.size()
    );

    return cfg;
}
