#include "filter/rule_engine.hpp"
#include "filter/rule_loader.hpp"
#include "logger/structured_logger.hpp"
#include "normalizer/text_normalizer.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "info") {
        return LogLevel::kInfo;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

LogLevel env_log_level(const char* name, LogLevel default_val) {
    const std::string raw = env_str(name, "");
    if (raw.empty()) {
        return default_val;
    }
    if (const auto level = parse_log_level(raw)) {
        return *level;
    }
    spdlog::warn("env {}: invalid value '{}', using default", name, raw);
    return default_val;
}

spdlog::level::level_enum to_console_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        case LogLevel::kInfo:
        default:
            return spdlog::level::info;
    }
}

std::string_view describe(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::kSourceUnavailable:
            return "rule source unavailable";
        case DiagnosticKind::kMissingPattern:
            return "missing pattern";
        case DiagnosticKind::kInvalidPattern:
            return "invalid pattern";
    }
    return "unknown";
}

// 프롬프트 출력 시 앞 40자(코드포인트)만 표시한다.
std::string preview(const std::string& prompt) {
    constexpr std::size_t kPreviewChars = 40;
    const std::string_view head = truncate_code_points(prompt, kPreviewChars);
    if (head.size() == prompt.size()) {
        return prompt;
    }
    return std::string(head) + "...";
}

} // namespace

// ---------------------------------------------------------------------------
// main
//   인자로 받은 프롬프트를 판정한다. 인자가 없으면 stdin 한 줄당 프롬프트 1개.
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::string rules_path = env_str("RULES_PATH", "config/rules.yaml");
    const std::string log_path   = env_str("LOG_PATH",   "/tmp/promptgate.log");
    const LogLevel    log_level  = env_log_level("LOG_LEVEL", LogLevel::kInfo);

    spdlog::set_level(to_console_level(log_level));
    spdlog::info("Starting promptgate stage-1 filter");
    spdlog::info("Rules: {}", rules_path);
    spdlog::info("Log: {}", log_path);

    // ── 구조화 로거 (실패 시 콘솔 로그만 사용) ──────────────────────────
    std::unique_ptr<StructuredLogger> logger;
    try {
        logger = std::make_unique<StructuredLogger>(log_level, log_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}, continuing with console logging only", e.what());
    }

    // ── 규칙 로드 + 엔진 생성 ───────────────────────────────────────────
    BuildResult built = RuleEngine::build(RuleLoader::load(rules_path));
    const RuleEngine& engine = built.engine;

    for (const auto& diag : built.diagnostics) {
        spdlog::warn("rule build: {} (list='{}', rule='{}'): {}",
                     describe(diag.kind), diag.list, diag.rule_id, diag.detail);
    }
    spdlog::info("{} W / {} B rules loaded", engine.whitelist_size(), engine.blacklist_size());
    if (engine.whitelist_size() == 0 && engine.blacklist_size() == 0) {
        spdlog::warn("No rules loaded, every input will take the zero-trust default");
    }

    if (logger) {
        logger->log_rule_load(RuleLoadLog{
            .source          = rules_path,
            .whitelist_rules = engine.whitelist_size(),
            .blacklist_rules = engine.blacklist_size(),
            .rejected_rules  = built.diagnostics.size(),
            .timestamp       = std::chrono::system_clock::now(),
        });
    }

    // ── 프롬프트 판정 ───────────────────────────────────────────────────
    DecisionStats stats;

    const auto classify_one = [&](const std::string& prompt) {
        const auto started = std::chrono::steady_clock::now();
        const FilterResult result = engine.classify(prompt);
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);

        stats.record(result);
        if (logger) {
            logger->log_decision(DecisionLog{
                .decision     = result.decision,
                .rule_id      = result.rule_id,
                .message      = result.message,
                .input_length = prompt.size(),
                .timestamp    = std::chrono::system_clock::now(),
                .duration     = elapsed,
            });
        }

        std::cout << "Input: '" << preview(prompt) << "'\n"
                  << "Decision: " << to_string(result.decision)
                  << " (Rule: " << result.rule_id << ")\n"
                  << "Message: " << result.message << "\n\n";
    };

    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            classify_one(argv[i]);
        }
    } else {
        std::string line;
        while (std::getline(std::cin, line)) {
            classify_one(line);
        }
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    const auto snap = stats.snapshot();
    spdlog::info("Classified {} prompts: allow={}, block={}, escalate={} (default={})",
                 snap.total, snap.allowed, snap.blocked, snap.escalated, snap.default_escalated);

    return EXIT_SUCCESS;
}
