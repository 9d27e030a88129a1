// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
static std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (10MB, 3개 파일 유지)
        const std::size_t max_file_size = 10 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 전역 registry 에 등록하지 않는다 (인스턴스별 소유).
        logger_ = std::make_shared<spdlog::logger>("promptgate", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    const bool blocked = entry.decision == Decision::kBlock;
    const LogLevel level = blocked ? LogLevel::kWarn : LogLevel::kInfo;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"decision","decision":")" << to_string(entry.decision)
         << R"(","rule_id":")" << escape_json_string(entry.rule_id)
         << R"(","message":")" << escape_json_string(entry.message)
         << R"(","input_length":)" << entry.input_length
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    if (blocked) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_rule_load: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_rule_load(const RuleLoadLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"rule_load","source":")" << escape_json_string(entry.source)
         << R"(","whitelist_rules":)" << entry.whitelist_rules
         << R"(,"blacklist_rules":)" << entry.blacklist_rules
         << R"(,"rejected_rules":)" << entry.rejected_rules
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
