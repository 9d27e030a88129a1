#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 판정 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - record(): 여러 스레드에서 classify() 결과를 동시에 기록해도 안전.
// - snapshot(): 갱신 경로와 mutex 없이 읽는다.
//
// [격리 원칙]
// - 통계 갱신 실패가 판정 경로로 전파되지 않도록 모든 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// DecisionStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   default_escalated: escalated 중 어떤 규칙에도 매칭되지 않은 건수
//                      (FilterResult::rule_matched == false)
//   block_rate / escalate_rate: total == 0 이면 0.0
// ---------------------------------------------------------------------------
struct DecisionStatsSnapshot {
    std::uint64_t                              total{0};
    std::uint64_t                              allowed{0};
    std::uint64_t                              blocked{0};
    std::uint64_t                              escalated{0};
    std::uint64_t                              default_escalated{0};
    double                                     block_rate{0.0};
    double                                     escalate_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// DecisionStats
// ---------------------------------------------------------------------------
class DecisionStats {
public:
    DecisionStats() noexcept = default;
    ~DecisionStats()         = default;

    // 복사/이동 금지 (atomic)
    DecisionStats(const DecisionStats&)            = delete;
    DecisionStats& operator=(const DecisionStats&) = delete;
    DecisionStats(DecisionStats&&)                 = delete;
    DecisionStats& operator=(DecisionStats&&)      = delete;

    // record
    //   classify() 결과 1건을 집계한다.
    void record(const FilterResult& result) noexcept {
        total_.fetch_add(1, std::memory_order_relaxed);
        switch (result.decision) {
            case Decision::kAllow:
                allowed_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Decision::kBlock:
                blocked_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Decision::kEscalate:
                escalated_.fetch_add(1, std::memory_order_relaxed);
                if (!result.rule_matched) {
                    default_escalated_.fetch_add(1, std::memory_order_relaxed);
                }
                break;
        }
    }

    [[nodiscard]] DecisionStatsSnapshot snapshot() const noexcept {
        const auto total     = total_.load(std::memory_order_relaxed);
        const auto blocked   = blocked_.load(std::memory_order_relaxed);
        const auto escalated = escalated_.load(std::memory_order_relaxed);

        double block_rate    = 0.0;
        double escalate_rate = 0.0;
        if (total > 0) {
            block_rate    = static_cast<double>(blocked) / static_cast<double>(total);
            escalate_rate = static_cast<double>(escalated) / static_cast<double>(total);
        }

        return DecisionStatsSnapshot{
            .total             = total,
            .allowed           = allowed_.load(std::memory_order_relaxed),
            .blocked           = blocked,
            .escalated         = escalated,
            .default_escalated = default_escalated_.load(std::memory_order_relaxed),
            .block_rate        = block_rate,
            .escalate_rate     = escalate_rate,
            .captured_at       = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_{0};
    std::atomic<std::uint64_t> allowed_{0};
    std::atomic<std::uint64_t> blocked_{0};
    std::atomic<std::uint64_t> escalated_{0};
    std::atomic<std::uint64_t> default_escalated_{0};
};
