#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bars/RangeBarBuilder.h"
#include "bars/RenkoBuilder.h"
#include "bars/TickBarBuilder.h"
#include "common/GatewayConfig.h"
#include "core/contracts/IBarRepository.h"

namespace cryptogate {
namespace bars {

struct AggregationSummary {
    std::size_t candles_fed = 0;
    std::size_t ticks_fed = 0;
    std::size_t tick_bars = 0;
    std::size_t range_bars = 0;
    std::size_t renko_bricks = 0;

    AggregationSummary& operator+=(const AggregationSummary& other);
};

// 심볼 진행 상태 (헬스 로그 / 테스트)
struct SymbolProgress {
    double tick_progress = 0.0;
    double current_range = 0.0;
    std::optional<Price> renko_anchor;
    std::optional<double> renko_brick_size;
    std::optional<Timestamp> last_processed;
};

// (source, symbol) 마다 Tick / Range / Renko 빌더 한 세트
//
// 내부 잠금 없음. 오케스트레이터 스레드 하나에서만 호출한다 (심볼당 단일 writer).
// 캔들 배치는 마지막으로 처리한 시각보다 새로운 것만 넣고, 배치의 가장 최근 캔들은
// 아직 만들어지는 중일 수 있어 다음 배치로 미룬다.
// 저장에 실패한 바는 버리지 않고 보관했다가 다음 저장 때 먼저 다시 저장한다.
class BarAggregationService {
public:
    BarAggregationService(BarConfig config, std::shared_ptr<core::IBarRepository> repository);

    AggregationSummary onCandles(const std::vector<MarketData>& candles);
    // 외부 체결 피드용 입력. REST 캔들 수집 경로는 onCandles 만 쓴다
    AggregationSummary onTick(const std::string& source, const Tick& tick);

    // 세션 종료: 진행 중인 Tick / Range 바 강제 방출
    AggregationSummary flush();

    std::optional<SymbolProgress> progress(const std::string& source, const std::string& symbol) const;
    std::size_t trackedSymbols() const { return builders_.size(); }
    // 저장 대기 중인 바 개수 (Tick + Range + Renko)
    std::size_t pendingBars() const {
        return pending_tick_bars_.size() + pending_range_bars_.size() + pending_bricks_.size();
    }

private:
    using Key = std::pair<std::string, std::string>;   // (source, symbol)

    struct SymbolBuilders {
        std::unique_ptr<TickBarBuilder> tick;
        std::unique_ptr<RangeBarBuilder> range;
        std::unique_ptr<RenkoBuilder> renko;
        std::vector<MarketData> atr_history;
        std::optional<Timestamp> last_processed;
    };

    SymbolBuilders& buildersFor(const std::string& source, const std::string& symbol);
    void ensureRenko(SymbolBuilders& b, const MarketData& candle);
    double rangeThresholdFor(const std::string& symbol) const;
    double brickSizeFor(const std::string& symbol) const;

    // 새 바를 대기열에 붙이고 종류별로 저장. 실패하면 남은 대기열을 두고 예외 전파
    void persist(std::vector<TickBar> tick_bars,
                 std::vector<RangeBar> range_bars,
                 std::vector<RenkoBrick> bricks);

    BarConfig config_;
    std::shared_ptr<core::IBarRepository> repository_;
    std::map<Key, SymbolBuilders> builders_;

    std::vector<TickBar> pending_tick_bars_;
    std::vector<RangeBar> pending_range_bars_;
    std::vector<RenkoBrick> pending_bricks_;
};

} // namespace bars
} // namespace cryptogate
