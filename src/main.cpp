#include "bars/BarAggregationService.h"
#include "broker/BrokerFactory.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/orchestration/ChannelOrchestrator.h"
#include "core/state/BarJournalJsonl.h"
#include "core/state/MarketDataJournalJsonl.h"
#include "core/state/PostgresMarketDataRepository.h"
#include "market/ChannelFactory.h"
#include "network/CurlHttpClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace cryptogate;

namespace {

// SIGINT / SIGTERM 에서는 플래그만 세우고 정리는 메인 스레드에서
std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int) {
    g_shutdown_requested.store(true);
}

std::filesystem::path resolveDataDir(const std::string& dir) {
    std::filesystem::path path(dir);
    if (!path.is_absolute()) {
        path = utils::PathUtils::resolveRelativePath(dir);
    }
    std::filesystem::create_directories(path);
    return path;
}

std::shared_ptr<core::IMarketDataRepository> createMarketDataRepository(const StorageConfig& storage) {
    if (storage.backend == "postgres") {
        if (storage.database_url.empty()) {
            throw InvalidConfigurationError("storage.backend=postgres requires CRYPTOGATE_DB_URL");
        }
        return std::make_shared<core::PostgresMarketDataRepository>(storage.database_url);
    }
    const auto dir = resolveDataDir(storage.data_dir);
    LOG_INFO("시세 저장: {}", (dir / "market_data.jsonl").string());
    return std::make_shared<core::MarketDataJournalJsonl>(dir / "market_data.jsonl");
}

void logHealth(const core::ChannelOrchestrator& orchestrator) {
    for (const auto& s : orchestrator.channelStatuses()) {
        LOG_INFO("[{}] 연결={} 구독={} 누적 수신={}", s.name, s.is_connected ? "Y" : "N",
                 s.subscribed_symbols.size(), s.total_messages_received);
    }
    if (auto report = orchestrator.lastReport()) {
        LOG_INFO("마지막 사이클 #{}: 저장 {}건, 실패 {}개", report->cycle, report->total_saved, report->failed);
    }
}

}

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        const GatewayConfig& settings = config.get();

        Logger::getInstance().initialize(settings.logging.dir, settings.logging.level);

        LOG_INFO("========================================");
        LOG_INFO("CryptoGate v1.0 - 시세 수집 / 주문 게이트웨이");
        LOG_INFO("========================================");

        // 채널
        std::vector<std::shared_ptr<market::IMarketDataChannel>> channels;
        for (const auto& channel_config : settings.market_data.channels) {
            if (!channel_config.enabled) {
                LOG_INFO("[{}] 채널 비활성화 (설정)", channel_config.name);
                continue;
            }
            // 채널마다 curl 핸들을 따로 둬서 fan-out 이 직렬화되지 않게
            channels.push_back(market::createChannel(channel_config, std::make_shared<network::CurlHttpClient>()));
        }
        if (channels.empty()) {
            LOG_WARN("활성화된 시세 채널이 없습니다");
        }

        auto market_repository = createMarketDataRepository(settings.storage);

        std::shared_ptr<bars::BarAggregationService> aggregator;
        if (settings.bars.enabled) {
            const auto dir = resolveDataDir(settings.storage.data_dir);
            aggregator = std::make_shared<bars::BarAggregationService>(
                settings.bars, std::make_shared<core::BarJournalJsonl>(dir / "bars.jsonl"));
        }

        core::OrchestratorConfig orchestrator_config;
        orchestrator_config.fetch_interval = std::chrono::seconds(settings.market_data.fetch_interval_seconds);
        orchestrator_config.startup_delay = std::chrono::seconds(settings.market_data.startup_delay_seconds);
        orchestrator_config.interval = settings.market_data.interval;
        orchestrator_config.limit = settings.market_data.limit;

        core::ChannelOrchestrator orchestrator(channels, market_repository, orchestrator_config, aggregator);

        // 브로커: 연결 실패는 로그만 남기고 계속 (주문 시 ensureConnected 에서 다시 걸린다)
        auto broker_http = std::make_shared<network::CurlHttpClient>();
        std::vector<std::shared_ptr<broker::IBrokerGateway>> brokers;
        for (const auto& broker_config : settings.brokers) {
            if (!broker_config.enabled) {
                continue;
            }
            auto gateway = broker::createBroker(broker_config, broker_http);
            try {
                gateway->connect();
            } catch (const BrokerUnavailableError& e) {
                LOG_ERROR("[{}] 브로커 연결 실패: {}", broker_config.name, e.what());
            } catch (const GatewayError& e) {
                LOG_ERROR("[{}] 브로커 연결 거부: {}", broker_config.name, e.what());
            }
            brokers.push_back(std::move(gateway));
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!orchestrator.start()) {
            LOG_ERROR("오케스트레이터 시작 실패");
            return 1;
        }
        std::cout << "\n중지하려면 Ctrl+C를 누르세요.\n\n";

        auto last_health = std::chrono::steady_clock::now();
        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            const auto now = std::chrono::steady_clock::now();
            if (now - last_health >= std::chrono::minutes(5)) {
                logHealth(orchestrator);
                last_health = now;
            }
        }

        LOG_INFO("종료 신호 수신");
        orchestrator.stop();
        for (auto& gateway : brokers) {
            gateway->disconnect();
        }

        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "\n오류가 발생했습니다: " << e.what() << std::endl;
        return 1;
    }
}
