#pragma once

#include <map>
#include <string>
#include <vector>

namespace cryptogate {

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

struct ChannelConfig {
    std::string name;
    bool enabled = true;
    std::vector<std::string> symbols;   // 비어 있으면 채널 기본 심볼
};

struct MarketDataConfig {
    int fetch_interval_seconds = 60;
    int startup_delay_seconds = 5;
    std::string interval = "1m";
    int limit = 100;
    std::vector<ChannelConfig> channels;
};

// 브로커별 요청 제한 + 인증 (키는 환경 변수에서만)
struct BrokerConfig {
    std::string name;
    bool enabled = false;
    bool testnet = true;
    int min_request_interval_ms = 50;
    int max_concurrent_requests = 20;
    int recv_window_ms = 5000;
    std::string api_key;
    std::string api_secret;
};

struct OrdersConfig {
    std::string client_order_prefix = "AT";
    std::string default_exchange = "paper";
};

struct BarConfig {
    bool enabled = true;
    int tick_size = 100;
    double range_threshold = 10.0;
    std::map<std::string, double> range_thresholds;   // 심볼별 override
    std::string renko_sizing = "Fixed";                // Fixed | ATR | Percentage
    double brick_size = 10.0;
    std::map<std::string, double> brick_sizes;
    int atr_period = 13;
    double atr_multiplier = 1.0;
    double percentage = 1.0;
};

struct StorageConfig {
    std::string backend = "jsonl";   // jsonl | postgres
    std::string data_dir = "data";
    std::string database_url;        // CRYPTOGATE_DB_URL
};

struct GatewayConfig {
    LoggingConfig logging;
    MarketDataConfig market_data;
    std::vector<BrokerConfig> brokers;
    OrdersConfig orders;
    BarConfig bars;
    StorageConfig storage;
};

} // namespace cryptogate
