#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace cryptogate {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return trimCopy(s);
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string readEnvVar(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? trimCopy(value) : "";
}

// 브로커별 기본 제한값 (거래소 공개 한도 기준)
BrokerConfig defaultBroker(const std::string& name) {
    BrokerConfig b;
    b.name = name;
    if (name == "binance") {
        b.min_request_interval_ms = 50;
        b.max_concurrent_requests = 20;
    } else if (name == "bybit") {
        b.min_request_interval_ms = 100;
        b.max_concurrent_requests = 10;
    } else if (name == "paper") {
        b.enabled = true;
        b.min_request_interval_ms = 0;
        b.max_concurrent_requests = 100;
    }
    return b;
}

std::vector<ChannelConfig> defaultChannels() {
    std::vector<ChannelConfig> out;
    for (const char* name : {"binance", "okx", "coinbase", "kraken"}) {
        ChannelConfig c;
        c.name = name;
        out.push_back(c);
    }
    return out;
}

std::map<std::string, double> readDoubleMap(const nlohmann::json& node) {
    std::map<std::string, double> out;
    if (!node.is_object()) {
        return out;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        out[it.key()] = it.value().get<double>();
    }
    return out;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "설정 파일 경로: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
        std::cout << "기본값을 사용합니다." << std::endl;
        loadFromJson(nlohmann::json::object());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw InvalidConfigurationError("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigurationError("Config parse error: " + std::string(e.what()));
    }

    loadFromJson(j);
    std::cout << "설정 파일 로드 완료" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    GatewayConfig next;

    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            next.logging.level = toLowerCopy(l.value("level", std::string("info")));
            next.logging.dir = l.value("dir", std::string("logs"));
        }

        next.market_data.channels = defaultChannels();
        if (j.contains("market_data")) {
            const auto& m = j["market_data"];
            next.market_data.fetch_interval_seconds = m.value("fetch_interval_seconds", 60);
            next.market_data.startup_delay_seconds = m.value("startup_delay_seconds", 5);
            next.market_data.interval = m.value("interval", std::string("1m"));
            next.market_data.limit = m.value("limit", 100);

            if (m.contains("channels") && m["channels"].is_object()) {
                next.market_data.channels.clear();
                for (auto it = m["channels"].begin(); it != m["channels"].end(); ++it) {
                    ChannelConfig c;
                    c.name = toLowerCopy(it.key());
                    c.enabled = it.value().value("enabled", true);
                    if (it.value().contains("symbols")) {
                        c.symbols = it.value()["symbols"].get<std::vector<std::string>>();
                    }
                    next.market_data.channels.push_back(std::move(c));
                }
            }
        }

        std::map<std::string, BrokerConfig> brokers;
        for (const char* name : {"binance", "bybit", "paper"}) {
            brokers[name] = defaultBroker(name);
        }
        if (j.contains("brokers") && j["brokers"].is_object()) {
            for (auto it = j["brokers"].begin(); it != j["brokers"].end(); ++it) {
                const std::string name = toLowerCopy(it.key());
                const auto& b = it.value();
                auto base = brokers.count(name) ? brokers[name] : defaultBroker(name);
                base.enabled = b.value("enabled", base.enabled);
                base.testnet = b.value("testnet", base.testnet);
                base.min_request_interval_ms = b.value("min_request_interval_ms", base.min_request_interval_ms);
                base.max_concurrent_requests = b.value("max_concurrent_requests", base.max_concurrent_requests);
                base.recv_window_ms = b.value("recv_window_ms", base.recv_window_ms);

                if (!b.value("api_key", std::string()).empty() || !b.value("api_secret", std::string()).empty()) {
                    std::cout << "경고: config 의 " << name << " api 키 값은 무시됩니다. 환경 변수("
                              << toUpperCopy(name) << "_API_KEY/" << toUpperCopy(name)
                              << "_API_SECRET)를 사용하세요." << std::endl;
                }
                brokers[name] = base;
            }
        }
        for (auto& [name, broker] : brokers) {
            if (name == "paper") {
                next.brokers.push_back(broker);
                continue;
            }
            broker.api_key = readEnvVar(toUpperCopy(name) + "_API_KEY");
            broker.api_secret = readEnvVar(toUpperCopy(name) + "_API_SECRET");
            if (broker.enabled && (broker.api_key.empty() || broker.api_secret.empty())) {
                std::cout << "경고: " << toUpperCopy(name) << "_API_KEY 또는 " << toUpperCopy(name)
                          << "_API_SECRET 환경 변수가 비어 있습니다." << std::endl;
            }
            next.brokers.push_back(broker);
        }

        if (j.contains("orders")) {
            const auto& o = j["orders"];
            next.orders.client_order_prefix = o.value("client_order_prefix", std::string("AT"));
            next.orders.default_exchange = toLowerCopy(o.value("default_exchange", std::string("paper")));
        }

        if (j.contains("bars")) {
            const auto& b = j["bars"];
            next.bars.enabled = b.value("enabled", true);
            next.bars.tick_size = b.value("tick_size", 100);
            next.bars.range_threshold = b.value("range_threshold", 10.0);
            next.bars.renko_sizing = b.value("renko_sizing", std::string("Fixed"));
            next.bars.brick_size = b.value("brick_size", 10.0);
            next.bars.atr_period = b.value("atr_period", 13);
            next.bars.atr_multiplier = b.value("atr_multiplier", 1.0);
            next.bars.percentage = b.value("percentage", 1.0);
            if (b.contains("range_thresholds")) {
                next.bars.range_thresholds = readDoubleMap(b["range_thresholds"]);
            }
            if (b.contains("brick_sizes")) {
                next.bars.brick_sizes = readDoubleMap(b["brick_sizes"]);
            }
        }

        if (j.contains("storage")) {
            const auto& s = j["storage"];
            next.storage.backend = toLowerCopy(s.value("backend", std::string("jsonl")));
            next.storage.data_dir = s.value("data_dir", std::string("data"));
        }
        next.storage.database_url = readEnvVar("CRYPTOGATE_DB_URL");
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigurationError("Config value error: " + std::string(e.what()));
    }

    validate(next);
    config_ = std::move(next);
}

std::optional<BrokerConfig> Config::getBroker(const std::string& name) const {
    const std::string key = toLowerCopy(name);
    for (const auto& broker : config_.brokers) {
        if (broker.name == key) {
            return broker;
        }
    }
    return std::nullopt;
}

void Config::validate(const GatewayConfig& config) {
    const auto& m = config.market_data;
    if (m.fetch_interval_seconds <= 0) {
        throw InvalidConfigurationError("market_data.fetch_interval_seconds must be positive");
    }
    if (m.startup_delay_seconds < 0) {
        throw InvalidConfigurationError("market_data.startup_delay_seconds must not be negative");
    }
    if (m.limit <= 0) {
        throw InvalidConfigurationError("market_data.limit must be positive");
    }

    for (const auto& b : config.brokers) {
        if (b.min_request_interval_ms < 0) {
            throw InvalidConfigurationError("brokers." + b.name + ".min_request_interval_ms must not be negative");
        }
        if (b.max_concurrent_requests <= 0) {
            throw InvalidConfigurationError("brokers." + b.name + ".max_concurrent_requests must be positive");
        }
    }

    if (config.orders.client_order_prefix.empty()) {
        throw InvalidConfigurationError("orders.client_order_prefix must not be empty");
    }

    const auto& bars = config.bars;
    if (bars.tick_size <= 0) {
        throw InvalidConfigurationError("bars.tick_size must be positive");
    }
    if (bars.range_threshold <= 0.0) {
        throw InvalidConfigurationError("bars.range_threshold must be positive");
    }
    if (bars.brick_size <= 0.0) {
        throw InvalidConfigurationError("bars.brick_size must be positive");
    }
    for (const auto& [symbol, value] : bars.range_thresholds) {
        if (value <= 0.0) {
            throw InvalidConfigurationError("bars.range_thresholds." + symbol + " must be positive");
        }
    }
    for (const auto& [symbol, value] : bars.brick_sizes) {
        if (value <= 0.0) {
            throw InvalidConfigurationError("bars.brick_sizes." + symbol + " must be positive");
        }
    }
    if (bars.renko_sizing != "Fixed" && bars.renko_sizing != "ATR" && bars.renko_sizing != "Percentage") {
        throw InvalidConfigurationError("bars.renko_sizing must be Fixed, ATR or Percentage");
    }
    if (bars.atr_period <= 0 || bars.atr_multiplier <= 0.0) {
        throw InvalidConfigurationError("bars.atr_period and bars.atr_multiplier must be positive");
    }
    if (bars.percentage <= 0.0 || bars.percentage > 100.0) {
        throw InvalidConfigurationError("bars.percentage must be in (0, 100]");
    }

    const auto& storage = config.storage;
    if (storage.backend != "jsonl" && storage.backend != "postgres") {
        throw InvalidConfigurationError("storage.backend must be jsonl or postgres");
    }
}

} // namespace cryptogate
