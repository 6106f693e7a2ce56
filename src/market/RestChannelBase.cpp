#include "market/RestChannelBase.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <nlohmann/json.hpp>

namespace cryptogate {
namespace market {

FetchResult FetchResult::ok(std::vector<MarketData> records) {
    FetchResult r;
    r.outcome = records.empty() ? Outcome::EMPTY : Outcome::OK;
    r.records = std::move(records);
    return r;
}

FetchResult FetchResult::empty() {
    return FetchResult{};
}

FetchResult FetchResult::failed(std::string message) {
    FetchResult r;
    r.outcome = Outcome::ERROR;
    r.error = std::move(message);
    return r;
}

const std::vector<MarketData>& FetchResult::recordsOrThrow(const std::string& channel) const {
    if (outcome == Outcome::ERROR) {
        throw DataUnavailableError(channel, error);
    }
    return records;
}

RestChannelBase::RestChannelBase(std::string name,
                                 std::string base_url,
                                 std::shared_ptr<network::IHttpClient> http,
                                 int max_requests_per_second,
                                 std::vector<std::string> configured_symbols)
    : name_(std::move(name))
    , base_url_(std::move(base_url))
    , http_(std::move(http))
    , rate_limiter_(name_, {execution::RateLimitConfig("default", max_requests_per_second)})
    , configured_symbols_(std::move(configured_symbols)) {
    if (!http_) {
        throw InvalidConfigurationError(name_ + ": channel requires an http client");
    }
}

void RestChannelBase::start() {
    if (is_connected_.load()) {
        LOG_WARN("[{}] 채널 이미 시작됨", name_);
        return;
    }

    LOG_INFO("[{}] REST 채널 시작", name_);

    bool ok = false;
    try {
        ok = testConnection();
    } catch (const network::TransportError& e) {
        LOG_ERROR("[{}] 연결 테스트 전송 실패: {}", name_, e.what());
    } catch (const HttpStatusError& e) {
        LOG_ERROR("[{}] 연결 테스트 실패: {}", name_, e.what());
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("[{}] 연결 테스트 응답 파싱 실패: {}", name_, e.what());
    }

    if (!ok) {
        throw DataUnavailableError(name_, "connection test failed (" + base_url_ + ")");
    }

    is_connected_.store(true);
    LOG_INFO("[{}] 연결 완료: {}", name_, base_url_);
}

void RestChannelBase::stop() {
    LOG_INFO("[{}] REST 채널 중지", name_);
    is_connected_.store(false);
    std::lock_guard<std::mutex> lock(state_mutex_);
    subscribed_symbols_.clear();
}

void RestChannelBase::subscribe(const std::vector<std::string>& symbols) {
    if (!is_connected_.load()) {
        throw NotConnectedError(name_ + " channel");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& symbol : symbols) {
        if (std::find(subscribed_symbols_.begin(), subscribed_symbols_.end(), symbol) ==
            subscribed_symbols_.end()) {
            subscribed_symbols_.push_back(symbol);
        }
    }
    LOG_INFO("[{}] 구독 {}개 (총 {}개)", name_, symbols.size(), subscribed_symbols_.size());
}

void RestChannelBase::unsubscribe(const std::vector<std::string>& symbols) {
    if (!is_connected_.load()) {
        throw NotConnectedError(name_ + " channel");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& symbol : symbols) {
        subscribed_symbols_.erase(
            std::remove(subscribed_symbols_.begin(), subscribed_symbols_.end(), symbol),
            subscribed_symbols_.end());
    }
    LOG_INFO("[{}] 구독 해제 {}개 (남은 {}개)", name_, symbols.size(), subscribed_symbols_.size());
}

FetchResult RestChannelBase::fetchData(const std::vector<std::string>& symbols,
                                       const std::string& interval,
                                       int limit) {
    const auto targets = resolveSymbols(symbols);
    if (targets.empty()) {
        return FetchResult::empty();
    }
    if (limit <= 0) {
        limit = 1;
    }

    std::vector<MarketData> all;
    std::size_t transport_failures = 0;
    std::string last_error;

    for (const auto& symbol : targets) {
        try {
            auto candles = fetchSymbol(symbol, interval, limit);

            std::size_t dropped = 0;
            std::vector<MarketData> valid;
            valid.reserve(candles.size());
            for (auto& candle : candles) {
                if (isValidCandle(candle)) {
                    valid.push_back(std::move(candle));
                } else {
                    ++dropped;
                }
            }
            if (dropped > 0) {
                LOG_WARN("[{}] {} 비정상 캔들 {}개 제외", name_, symbol, dropped);
            }

            std::sort(valid.begin(), valid.end(), [](const MarketData& a, const MarketData& b) {
                return a.timestamp < b.timestamp;
            });
            if (valid.size() > static_cast<std::size_t>(limit)) {
                valid.erase(valid.begin(), valid.end() - limit);
            }
            all.insert(all.end(), valid.begin(), valid.end());
        } catch (const network::TransportError& e) {
            ++transport_failures;
            last_error = e.what();
            LOG_ERROR("[{}] {} 네트워크 오류: {}", name_, symbol, e.what());
        } catch (const HttpStatusError& e) {
            if (e.isTransportLevel()) {
                ++transport_failures;
                last_error = e.what();
            }
            LOG_ERROR("[{}] {} {}", name_, symbol, e.what());
        } catch (const VenueError& e) {
            LOG_ERROR("[{}] {} API 오류: {}", name_, symbol, e.what());
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR("[{}] {} 응답 파싱 실패: {}", name_, symbol, e.what());
        }
    }

    if (transport_failures == targets.size()) {
        LOG_ERROR("[{}] 모든 심볼 요청 실패 ({}개)", name_, targets.size());
        return FetchResult::failed(name_ + ": all " + std::to_string(targets.size()) +
                                   " symbol requests failed (" + last_error + ")");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        total_messages_received_ += static_cast<long long>(all.size());
        last_data_received_at_ = std::chrono::system_clock::now();
    }

    LOG_INFO("[{}] {}개 심볼에서 캔들 {}개 수신", name_, targets.size(), all.size());
    return FetchResult::ok(std::move(all));
}

ChannelStatus RestChannelBase::status() const {
    ChannelStatus s;
    s.name = name_;
    s.is_connected = is_connected_.load();
    std::lock_guard<std::mutex> lock(state_mutex_);
    s.subscribed_symbols = subscribed_symbols_;
    s.last_data_received_at = last_data_received_at_;
    s.total_messages_received = total_messages_received_;
    return s;
}

bool RestChannelBase::isValidCandle(const MarketData& candle) {
    if (candle.symbol.empty()) return false;
    if (candle.high < candle.low) return false;
    if (!(candle.low <= candle.open && candle.open <= candle.high)) return false;
    if (!(candle.low <= candle.close && candle.close <= candle.high)) return false;
    if (candle.volume < 0.0) return false;
    return true;
}

int RestChannelBase::intervalSeconds(const std::string& interval) {
    // 1년을 넘는 간격은 잘못된 값으로 보고 기본 1분
    constexpr long long kMaxIntervalSeconds = 366LL * 86400;

    if (interval.size() < 2) {
        return 60;
    }
    long long amount = 0;
    std::size_t i = 0;
    while (i < interval.size() && std::isdigit(static_cast<unsigned char>(interval[i]))) {
        amount = amount * 10 + (interval[i] - '0');
        if (amount > kMaxIntervalSeconds) {
            return 60;
        }
        ++i;
    }
    if (amount <= 0 || i + 1 != interval.size()) {
        return 60;
    }

    long long unit = 0;
    switch (std::tolower(static_cast<unsigned char>(interval[i]))) {
        case 'm': unit = 60; break;
        case 'h': unit = 3600; break;
        case 'd': unit = 86400; break;
        case 'w': unit = 604800; break;
        default: return 60;
    }
    const long long seconds = amount * unit;
    return seconds > kMaxIntervalSeconds ? 60 : static_cast<int>(seconds);
}

network::HttpResponse RestChannelBase::get(const std::string& path, const network::QueryParams& query) {
    rate_limiter_.acquire("default");

    auto response = http_->get(base_url_ + path, network::buildQueryString(query));
    if (response.isRateLimited() || response.isBlocked()) {
        rate_limiter_.handleRateLimitError(response.status_code);
    }
    if (!response.isSuccess()) {
        throw HttpStatusError(response.status_code,
                              "HTTP " + std::to_string(response.status_code) + " " + path);
    }
    return response;
}

std::vector<std::string> RestChannelBase::resolveSymbols(const std::vector<std::string>& requested) const {
    if (!requested.empty()) {
        return requested;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!subscribed_symbols_.empty()) {
            return subscribed_symbols_;
        }
    }
    if (!configured_symbols_.empty()) {
        return configured_symbols_;
    }
    return builtInSymbols();
}

} // namespace market
} // namespace cryptogate
