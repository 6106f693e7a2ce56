#include "broker/BrokerFactory.h"
#include "broker/PaperBroker.h"
#include "common/Config.h"
#include "core/state/InMemoryOrderRepository.h"
#include "core/state/PostgresOrderRepository.h"
#include "execution/OrderIdempotencyService.h"
#include "network/CurlHttpClient.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace cryptogate;

namespace {

void printUsage() {
    std::cerr << "Usage:\n"
              << "  CryptoGateOrder place  <exchange> <symbol> <BUY|SELL> <quantity> [limit_price]\n"
              << "  CryptoGateOrder cancel <exchange> <exchange_order_id> <symbol>\n"
              << "  CryptoGateOrder status <exchange> <exchange_order_id> <symbol>\n"
              << "config 경로는 CRYPTOGATE_CONFIG 환경 변수 (기본 config/config.json)\n";
}

void printOrder(const Order& order) {
    std::cout << "client_order_id:   " << order.client_order_id << "\n"
              << "exchange_order_id: " << order.exchange_order_id << "\n"
              << "symbol:            " << order.symbol << " " << toString(order.side) << " "
              << toString(order.type) << "\n"
              << "status:            " << toString(order.status) << "\n"
              << "filled:            " << order.filled_quantity << " / " << order.quantity << "\n";
    if (order.average_fill_price) {
        std::cout << "avg price:         " << *order.average_fill_price << "\n";
    }
}

std::shared_ptr<core::IOrderRepository> createOrderRepository(const StorageConfig& storage) {
    if (!storage.database_url.empty()) {
        return std::make_shared<core::PostgresOrderRepository>(storage.database_url);
    }
    std::cout << "경고: CRYPTOGATE_DB_URL 이 없어 메모리 저장소를 사용합니다 (중복 방지는 이 프로세스 안에서만)\n";
    return std::make_shared<core::InMemoryOrderRepository>();
}

}

int main(int argc, char* argv[]) {
    if (argc < 5) {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    const std::string exchange = argv[2];

    try {
        const char* env_path = std::getenv("CRYPTOGATE_CONFIG");
        auto& cfg = Config::getInstance();
        cfg.load(env_path ? env_path : "config/config.json");

        auto broker_config = cfg.getBroker(exchange);
        if (!broker_config) {
            std::cerr << "Unknown exchange: " << exchange << "\n";
            return 1;
        }

        auto gateway = broker::createBroker(*broker_config, std::make_shared<network::CurlHttpClient>());
        gateway->connect();

        if (command == "place") {
            if (argc < 6) {
                printUsage();
                return 1;
            }
            OrderRequest request;
            request.exchange = exchange;
            request.symbol = argv[3];
            request.side = orderSideFromString(argv[4]);
            request.quantity = std::stod(argv[5]);
            request.strategy_id = "manual";
            if (argc > 6) {
                request.type = OrderType::LIMIT;
                request.price = std::stod(argv[6]);
            }

            // 모의 거래소는 시세가 없으므로 지정가를 현재가로 둔다
            if (auto paper = std::dynamic_pointer_cast<broker::PaperBroker>(gateway)) {
                if (request.price) {
                    paper->setMarketPrice(request.symbol, *request.price);
                }
            }

            execution::OrderIdempotencyService service(createOrderRepository(cfg.getStorage()),
                                                       cfg.getOrders().client_order_prefix);
            auto placed = service.submit(request, *gateway);
            printOrder(placed);
            return placed.status == OrderStatus::REJECTED ? 2 : 0;
        }

        if (command == "cancel" || command == "status") {
            const std::string exchange_order_id = argv[3];
            const std::string symbol = argv[4];

            auto current = gateway->getOrderStatus(exchange_order_id, symbol);
            if (command == "status") {
                printOrder(current);
                return 0;
            }
            if (isTerminal(current.status)) {
                std::cout << "Order already terminal (" << toString(current.status) << "); no cancel needed\n";
                return 0;
            }
            auto cancelled = gateway->cancelOrder(exchange_order_id, symbol);
            printOrder(cancelled);
            return 0;
        }

        printUsage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Order tool failed: " << e.what() << "\n";
        return 1;
    }
}
