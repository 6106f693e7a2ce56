#pragma once

#include <cstddef>
#include <string>

namespace cryptogate {
namespace network {

class RequestSigner {
public:
    // HMAC-SHA256 -> lowercase hex (Binance query / Bybit v5 header 서명)
    static std::string hmacSha256Hex(const std::string& secret, const std::string& message);

    // OpenSSL CSPRNG 기반 랜덤 hex (byte_count * 2 글자)
    static std::string randomHex(std::size_t byte_count);

    static long long nowMillis();

private:
    static std::string toHex(const unsigned char* data, std::size_t length);
};

} // namespace network
} // namespace cryptogate
