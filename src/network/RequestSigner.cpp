#include "network/RequestSigner.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace cryptogate {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& secret, const std::string& message) {
    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    const unsigned char* result = HMAC(
        EVP_sha256(),
        secret.c_str(), static_cast<int>(secret.length()),
        reinterpret_cast<const unsigned char*>(message.c_str()), message.length(),
        signature, &signature_len);

    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 signing failed");
    }

    return toHex(signature, signature_len);
}

std::string RequestSigner::randomHex(std::size_t byte_count) {
    std::vector<unsigned char> buffer(byte_count);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return toHex(buffer.data(), buffer.size());
}

long long RequestSigner::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string RequestSigner::toHex(const unsigned char* data, std::size_t length) {
    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

} // namespace network
} // namespace cryptogate
