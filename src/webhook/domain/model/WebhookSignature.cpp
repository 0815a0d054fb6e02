#include "taskcore/webhook/domain/model/WebhookSignature.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace taskcore::webhook::domain::model {

namespace {

std::string toHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

std::string WebhookSignature::sign(const std::string& secret, const std::string& body) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
                                       secret.data(), static_cast<int>(secret.length()),
                                       reinterpret_cast<const unsigned char*>(body.data()), body.length(),
                                       digest, &digestLength);
    if (result == nullptr) {
        throw shared::exception::DomainException("SIGNATURE_ERROR", "Failed to compute HMAC-SHA256");
    }
    return std::string(PREFIX) + toHex(digest, digestLength);
}

std::string WebhookSignature::signPayload(const std::string& secret, const Json::Value& payload) {
    return sign(secret, shared::util::toCompactString(payload));
}

bool WebhookSignature::verify(const std::string& secret, const std::string& body, const std::string& signature) {
    const std::string expected = sign(secret, body);
    if (signature.length() != expected.length()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), signature.data(), expected.length()) == 0;
}

std::string WebhookSignature::generateSecret() {
    std::vector<unsigned char> bytes(32);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw shared::exception::DomainException("SIGNATURE_ERROR", "Failed to generate webhook secret");
    }
    return toHex(bytes.data(), bytes.size());
}

} // namespace taskcore::webhook::domain::model
