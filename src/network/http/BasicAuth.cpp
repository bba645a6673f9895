#include "BasicAuth.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <limits>
#include <memory>
#include <stdexcept>

namespace renterd::network {

std::string Base64Encode(const uint8_t* input, size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::length_error("base64 input too large");
    }
    const size_t base_length = 4 * ((length + 2) / 3);
    auto buffer = std::make_unique<char[]>(base_length + 1);
    const int encoded = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input,
                                        static_cast<int>(length));
    if (encoded < 0 || static_cast<size_t>(encoded) != base_length) {
        throw std::runtime_error("OpenSSL base64 encoding failed");
    }
    return {buffer.get(), base_length};
}

std::string BasicAuthorization(std::string_view user, std::string_view password) {
    std::string credentials;
    credentials.reserve(user.size() + 1 + password.size());
    credentials.append(user).append(":").append(password);
    auto encoded =
        Base64Encode(reinterpret_cast<const uint8_t*>(credentials.data()), credentials.size());
    OPENSSL_cleanse(credentials.data(), credentials.size());
    return "Basic " + encoded;
}

}  // namespace renterd::network
