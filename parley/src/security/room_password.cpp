#include "../../include/security/room_password.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace parley {

std::string RoomPassword::hash(const std::string& password) {
    const std::string salt = generateSalt();
    if (salt.empty()) {
        return "";
    }
    return salt + ":" + sha256Hex(salt + password);
}

bool RoomPassword::verify(const std::string& password, const std::string& hash) {
    const size_t colon_pos = hash.find(':');
    if (colon_pos == std::string::npos) {
        return false;
    }

    const std::string salt = hash.substr(0, colon_pos);
    const std::string stored_hash = hash.substr(colon_pos + 1);
    const std::string computed = sha256Hex(salt + password);

    if (computed.empty() || computed.size() != stored_hash.size()) {
        return false;
    }
    return CRYPTO_memcmp(computed.data(), stored_hash.data(), computed.size()) == 0;
}

std::string RoomPassword::generateSalt() {
    unsigned char salt[16];
    if (RAND_bytes(salt, sizeof(salt)) != 1) {
        return "";
    }

    std::ostringstream salt_hex;
    for (int i = 0; i < 16; i++) {
        salt_hex << std::hex << std::setw(2) << std::setfill('0') << (int)salt[i];
    }
    return salt_hex.str();
}

std::string RoomPassword::sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return "";
    }

    std::ostringstream hash_hex;
    for (unsigned int i = 0; i < digest_len; i++) {
        hash_hex << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return hash_hex.str();
}

} // namespace parley
