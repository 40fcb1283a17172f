#include "../../include/utils/id_generator.hpp"
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace parley {
namespace IdGenerator {

std::string generate() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating an id");
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace IdGenerator
} // namespace parley
