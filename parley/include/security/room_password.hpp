#ifndef PARLEY_ROOM_PASSWORD_HPP
#define PARLEY_ROOM_PASSWORD_HPP

#include <string>

namespace parley {

// Rooms never keep the plain password; only "salt:sha256(salt + password)".
class RoomPassword {
public:
    // Returns an empty string if the system RNG fails.
    static std::string hash(const std::string& password);

    static bool verify(const std::string& password, const std::string& hash);

    static std::string generateSalt();

private:
    static std::string sha256Hex(const std::string& input);
};

} // namespace parley

#endif // PARLEY_ROOM_PASSWORD_HPP
