#pragma once

#include <string>
#include <stdexcept>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace erebus {

class RandomId {
public:
    // RFC 4122 version 4 UUID from the OpenSSL CSPRNG.
    static std::string uuid() {
        unsigned char b[16];
        if (RAND_bytes(b, sizeof(b)) != 1) {
            throw std::runtime_error("CSPRNG failure while generating id");
        }
        b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
        b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);

        std::stringstream ss;
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
        }
        return ss.str();
    }
};

}
