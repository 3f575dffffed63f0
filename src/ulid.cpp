#include "ulid.hpp"
#include <cmath>
#include <cctype>
#include <stdexcept>

namespace erebus {

double SeededRandom::next() {
    state_ ^= static_cast<int32_t>(static_cast<uint32_t>(state_) << 13);
    state_ ^= state_ >> 17;
    state_ ^= static_cast<int32_t>(static_cast<uint32_t>(state_) << 5);
    return static_cast<double>(static_cast<uint32_t>(state_)) / 4294967295.0;
}

uint32_t hash_string_to_seed(const std::string& str) {
    int32_t hash = 0;
    for (unsigned char c : str) {
        uint32_t h = static_cast<uint32_t>(hash);
        h = (h << 5) - h + c;
        hash = static_cast<int32_t>(h);
    }
    if (hash == 0) return 1;  // xorshift never leaves the zero state
    return hash < 0 ? static_cast<uint32_t>(-static_cast<int64_t>(hash)) : static_cast<uint32_t>(hash);
}

std::string Ulid::encode_time(uint64_t time_ms) {
    if (time_ms > TIME_MAX) {
        throw std::invalid_argument("ULID time exceeds 48 bits");
    }
    std::string out(TIME_LENGTH, '0');
    for (size_t i = TIME_LENGTH; i-- > 0;) {
        out[i] = ENCODING[time_ms % 32];
        time_ms /= 32;
    }
    return out;
}

std::string Ulid::generate(uint64_t time_ms, const std::function<double()>& prng) {
    std::string out = encode_time(time_ms);
    out.reserve(LENGTH);
    for (size_t i = 0; i < RANDOM_LENGTH; ++i) {
        auto idx = static_cast<size_t>(std::floor(prng() * 32));
        if (idx >= 32) idx = 31;
        out += ENCODING[idx];
    }
    return out;
}

std::string Ulid::increment(const std::string& ulid) {
    if (!is_valid(ulid)) {
        throw std::invalid_argument("Invalid ULID: " + ulid);
    }
    std::string out = ulid;
    for (size_t i = LENGTH; i-- > TIME_LENGTH;) {
        int v = decode_char(out[i]);
        if (v < 31) {
            out[i] = ENCODING[v + 1];
            return out;
        }
        out[i] = ENCODING[0];
    }
    throw std::overflow_error("ULID random component exhausted for this millisecond");
}

uint64_t Ulid::decode_time(const std::string& ulid) {
    if (!is_valid(ulid)) {
        throw std::invalid_argument("Invalid ULID: " + ulid);
    }
    uint64_t t = 0;
    for (size_t i = 0; i < TIME_LENGTH; ++i) {
        t = t * 32 + static_cast<uint64_t>(decode_char(ulid[i]));
    }
    if (t > TIME_MAX) {
        throw std::invalid_argument("Malformed ULID timestamp: " + ulid);
    }
    return t;
}

bool Ulid::is_valid(const std::string& ulid) {
    if (ulid.size() != LENGTH) return false;
    for (char c : ulid) {
        if (decode_char(c) < 0) return false;
    }
    return true;
}

int Ulid::decode_char(char c) {
    char u = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (int i = 0; i < 32; ++i) {
        if (ENCODING[i] == u) return i;
    }
    return -1;
}

}
