#pragma once

#include <string>
#include <cstdint>
#include <functional>

namespace erebus {

// Deterministic xorshift32 generator. The state follows 32-bit signed
// arithmetic so a given seed yields the same stream on every shard.
class SeededRandom {
public:
    explicit SeededRandom(uint32_t seed) : state_(static_cast<int32_t>(seed)) {}

    // Uniform value in [0, 1].
    double next();

private:
    int32_t state_;
};

// 32-bit string hash ((h << 5) - h + c), returned as an absolute value.
uint32_t hash_string_to_seed(const std::string& str);

// Crockford base32 ULID: 10 characters of millisecond time, 16 of randomness.
// Lexicographic order of two ULIDs equals their chronological order.
class Ulid {
public:
    static constexpr size_t LENGTH = 26;
    static constexpr size_t TIME_LENGTH = 10;
    static constexpr size_t RANDOM_LENGTH = 16;
    static constexpr uint64_t TIME_MAX = (1ULL << 48) - 1;
    static constexpr const char* ENCODING = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    static std::string generate(uint64_t time_ms, const std::function<double()>& prng);

    // Next ULID in the same millisecond. Throws std::overflow_error when the random part is exhausted.
    static std::string increment(const std::string& ulid);

    // Throws std::invalid_argument for malformed input.
    static uint64_t decode_time(const std::string& ulid);
    static std::string encode_time(uint64_t time_ms);

    static bool is_valid(const std::string& ulid);

private:
    static int decode_char(char c);
};

}
