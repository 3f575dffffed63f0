#include <gtest/gtest.h>
#include "ulid.hpp"

using namespace erebus;

TEST(UlidTest, EncodesTimePrefix) {
    EXPECT_EQ(Ulid::encode_time(0), "0000000000");
    EXPECT_EQ(Ulid::decode_time(Ulid::encode_time(1700000000000ULL) + "0000000000000000"), 1700000000000ULL);
    EXPECT_THROW(Ulid::encode_time(Ulid::TIME_MAX + 1), std::invalid_argument);
}

TEST(UlidTest, GenerateIsValidAndTimeOrdered) {
    SeededRandom rng(42);
    auto prng = [&rng]() { return rng.next(); };

    auto a = Ulid::generate(1000, prng);
    auto b = Ulid::generate(1001, prng);
    EXPECT_EQ(a.size(), Ulid::LENGTH);
    EXPECT_TRUE(Ulid::is_valid(a));
    EXPECT_LT(a, b);
    EXPECT_EQ(Ulid::decode_time(a), 1000u);
}

TEST(UlidTest, IncrementCarries) {
    std::string base = Ulid::encode_time(5) + "000000000000000Z";
    auto next = Ulid::increment(base);
    EXPECT_EQ(next, Ulid::encode_time(5) + "0000000000000010");
    EXPECT_GT(next, base);

    std::string full = Ulid::encode_time(5) + std::string(Ulid::RANDOM_LENGTH, 'Z');
    EXPECT_THROW(Ulid::increment(full), std::overflow_error);
}

TEST(UlidTest, RejectsInvalidCharacters) {
    EXPECT_FALSE(Ulid::is_valid("0"));
    EXPECT_FALSE(Ulid::is_valid(std::string(26, 'U')));  // U is not in Crockford base32
    EXPECT_THROW(Ulid::decode_time("short"), std::invalid_argument);
}

TEST(UlidTest, SeededRandomIsDeterministic) {
    SeededRandom a(hash_string_to_seed("room-1"));
    SeededRandom b(hash_string_to_seed("room-1"));
    for (int i = 0; i < 100; ++i) {
        double v = a.next();
        EXPECT_EQ(v, b.next());
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 1.0);
    }
    EXPECT_EQ(hash_string_to_seed(""), 1u);
}
