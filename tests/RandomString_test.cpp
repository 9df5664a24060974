#include <gtest/gtest.h>
#include <cstring>
#include <set>
#include "core/RandomString.hpp"
#include "core/ToolkitError.hpp"
#include <stdexcept>

using namespace toolkit;

TEST(RandomStringTest, ReturnsRequestedLength) {
    for (std::size_t n : {0u, 1u, 10u, 1000u}) {
        EXPECT_EQ(randomString(n).size(), n) << "n = " << n;
    }
}

TEST(RandomStringTest, SourceHasSixtySixCharacters) {
    EXPECT_EQ(std::strlen(RANDOM_STRING_SOURCE), 66u);
}

TEST(RandomStringTest, OnlyUsesSourceCharacters) {
    std::string value = randomString(2000);
    for (char c : value) {
        EXPECT_NE(std::strchr(RANDOM_STRING_SOURCE, c), nullptr) << "unexpected '" << c << "'";
    }
}

TEST(RandomStringTest, ConsecutiveCallsDiffer) {
    EXPECT_NE(randomString(32), randomString(32));
}

TEST(RandomStringTest, LongStringCoversMostOfTheAlphabet) {
    std::string value = randomString(5000);
    std::set<char> seen(value.begin(), value.end());
    EXPECT_GT(seen.size(), 60u);
}

TEST(RandomStringTest, InjectedSourceDrivesOutput) {
    RandomDraw constant = []() { return std::uint32_t{1}; };

    std::string value = randomString(5, constant);

    ASSERT_EQ(value.size(), 5u);
    EXPECT_NE(std::strchr(RANDOM_STRING_SOURCE, value[0]), nullptr);
    EXPECT_EQ(value, std::string(5, value[0]));
}

TEST(RandomStringTest, RecoversFromTransientSourceFailure) {
    int calls = 0;
    RandomDraw flaky = [&calls]() -> std::uint32_t {
        if (++calls <= 2) throw std::runtime_error("device busy");
        return 1;
    };

    std::string value = randomString(4, flaky);

    EXPECT_EQ(value.size(), 4u);
    EXPECT_EQ(value, std::string(4, value[0]));
}

TEST(RandomStringTest, PersistentSourceFailureIsEntropyError) {
    int calls = 0;
    RandomDraw broken = [&calls]() -> std::uint32_t {
        ++calls;
        throw std::runtime_error("no entropy");
    };

    try {
        randomString(8, broken);
        FAIL() << "Expected ToolkitError";
    } catch (const ToolkitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Entropy);
    }
    EXPECT_EQ(calls, 3);
}

TEST(RandomStringTest, EmptyStringNeverDraws) {
    RandomDraw broken = []() -> std::uint32_t { throw std::runtime_error("unused"); };
    EXPECT_EQ(randomString(0, broken), "");
}
