#include "core/RandomString.hpp"
#include "core/ToolkitError.hpp"
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <random>

namespace toolkit {

const char RANDOM_STRING_SOURCE[] =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_+-=";

namespace {
    constexpr int MAX_DRAW_ATTEMPTS = 3;

    // Lets std::uniform_int_distribution consume a RandomDraw
    struct DrawGenerator {
        using result_type = std::uint32_t;

        static constexpr result_type min() { return 0; }
        static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

        result_type operator()() { return draw(); }

        const RandomDraw& draw;
    };
}

std::string randomString(std::size_t n) {
    std::unique_ptr<std::random_device> rd;
    try {
        rd = std::make_unique<std::random_device>();
    } catch (const std::exception& e) {
        throw ToolkitError(ErrorKind::Entropy, std::string("random source unavailable: ") + e.what());
    }
    return randomString(n, [&rd]() { return static_cast<std::uint32_t>((*rd)()); });
}

std::string randomString(std::size_t n, const RandomDraw& draw) {
    const std::size_t alphabetSize = std::strlen(RANDOM_STRING_SOURCE);
    std::string result(n, '\0');
    if (n == 0) return result;

    std::uniform_int_distribution<std::size_t> dis(0, alphabetSize - 1);
    DrawGenerator generator{draw};

    for (int attempt = 1;; ++attempt) {
        try {
            for (std::size_t i = 0; i < n; ++i) {
                result[i] = RANDOM_STRING_SOURCE[dis(generator)];
            }
            return result;
        } catch (const std::exception& e) {
            std::cerr << "Random source failure (attempt " << attempt << "/"
                      << MAX_DRAW_ATTEMPTS << "): " << e.what() << std::endl;
            if (attempt >= MAX_DRAW_ATTEMPTS) {
                throw ToolkitError(ErrorKind::Entropy,
                                   std::string("random source unavailable: ") + e.what());
            }
            dis.reset();
        }
    }
}

} // namespace toolkit
