#pragma once

#include "store/StoreError.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace cloudclip::store {

// Six-digit numeric session codes ("100000".."999999"), short enough to read
// out loud or type on another machine.
class CodeGenerator {
public:
    static constexpr std::uint32_t kMinCode = 100000;
    static constexpr std::uint32_t kMaxCode = 999999;
    static constexpr std::size_t kDefaultMaxAttempts = 64;

    explicit CodeGenerator(std::size_t max_attempts = kDefaultMaxAttempts)
        : rng_(seed_engine_()),
          max_attempts_(max_attempts) {}

    // Deterministic sequence, for tests.
    CodeGenerator(std::uint64_t seed, std::size_t max_attempts)
        : rng_(seed),
          max_attempts_(max_attempts) {}

    // One uniform draw, no uniqueness check.
    std::string draw() {
        std::lock_guard<std::mutex> lk(mu_);
        return std::to_string(dist_(rng_));
    }

    // Draws until the code is absent from `existing` (anything with count()).
    // The caller must hold whatever lock protects `existing` until the new
    // code has been inserted, or two callers can be handed the same code.
    template <typename IdSet>
    std::string generate_unique(const IdSet& existing) {
        for (std::size_t attempt = 0; attempt < max_attempts_; ++attempt) {
            std::string code = draw();
            if (existing.count(code) == 0) return code;
        }
        throw ExhaustedCodespace("no free session code after " +
                                 std::to_string(max_attempts_) + " attempts");
    }

    std::size_t max_attempts() const noexcept { return max_attempts_; }

private:
    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

private:
    std::mutex mu_;
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint32_t> dist_{kMinCode, kMaxCode};
    std::size_t max_attempts_;
};

} // namespace cloudclip::store
