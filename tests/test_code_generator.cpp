#include <gtest/gtest.h>
#include "store/CodeGenerator.hpp"

#include <cctype>
#include <set>
#include <string>
#include <unordered_set>

using namespace cloudclip::store;

namespace {

struct SaturatedIds {
    mutable std::size_t lookups = 0;
    std::size_t count(const std::string&) const {
        ++lookups;
        return 1;
    }
};

bool is_six_digits(const std::string& s) {
    if (s.size() != 6) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

TEST(CodeGenerator, DrawsSixDigitCodesInRange) {
    CodeGenerator gen;
    for (int i = 0; i < 1000; ++i) {
        const std::string code = gen.draw();
        ASSERT_TRUE(is_six_digits(code)) << code;
        const auto value = std::stoul(code);
        EXPECT_GE(value, CodeGenerator::kMinCode);
        EXPECT_LE(value, CodeGenerator::kMaxCode);
    }
}

TEST(CodeGenerator, SkipsCodesAlreadyInUse) {
    CodeGenerator probe(42, 64);
    CodeGenerator gen(42, 64);

    // Same seed, so the first draw of `gen` is known in advance.
    std::unordered_set<std::string> existing{probe.draw()};
    const std::string code = gen.generate_unique(existing);

    EXPECT_EQ(existing.count(code), 0u);
    EXPECT_TRUE(is_six_digits(code));
}

TEST(CodeGenerator, ReturnsFirstFreeDraw) {
    CodeGenerator probe(7, 64);
    CodeGenerator gen(7, 64);

    std::unordered_set<std::string> none;
    EXPECT_EQ(gen.generate_unique(none), probe.draw());
}

TEST(CodeGenerator, GivesUpAfterAttemptBudget) {
    CodeGenerator gen(1, 16);
    SaturatedIds all_taken;

    EXPECT_THROW(gen.generate_unique(all_taken), ExhaustedCodespace);
    EXPECT_EQ(all_taken.lookups, 16u);
}

TEST(CodeGenerator, SpreadsDraws) {
    CodeGenerator gen(123, 64);
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) seen.insert(gen.draw());
    // 200 draws from 900000 values; a handful of collisions at most.
    EXPECT_GT(seen.size(), 190u);
}
