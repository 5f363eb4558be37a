/**
 * @file introduction_code_test.cpp
 * @brief Unit tests for introduction code parsing and generation
 */

#include "stork/IntroductionCode.h"
#include "stork/config.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace Stork;

TEST(IntroductionCodeTest, WordListIsSortedAndUnique)
{
    ASSERT_EQ(IntroductionCode::wordListSize(), 256u);
    for (int i = 1; i < 256; ++i) {
        EXPECT_LT(std::string(IntroductionCode::wordAt(static_cast<uint8_t>(i - 1))),
                  std::string(IntroductionCode::wordAt(static_cast<uint8_t>(i))))
            << "at index " << i;
    }
}

TEST(IntroductionCodeTest, ParsesCanonicalCode)
{
    const std::string w0 = IntroductionCode::wordAt(0);
    const std::string w1 = IntroductionCode::wordAt(200);

    IntroductionCode code;
    std::string err;
    ASSERT_TRUE(IntroductionCode::parse("7-" + w0 + "-" + w1, code, err)) << err;

    EXPECT_EQ(code.nameplate(), 7u);
    ASSERT_EQ(code.words().size(), 2u);
    EXPECT_EQ(code.words()[0], w0);
    EXPECT_EQ(code.words()[1], w1);
    EXPECT_EQ(code.toString(), "7-" + w0 + "-" + w1);
}

TEST(IntroductionCodeTest, TrimsWhitespaceAndIgnoresCase)
{
    IntroductionCode code;
    std::string err;
    ASSERT_TRUE(IntroductionCode::parse("  12-ACORN-Acorn\n", code, err)) << err;
    EXPECT_EQ(code.toString(), "12-acorn-acorn");
}

TEST(IntroductionCodeTest, RejectsMalformedInput)
{
    const char* bad[] = {
        "",
        "   ",
        "acorn-acorn",        // no nameplate
        "0-acorn",            // nameplate zero
        "1234567-acorn",      // nameplate too long
        "7",                  // no words
        "7-",                 // empty word
        "7--acorn",           // empty word
        "7-acorn-",           // trailing dash
        "7-notaword",         // unknown word
        "x7-acorn",
        "7-acorn-acorn-acorn-acorn-acorn-acorn-acorn-acorn-acorn",  // too many words
    };

    for (const char* text : bad) {
        IntroductionCode code;
        std::string err;
        EXPECT_FALSE(IntroductionCode::parse(text, code, err)) << "accepted: '" << text << "'";
        EXPECT_FALSE(err.empty()) << text;
        EXPECT_FALSE(code.isValid());
    }
}

TEST(IntroductionCodeTest, GeneratedCodeParsesBack)
{
    for (unsigned words = 1; words <= MAX_CODE_WORDS; ++words) {
        IntroductionCode generated;
        std::string err;
        ASSERT_TRUE(IntroductionCode::generate(42, words, generated, err)) << err;
        EXPECT_EQ(generated.words().size(), words);

        IntroductionCode parsed;
        ASSERT_TRUE(IntroductionCode::parse(generated.toString(), parsed, err)) << err;
        EXPECT_EQ(parsed, generated);
    }
}

TEST(IntroductionCodeTest, GenerateRejectsBadArguments)
{
    IntroductionCode code;
    std::string err;
    EXPECT_FALSE(IntroductionCode::generate(0, 2, code, err));
    EXPECT_FALSE(IntroductionCode::generate(5, 0, code, err));
    EXPECT_FALSE(IntroductionCode::generate(5, MAX_CODE_WORDS + 1, code, err));
    EXPECT_FALSE(IntroductionCode::generate(MAX_NAMEPLATE + 1, 2, code, err));
}

TEST(IntroductionCodeTest, GeneratedSuffixesVary)
{
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        IntroductionCode code;
        std::string err;
        ASSERT_TRUE(IntroductionCode::generate(3, 4, code, err)) << err;
        seen.insert(code.toString());
    }
    // 32 bits of entropy per code; 20 draws colliding down to one is not plausible
    EXPECT_GT(seen.size(), 15u);
}
