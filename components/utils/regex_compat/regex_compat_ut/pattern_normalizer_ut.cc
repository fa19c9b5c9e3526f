// Copyright (C) 2022 Check Point Software Technologies Ltd. All rights reserved.

// Licensed under the Apache License, Version 2.0 (the "License");
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "pattern_normalizer.h"

#include "cptest.h"
#include "debug.h"

using namespace std;
using namespace testing;
using namespace RegexCompat;

USE_DEBUG_FLAG(D_REGEX_NORMALIZER);

TEST(PatternNormalizerTest, expands_unicode_escapes)
{
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\uAC00"), "가");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u00e9t\\u00E9"), "été");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("[\\uAC00-\\uD7A3]+"), "[가-힣]+");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u0041\\u0062c"), "Abc");
}

TEST(PatternNormalizerTest, escaped_metacharacters_stay_literal)
{
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("a\\u002Eb"), "a\\.b");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("[\\u0041\\u002D\\u005A]"), "[A\\-Z]");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u005C"), "\\\\");
}

TEST(PatternNormalizerTest, malformed_escapes_are_left_untouched)
{
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u12"), "\\u12");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\uZZZZ"), "\\uZZZZ");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u12G4x"), "\\u12G4x");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("abc\\u"), "abc\\u");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\uD800"), "\\uD800");
}

TEST(PatternNormalizerTest, escaped_backslash_is_not_an_escape_prefix)
{
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\\\u0041"), "\\\\u0041");
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\\\\\u0041"), "\\\\A");
}

TEST(PatternNormalizerTest, only_five_hex_digits_are_not_consumed)
{
    EXPECT_EQ(PatternNormalizer::expandUnicodeEscapes("\\u00411"), "A1");
}

TEST(PatternNormalizerTest, detects_non_latin_scripts)
{
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("[가-힣]+"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("[ㄱ-ㅎ]"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("[一-龥]"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("[ァ-ン]+"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("\\p{Han}+"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("\\p{Hangul}"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("name\\uZZZZ"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("주민등록번호"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("電話"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("あ"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("カタカナ"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("\xe1\x84\x80"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("\xe3\x84\xb1"));

    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("\\bword\\b"));
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("café"));
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("Привет"));
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("\\p{L}+"));
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript(""));
}

TEST(PatternNormalizerTest, script_table_boundaries)
{
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x4E00));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x9FFF));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x3400));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0xD7AF));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x3040));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x30FF));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x1100));
    EXPECT_TRUE(PatternNormalizer::isInNonLatinScript(0x318F));

    EXPECT_FALSE(PatternNormalizer::isInNonLatinScript(0x4DC0));
    EXPECT_FALSE(PatternNormalizer::isInNonLatinScript(0xA000));
    EXPECT_FALSE(PatternNormalizer::isInNonLatinScript(0x0E01));
    EXPECT_FALSE(PatternNormalizer::isInNonLatinScript('a'));
    EXPECT_EQ(non_latin_script_ranges.size(), 7u);
}

TEST(PatternNormalizerTest, invalid_utf8_does_not_stop_detection)
{
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("\xff\xfe" "abc"));
    EXPECT_TRUE(PatternNormalizer::usesNonLatinScript("\xff" "가"));
    EXPECT_FALSE(PatternNormalizer::usesNonLatinScript("\xea\xb0"));
}

TEST(PatternNormalizerTest, finds_word_boundaries)
{
    EXPECT_TRUE(PatternNormalizer::hasWordBoundary("\\bfoo"));
    EXPECT_TRUE(PatternNormalizer::hasWordBoundary("foo\\b"));
    EXPECT_TRUE(PatternNormalizer::hasWordBoundary("\\\\\\b"));
    EXPECT_FALSE(PatternNormalizer::hasWordBoundary("foo"));
    EXPECT_FALSE(PatternNormalizer::hasWordBoundary("\\Bfoo"));
    EXPECT_FALSE(PatternNormalizer::hasWordBoundary("\\\\b"));
    EXPECT_FALSE(PatternNormalizer::hasWordBoundary("\\"));
}

TEST(PatternNormalizerTest, removes_word_boundaries_around_cjk)
{
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\b한국\\b"), "한국");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\b[가-힣]{2,4}\\b\\s+\\d+"), "[가-힣]{2,4}\\s+\\d+");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("(?:\\b東京|\\bOsaka)\\b"), "(?:東京|Osaka)");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\p{Han}\\b\\B"), "\\p{Han}\\B");
}

TEST(PatternNormalizerTest, keeps_other_escapes_when_removing_boundaries)
{
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\b가\\\\b\\d\\b"), "가\\\\b\\d");
}

TEST(PatternNormalizerTest, keeps_word_boundaries_in_ascii_patterns)
{
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\bword\\b"), "\\bword\\b");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\b\\d{3}-\\d{4}\\b"), "\\b\\d{3}-\\d{4}\\b");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("\\bcafé\\b"), "\\bcafé\\b");
    EXPECT_EQ(PatternNormalizer::rewriteWordBoundaries("[가-힣]+"), "[가-힣]+");
}

TEST(PatternNormalizerTest, normalize_is_identity_on_ascii_patterns)
{
    vector<string> patterns = {
        "\\bword\\b",
        "\\d{5}",
        "a|b",
        "(?i)\\bhello\\s+world\\b",
        "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}",
        "\\\\b",
        ""
    };
    for (const string &pattern : patterns) {
        EXPECT_EQ(PatternNormalizer::normalize(pattern), pattern);
    }
}

TEST(PatternNormalizerTest, normalize_expands_escapes_before_detecting_scripts)
{
    EXPECT_EQ(PatternNormalizer::normalize("\\b\\uD55C\\uAD6D\\b"), "한국");
    EXPECT_EQ(PatternNormalizer::normalize("\\b\\u00e9\\b"), "\\bé\\b");
    EXPECT_EQ(PatternNormalizer::normalize("\\b\\uZZZZ\\b"), "\\uZZZZ");
}

TEST(PatternNormalizerTest, normalize_is_deterministic)
{
    string pattern = "\\b[\\uAC00-\\uD7A3]+\\b";
    EXPECT_EQ(PatternNormalizer::normalize(pattern), PatternNormalizer::normalize(pattern));
    EXPECT_EQ(PatternNormalizer::normalize(pattern), "[가-힣]+");
}

TEST(PatternNormalizerTest, traces_rewritten_patterns)
{
    CPTestDebugCapture capture;
    Debug::setUnitTestFlag(D_REGEX_NORMALIZER, Debug::DebugLevel::TRACE);

    PatternNormalizer::normalize("\\b가\\b");
    EXPECT_THAT(capture.getOutput(), HasSubstr("Transformed pattern for Unicode compatibility"));

    capture.clear();
    PatternNormalizer::normalize("\\bword\\b");
    EXPECT_THAT(capture.getOutput(), Not(HasSubstr("Transformed pattern")));

    Debug::resetFlagLevels();
}
