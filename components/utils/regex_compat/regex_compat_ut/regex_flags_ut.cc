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

#include "regex_flags.h"

#include "cptest.h"
#include "debug.h"
#include "pcre2_engine.h"
#include "re2_engine.h"

using namespace std;
using namespace testing;
using namespace RegexCompat;

class RegexFlagsTest : public Test
{
public:
    CPTestDebugCapture capture;
};

TEST_F(RegexFlagsTest, flag_values_follow_the_common_numbering)
{
    EXPECT_EQ(NO_FLAGS, 0u);
    EXPECT_EQ(IGNORECASE, 2u);
    EXPECT_EQ(MULTILINE, 8u);
    EXPECT_EQ(DOTALL, 16u);
    EXPECT_EQ(UNICODE, 32u);
    EXPECT_EQ(VERBOSE, 64u);
}

TEST_F(RegexFlagsTest, translates_flag_names)
{
    EXPECT_EQ(translateFlagNames({}), NO_FLAGS);
    EXPECT_EQ(translateFlagNames({ "IGNORECASE" }), IGNORECASE);
    EXPECT_EQ(translateFlagNames({ "MULTILINE" }), MULTILINE);
    EXPECT_EQ(translateFlagNames({ "DOTALL" }), DOTALL);
    EXPECT_EQ(translateFlagNames({ "IGNORECASE", "MULTILINE", "DOTALL" }), IGNORECASE | MULTILINE | DOTALL);
}

TEST_F(RegexFlagsTest, translation_of_several_names_is_their_union)
{
    RegexFlags combined = translateFlagNames({ "IGNORECASE", "MULTILINE" });
    EXPECT_EQ(combined, translateFlagNames({ "IGNORECASE" }) | translateFlagNames({ "MULTILINE" }));
    EXPECT_EQ(translateFlagNames({ "MULTILINE", "MULTILINE" }), MULTILINE);
}

TEST_F(RegexFlagsTest, accepts_aliases_and_any_letter_case)
{
    EXPECT_EQ(translateFlagNames({ "I", "M", "S" }), IGNORECASE | MULTILINE | DOTALL);
    EXPECT_EQ(translateFlagNames({ "re.IGNORECASE" }), IGNORECASE);
    EXPECT_EQ(translateFlagNames({ "re.s" }), DOTALL);
    EXPECT_EQ(translateFlagNames({ " multiline " }), MULTILINE);
    EXPECT_EQ(translateFlagNames({ "DotAll" }), DOTALL);
}

TEST_F(RegexFlagsTest, unicode_is_always_on)
{
    EXPECT_EQ(translateFlagNames({ "UNICODE" }), NO_FLAGS);
    EXPECT_EQ(translateFlagNames({ "U", "IGNORECASE" }), IGNORECASE);
    EXPECT_THAT(capture.getOutput(), Not(HasSubstr("###")));
}

TEST_F(RegexFlagsTest, verbose_is_reported_and_ignored)
{
    EXPECT_EQ(translateFlagNames({ "IGNORECASE", "VERBOSE" }), IGNORECASE);
    EXPECT_THAT(capture.getOutput(), HasSubstr("VERBOSE flag is not supported"));

    capture.clear();
    EXPECT_EQ(translateFlagNames({ "x" }), NO_FLAGS);
    EXPECT_THAT(capture.getOutput(), HasSubstr("VERBOSE flag is not supported"));
}

TEST_F(RegexFlagsTest, unknown_names_are_reported_and_ignored)
{
    EXPECT_EQ(translateFlagNames({ "ASCII", "DOTALL" }), DOTALL);
    EXPECT_THAT(capture.getOutput(), HasSubstr("Ignoring unknown regex flag name: 'ASCII'"));
}

TEST_F(RegexFlagsTest, multiline_becomes_an_inline_directive)
{
    EXPECT_EQ(applyMultilineDirective("^abc$", MULTILINE), "(?m)^abc$");
    EXPECT_EQ(applyMultilineDirective("^abc$", MULTILINE | IGNORECASE), "(?m)^abc$");
    EXPECT_EQ(applyMultilineDirective("^abc$", IGNORECASE | DOTALL), "^abc$");
}

TEST_F(RegexFlagsTest, sanitize_keeps_supported_flags)
{
    EXPECT_EQ(sanitizeFlags(IGNORECASE | MULTILINE | DOTALL, "id"), IGNORECASE | MULTILINE | DOTALL);
    EXPECT_EQ(sanitizeFlags(UNICODE | DOTALL, "id"), DOTALL);
    EXPECT_EQ(capture.getOutput(), "");
}

TEST_F(RegexFlagsTest, sanitize_reports_unsupported_bits)
{
    EXPECT_EQ(sanitizeFlags(IGNORECASE | VERBOSE, "ssn-pattern"), IGNORECASE);
    EXPECT_THAT(capture.getOutput(), HasSubstr("VERBOSE flag is not supported"));
    EXPECT_THAT(capture.getOutput(), HasSubstr("Pattern ID: ssn-pattern"));

    capture.clear();
    EXPECT_EQ(sanitizeFlags(256 | DOTALL, "id"), DOTALL);
    EXPECT_THAT(capture.getOutput(), HasSubstr("Ignoring unsupported regex flag bits 256"));
}

TEST_F(RegexFlagsTest, dumps_flags)
{
    EXPECT_EQ(dumpFlags(NO_FLAGS), "0");
    EXPECT_EQ(dumpFlags(IGNORECASE), "IGNORECASE");
    EXPECT_EQ(dumpFlags(IGNORECASE | MULTILINE | DOTALL), "IGNORECASE|MULTILINE|DOTALL");
    EXPECT_EQ(dumpFlags(UNICODE), "0");
}

TEST_F(RegexFlagsTest, pcre2_options)
{
    uint32_t base = Pcre2Engine::translateFlags(NO_FLAGS);
    EXPECT_TRUE(base & PCRE2_UTF);
    EXPECT_TRUE(base & PCRE2_UCP);
    EXPECT_TRUE(base & PCRE2_DOLLAR_ENDONLY);
    EXPECT_FALSE(base & PCRE2_CASELESS);
    EXPECT_FALSE(base & PCRE2_DOTALL);

    EXPECT_EQ(Pcre2Engine::translateFlags(IGNORECASE), base | PCRE2_CASELESS);
    EXPECT_EQ(Pcre2Engine::translateFlags(DOTALL), base | PCRE2_DOTALL);
    EXPECT_EQ(Pcre2Engine::translateFlags(MULTILINE), base);
}

#ifdef USE_RE2
TEST_F(RegexFlagsTest, re2_options)
{
    RE2::Options plain = Re2Engine::translateFlags(NO_FLAGS);
    EXPECT_TRUE(plain.case_sensitive());
    EXPECT_FALSE(plain.dot_nl());
    EXPECT_FALSE(plain.log_errors());
    EXPECT_EQ(plain.encoding(), RE2::Options::EncodingUTF8);

    EXPECT_FALSE(Re2Engine::translateFlags(IGNORECASE).case_sensitive());
    EXPECT_TRUE(Re2Engine::translateFlags(DOTALL).dot_nl());

    RE2::Options multiline = Re2Engine::translateFlags(MULTILINE);
    EXPECT_TRUE(multiline.case_sensitive());
    EXPECT_FALSE(multiline.dot_nl());
    EXPECT_FALSE(multiline.one_line());
}
#endif // USE_RE2
