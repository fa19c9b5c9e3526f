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

#include "regex_match.h"

#include <sstream>

#include "cptest.h"
#include "regex_compat_errors.h"

using namespace std;
using namespace testing;
using namespace RegexCompat;

class RegexMatchTest : public Test
{
public:
    RegexMatchTest()
            :
        match(
            vector<RegexMatch::MatchGroup>({
                RegexMatch::MatchGroup(0, "", "key=42", 4, 10),
                RegexMatch::MatchGroup(1, "name", "key", 4, 7),
                RegexMatch::MatchGroup(2, ""),
                RegexMatch::MatchGroup(3, "value", "42", 8, 10)
            })
        )
    {
    }

    RegexMatch match;
};

TEST_F(RegexMatchTest, groups_by_index)
{
    EXPECT_EQ(match.group(), "key=42");
    EXPECT_EQ(match.group(1), "key");
    EXPECT_EQ(match.group(2), "");
    EXPECT_EQ(match.group(3), "42");
    EXPECT_EQ(match.group(4), "");
    EXPECT_EQ(match.getGroupCount(), 3u);
    EXPECT_EQ(match.groups(), vector<string>({ "key", "", "42" }));
}

TEST_F(RegexMatchTest, groups_by_name)
{
    EXPECT_THAT(match.group("name"), IsValue("key"));
    EXPECT_THAT(match.group("value"), IsValue("42"));
    EXPECT_THAT(match.group(""), IsError(_));
    EXPECT_THAT(match.group("other"), IsError("No group named 'other'"));
}

TEST_F(RegexMatchTest, offsets)
{
    EXPECT_EQ(match.start(), 4u);
    EXPECT_EQ(match.end(), 10u);
    EXPECT_EQ(match.span(3), (make_pair<size_t, size_t>(8, 10)));
    EXPECT_EQ(match.start(2), string::npos);
    EXPECT_EQ(match.end(9), string::npos);
    EXPECT_TRUE(match.isMatched(1));
    EXPECT_FALSE(match.isMatched(2));
    EXPECT_FALSE(match.isMatched(9));
    EXPECT_FALSE(match.empty());
}

TEST_F(RegexMatchTest, unmatched_named_group)
{
    RegexMatch optional(
        vector<RegexMatch::MatchGroup>({ RegexMatch::MatchGroup(0, "", "", 3, 3), RegexMatch::MatchGroup(1, "opt") })
    );
    EXPECT_THAT(optional.group("opt"), IsError("Group 'opt' did not participate in the match"));
    EXPECT_TRUE(optional.empty());
}

TEST_F(RegexMatchTest, printout)
{
    stringstream printed;
    printed << match;
    EXPECT_EQ(printed.str(), "RegexMatch(span=(4, 10), match='key=42', groups=[key, , 42])");

    stringstream no_groups;
    no_groups << RegexMatch(vector<RegexMatch::MatchGroup>({ RegexMatch::MatchGroup(0, "", "a\nb", 0, 3) }));
    EXPECT_EQ(no_groups.str(), "RegexMatch(span=(0, 3), match='a\\x0ab')");
}

TEST(RegexCompatErrorsTest, pattern_syntax_error)
{
    PatternSyntaxError err("[a", "(?m)[a", "pcre2", "missing terminating ] for character class", 6);
    EXPECT_EQ(err.getPattern(), "[a");
    EXPECT_EQ(err.getCompiledText(), "(?m)[a");
    EXPECT_EQ(err.getEngineName(), "pcre2");
    EXPECT_EQ(err.getOffset(), 6u);

    stringstream printed;
    printed << err;
    EXPECT_EQ(
        printed.str(),
        "PatternSyntaxError(pcre2: missing terminating ] for character class at offset 6, pattern '[a')"
    );

    PatternSyntaxError without_offset("(", "(", "re2", "missing ): (");
    stringstream short_print;
    short_print << without_offset;
    EXPECT_EQ(short_print.str(), "PatternSyntaxError(re2: missing ): (, pattern '(')");

    EXPECT_FALSE(err == without_offset);
    PatternSyntaxError same = err;
    same.setPatternId("other-id");
    EXPECT_TRUE(err == same);
}

TEST(RegexCompatErrorsTest, configuration_error)
{
    ConfigurationError err("no engine");
    EXPECT_EQ(err.getMessage(), "no engine");
    EXPECT_EQ(err, ConfigurationError("no engine"));

    stringstream printed;
    printed << err;
    EXPECT_EQ(printed.str(), "ConfigurationError(no engine)");
}
