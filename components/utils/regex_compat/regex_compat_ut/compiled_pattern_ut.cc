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

#include "compiled_pattern.h"

#include <list>
#include <thread>
#include <sstream>

#include "cptest.h"
#include "regex_compiler.h"

using namespace std;
using namespace testing;
using namespace RegexCompat;

class CompiledPatternTest : public TestWithParam<EnginePreference>
{
public:
    CompiledPatternTest()
    {
        EXPECT_TRUE(compiler.setEnginePreference(GetParam()).ok());
    }

    const CompiledPattern &
    compile(const string &pattern, RegexFlags flags = NO_FLAGS)
    {
        auto compiled = compiler.compile(pattern, flags, "test-pattern");
        compiled.verify<RegexCompatException>();
        patterns.push_back(compiled.unpackMove());
        return *patterns.back();
    }

    string
    expectedEngineName() const
    {
        return GetParam() == EnginePreference::BACKTRACKING ? "pcre2" : "re2";
    }

    RegexCompiler compiler;
    list<unique_ptr<CompiledPattern>> patterns;
};

TEST_P(CompiledPatternTest, fullmatch_requires_the_whole_text)
{
    const CompiledPattern &zip_code = compile("\\d{5}");

    EXPECT_THAT(zip_code.fullmatch("12345"), IsValue(_));
    EXPECT_THAT(zip_code.fullmatch("1234"), IsError(_));
    EXPECT_THAT(zip_code.fullmatch("123456"), IsError(_));
    EXPECT_THAT(zip_code.fullmatch("a12345"), IsError(_));
    EXPECT_THAT(zip_code.fullmatch("12345\n"), IsError(_));

    EXPECT_EQ(zip_code.fullmatch("12345").unpack().group(), "12345");
}

TEST_P(CompiledPatternTest, fullmatch_keeps_alternation_inside_the_anchors)
{
    const CompiledPattern &alternation = compile("a|b");

    EXPECT_THAT(alternation.fullmatch("a"), IsValue(_));
    EXPECT_THAT(alternation.fullmatch("b"), IsValue(_));
    EXPECT_THAT(alternation.fullmatch("ab"), IsError(_));
    EXPECT_THAT(alternation.fullmatch("ba"), IsError(_));

    // Matching at the start only would accept these
    EXPECT_THAT(alternation.match("ab"), IsValue(_));
    EXPECT_THAT(alternation.search("xb"), IsValue(_));
}

TEST_P(CompiledPatternTest, fullmatch_agrees_with_explicit_anchoring)
{
    vector<string> patterns = { "a+b*", "(x|xy)z?", "\\w+@\\w+", "[0-9]{2,3}" };
    vector<string> texts = { "", "a", "aab", "ba", "xyz", "xz", "x", "me@home", "me@home!", "12", "1234" };

    for (const string &pattern : patterns) {
        const CompiledPattern &plain = compile(pattern);
        const CompiledPattern &anchored = compile("^(?:" + pattern + ")$");
        for (const string &text : texts) {
            EXPECT_EQ(plain.fullmatch(text).ok(), anchored.match(text).ok()) << pattern << " on " << text;
        }
    }
}

TEST_P(CompiledPatternTest, search_and_match)
{
    const CompiledPattern &pattern = compile("b+");

    auto found = pattern.search("aabbbc");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.unpack().group(), "bbb");
    EXPECT_EQ(found.unpack().span(), make_pair<size_t, size_t>(2, 5));

    EXPECT_THAT(pattern.match("aabbbc"), IsError(_));
    EXPECT_THAT(pattern.search("xyz"), IsError(_));
    EXPECT_THAT(pattern.search(""), IsError(_));

    auto at_start = pattern.match("bbc");
    ASSERT_TRUE(at_start.ok());
    EXPECT_EQ(at_start.unpack().span(), make_pair<size_t, size_t>(0, 2));
}

TEST_P(CompiledPatternTest, capture_groups)
{
    const CompiledPattern &email = compile("(?P<user>\\w+)@(?P<host>\\w+)\\.com");
    EXPECT_EQ(email.getGroupCount(), 2u);

    auto found = email.search("mail john@example.com now");
    ASSERT_TRUE(found.ok());
    const RegexMatch &match = found.unpack();

    EXPECT_EQ(match.group(), "john@example.com");
    EXPECT_EQ(match.group(1), "john");
    EXPECT_EQ(match.group(2), "example");
    EXPECT_EQ(match.start(1), 5u);
    EXPECT_EQ(match.end(2), 17u);
    EXPECT_THAT(match.group("user"), IsValue("john"));
    EXPECT_THAT(match.group("host"), IsValue("example"));
    EXPECT_THAT(match.group("domain"), IsError("No group named 'domain'"));
    EXPECT_EQ(match.groups(), vector<string>({ "john", "example" }));
    EXPECT_EQ(match.getGroupCount(), 2u);
}

TEST_P(CompiledPatternTest, unmatched_groups)
{
    const CompiledPattern &pattern = compile("(a)|(?P<second>b)");

    auto found = pattern.search("xb");
    ASSERT_TRUE(found.ok());
    const RegexMatch &match = found.unpack();

    EXPECT_FALSE(match.isMatched(1));
    EXPECT_TRUE(match.isMatched(2));
    EXPECT_EQ(match.group(1), "");
    EXPECT_EQ(match.start(1), string::npos);
    EXPECT_EQ(match.groups(), vector<string>({ "", "b" }));
    EXPECT_THAT(match.group("second"), IsValue("b"));
    EXPECT_EQ(match.group(7), "");
}

TEST_P(CompiledPatternTest, empty_group_is_matched)
{
    auto found = compile("a(x*)b").search("ab");
    ASSERT_TRUE(found.ok());
    EXPECT_TRUE(found.unpack().isMatched(1));
    EXPECT_EQ(found.unpack().span(1), make_pair<size_t, size_t>(1, 1));
}

TEST_P(CompiledPatternTest, findall)
{
    CPTestDebugCapture capture;

    const CompiledPattern &digits = compile("\\d+");
    EXPECT_EQ(digits.findall("a1b23c456"), vector<string>({ "1", "23", "456" }));
    EXPECT_EQ(digits.findall("abc"), vector<string>());

    const CompiledPattern &one_group = compile("(\\d)x");
    EXPECT_EQ(one_group.findall("1x2y3x"), vector<string>({ "1", "3" }));
    EXPECT_THAT(capture.getOutput(), Not(HasSubstr("findallGroups")));

    const CompiledPattern &two_groups = compile("(\\w)=(\\d)");
    EXPECT_EQ(two_groups.findall("a=1,b=2"), vector<string>({ "a=1", "b=2" }));
    EXPECT_THAT(capture.getOutput(), HasSubstr("the pattern has 2 groups. Use findallGroups() for the group values"));
    EXPECT_EQ(
        two_groups.findallGroups("a=1,b=2"),
        vector<vector<string>>({ { "a", "1" }, { "b", "2" } })
    );
}

TEST_P(CompiledPatternTest, finditer_is_lazy_and_restartable)
{
    const CompiledPattern &digits = compile("\\d+");
    MatchRange matches = digits.finditer("a1b23c");

    vector<pair<size_t, size_t>> spans;
    for (const RegexMatch &match : matches) {
        spans.push_back(match.span());
    }
    EXPECT_EQ(spans, vector<pair<size_t, size_t>>({ make_pair(1, 2), make_pair(3, 5) }));

    uint count = 0;
    for (auto iter = matches.begin(); iter != matches.end(); ++iter) {
        count++;
    }
    EXPECT_EQ(count, 2u);

    EXPECT_TRUE(digits.finditer("none").begin() == digits.finditer("none").end());
}

TEST_P(CompiledPatternTest, finditer_keeps_its_own_copy_of_the_text)
{
    const CompiledPattern &word = compile("[a-z]+");
    MatchRange matches = word.finditer(string("one two"));

    auto iter = matches.begin();
    ASSERT_TRUE(iter != matches.end());
    EXPECT_EQ(iter->group(), "one");
    ++iter;
    ASSERT_TRUE(iter != matches.end());
    EXPECT_EQ((*iter).group(), "two");
    ++iter;
    EXPECT_TRUE(iter == matches.end());
}

TEST_P(CompiledPatternTest, empty_matches_advance)
{
    const CompiledPattern &stars = compile("x*");
    EXPECT_EQ(stars.findall("abxd"), vector<string>({ "", "", "x", "", "" }));
    EXPECT_EQ(stars.sub("-", "abxd"), "-a-b--d-");
    EXPECT_EQ(stars.findall(""), vector<string>({ "" }));

    // One empty match per character, never inside a multi-byte character
    EXPECT_EQ(stars.findall("가나"), vector<string>({ "", "", "" }));
    EXPECT_EQ(stars.sub("|", "가나"), "|가|나|");
}

TEST_P(CompiledPatternTest, sub)
{
    const CompiledPattern &digits = compile("\\d+");
    EXPECT_EQ(digits.sub("X", "a1b23c456", 2), "aXbXc456");
    EXPECT_EQ(digits.sub("X", "a1b23c456"), "aXbXcX");
    EXPECT_EQ(digits.sub("X", "abc"), "abc");
    EXPECT_EQ(digits.sub("", "a1b2"), "ab");
}

TEST_P(CompiledPatternTest, sub_is_idempotent_once_nothing_matches)
{
    const CompiledPattern &spaces = compile("\\s{2,}");
    string once = spaces.sub(" ", "a   b \t c");
    EXPECT_EQ(once, "a b c");

    const CompiledPattern &recompiled = compile("\\s{2,}");
    EXPECT_EQ(recompiled.sub(" ", once), once);
}

TEST_P(CompiledPatternTest, sub_expands_group_references)
{
    const CompiledPattern &email = compile("(\\w+)@(?P<host>\\w+)");

    EXPECT_EQ(email.sub("\\2 at \\1", "john@example"), "example at john");
    EXPECT_EQ(email.sub("\\g<host>/\\g<1>", "john@example"), "example/john");
    EXPECT_EQ(email.sub("\\g<1>0", "john@example"), "john0");
    EXPECT_EQ(email.sub("<\\g<0>>", "john@example"), "<john@example>");
    EXPECT_EQ(email.sub("\\1\\n\\t\\\\", "john@example"), "john\n\t\\");
    EXPECT_EQ(email.sub("\\d\\", "john@example"), "\\d\\");
}

TEST_P(CompiledPatternTest, sub_with_missing_group_expands_to_nothing)
{
    CPTestDebugCapture capture;
    const CompiledPattern &word = compile("(\\w+)");

    EXPECT_EQ(word.sub("[\\3]", "ab"), "[]");
    EXPECT_EQ(word.sub("[\\g<nope>]", "ab"), "[]");
    EXPECT_THAT(capture.getOutput(), HasSubstr("refers to a missing group"));
}

TEST_P(CompiledPatternTest, sub_with_callback)
{
    const CompiledPattern &digits = compile("\\d+");
    auto double_it = [] (const RegexMatch &match) { return to_string(stoi(match.group()) * 2); };

    EXPECT_EQ(digits.sub(double_it, "a1b23c4"), "a2b46c8");
    EXPECT_EQ(digits.sub(double_it, "a1b23c4", 1), "a2b23c4");
}

TEST_P(CompiledPatternTest, subn_counts_replacements)
{
    const CompiledPattern &digit = compile("\\d");

    EXPECT_EQ(digit.subn("#", "a1b2c3"), make_pair(string("a#b#c#"), 3u));
    EXPECT_EQ(digit.subn("#", "a1b2c3", 2), make_pair(string("a#b#c3"), 2u));
    EXPECT_EQ(digit.subn("#", "abc"), make_pair(string("abc"), 0u));
}

TEST_P(CompiledPatternTest, split)
{
    const CompiledPattern &comma = compile(",\\s*");
    EXPECT_EQ(comma.split("a, b,c"), vector<string>({ "a", "b", "c" }));
    EXPECT_EQ(comma.split("a, b,c", 1), vector<string>({ "a", "b,c" }));
    EXPECT_EQ(comma.split(",a,"), vector<string>({ "", "a", "" }));
    EXPECT_EQ(comma.split("abc"), vector<string>({ "abc" }));
    EXPECT_EQ(comma.split(""), vector<string>({ "" }));
}

TEST_P(CompiledPatternTest, split_returns_captured_separators)
{
    const CompiledPattern &separator = compile("(,)|(;)");
    EXPECT_EQ(separator.split("a,b;c"), vector<string>({ "a", ",", "", "b", "", ";", "c" }));
}

TEST_P(CompiledPatternTest, ignorecase)
{
    EXPECT_THAT(compile("hello", IGNORECASE).search("Say HeLLo"), IsValue(_));
    EXPECT_THAT(compile("hello").search("Say HeLLo"), IsError(_));
    EXPECT_THAT(compile("[a-z]+", IGNORECASE).fullmatch("MiXeD"), IsValue(_));
}

TEST_P(CompiledPatternTest, dotall)
{
    EXPECT_THAT(compile("a.b", DOTALL).fullmatch("a\nb"), IsValue(_));
    EXPECT_THAT(compile("a.b").fullmatch("a\nb"), IsError(_));
    EXPECT_THAT(compile("a.b").fullmatch("a-b"), IsValue(_));
}

TEST_P(CompiledPatternTest, multiline)
{
    const CompiledPattern &lines = compile("^\\d+$", MULTILINE);
    EXPECT_EQ(lines.findall("12\n34\nx5"), vector<string>({ "12", "34" }));
    EXPECT_EQ(compile("^\\d+$").findall("12\n34"), vector<string>());

    // The anchors added for fullmatch still refer to the whole text
    EXPECT_THAT(lines.fullmatch("12\n34"), IsError(_));
    EXPECT_THAT(lines.fullmatch("12"), IsValue(_));
    EXPECT_EQ(lines.getNormalizedPattern(), "^\\d+$");
}

TEST_P(CompiledPatternTest, dollar_matches_only_at_the_end)
{
    EXPECT_THAT(compile("abc$").search("abc\n"), IsError(_));
    EXPECT_THAT(compile("abc$").search("xabc"), IsValue(_));
}

TEST_P(CompiledPatternTest, non_latin_text)
{
    const CompiledPattern &hangul = compile("[가-힣]+");
    EXPECT_EQ(hangul.findall("안녕 세계!"), vector<string>({ "안녕", "세계" }));

    auto found = hangul.search("hi 세계");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.unpack().span(), make_pair<size_t, size_t>(3, 9));
}

TEST_P(CompiledPatternTest, word_boundaries_are_dropped_for_cjk_patterns)
{
    const CompiledPattern &korea = compile("\\b한국\\b");
    EXPECT_EQ(korea.getPattern(), "\\b한국\\b");
    EXPECT_EQ(korea.getNormalizedPattern(), "한국");
    EXPECT_THAT(korea.search("나는한국사람"), IsValue(_));

    const CompiledPattern &word = compile("\\bcat\\b");
    EXPECT_EQ(word.getNormalizedPattern(), "\\bcat\\b");
    EXPECT_THAT(word.search("a cat here"), IsValue(_));
    EXPECT_THAT(word.search("concatenate"), IsError(_));
}

TEST_P(CompiledPatternTest, unicode_escapes)
{
    const CompiledPattern &syllable = compile("\\uAC00+");
    EXPECT_EQ(syllable.getNormalizedPattern(), "가+");
    EXPECT_THAT(syllable.fullmatch("가가"), IsValue(_));

    const CompiledPattern &dot = compile("a\\u002Eb");
    EXPECT_THAT(dot.fullmatch("a.b"), IsValue(_));
    EXPECT_THAT(dot.fullmatch("axb"), IsError(_));
}

TEST_P(CompiledPatternTest, malformed_pattern)
{
    auto compiled = compiler.compile("(abc", NO_FLAGS, "broken-id");
    ASSERT_FALSE(compiled.ok());

    PatternSyntaxError err = compiled.getErr();
    EXPECT_EQ(err.getPattern(), "(abc");
    EXPECT_EQ(err.getCompiledText(), "(abc");
    EXPECT_EQ(err.getPatternId(), "broken-id");
    EXPECT_EQ(err.getEngineName(), expectedEngineName());
    EXPECT_FALSE(err.getMessage().empty());

    EXPECT_THROW(compiled.verify<RegexCompatException>(), RegexCompatException);
}

TEST_P(CompiledPatternTest, introspection)
{
    const CompiledPattern &pattern = compile("\\d+", IGNORECASE);

    EXPECT_EQ(pattern.getPattern(), "\\d+");
    EXPECT_EQ(pattern.getFlags(), IGNORECASE);
    EXPECT_EQ(pattern.getPatternId(), "test-pattern");
    EXPECT_EQ(pattern.getEngineName(), expectedEngineName());
    EXPECT_EQ(
        pattern.getEngineType(),
        GetParam() == EnginePreference::BACKTRACKING ? RegexEngineType::BACKTRACKING : RegexEngineType::LINEAR
    );

    stringstream repr;
    repr << pattern;
    EXPECT_EQ(repr.str(), "CompiledPattern('\\\\d+', flags=2, backend=" + expectedEngineName() + ")");
}

TEST_P(CompiledPatternTest, match_printout)
{
    auto found = compile("b(c)").search("abcd");
    ASSERT_TRUE(found.ok());

    stringstream repr;
    repr << found.unpack();
    EXPECT_EQ(repr.str(), "RegexMatch(span=(1, 3), match='bc', groups=[c])");
}

TEST_P(CompiledPatternTest, shared_across_threads_without_locking)
{
    const CompiledPattern &digits = compile("\\d+");
    vector<string> results(8);
    vector<thread> workers;
    for (uint i = 0; i < results.size(); i++) {
        workers.emplace_back(
            [&digits, &results, i] () { results[i] = digits.sub("#", "a1b22c333-" + to_string(i)); }
        );
    }
    for (thread &worker : workers) worker.join();

    for (uint i = 0; i < results.size(); i++) {
        EXPECT_EQ(results[i], "a#b#c#-#");
    }
}

#ifdef USE_RE2
INSTANTIATE_TEST_CASE_P(
    engines,
    CompiledPatternTest,
    ::testing::Values(EnginePreference::LINEAR, EnginePreference::BACKTRACKING)
);
#else
INSTANTIATE_TEST_CASE_P(engines, CompiledPatternTest, ::testing::Values(EnginePreference::BACKTRACKING));
#endif // USE_RE2
