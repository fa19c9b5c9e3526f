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

#include "regex_compiler.h"

#include <sstream>

#include "cptest.h"
#include "debug.h"
#include "pcre2_engine.h"
#include "mock/mock_pattern_engine.h"

using namespace std;
using namespace testing;
using namespace RegexCompat;

USE_DEBUG_FLAG(D_REGEX_NORMALIZER);
USE_DEBUG_FLAG(D_REGEX_PCRE2);

namespace RegexCompat
{

// Using IsError(Maybe<T>) requires T to be printable. So we need to print unique_ptr<CompiledPattern>:
static ostream &
operator<<(ostream &os, const unique_ptr<CompiledPattern> &pattern)
{
    return os << "unique_ptr<CompiledPattern>(" << pattern.get() << ")";
}

} // namespace RegexCompat

static MockPatternEngine::CompileResult
compileWithPcre2(const string &pattern, RegexFlags flags)
{
    return Pcre2Engine().compile(pattern, flags);
}

class RegexCompilerTest : public Test
{
public:
    RegexCompilerTest()
    {
        auto linear = make_unique<NiceMock<MockPatternEngine>>();
        mock_linear = linear.get();
        ON_CALL(*mock_linear, getType()).WillByDefault(Return(RegexEngineType::LINEAR));
        ON_CALL(*mock_linear, getName()).WillByDefault(Return("mock-linear"));
        compiler = make_unique<RegexCompiler>(move(linear), make_unique<Pcre2Engine>());
    }

    ~RegexCompilerTest()
    {
        Debug::resetFlagLevels();
    }

    Maybe<void, ConfigurationError>
    loadConfiguration(RegexCompiler &target, const string &json)
    {
        stringstream config(json);
        return target.loadConfiguration(config);
    }

    NiceMock<MockPatternEngine> *mock_linear;
    unique_ptr<RegexCompiler> compiler;
    RegexCompiler no_linear_compiler{nullptr, make_unique<Pcre2Engine>()};
    CPTestDebugCapture capture;
};

TEST_F(RegexCompilerTest, preference_starts_as_auto)
{
    EXPECT_EQ(compiler->getEnginePreference(), EnginePreference::AUTO);
    EXPECT_EQ(no_linear_compiler.getEnginePreference(), EnginePreference::AUTO);
    EXPECT_TRUE(compiler->isLinearEngineAvailable());
    EXPECT_FALSE(no_linear_compiler.isLinearEngineAvailable());
}

TEST_F(RegexCompilerTest, auto_prefers_the_linear_engine)
{
    EXPECT_EQ(compiler->selectEngine().getName(), "mock-linear");
    EXPECT_EQ(no_linear_compiler.selectEngine().getName(), "pcre2");
}

TEST_F(RegexCompilerTest, forced_preferences)
{
    EXPECT_TRUE(compiler->setEnginePreference(EnginePreference::LINEAR).ok());
    EXPECT_EQ(compiler->selectEngine().getType(), RegexEngineType::LINEAR);

    EXPECT_TRUE(compiler->setEnginePreference(EnginePreference::BACKTRACKING).ok());
    EXPECT_EQ(compiler->getEnginePreference(), EnginePreference::BACKTRACKING);
    EXPECT_EQ(compiler->selectEngine().getType(), RegexEngineType::BACKTRACKING);

    EXPECT_TRUE(no_linear_compiler.setEnginePreference(EnginePreference::BACKTRACKING).ok());
    EXPECT_EQ(no_linear_compiler.selectEngine().getName(), "pcre2");

    EXPECT_THAT(capture.getOutput(), HasSubstr("Regex engine preference changed from auto to backtracking"));
}

TEST_F(RegexCompilerTest, forcing_a_missing_linear_engine_fails)
{
    EXPECT_TRUE(no_linear_compiler.setEnginePreference(EnginePreference::BACKTRACKING).ok());

    auto result = no_linear_compiler.setEnginePreference(EnginePreference::LINEAR);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(
        result.getErr(),
        ConfigurationError("The linear-time regex engine is not available in this process")
    );
    EXPECT_EQ(no_linear_compiler.getEnginePreference(), EnginePreference::BACKTRACKING);

    EXPECT_TRUE(no_linear_compiler.setEnginePreference(EnginePreference::AUTO).ok());
    EXPECT_FALSE(no_linear_compiler.setEnginePreference(EnginePreference::LINEAR).ok());
    EXPECT_EQ(no_linear_compiler.getEnginePreference(), EnginePreference::AUTO);
}

TEST_F(RegexCompilerTest, compiles_primary_and_anchored_forms_with_the_selected_engine)
{
    EXPECT_CALL(*mock_linear, compile("a|b", NO_FLAGS)).WillOnce(Invoke(compileWithPcre2));
    EXPECT_CALL(*mock_linear, compile("^(?:a|b)$", NO_FLAGS)).WillOnce(Invoke(compileWithPcre2));

    auto compiled = compiler->compile("a|b");
    ASSERT_TRUE(compiled.ok());
    const CompiledPattern &pattern = *compiled.unpack();
    EXPECT_EQ(pattern.getEngineName(), "mock-linear");
    EXPECT_EQ(pattern.getEngineType(), RegexEngineType::LINEAR);
    EXPECT_THAT(pattern.fullmatch("b"), IsValue(_));
    EXPECT_THAT(pattern.fullmatch("ab"), IsError(_));
}

TEST_F(RegexCompilerTest, engine_receives_the_normalized_pattern)
{
    EXPECT_CALL(*mock_linear, compile("(?m)가$", MULTILINE | IGNORECASE)).WillOnce(Invoke(compileWithPcre2));
    EXPECT_CALL(*mock_linear, compile("^(?:(?m)가$)$", MULTILINE | IGNORECASE)).WillOnce(Invoke(compileWithPcre2));

    auto compiled = compiler->compile("\\b\\uAC00$", MULTILINE | IGNORECASE, "id-7");
    ASSERT_TRUE(compiled.ok());
    EXPECT_EQ(compiled.unpack()->getPattern(), "\\b\\uAC00$");
    EXPECT_EQ(compiled.unpack()->getNormalizedPattern(), "가$");
    EXPECT_EQ(compiled.unpack()->getPatternId(), "id-7");
}

TEST_F(RegexCompilerTest, engine_receives_only_supported_flags)
{
    EXPECT_CALL(*mock_linear, compile("a b", IGNORECASE)).WillOnce(Invoke(compileWithPcre2));
    EXPECT_CALL(*mock_linear, compile("^(?:a b)$", IGNORECASE)).WillOnce(Invoke(compileWithPcre2));

    auto compiled = compiler->compile("a b", IGNORECASE | VERBOSE | UNICODE, "spaced");
    ASSERT_TRUE(compiled.ok());
    EXPECT_EQ(compiled.unpack()->getFlags(), IGNORECASE | VERBOSE | UNICODE);
    EXPECT_THAT(compiled.unpack()->fullmatch("A B"), IsValue(_));
    EXPECT_THAT(capture.getOutput(), HasSubstr("VERBOSE flag is not supported"));
    EXPECT_THAT(capture.getOutput(), HasSubstr("Pattern ID: spaced"));
}

TEST_F(RegexCompilerTest, engine_errors_name_the_raw_pattern)
{
    EXPECT_CALL(*mock_linear, compile("x(", NO_FLAGS)).WillOnce(
        Invoke(
            [] (const string &pattern, RegexFlags) -> MockPatternEngine::CompileResult
            {
                return genError(PatternSyntaxError("", pattern, "mock-linear", "missing )", 2));
            }
        )
    );

    auto compiled = compiler->compile("x(", NO_FLAGS, "bad-one");
    EXPECT_THAT(
        compiled,
        IsError(PatternSyntaxError("x(", "x(", "mock-linear", "missing )", 2))
    );
    EXPECT_EQ(compiled.getErr().getPatternId(), "bad-one");

    stringstream printed;
    printed << compiled.getErr();
    EXPECT_EQ(printed.str(), "PatternSyntaxError(mock-linear: missing ) at offset 2, pattern 'x(', id bad-one)");
}

TEST_F(RegexCompilerTest, failures_are_not_retried_with_the_other_engine)
{
    EXPECT_CALL(*mock_linear, compile(_, _)).WillOnce(
        Invoke(
            [] (const string &pattern, RegexFlags) -> MockPatternEngine::CompileResult
            {
                return genError(PatternSyntaxError("", pattern, "mock-linear", "invalid perl operator: (?="));
            }
        )
    );

    EXPECT_FALSE(compiler->compile("(?=\\d)\\d+").ok());
}

TEST_F(RegexCompilerTest, existing_patterns_keep_their_engine)
{
    EXPECT_CALL(*mock_linear, compile(_, _)).Times(2).WillRepeatedly(Invoke(compileWithPcre2));
    auto before = compiler->compile("\\d+");
    ASSERT_TRUE(before.ok());

    EXPECT_TRUE(compiler->setEnginePreference(EnginePreference::BACKTRACKING).ok());
    auto after = compiler->compile("\\d+");
    ASSERT_TRUE(after.ok());

    EXPECT_EQ(before.unpack()->getEngineName(), "mock-linear");
    EXPECT_EQ(after.unpack()->getEngineName(), "pcre2");
    EXPECT_EQ(before.unpack()->findall("1 22"), vector<string>({ "1", "22" }));
}

TEST_F(RegexCompilerTest, backtracking_engine_supports_lookaround_and_backreferences)
{
    auto lookahead = no_linear_compiler.compile("(?=\\d)\\d+");
    ASSERT_TRUE(lookahead.ok());
    EXPECT_EQ(lookahead.unpack()->findall("ab12c3"), vector<string>({ "12", "3" }));

    auto backreference = no_linear_compiler.compile("(\\w)\\1");
    ASSERT_TRUE(backreference.ok());
    EXPECT_EQ(backreference.unpack()->findall("abccdee"), vector<string>({ "c", "e" }));

    // Lookbehind sees the text before the position where the search resumes
    auto lookbehind = no_linear_compiler.compile("(?<=a)b");
    ASSERT_TRUE(lookbehind.ok());
    EXPECT_EQ(lookbehind.unpack()->sub("X", "abab cb"), "aXaX cb");
}

#ifdef USE_RE2
TEST_F(RegexCompilerTest, linear_engine_rejects_lookaround)
{
    RegexCompiler re2_compiler;
    EXPECT_TRUE(re2_compiler.setEnginePreference(EnginePreference::LINEAR).ok());

    auto compiled = re2_compiler.compile("(?=\\d)\\d+");
    ASSERT_FALSE(compiled.ok());
    EXPECT_EQ(compiled.getErr().getEngineName(), "re2");
    EXPECT_EQ(compiled.getErr().getPattern(), "(?=\\d)\\d+");

    EXPECT_FALSE(re2_compiler.compile("(\\w)\\1").ok());
    EXPECT_FALSE(re2_compiler.compile("(?<=a)b").ok());
}

TEST_F(RegexCompilerTest, default_compiler_uses_the_linear_engine)
{
    RegexCompiler re2_compiler;
    EXPECT_TRUE(re2_compiler.isLinearEngineAvailable());
    EXPECT_EQ(re2_compiler.selectEngine().getName(), "re2");
}
#else
TEST_F(RegexCompilerTest, default_compiler_has_no_linear_engine)
{
    RegexCompiler pcre2_compiler;
    EXPECT_FALSE(pcre2_compiler.isLinearEngineAvailable());
    EXPECT_EQ(pcre2_compiler.selectEngine().getName(), "pcre2");
    EXPECT_FALSE(pcre2_compiler.setEnginePreference(EnginePreference::LINEAR).ok());
}
#endif // USE_RE2

TEST_F(RegexCompilerTest, process_wide_functions)
{
    EXPECT_EQ(getEnginePreference(), EnginePreference::AUTO);

    EXPECT_TRUE(setEnginePreference(EnginePreference::BACKTRACKING).ok());
    EXPECT_EQ(getEnginePreference(), EnginePreference::BACKTRACKING);
    EXPECT_EQ(&getDefaultCompiler(), &getDefaultCompiler());

    auto compiled = RegexCompat::compile("\\d{5}", NO_FLAGS, "zip");
    ASSERT_TRUE(compiled.ok());
    EXPECT_EQ(compiled.unpack()->getEngineName(), "pcre2");
    EXPECT_THAT(compiled.unpack()->fullmatch("12345"), IsValue(_));

    stringstream config("{\"engine\": \"auto\"}");
    EXPECT_TRUE(RegexCompat::loadConfiguration(config).ok());
    EXPECT_EQ(getEnginePreference(), EnginePreference::AUTO);
}

TEST_F(RegexCompilerTest, parses_engine_names)
{
    EXPECT_THAT(parseEnginePreference("auto"), IsValue(EnginePreference::AUTO));
    EXPECT_THAT(parseEnginePreference("Linear"), IsValue(EnginePreference::LINEAR));
    EXPECT_THAT(parseEnginePreference("re2"), IsValue(EnginePreference::LINEAR));
    EXPECT_THAT(parseEnginePreference("BACKTRACKING"), IsValue(EnginePreference::BACKTRACKING));
    EXPECT_THAT(parseEnginePreference("pcre2"), IsValue(EnginePreference::BACKTRACKING));
    EXPECT_THAT(parseEnginePreference("standard"), IsValue(EnginePreference::BACKTRACKING));
    EXPECT_THAT(parseEnginePreference("fastest"), IsError(ConfigurationError("Unknown regex engine 'fastest'")));
}

TEST_F(RegexCompilerTest, loads_engine_from_configuration)
{
    EXPECT_TRUE(loadConfiguration(*compiler, "{\"engine\": \"backtracking\"}").ok());
    EXPECT_EQ(compiler->getEnginePreference(), EnginePreference::BACKTRACKING);

    EXPECT_TRUE(loadConfiguration(*compiler, "{\"engine\": \"RE2\"}").ok());
    EXPECT_EQ(compiler->getEnginePreference(), EnginePreference::LINEAR);

    EXPECT_TRUE(loadConfiguration(*compiler, "{}").ok());
    EXPECT_EQ(compiler->getEnginePreference(), EnginePreference::LINEAR);
}

TEST_F(RegexCompilerTest, rejected_configuration_changes_nothing)
{
    EXPECT_TRUE(no_linear_compiler.setEnginePreference(EnginePreference::BACKTRACKING).ok());
    EXPECT_TRUE(loadConfiguration(no_linear_compiler, "{\"backtrackingMatchLimit\": 1000}").ok());
    EXPECT_EQ(no_linear_compiler.getBacktrackingMatchLimit(), 1000u);

    EXPECT_THAT(
        loadConfiguration(no_linear_compiler, "{\"engine\": \"fastest\"}"),
        IsError(ConfigurationError("Unknown regex engine 'fastest'"))
    );
    EXPECT_THAT(
        loadConfiguration(no_linear_compiler, "{\"engine\": \"linear\"}"),
        IsError(ConfigurationError("The linear-time regex engine is not available in this process"))
    );
    EXPECT_FALSE(
        loadConfiguration(
            no_linear_compiler,
            "{\"engine\": \"auto\", \"debug\": [ { \"flag\": \"D_REGEX_NOTHING\", \"level\": \"Trace\" } ]}"
        ).ok()
    );
    EXPECT_FALSE(
        loadConfiguration(
            no_linear_compiler,
            "{\"engine\": \"auto\", \"debug\": [ { \"flag\": \"D_REGEX_PCRE2\", \"level\": \"Loud\" } ]}"
        ).ok()
    );
    EXPECT_FALSE(loadConfiguration(no_linear_compiler, "{\"engine\": ").ok());

    EXPECT_FALSE(loadConfiguration(no_linear_compiler, "{\"engine\": 5, \"backtrackingMatchLimit\": 10}").ok());
    EXPECT_FALSE(loadConfiguration(no_linear_compiler, "{\"engine\": \"auto\", \"backtrackingMatchLimit\": -1}").ok());
    EXPECT_FALSE(loadConfiguration(no_linear_compiler, "{\"backtrackingMatchLimit\": \"10\"}").ok());
    EXPECT_FALSE(loadConfiguration(no_linear_compiler, "{\"engine\": \"auto\", \"debug\": 3}").ok());
    EXPECT_THAT(
        loadConfiguration(
            no_linear_compiler,
            "{\"engine\": \"auto\", \"backtrackingMatchLimit\": 10, \"debug\": [ { \"flag\": \"D_REGEX_PCRE2\" } ]}"
        ),
        IsError(ConfigurationError("A debug setting must have both a \"flag\" and a \"level\""))
    );

    EXPECT_EQ(no_linear_compiler.getEnginePreference(), EnginePreference::BACKTRACKING);
    EXPECT_EQ(no_linear_compiler.getBacktrackingMatchLimit(), 1000u);
    EXPECT_FALSE(Debug::isFlagAtleastLevel(D_REGEX_PCRE2, Debug::DebugLevel::TRACE));
    EXPECT_THAT(capture.getOutput(), HasSubstr("Rejected the regex configuration"));
}

TEST_F(RegexCompilerTest, loads_debug_levels_from_configuration)
{
    EXPECT_FALSE(Debug::isFlagAtleastLevel(D_REGEX_NORMALIZER, Debug::DebugLevel::TRACE));

    auto loaded = loadConfiguration(
        *compiler,
        "{\"debug\": [ { \"flag\": \"D_REGEX_COMPAT\", \"level\": \"Trace\" } ]}"
    );
    EXPECT_TRUE(loaded.ok());
    EXPECT_TRUE(Debug::isFlagAtleastLevel(D_REGEX_NORMALIZER, Debug::DebugLevel::TRACE));
    EXPECT_TRUE(Debug::isFlagAtleastLevel(D_REGEX_PCRE2, Debug::DebugLevel::TRACE));
}

TEST_F(RegexCompilerTest, match_limit_stops_runaway_backtracking)
{
    EXPECT_TRUE(
        loadConfiguration(no_linear_compiler, "{\"engine\": \"backtracking\", \"backtrackingMatchLimit\": 1000}").ok()
    );

    auto compiled = no_linear_compiler.compile("(a+)+$");
    ASSERT_TRUE(compiled.ok());

    string subject(30, 'a');
    subject += "b";
    EXPECT_THAT(compiled.unpack()->search(subject), IsError(_));
    EXPECT_EQ(compiled.unpack()->findall(subject), vector<string>());

    EXPECT_EQ(compiled.unpack()->findall("aaa"), vector<string>({ "aaa" }));
}

TEST_F(RegexCompilerTest, compile_failures_are_logged)
{
    Debug::setUnitTestFlag(D_REGEX_PCRE2, Debug::DebugLevel::DEBUG);

    auto compiled = no_linear_compiler.compile("[unclosed", NO_FLAGS, "broken");
    ASSERT_FALSE(compiled.ok());
    EXPECT_EQ(compiled.getErr().getEngineName(), "pcre2");
    EXPECT_NE(compiled.getErr().getOffset(), string::npos);
    EXPECT_THAT(capture.getOutput(), HasSubstr("pcre2_compile failed"));
}

TEST_F(RegexCompilerTest, configuration_error_printout)
{
    stringstream printed;
    printed << ConfigurationError("bad engine");
    EXPECT_EQ(printed.str(), "ConfigurationError(bad engine)");

    Maybe<void, ConfigurationError> failed = genError(ConfigurationError("bad engine"));
    EXPECT_THROW(failed.verify<RegexCompatException>(), RegexCompatException);
}
