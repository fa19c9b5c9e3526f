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

#include "debug.h"

#include <sstream>
#include <string>

#include "cptest.h"

using namespace std;
using namespace testing;

USE_DEBUG_FLAG(D_REGEX_COMPAT);
USE_DEBUG_FLAG(D_REGEX_RE2);
USE_DEBUG_FLAG(D_REGEX_PCRE2);

string line = "";

void doRe2Error() { dbgError(D_REGEX_RE2) << "RE2 error message"; line = to_string(__LINE__); }
void doRe2Warning() { dbgWarning(D_REGEX_RE2) << "RE2 warning message"; line = to_string(__LINE__); }
void doRe2Info() { dbgInfo(D_REGEX_RE2) << "RE2 info message"; line = to_string(__LINE__); }
void doRe2Debug() { dbgDebug(D_REGEX_RE2) << "RE2 debug message"; line = to_string(__LINE__); }
void doRe2Trace() { dbgTrace(D_REGEX_RE2) << "RE2 trace message"; line = to_string(__LINE__); }
void doPcre2Trace() { dbgTrace(D_REGEX_PCRE2) << "PCRE2 trace message"; line = to_string(__LINE__); }
void doTwoFlags() { dbgDebug(D_REGEX_RE2, D_REGEX_PCRE2) << "stab"; line = to_string(__LINE__); }

static string
header(const string &func, const string &prompt)
{
    string location = func + "@debug_ut.cc:" + line;
    if (location.size() < 60) location.resize(60, ' ');
    return "[" + location + " | " + prompt + "] ";
}

class Printable
{
public:
    ostream & print(ostream &os) const { return os << "Printable(" << value << ")"; }

    int value = 7;
};

class NoisyPrintable
{
public:
    ostream &
    print(ostream &os) const
    {
        dbgError(D_REGEX_COMPAT) << "Nested message";
        return os << "NoisyPrintable";
    }
};

TEST(DebugBaseTest, death_on_panic)
{
    cptestPrepareToDie();

    EXPECT_DEATH(dbgAssert(1==2) << "Does your school teach otherwise?", "Does your school teach otherwise?");
}

TEST(DebugBaseTest, default_levels)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    doRe2Error();
    EXPECT_EQ(debug_output.str(), header("doRe2Error", "!!!") + "RE2 error message\n");
    debug_output.str("");

    doRe2Info();
    EXPECT_EQ(debug_output.str(), header("doRe2Info", "---") + "RE2 info message\n");
    debug_output.str("");

    doRe2Warning();
    EXPECT_EQ(debug_output.str(), header("doRe2Warning", "###") + "RE2 warning message\n");
    debug_output.str("");

    doRe2Debug();
    EXPECT_EQ(debug_output.str(), "");

    doRe2Trace();
    EXPECT_EQ(debug_output.str(), "");

    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, header_is_padded_to_fixed_width)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    doRe2Error();
    EXPECT_EQ(
        debug_output.str(),
        "[doRe2Error@debug_ut.cc:" + line + string(60 - 23 - line.size(), ' ') + " | !!!] RE2 error message\n"
    );

    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, set_flag_to_error)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);
    Debug::setUnitTestFlag(D_REGEX_RE2, Debug::DebugLevel::ERROR);

    doRe2Error();
    EXPECT_EQ(debug_output.str(), header("doRe2Error", "!!!") + "RE2 error message\n");
    debug_output.str("");

    doRe2Warning();
    EXPECT_EQ(debug_output.str(), "");

    doRe2Info();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetFlagLevels();
    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, set_flag_to_trace)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);
    Debug::setUnitTestFlag(D_REGEX_RE2, Debug::DebugLevel::TRACE);

    doRe2Debug();
    EXPECT_EQ(debug_output.str(), header("doRe2Debug", "@@@") + "RE2 debug message\n");
    debug_output.str("");

    doRe2Trace();
    EXPECT_EQ(debug_output.str(), header("doRe2Trace", ">>>") + "RE2 trace message\n");
    debug_output.str("");

    doPcre2Trace();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetFlagLevels();
    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, parent_level_applies_to_children)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    Debug::setFlagLevel(D_REGEX_COMPAT, Debug::DebugLevel::TRACE);
    EXPECT_TRUE(Debug::isFlagAtleastLevel(D_REGEX_RE2, Debug::DebugLevel::TRACE));
    EXPECT_TRUE(Debug::isFlagAtleastLevel(D_REGEX_PCRE2, Debug::DebugLevel::TRACE));

    doPcre2Trace();
    EXPECT_EQ(debug_output.str(), header("doPcre2Trace", ">>>") + "PCRE2 trace message\n");
    debug_output.str("");

    Debug::setFlagLevel(D_REGEX_COMPAT, Debug::DebugLevel::NONE);
    doRe2Error();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetFlagLevels();
    doRe2Error();
    EXPECT_EQ(debug_output.str(), header("doRe2Error", "!!!") + "RE2 error message\n");

    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, unit_test_flag_only_sets_one_flag)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    Debug::setUnitTestFlag(D_REGEX_COMPAT, Debug::DebugLevel::TRACE);
    EXPECT_TRUE(isDebugRequired(TRACE, D_REGEX_COMPAT));
    EXPECT_FALSE(isDebugRequired(TRACE, D_REGEX_PCRE2));

    doPcre2Trace();
    EXPECT_EQ(debug_output.str(), "");

    Debug::resetFlagLevels();
    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, multi_flag_debugs)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    doTwoFlags();
    EXPECT_EQ(debug_output.str(), "");

    Debug::setUnitTestFlag(D_REGEX_PCRE2, Debug::DebugLevel::DEBUG);
    doTwoFlags();
    EXPECT_EQ(debug_output.str(), header("doTwoFlags", "@@@") + "stab\n");
    debug_output.str("");

    Debug::resetFlagLevels();
    Debug::setUnitTestFlag(D_REGEX_RE2, Debug::DebugLevel::TRACE);
    doTwoFlags();
    EXPECT_EQ(debug_output.str(), header("doTwoFlags", "@@@") + "stab\n");

    Debug::resetFlagLevels();
    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, prints_objects_through_their_print_method)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    Printable printable;
    dbgError(D_REGEX_COMPAT) << "Object: " << printable << ", number: " << 5;
    EXPECT_THAT(debug_output.str(), EndsWith("] Object: Printable(7), number: 5\n"));

    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, nested_messages_are_suppressed)
{
    stringstream debug_output;
    Debug::setNewDefaultStdout(&debug_output);

    NoisyPrintable noisy;
    dbgError(D_REGEX_COMPAT) << noisy;
    EXPECT_THAT(debug_output.str(), EndsWith("] NoisyPrintable\n"));
    EXPECT_THAT(debug_output.str(), Not(HasSubstr("Nested message")));

    Debug::setNewDefaultStdout(&cout);
}

TEST(DebugBaseTest, find_flags_and_levels_by_name)
{
    Debug::DebugFlags flag;
    EXPECT_TRUE(Debug::findFlagByName("D_REGEX_RE2", flag));
    EXPECT_EQ(flag, D_REGEX_RE2);
    EXPECT_TRUE(Debug::findFlagByName("D_ALL", flag));
    EXPECT_FALSE(Debug::findFlagByName("D_NO_SUCH_FLAG", flag));

    Debug::DebugLevel level;
    EXPECT_TRUE(Debug::findLevelByName("Trace", level));
    EXPECT_EQ(level, Debug::DebugLevel::TRACE);
    EXPECT_TRUE(Debug::findLevelByName("None", level));
    EXPECT_EQ(level, Debug::DebugLevel::NONE);
    EXPECT_FALSE(Debug::findLevelByName("Loud", level));
}

TEST(DebugBaseTest, debug_capture_collects_messages)
{
    CPTestDebugCapture capture;

    doRe2Warning();
    EXPECT_THAT(capture.getOutput(), HasSubstr("RE2 warning message"));

    capture.clear();
    EXPECT_EQ(capture.getOutput(), "");
}
