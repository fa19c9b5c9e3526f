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

#include "debug_ex.h"

#include <iostream>
#include <map>
#include <array>
#include <cstdlib>

using namespace std;

using FlagsArray = array<Debug::DebugLevel, static_cast<size_t>(Debug::DebugFlags::COUNT)>;

static constexpr Debug::DebugLevel default_level = Debug::DebugLevel::INFO;
static const int minimal_location_info_length = 60;

#define DEFINE_FLAG(flag_name, parent_name) \
extern const Debug::DebugFlags flag_name = Debug::DebugFlags::flag_name;
#include "debug_flags.h"
#undef DEFINE_FLAG

static const multimap<Debug::DebugFlags, Debug::DebugFlags> flags_hierarchy = {

#define DEFINE_FLAG(flag_name, parent_name) \
    { Debug::DebugFlags::parent_name, Debug::DebugFlags::flag_name },
#include "debug_flags.h"
#undef DEFINE_FLAG

};

static const map<string, Debug::DebugFlags> flags_by_name = {
    { "D_ALL", Debug::DebugFlags::D_ALL },
#define DEFINE_FLAG(flag_name, parent_name) { #flag_name, Debug::DebugFlags::flag_name },
#include "debug_flags.h"
#undef DEFINE_FLAG
};

static const map<Debug::DebugLevel, string> prompt = {
    { Debug::DebugLevel::NOISE,     "***" },
    { Debug::DebugLevel::TRACE,     ">>>" },
    { Debug::DebugLevel::DEBUG,     "@@@" },
    { Debug::DebugLevel::WARNING,   "###" },
    { Debug::DebugLevel::INFO,      "---" },
    { Debug::DebugLevel::ERROR,     "!!!" },
    { Debug::DebugLevel::ASSERTION, "~~~" }
};

static FlagsArray
makeDefaultLevels()
{
    FlagsArray levels;
    levels.fill(default_level);
    return levels;
}

static FlagsArray global_flags_levels = makeDefaultLevels();
static shared_ptr<Debug::DebugStream> default_stream = make_shared<Debug::DebugStream>(&cout);

static Debug::DebugLevel &
levelOf(Debug::DebugFlags flag)
{
    return global_flags_levels[static_cast<size_t>(flag)];
}

static void
assignValueToFlagRecursively(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    levelOf(flag) = level;
    auto sub_flags_range = flags_hierarchy.equal_range(flag);
    for (auto flag_iterator = sub_flags_range.first; flag_iterator != sub_flags_range.second; flag_iterator++) {
        assignValueToFlagRecursively(flag_iterator->second, level);
    }
}

void
Debug::DebugStream::printHeader(
    DebugLevel curr_level,
    const string &file_name,
    const string &func_name,
    uint line)
{
    stringstream os;
    os << func_name << '@' << file_name << ':' << line;
    stringstream location;
    location.width(minimal_location_info_length);
    location << left << os.str() <<  " | ";
    (*getStream()) << "[" << location.str() << prompt.at(curr_level) << "] ";
}

// LCOV_EXCL_START - function is covered in unit-test, but not detected bt gcov
Debug::Debug(const string &file_name, const string &func_name, const uint &line)
        :
    do_assert(true)
{
    startStream(DebugLevel::ASSERTION, file_name, func_name, line);
}
// LCOV_EXCL_STOP

Debug::Debug(
    const string &file_name,
    const string &func_name,
    const uint &line,
    const DebugLevel &level,
    const DebugFlags &flag1)
        :
    do_assert(false)
{
    if (evalFlagByFlag(level, flag1)) startStream(level, file_name, func_name, line);
}

Debug::Debug(
    const string &file_name,
    const string &func_name,
    const uint &line,
    const DebugLevel &level,
    const DebugFlags &flag1,
    const DebugFlags &flag2)
        :
    do_assert(false)
{
    if (evalFlagByFlag(level, flag1) || evalFlagByFlag(level, flag2)) {
        startStream(level, file_name, func_name, line);
    }
}

Debug::~Debug()
{
    if (do_assert) stream << "\nPanic!";

    if (is_active) default_stream->finishMessage();

    if (do_assert) abort();

    is_debug_running = false;
}

void
Debug::startStream(const DebugLevel &level, const string &file_name, const string &func_name, uint line)
{
    default_stream->printHeader(level, file_name, func_name, line);
    stream.addStream(default_stream->getStream());
    is_active = true;
    is_debug_running = true;
}

bool
Debug::evalFlagByFlag(Debug::DebugLevel level, Debug::DebugFlags flag)
{
    return levelOf(flag) <= level;
}

bool
Debug::isFlagAtleastLevel(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    return levelOf(flag) <= level;
}

void
Debug::updateLowestGlobalLevel()
{
    lowest_global_level = levelOf(DebugFlags::D_ALL);
    for (const auto &level : global_flags_levels) {
        if (level < lowest_global_level) lowest_global_level = level;
    }
}

void
Debug::setFlagLevel(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    assignValueToFlagRecursively(flag, level);
    updateLowestGlobalLevel();
}

void
Debug::setUnitTestFlag(Debug::DebugFlags flag, Debug::DebugLevel level)
{
    if (lowest_global_level > level) lowest_global_level = level;
    levelOf(flag) = level;
}

void
Debug::resetFlagLevels()
{
    global_flags_levels.fill(default_level);
    lowest_global_level = default_level;
}

bool
Debug::findFlagByName(const string &flag_name, Debug::DebugFlags &flag)
{
    auto found = flags_by_name.find(flag_name);
    if (found == flags_by_name.end()) return false;
    flag = found->second;
    return true;
}

bool
Debug::findLevelByName(const string &level_name, Debug::DebugLevel &level)
{
    static const map<string, Debug::DebugLevel> levels_by_name = {
        { "Error",   Debug::DebugLevel::ERROR   },
        { "Warning", Debug::DebugLevel::WARNING },
        { "Info",    Debug::DebugLevel::INFO    },
        { "Debug",   Debug::DebugLevel::DEBUG   },
        { "Trace",   Debug::DebugLevel::TRACE   },
        { "None",    Debug::DebugLevel::NONE    }
    };

    auto found = levels_by_name.find(level_name);
    if (found == levels_by_name.end()) return false;
    level = found->second;
    return true;
}

void
Debug::setNewDefaultStdout(ostream *new_stream)
{
    default_stream = make_shared<Debug::DebugStream>(new_stream);
}

Debug::DebugLevel Debug::lowest_global_level = default_level;
bool Debug::is_debug_running = false;
