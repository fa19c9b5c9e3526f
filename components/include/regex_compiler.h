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

#ifndef __REGEX_COMPILER_H__
#define __REGEX_COMPILER_H__

#include <memory>
#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <cereal/archives/json.hpp>

#include "maybe_res.h"
#include "regex_flags.h"
#include "compiled_pattern.h"
#include "i_pattern_engine.h"
#include "regex_compat_errors.h"

namespace RegexCompat
{

enum class EnginePreference
{
    AUTO,
    LINEAR,
    BACKTRACKING
};

std::ostream & operator<<(std::ostream &os, EnginePreference preference);

// "auto", "linear" and "backtracking", in any letter case. "re2" is accepted for linear, "pcre2" and "standard" for
// backtracking.
Maybe<EnginePreference, ConfigurationError> parseEnginePreference(const std::string &name);

class DebugLevelSetting
{
public:
    void load(cereal::JSONInputArchive &ar);

    // Both "flag" and "level" are required.
    bool isComplete() const { return has_flag && has_level; }
    const std::string & getFlagName() const { return flag_name; }
    const std::string & getLevelName() const { return level_name; }

private:
    std::string flag_name;
    std::string level_name;
    bool has_flag = false;
    bool has_level = false;
};

// The document accepted by RegexCompiler::loadConfiguration(). Every key is optional, a key with a value of the
// wrong type throws cereal::RapidJSONException:
// {
//     "engine": "auto",
//     "backtrackingMatchLimit": 100000,
//     "debug": [ { "flag": "D_REGEX_COMPAT", "level": "Trace" } ]
// }
class RegexCompatSettings
{
public:
    void load(cereal::JSONInputArchive &ar);

    const Maybe<std::string> & getEngineName() const { return engine_name; }
    const Maybe<uint> & getBacktrackingMatchLimit() const { return backtracking_match_limit; }
    const std::vector<DebugLevelSetting> & getDebugLevels() const { return debug_levels; }

private:
    Maybe<std::string> engine_name = genError("Engine was not configured");
    Maybe<uint> backtracking_match_limit = genError("Match limit was not configured");
    std::vector<DebugLevelSetting> debug_levels;
};

// Compiles patterns with the engine that its preference selects. Each compiler has its own preference, so differently
// configured compilers can live side by side. The free functions below use a process wide default compiler.
class RegexCompiler
{
public:
    // The linear-time engine when it is built in, and the backtracking engine.
    RegexCompiler();
    // A null linear engine stands for a process without one.
    RegexCompiler(
        std::unique_ptr<I_PatternEngine> &&_linear_engine,
        std::unique_ptr<I_PatternEngine> &&_backtracking_engine
    );

    // Forcing the linear-time engine when there is none fails, and leaves the preference as it was.
    Maybe<void, ConfigurationError> setEnginePreference(EnginePreference preference);
    EnginePreference getEnginePreference() const { return preference; }
    // 0 is the backtracking engine's own default.
    uint getBacktrackingMatchLimit() const { return backtracking_match_limit; }

    bool isLinearEngineAvailable() const { return linear_engine != nullptr; }
    const I_PatternEngine & selectEngine() const;

    // Applies a JSON settings document. Nothing is applied unless the whole document is valid.
    Maybe<void, ConfigurationError> loadConfiguration(std::istream &config);

    Maybe<std::unique_ptr<CompiledPattern>, PatternSyntaxError>
    compile(const std::string &pattern, RegexFlags flags = NO_FLAGS, const std::string &pattern_id = "") const;

private:
    Maybe<void, ConfigurationError> applySettings(const RegexCompatSettings &settings);

    std::unique_ptr<I_PatternEngine> linear_engine;
    std::unique_ptr<I_PatternEngine> backtracking_engine;
    EnginePreference preference = EnginePreference::AUTO;
    uint backtracking_match_limit = 0;
};

RegexCompiler & getDefaultCompiler();

Maybe<void, ConfigurationError> setEnginePreference(EnginePreference preference);
EnginePreference getEnginePreference();
Maybe<void, ConfigurationError> loadConfiguration(std::istream &config);

Maybe<std::unique_ptr<CompiledPattern>, PatternSyntaxError>
compile(const std::string &pattern, RegexFlags flags = NO_FLAGS, const std::string &pattern_id = "");

} // namespace RegexCompat

#endif // __REGEX_COMPILER_H__
