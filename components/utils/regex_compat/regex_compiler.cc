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

#include <map>
#include <utility>
#include <cereal/types/vector.hpp>
#include <boost/algorithm/string.hpp>

#include "debug.h"
#include "pattern_normalizer.h"
#include "pcre2_engine.h"
#include "re2_engine.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_COMPAT);
USE_DEBUG_FLAG(D_REGEX_ENGINE_SELECTOR);

namespace RegexCompat
{

static const map<string, EnginePreference> preferences_by_name = {
    { "auto",           EnginePreference::AUTO },
    { "automatic",      EnginePreference::AUTO },
    { "linear",         EnginePreference::LINEAR },
    { "re2",            EnginePreference::LINEAR },
    { "backtracking",   EnginePreference::BACKTRACKING },
    { "pcre2",          EnginePreference::BACKTRACKING },
    { "standard",       EnginePreference::BACKTRACKING }
};

ostream &
operator<<(ostream &os, EnginePreference preference)
{
    switch (preference) {
        case EnginePreference::AUTO: return os << "auto";
        case EnginePreference::LINEAR: return os << "linear";
        case EnginePreference::BACKTRACKING: return os << "backtracking";
    }
    dbgAssert(false) << "Unknown engine preference";
    return os;
}

ostream &
operator<<(ostream &os, RegexEngineType type)
{
    switch (type) {
        case RegexEngineType::LINEAR: return os << "linear";
        case RegexEngineType::BACKTRACKING: return os << "backtracking";
    }
    dbgAssert(false) << "Unknown engine type";
    return os;
}

Maybe<EnginePreference, ConfigurationError>
parseEnginePreference(const string &name)
{
    auto preference = preferences_by_name.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name)));
    if (preference == preferences_by_name.end()) {
        return genError(ConfigurationError("Unknown regex engine " + dumpQuoted(name)));
    }
    return preference->second;
}

// Loads the value of an optional key. An absent key is reported with false, a value of the wrong type throws.
template <typename T>
static bool
loadOptionalKey(cereal::JSONInputArchive &ar, const char *key, T &value)
{
    try {
        ar(cereal::make_nvp(key, value));
        return true;
    } catch (const cereal::RapidJSONException &) {
        throw;
    } catch (const cereal::Exception &e) {
        dbgTrace(D_REGEX_COMPAT) << "No '" << key << "' in the regex configuration. Error: " << e.what();
        ar.setNextName(nullptr);
        return false;
    }
}

void
DebugLevelSetting::load(cereal::JSONInputArchive &ar)
{
    has_flag = loadOptionalKey(ar, "flag", flag_name);
    has_level = loadOptionalKey(ar, "level", level_name);
}

void
RegexCompatSettings::load(cereal::JSONInputArchive &ar)
{
    string engine;
    if (loadOptionalKey(ar, "engine", engine)) engine_name = engine;

    uint match_limit;
    if (loadOptionalKey(ar, "backtrackingMatchLimit", match_limit)) backtracking_match_limit = match_limit;

    if (!loadOptionalKey(ar, "debug", debug_levels)) debug_levels.clear();
}

RegexCompiler::RegexCompiler()
        :
#ifdef USE_RE2
    linear_engine(make_unique<Re2Engine>()),
#endif // USE_RE2
    backtracking_engine(make_unique<Pcre2Engine>())
{
}

RegexCompiler::RegexCompiler(
    unique_ptr<I_PatternEngine> &&_linear_engine,
    unique_ptr<I_PatternEngine> &&_backtracking_engine)
        :
    linear_engine(move(_linear_engine)),
    backtracking_engine(move(_backtracking_engine))
{
    dbgAssert(backtracking_engine != nullptr) << "The backtracking engine is always required";
}

Maybe<void, ConfigurationError>
RegexCompiler::setEnginePreference(EnginePreference new_preference)
{
    if (new_preference == EnginePreference::LINEAR && !isLinearEngineAvailable()) {
        dbgWarning(D_REGEX_ENGINE_SELECTOR)
            << "Cannot force the linear-time regex engine, it is not available. Keeping the preference "
            << preference;
        return genError(ConfigurationError("The linear-time regex engine is not available in this process"));
    }

    dbgInfo(D_REGEX_ENGINE_SELECTOR)
        << "Regex engine preference changed from "
        << preference
        << " to "
        << new_preference;
    preference = new_preference;
    return Maybe<void, ConfigurationError>();
}

const I_PatternEngine &
RegexCompiler::selectEngine() const
{
    switch (preference) {
        case EnginePreference::AUTO:
            if (isLinearEngineAvailable()) return *linear_engine;
            return *backtracking_engine;
        case EnginePreference::LINEAR:
            dbgAssert(isLinearEngineAvailable()) << "Linear-time engine is preferred but not available";
            return *linear_engine;
        case EnginePreference::BACKTRACKING:
            return *backtracking_engine;
    }
    dbgAssert(false) << "Unknown engine preference";
    return *backtracking_engine;
}

Maybe<void, ConfigurationError>
RegexCompiler::applySettings(const RegexCompatSettings &settings)
{
    EnginePreference new_preference = preference;
    if (settings.getEngineName().ok()) {
        auto parsed = parseEnginePreference(settings.getEngineName().unpack());
        if (!parsed.ok()) return parsed.passErr();
        new_preference = parsed.unpack();
        if (new_preference == EnginePreference::LINEAR && !isLinearEngineAvailable()) {
            return genError(ConfigurationError("The linear-time regex engine is not available in this process"));
        }
    }

    vector<pair<Debug::DebugFlags, Debug::DebugLevel>> debug_levels;
    for (const DebugLevelSetting &setting : settings.getDebugLevels()) {
        Debug::DebugFlags flag;
        Debug::DebugLevel level;
        if (!setting.isComplete()) {
            return genError(ConfigurationError("A debug setting must have both a \"flag\" and a \"level\""));
        }
        if (!Debug::findFlagByName(setting.getFlagName(), flag)) {
            return genError(ConfigurationError("Unknown debug flag " + dumpQuoted(setting.getFlagName())));
        }
        if (!Debug::findLevelByName(setting.getLevelName(), level)) {
            return genError(ConfigurationError("Unknown debug level " + dumpQuoted(setting.getLevelName())));
        }
        debug_levels.emplace_back(flag, level);
    }

    for (const auto &debug_level : debug_levels) {
        Debug::setFlagLevel(debug_level.first, debug_level.second);
    }

    if (settings.getBacktrackingMatchLimit().ok()) {
        uint match_limit = settings.getBacktrackingMatchLimit().unpack();
        dbgInfo(D_REGEX_ENGINE_SELECTOR) << "Setting the backtracking engine match limit to " << match_limit;
        backtracking_engine = make_unique<Pcre2Engine>(match_limit);
        backtracking_match_limit = match_limit;
    }

    if (new_preference != preference) return setEnginePreference(new_preference);
    return Maybe<void, ConfigurationError>();
}

Maybe<void, ConfigurationError>
RegexCompiler::loadConfiguration(istream &config)
{
    RegexCompatSettings settings;
    try {
        cereal::JSONInputArchive archive(config);
        settings.load(archive);
    } catch (const cereal::RapidJSONException &e) {
        dbgWarning(D_REGEX_COMPAT) << "Malformed value in the regex configuration. Error: " << e.what();
        return genError(ConfigurationError(string("Failed to parse the regex configuration: ") + e.what()));
    } catch (const cereal::Exception &e) {
        dbgWarning(D_REGEX_COMPAT) << "Failed to load the regex configuration. Error: " << e.what();
        return genError(ConfigurationError(string("Failed to parse the regex configuration: ") + e.what()));
    }

    auto applied = applySettings(settings);
    if (!applied.ok()) {
        dbgWarning(D_REGEX_COMPAT) << "Rejected the regex configuration. Error: " << applied.getErr();
    }
    return applied;
}

Maybe<unique_ptr<CompiledPattern>, PatternSyntaxError>
RegexCompiler::compile(const string &pattern, RegexFlags flags, const string &pattern_id) const
{
    RegexFlags engine_flags = sanitizeFlags(flags, pattern_id);
    const I_PatternEngine &engine = selectEngine();

    dbgTrace(D_REGEX_ENGINE_SELECTOR)
        << "Compiling pattern "
        << dumpQuoted(pattern)
        << " with the "
        << engine.getName()
        << " engine (preference: "
        << preference
        << ")";

    string normalized = PatternNormalizer::normalize(pattern);
    string compiled_text = applyMultilineDirective(normalized, engine_flags);

    auto primary = engine.compile(compiled_text, engine_flags);
    if (!primary.ok()) {
        PatternSyntaxError err = primary.getErr();
        err.setPattern(pattern);
        err.setPatternId(pattern_id);
        dbgDebug(D_REGEX_COMPAT) << "Failed to compile regex: " << err;
        return genError(err);
    }

    // The group keeps a top level alternation inside the anchors
    auto anchored = engine.compile("^(?:" + compiled_text + ")$", engine_flags);
    if (!anchored.ok()) {
        PatternSyntaxError err = anchored.getErr();
        err.setPattern(pattern);
        err.setPatternId(pattern_id);
        dbgDebug(D_REGEX_COMPAT) << "Failed to compile the anchored form of regex: " << err;
        return genError(err);
    }

    unique_ptr<CompiledPattern> compiled = make_unique<CompiledPattern>(
        pattern,
        normalized,
        flags,
        pattern_id,
        engine.getType(),
        engine.getName(),
        primary.unpackMove(),
        anchored.unpackMove()
    );
    return move(compiled);
}

RegexCompiler &
getDefaultCompiler()
{
    static RegexCompiler default_compiler;
    return default_compiler;
}

Maybe<void, ConfigurationError>
setEnginePreference(EnginePreference preference)
{
    return getDefaultCompiler().setEnginePreference(preference);
}

EnginePreference
getEnginePreference()
{
    return getDefaultCompiler().getEnginePreference();
}

Maybe<void, ConfigurationError>
loadConfiguration(istream &config)
{
    return getDefaultCompiler().loadConfiguration(config);
}

Maybe<unique_ptr<CompiledPattern>, PatternSyntaxError>
compile(const string &pattern, RegexFlags flags, const string &pattern_id)
{
    return getDefaultCompiler().compile(pattern, flags, pattern_id);
}

} // namespace RegexCompat
