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

#ifdef USE_RE2
#include "re2_engine.h"

#include <vector>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_RE2);

namespace RegexCompat
{

Re2CompiledForm::Re2CompiledForm(unique_ptr<RE2> &&_re)
        :
    re(move(_re)),
    group_count(re->NumberOfCapturingGroups())
{
    for (const auto &name : re->CapturingGroupNames()) {
        group_names[name.first] = name.second;
    }
}

Maybe<RegexMatch>
Re2CompiledForm::find(const string &text, size_t start_offset, bool anchored) const
{
    if (start_offset > text.size()) return genError("Start offset is beyond the end of the text");

    vector<re2::StringPiece> submatches(group_count + 1);
    bool found = re->Match(
        text,
        start_offset,
        text.size(),
        anchored ? RE2::ANCHOR_START : RE2::UNANCHORED,
        submatches.data(),
        submatches.size()
    );
    if (!found) return genError("No match");

    vector<RegexMatch::MatchGroup> groups;
    groups.reserve(submatches.size());
    for (uint index = 0; index < submatches.size(); index++) {
        auto name = group_names.find(index);
        const string &group_name = name == group_names.end() ? "" : name->second;

        const re2::StringPiece &submatch = submatches[index];
        // A group that did not participate has no data, an empty group that did points into the text
        if (submatch.data() == nullptr) {
            groups.emplace_back(index, group_name);
            continue;
        }

        size_t start = submatch.data() - text.data();
        string value(submatch.data(), submatch.size());
        groups.emplace_back(index, group_name, value, start, start + value.size());
    }

    return RegexMatch(move(groups));
}

RE2::Options
Re2Engine::translateFlags(RegexFlags flags)
{
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingUTF8);
    options.set_log_errors(false);
    options.set_case_sensitive((flags & IGNORECASE) == 0);
    options.set_dot_nl((flags & DOTALL) != 0);
    return options;
}

Maybe<unique_ptr<I_CompiledForm>, PatternSyntaxError>
Re2Engine::compile(const string &pattern, RegexFlags flags) const
{
    dbgTrace(D_REGEX_RE2) << "Compiling pattern " << dumpQuoted(pattern) << " with flags " << dumpFlags(flags);

    unique_ptr<RE2> re = make_unique<RE2>(pattern, translateFlags(flags));
    if (!re->ok()) {
        dbgDebug(D_REGEX_RE2)
            << "Failed to compile pattern "
            << dumpQuoted(pattern)
            << ": "
            << re->error()
            << " (error code "
            << re->error_code()
            << ")";
        return genError(PatternSyntaxError("", pattern, getName(), re->error()));
    }

    unique_ptr<I_CompiledForm> compiled = make_unique<Re2CompiledForm>(move(re));
    return move(compiled);
}

} // namespace RegexCompat

#endif // USE_RE2
