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

#include <map>
#include <boost/algorithm/string.hpp>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_FLAGS);

namespace RegexCompat
{

static const map<string, RegexFlags> flags_by_name = {
    { "IGNORECASE", IGNORECASE },
    { "I",          IGNORECASE },
    { "MULTILINE",  MULTILINE  },
    { "M",          MULTILINE  },
    { "DOTALL",     DOTALL     },
    { "S",          DOTALL     },
    { "UNICODE",    NO_FLAGS   },
    { "U",          NO_FLAGS   }
};

static string
canonicalFlagName(const string &name)
{
    string canonical = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(name));
    if (boost::algorithm::starts_with(canonical, "RE.")) canonical.erase(0, 3);
    return canonical;
}

RegexFlags
translateFlagNames(const vector<string> &names)
{
    RegexFlags flags = NO_FLAGS;
    for (const string &name : names) {
        string canonical = canonicalFlagName(name);

        auto flag = flags_by_name.find(canonical);
        if (flag != flags_by_name.end()) {
            flags |= flag->second;
            continue;
        }

        if (canonical == "VERBOSE" || canonical == "X") {
            dbgWarning(D_REGEX_FLAGS)
                << "VERBOSE flag is not supported by the linear-time engine. "
                << "Pattern comments and whitespace will not be ignored.";
            continue;
        }

        dbgWarning(D_REGEX_FLAGS) << "Ignoring unknown regex flag name: " << dumpQuoted(name);
    }

    dbgTrace(D_REGEX_FLAGS) << "Translated flag names [" << makeSeparatedStr(names, ", ") << "] to " << flags;
    return flags;
}

string
applyMultilineDirective(const string &pattern, RegexFlags flags)
{
    if (flags & MULTILINE) return "(?m)" + pattern;
    return pattern;
}

RegexFlags
sanitizeFlags(RegexFlags flags, const string &pattern_id)
{
    if (flags & VERBOSE) {
        dbgWarning(D_REGEX_FLAGS)
            << "VERBOSE flag is not supported, pattern comments and whitespace will not be ignored. Pattern ID: "
            << pattern_id;
    }

    RegexFlags unknown = flags & ~(SUPPORTED_FLAGS | UNICODE | VERBOSE);
    if (unknown != NO_FLAGS) {
        dbgWarning(D_REGEX_FLAGS)
            << "Ignoring unsupported regex flag bits "
            << unknown
            << ". Pattern ID: "
            << pattern_id;
    }

    return flags & SUPPORTED_FLAGS;
}

string
dumpFlags(RegexFlags flags)
{
    vector<string> names;
    if (flags & IGNORECASE) names.push_back("IGNORECASE");
    if (flags & MULTILINE)  names.push_back("MULTILINE");
    if (flags & DOTALL)     names.push_back("DOTALL");
    if (names.empty()) return "0";
    return makeSeparatedStr(names, "|");
}

} // namespace RegexCompat
