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

using namespace std;

namespace RegexCompat
{

const RegexMatch::MatchGroup *
RegexMatch::getGroup(uint index) const
{
    if (index >= match_groups.size()) return nullptr;
    return &match_groups[index];
}

string
RegexMatch::group(uint index) const
{
    auto match_group = getGroup(index);
    if (match_group == nullptr || !match_group->matched) return "";
    return match_group->value;
}

Maybe<string>
RegexMatch::group(const string &name) const
{
    for (const MatchGroup &match_group : match_groups) {
        if (match_group.index == 0 || match_group.name != name) continue;
        if (!match_group.matched) return genError("Group '" + name + "' did not participate in the match");
        return match_group.value;
    }
    return genError("No group named '" + name + "'");
}

size_t
RegexMatch::start(uint index) const
{
    auto match_group = getGroup(index);
    return match_group == nullptr ? string::npos : match_group->start;
}

size_t
RegexMatch::end(uint index) const
{
    auto match_group = getGroup(index);
    return match_group == nullptr ? string::npos : match_group->end;
}

pair<size_t, size_t>
RegexMatch::span(uint index) const
{
    return make_pair(start(index), end(index));
}

bool
RegexMatch::isMatched(uint index) const
{
    auto match_group = getGroup(index);
    return match_group != nullptr && match_group->matched;
}

vector<string>
RegexMatch::groups() const
{
    vector<string> values;
    for (uint index = 1; index < match_groups.size(); index++) {
        values.push_back(group(index));
    }
    return values;
}

ostream &
RegexMatch::print(ostream &os) const
{
    os << "RegexMatch(span=(" << start() << ", " << end() << "), match=" << dumpQuoted(group());
    if (getGroupCount() > 0) os << ", groups=[" << makeSeparatedStr(groups(), ", ") << "]";
    return os << ")";
}

ostream &
operator<<(ostream &os, const RegexMatch &match)
{
    return match.print(os);
}

} // namespace RegexCompat
