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

#ifndef __REGEX_MATCH_H__
#define __REGEX_MATCH_H__

#include <string>
#include <vector>
#include <utility>
#include <ostream>
#include <sys/types.h>

#include "maybe_res.h"

namespace RegexCompat
{

// A single successful match. Group 0 is the whole match, groups 1..N are the capture groups of the pattern in order.
// Offsets are byte offsets into the subject that was matched.
class RegexMatch
{
public:
    struct MatchGroup
    {
        MatchGroup(uint16_t index, const std::string &name)
                :
            index(index),
            name(name)
        {}

        MatchGroup(uint16_t index, const std::string &name, const std::string &value, size_t start, size_t end)
                :
            index(index),
            name(name),
            value(value),
            start(start),
            end(end),
            matched(true)
        {}

        uint16_t index;
        std::string name;
        std::string value;
        size_t start = std::string::npos;
        size_t end = std::string::npos;
        bool matched = false;
    };

    RegexMatch() {}
    explicit RegexMatch(std::vector<MatchGroup> &&groups) : match_groups(std::move(groups)) {}

    // Unmatched and out of range groups read as an empty string.
    std::string group(uint index = 0) const;
    Maybe<std::string> group(const std::string &name) const;

    size_t start(uint index = 0) const;
    size_t end(uint index = 0) const;
    std::pair<size_t, size_t> span(uint index = 0) const;
    bool isMatched(uint index) const;

    // All capture groups (without group 0).
    std::vector<std::string> groups() const;
    uint getGroupCount() const { return match_groups.empty() ? 0 : match_groups.size() - 1; }
    const std::vector<MatchGroup> & getMatchGroups() const { return match_groups; }

    bool empty() const { return start() == end(); }

    std::ostream & print(std::ostream &os) const;

private:
    const MatchGroup * getGroup(uint index) const;

    std::vector<MatchGroup> match_groups;
};

std::ostream & operator<<(std::ostream &os, const RegexMatch &match);

} // namespace RegexCompat

#endif // __REGEX_MATCH_H__
