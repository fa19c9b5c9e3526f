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

#ifndef __COMPILED_PATTERN_H__
#define __COMPILED_PATTERN_H__

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <iterator>
#include <ostream>
#include <functional>
#include <boost/noncopyable.hpp>

#include "maybe_res.h"
#include "regex_flags.h"
#include "regex_match.h"
#include "i_pattern_engine.h"

namespace RegexCompat
{

class CompiledPattern;

// Walks the non-overlapping matches of a pattern, left to right. A default constructed iterator is the end.
class MatchIterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = RegexMatch;
    using difference_type = std::ptrdiff_t;
    using pointer = const RegexMatch *;
    using reference = const RegexMatch &;

    MatchIterator() {}
    MatchIterator(const CompiledPattern *_pattern, const std::shared_ptr<const std::string> &_text);

    const RegexMatch & operator*() const { return current; }
    const RegexMatch * operator->() const { return &current; }

    MatchIterator & operator++();
    MatchIterator operator++(int);

    bool operator==(const MatchIterator &other) const;
    bool operator!=(const MatchIterator &other) const { return !(*this == other); }

private:
    void advance();

    const CompiledPattern *pattern = nullptr;
    std::shared_ptr<const std::string> text;
    size_t next_offset = 0;
    RegexMatch current;
};

// Lazy sequence of matches. The range keeps its own copy of the text, and every begin() starts over.
class MatchRange
{
public:
    MatchRange(const CompiledPattern *_pattern, const std::string &_text)
            :
        pattern(_pattern),
        text(std::make_shared<const std::string>(_text))
    {}

    MatchIterator begin() const { return MatchIterator(pattern, text); }
    MatchIterator end() const { return MatchIterator(); }

private:
    const CompiledPattern *pattern;
    std::shared_ptr<const std::string> text;
};

class CompiledPattern : boost::noncopyable
{
public:
    using ReplaceCallback = std::function<std::string(const RegexMatch &)>;

    CompiledPattern(
        const std::string &_pattern,
        const std::string &_normalized_pattern,
        RegexFlags _flags,
        const std::string &_pattern_id,
        RegexEngineType _engine_type,
        const std::string &_engine_name,
        std::unique_ptr<I_CompiledForm> &&_primary,
        std::unique_ptr<I_CompiledForm> &&_anchored
    );

    // The first match anywhere in the text.
    Maybe<RegexMatch> search(const std::string &text) const;
    // A match that starts at the beginning of the text.
    Maybe<RegexMatch> match(const std::string &text) const;
    // A match that covers the whole text.
    Maybe<RegexMatch> fullmatch(const std::string &text) const;

    // The returned range must not outlive this pattern.
    MatchRange finditer(const std::string &text) const;

    // Whole matches when the pattern has no groups, the first group when it has exactly one. A list of strings cannot
    // hold the group tuples of a pattern with more groups, so those get whole matches and a warning that points to
    // findallGroups().
    std::vector<std::string> findall(const std::string &text) const;
    std::vector<std::vector<std::string>> findallGroups(const std::string &text) const;

    // Replaces up to `limit` matches, all of them for 0. The replacement may refer to groups with \1 .. \99,
    // \g<number> and \g<name>, and may contain \\, \n, \t and \r. Other escapes are copied as is.
    std::string sub(const std::string &replacement, const std::string &text, uint limit = 0) const;
    std::string sub(const ReplaceCallback &replace, const std::string &text, uint limit = 0) const;
    std::pair<std::string, uint> subn(const std::string &replacement, const std::string &text, uint limit = 0) const;

    // Splits around up to `limit` matches, all of them for 0. Captured groups of each separator are returned between
    // the surrounding segments.
    std::vector<std::string> split(const std::string &text, uint limit = 0) const;

    const std::string & getPattern() const { return pattern; }
    const std::string & getNormalizedPattern() const { return normalized_pattern; }
    RegexFlags getFlags() const { return flags; }
    const std::string & getPatternId() const { return pattern_id; }
    RegexEngineType getEngineType() const { return engine_type; }
    const std::string & getEngineName() const { return engine_name; }
    uint getGroupCount() const { return primary->getGroupCount(); }

    std::ostream & print(std::ostream &os) const;

private:
    friend class MatchIterator;

    struct ReplacementPart
    {
        std::string literal;
        bool is_group = false;
        uint group_index = 0;
    };

    // Finds the next match at or after `offset`, and moves `offset` to where the search after it starts.
    Maybe<RegexMatch> findNext(const std::string &text, size_t &offset) const;

    std::vector<ReplacementPart> parseReplacement(const std::string &replacement) const;
    Maybe<uint> resolveGroupReference(const std::string &reference) const;
    std::string substitute(const ReplaceCallback &replace, const std::string &text, uint limit, uint &count) const;

    std::string pattern;
    std::string normalized_pattern;
    RegexFlags flags;
    std::string pattern_id;
    RegexEngineType engine_type;
    std::string engine_name;
    std::unique_ptr<I_CompiledForm> primary;
    std::unique_ptr<I_CompiledForm> anchored;
};

std::ostream & operator<<(std::ostream &os, const CompiledPattern &compiled_pattern);

} // namespace RegexCompat

#endif // __COMPILED_PATTERN_H__
