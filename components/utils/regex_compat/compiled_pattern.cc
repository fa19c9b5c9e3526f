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

#include "compiled_pattern.h"

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_COMPAT);

namespace RegexCompat
{

// Offset of the character after the one at `offset`, past the end of the text when there is none.
static size_t
nextCharOffset(const string &text, size_t offset)
{
    if (offset >= text.size()) return text.size() + 1;
    offset++;
    while (offset < text.size() && (static_cast<uint8_t>(text[offset]) & 0xC0) == 0x80) offset++;
    return offset;
}

MatchIterator::MatchIterator(const CompiledPattern *_pattern, const shared_ptr<const string> &_text)
        :
    pattern(_pattern),
    text(_text)
{
    advance();
}

void
MatchIterator::advance()
{
    if (pattern == nullptr) return;

    auto next = pattern->findNext(*text, next_offset);
    if (!next.ok()) {
        pattern = nullptr;
        text.reset();
        next_offset = 0;
        current = RegexMatch();
        return;
    }
    current = next.unpackMove();
}

MatchIterator &
MatchIterator::operator++()
{
    advance();
    return *this;
}

MatchIterator
MatchIterator::operator++(int)
{
    MatchIterator previous = *this;
    advance();
    return previous;
}

bool
MatchIterator::operator==(const MatchIterator &other) const
{
    return pattern == other.pattern && text == other.text && next_offset == other.next_offset;
}

CompiledPattern::CompiledPattern(
    const string &_pattern,
    const string &_normalized_pattern,
    RegexFlags _flags,
    const string &_pattern_id,
    RegexEngineType _engine_type,
    const string &_engine_name,
    unique_ptr<I_CompiledForm> &&_primary,
    unique_ptr<I_CompiledForm> &&_anchored)
        :
    pattern(_pattern),
    normalized_pattern(_normalized_pattern),
    flags(_flags),
    pattern_id(_pattern_id),
    engine_type(_engine_type),
    engine_name(_engine_name),
    primary(move(_primary)),
    anchored(move(_anchored))
{
    dbgAssert(primary != nullptr && anchored != nullptr) << "A compiled pattern needs both of its compiled forms";
}

Maybe<RegexMatch>
CompiledPattern::search(const string &text) const
{
    return primary->find(text, 0, false);
}

Maybe<RegexMatch>
CompiledPattern::match(const string &text) const
{
    return primary->find(text, 0, true);
}

Maybe<RegexMatch>
CompiledPattern::fullmatch(const string &text) const
{
    return anchored->find(text, 0, true);
}

Maybe<RegexMatch>
CompiledPattern::findNext(const string &text, size_t &offset) const
{
    if (offset > text.size()) return genError("End of text");

    auto next = primary->find(text, offset, false);
    if (!next.ok()) return next;

    // After an empty match the search resumes one character later, so iteration always moves forward
    offset = next.unpack().empty() ? nextCharOffset(text, next.unpack().end()) : next.unpack().end();
    return next;
}

MatchRange
CompiledPattern::finditer(const string &text) const
{
    return MatchRange(this, text);
}

vector<string>
CompiledPattern::findall(const string &text) const
{
    uint reported_group = getGroupCount() == 1 ? 1 : 0;
    if (getGroupCount() > 1) {
        dbgWarning(D_REGEX_COMPAT)
            << "findall() of "
            << dumpQuoted(pattern)
            << " returns whole matches, the pattern has "
            << getGroupCount()
            << " groups. Use findallGroups() for the group values";
    }

    vector<string> found;
    size_t offset = 0;
    for (auto next = findNext(text, offset); next.ok(); next = findNext(text, offset)) {
        found.push_back(next.unpack().group(reported_group));
    }
    return found;
}

vector<vector<string>>
CompiledPattern::findallGroups(const string &text) const
{
    vector<vector<string>> found;
    size_t offset = 0;
    for (auto next = findNext(text, offset); next.ok(); next = findNext(text, offset)) {
        found.push_back(next.unpack().groups());
    }
    return found;
}

Maybe<uint>
CompiledPattern::resolveGroupReference(const string &reference) const
{
    if (reference.empty()) return genError("Empty group reference");

    if (reference.find_first_not_of("0123456789") == string::npos) {
        if (reference.size() > 9) return genError("Group number is too large: " + reference);
        uint index = stoul(reference);
        if (index > getGroupCount()) return genError("Invalid group reference " + reference);
        return index;
    }

    for (const auto &name : primary->getGroupNames()) {
        if (name.second == reference) return name.first;
    }
    return genError("Unknown group name " + reference);
}

vector<CompiledPattern::ReplacementPart>
CompiledPattern::parseReplacement(const string &replacement) const
{
    vector<ReplacementPart> parts;
    string literal;

    auto flushLiteral = [&] () {
        if (literal.empty()) return;
        ReplacementPart part;
        part.literal = literal;
        parts.push_back(part);
        literal.clear();
    };

    auto addGroup = [&] (const string &reference) {
        auto index = resolveGroupReference(reference);
        if (!index.ok()) {
            dbgWarning(D_REGEX_COMPAT)
                << "Replacement "
                << dumpQuoted(replacement)
                << " refers to a missing group, it expands to nothing. Error: "
                << index.getErr();
            return;
        }
        flushLiteral();
        ReplacementPart part;
        part.is_group = true;
        part.group_index = index.unpack();
        parts.push_back(part);
    };

    for (size_t pos = 0; pos < replacement.size(); pos++) {
        char ch = replacement[pos];
        if (ch != '\\' || pos + 1 == replacement.size()) {
            literal += ch;
            continue;
        }

        char escaped = replacement[++pos];
        switch (escaped) {
            case '\\': literal += '\\'; break;
            case 'n': literal += '\n'; break;
            case 't': literal += '\t'; break;
            case 'r': literal += '\r'; break;
            case 'g': {
                size_t close = replacement.find('>', pos);
                if (pos + 1 < replacement.size() && replacement[pos + 1] == '<' && close != string::npos) {
                    addGroup(replacement.substr(pos + 2, close - pos - 2));
                    pos = close;
                } else {
                    literal += "\\g";
                }
                break;
            }
            default: {
                if (escaped < '1' || escaped > '9') {
                    literal += '\\';
                    literal += escaped;
                    break;
                }
                string reference(1, escaped);
                bool has_second_digit =
                    pos + 1 < replacement.size() && isdigit(static_cast<unsigned char>(replacement[pos + 1]));
                if (has_second_digit) reference += replacement[++pos];
                addGroup(reference);
                break;
            }
        }
    }
    flushLiteral();

    return parts;
}

string
CompiledPattern::substitute(const ReplaceCallback &replace, const string &text, uint limit, uint &count) const
{
    string result;
    size_t copied_until = 0;
    size_t offset = 0;
    count = 0;

    while (limit == 0 || count < limit) {
        auto next = findNext(text, offset);
        if (!next.ok()) break;

        const RegexMatch &found = next.unpack();
        result.append(text, copied_until, found.start() - copied_until);
        result += replace(found);
        copied_until = found.end();
        count++;
    }
    result.append(text, copied_until, string::npos);

    dbgTrace(D_REGEX_COMPAT) << "Replaced " << count << " matches of " << dumpQuoted(pattern);
    return result;
}

string
CompiledPattern::sub(const string &replacement, const string &text, uint limit) const
{
    return subn(replacement, text, limit).first;
}

string
CompiledPattern::sub(const ReplaceCallback &replace, const string &text, uint limit) const
{
    uint count;
    return substitute(replace, text, limit, count);
}

pair<string, uint>
CompiledPattern::subn(const string &replacement, const string &text, uint limit) const
{
    vector<ReplacementPart> parts = parseReplacement(replacement);
    auto expand = [&parts] (const RegexMatch &found) {
        string expanded;
        for (const ReplacementPart &part : parts) {
            expanded += part.is_group ? found.group(part.group_index) : part.literal;
        }
        return expanded;
    };

    uint count;
    string result = substitute(expand, text, limit, count);
    return make_pair(result, count);
}

vector<string>
CompiledPattern::split(const string &text, uint limit) const
{
    vector<string> segments;
    size_t segment_start = 0;
    size_t offset = 0;
    uint splits = 0;

    while (limit == 0 || splits < limit) {
        auto next = findNext(text, offset);
        if (!next.ok()) break;

        const RegexMatch &separator = next.unpack();
        segments.push_back(text.substr(segment_start, separator.start() - segment_start));
        for (const string &captured : separator.groups()) {
            segments.push_back(captured);
        }
        segment_start = separator.end();
        splits++;
    }
    segments.push_back(text.substr(segment_start));

    return segments;
}

ostream &
CompiledPattern::print(ostream &os) const
{
    return os << "CompiledPattern(" << dumpQuoted(pattern) << ", flags=" << flags << ", backend=" << engine_name << ")";
}

ostream &
operator<<(ostream &os, const CompiledPattern &compiled_pattern)
{
    return compiled_pattern.print(os);
}

} // namespace RegexCompat
