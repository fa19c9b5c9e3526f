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

#include "pattern_normalizer.h"

#include <cstring>
#include <sstream>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_NORMALIZER);

namespace RegexCompat
{

const vector<ScriptRange> non_latin_script_ranges = {
    { 0x4E00, 0x9FFF, "CJK Unified Ideographs" },
    { 0x3400, 0x4DBF, "CJK Unified Ideographs Extension A" },
    { 0xAC00, 0xD7AF, "Hangul Syllables" },
    { 0x3040, 0x309F, "Hiragana" },
    { 0x30A0, 0x30FF, "Katakana" },
    { 0x1100, 0x11FF, "Hangul Jamo" },
    { 0x3130, 0x318F, "Hangul Compatibility Jamo" }
};

const vector<string> non_latin_script_markers = {
    // Hangul
    "가-힣", "ㄱ-ㅎ", "ㅏ-ㅣ",
    // CJK Ideographs
    "一-龯", "一-龥",
    // Hiragana, Katakana
    "ぁ-ん", "ァ-ン",
    // Unicode property escapes
    "\\p{Han}", "\\p{Hangul}", "\\p{Hiragana}", "\\p{Katakana}"
};

static const string unicode_escape_marker = "\\u";
static const char *literal_escaped_chars = ".^$*+?()[]{}\\|-";

static bool
isHexDigit(char ch)
{
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

static uint32_t
hexValue(char ch)
{
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    return ch - 'A' + 10;
}

static void
appendUtf8(string &out, uint32_t code_point)
{
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>((code_point >> 6) | 0xC0);
        out += static_cast<char>((code_point & 0x3F) | 0x80);
    } else {
        // Four hex digits never exceed 0xFFFF
        out += static_cast<char>((code_point >> 12) | 0xE0);
        out += static_cast<char>(((code_point >> 6) & 0x3F) | 0x80);
        out += static_cast<char>((code_point & 0x3F) | 0x80);
    }
}

// Decodes the UTF-8 sequence at `pos` and moves `pos` past it. A malformed byte decodes to U+FFFD and is skipped.
static uint32_t
decodeUtf8(const string &text, size_t &pos)
{
    static const uint32_t replacement_char = 0xFFFD;

    uint8_t lead = text[pos++];
    if (lead < 0x80) return lead;

    uint trailing;
    uint32_t code_point;
    if ((lead & 0xE0) == 0xC0) {
        trailing = 1;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        trailing = 2;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        trailing = 3;
        code_point = lead & 0x07;
    } else {
        return replacement_char;
    }

    if (pos + trailing > text.size()) return replacement_char;
    for (uint i = 0; i < trailing; i++) {
        uint8_t next = text[pos + i];
        if ((next & 0xC0) != 0x80) return replacement_char;
        code_point = (code_point << 6) | (next & 0x3F);
    }
    pos += trailing;
    return code_point;
}

static string
dumpCodePoint(uint32_t code_point)
{
    ostringstream os;
    os << "U+" << hex << uppercase << code_point;
    return os.str();
}

// Reads the code point of a well formed \uXXXX escape starting at `pos`.
static bool
readUnicodeEscape(const string &pattern, size_t pos, uint32_t &code_point)
{
    if (pos + 6 > pattern.size() || pattern[pos] != '\\' || pattern[pos + 1] != 'u') return false;

    code_point = 0;
    for (size_t i = pos + 2; i < pos + 6; i++) {
        if (!isHexDigit(pattern[i])) return false;
        code_point = (code_point << 4) + hexValue(pattern[i]);
    }

    // A lone surrogate has no UTF-8 encoding
    return code_point < 0xD800 || code_point > 0xDFFF;
}

string
PatternNormalizer::expandUnicodeEscapes(const string &pattern)
{
    if (pattern.find(unicode_escape_marker) == string::npos) return pattern;

    string result;
    result.reserve(pattern.size());

    size_t pos = 0;
    while (pos < pattern.size()) {
        if (pattern[pos] != '\\') {
            result += pattern[pos++];
            continue;
        }

        if (pos + 1 < pattern.size() && pattern[pos + 1] == '\\') {
            result.append(pattern, pos, 2);
            pos += 2;
            continue;
        }

        uint32_t code_point;
        if (!readUnicodeEscape(pattern, pos, code_point)) {
            result += pattern[pos++];
            continue;
        }

        // ASCII metacharacters keep denoting themselves, not their regex meaning
        if (code_point < 0x80 && code_point != 0 && strchr(literal_escaped_chars, code_point) != nullptr) {
            result += '\\';
        }
        appendUtf8(result, code_point);
        pos += 6;
    }

    dbgTrace(D_REGEX_NORMALIZER) << "Expanded unicode escapes: " << dumpQuoted(pattern) << " -> " << dumpQuoted(result);
    return result;
}

bool
PatternNormalizer::isInNonLatinScript(uint32_t code_point)
{
    for (const ScriptRange &range : non_latin_script_ranges) {
        if (code_point >= range.first && code_point <= range.last) return true;
    }
    return false;
}

bool
PatternNormalizer::usesNonLatinScript(const string &pattern)
{
    for (const string &marker : non_latin_script_markers) {
        if (pattern.find(marker) != string::npos) {
            dbgTrace(D_REGEX_NORMALIZER) << "Pattern contains the script marker " << marker;
            return true;
        }
    }

    if (pattern.find(unicode_escape_marker) != string::npos) {
        dbgTrace(D_REGEX_NORMALIZER) << "Pattern contains an unexpanded unicode escape";
        return true;
    }

    size_t pos = 0;
    while (pos < pattern.size()) {
        uint32_t code_point = decodeUtf8(pattern, pos);
        if (isInNonLatinScript(code_point)) {
            dbgTrace(D_REGEX_NORMALIZER) << "Pattern contains the non-latin code point " << dumpCodePoint(code_point);
            return true;
        }
    }

    return false;
}

bool
PatternNormalizer::hasWordBoundary(const string &pattern)
{
    for (size_t pos = 0; pos + 1 < pattern.size(); pos++) {
        if (pattern[pos] != '\\') continue;
        if (pattern[pos + 1] == 'b') return true;
        // Skip the escaped character, so "\\b" is a backslash followed by a plain 'b'
        pos++;
    }
    return false;
}

string
PatternNormalizer::rewriteWordBoundaries(const string &pattern)
{
    if (!hasWordBoundary(pattern)) return pattern;

    // ASCII patterns, \b works fine
    if (!usesNonLatinScript(pattern)) return pattern;

    string transformed;
    transformed.reserve(pattern.size());
    for (size_t pos = 0; pos < pattern.size(); pos++) {
        if (pattern[pos] != '\\' || pos + 1 >= pattern.size()) {
            transformed += pattern[pos];
            continue;
        }

        if (pattern[pos + 1] != 'b') transformed.append(pattern, pos, 2);
        pos++;
    }

    dbgTrace(D_REGEX_NORMALIZER)
        << "Transformed pattern for Unicode compatibility: "
        << dumpQuoted(pattern)
        << " -> "
        << dumpQuoted(transformed);

    return transformed;
}

string
PatternNormalizer::normalize(const string &pattern)
{
    return rewriteWordBoundaries(expandUnicodeEscapes(pattern));
}

} // namespace RegexCompat
