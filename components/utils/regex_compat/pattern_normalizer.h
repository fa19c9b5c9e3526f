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

#ifndef __PATTERN_NORMALIZER_H__
#define __PATTERN_NORMALIZER_H__

#include <string>
#include <vector>
#include <sys/types.h>

namespace RegexCompat
{

struct ScriptRange
{
    uint32_t first;
    uint32_t last;
    const char *name;
};

// Code point ranges of scripts that delimit words with whitespace or punctuation rather than with alphanumeric
// transitions. The linear-time engine's \b only knows ASCII word characters, which is wrong for all of these.
extern const std::vector<ScriptRange> non_latin_script_ranges;

// Literal pattern fragments that reveal such a script: character class ranges and Unicode property escapes.
extern const std::vector<std::string> non_latin_script_markers;

class PatternNormalizer
{
public:
    // \uXXXX (exactly four hex digits) becomes the UTF-8 encoded code point. Anything else, including escapes with
    // fewer digits, non-hex digits, a surrogate code point or an escaped backslash ("\\u0041"), is copied as is.
    static std::string expandUnicodeEscapes(const std::string &pattern);

    // Best effort, over the literal pattern text only. A script range spelled in a form that is not listed in
    // non_latin_script_markers and has no literal character from non_latin_script_ranges is not detected.
    static bool usesNonLatinScript(const std::string &pattern);

    // Removes every \b assertion when the pattern uses a non-latin script. Patterns without \b, and ASCII patterns,
    // are returned unchanged.
    static std::string rewriteWordBoundaries(const std::string &pattern);

    // expandUnicodeEscapes() followed by rewriteWordBoundaries().
    static std::string normalize(const std::string &pattern);

    static bool isInNonLatinScript(uint32_t code_point);
    static bool hasWordBoundary(const std::string &pattern);
};

} // namespace RegexCompat

#endif // __PATTERN_NORMALIZER_H__
