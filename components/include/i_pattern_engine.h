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

#ifndef __I_PATTERN_ENGINE_H__
#define __I_PATTERN_ENGINE_H__

#include <map>
#include <memory>
#include <string>
#include <ostream>

#include "maybe_res.h"
#include "regex_flags.h"
#include "regex_match.h"
#include "regex_compat_errors.h"

namespace RegexCompat
{

enum class RegexEngineType
{
    LINEAR,
    BACKTRACKING
};

std::ostream & operator<<(std::ostream &os, RegexEngineType type);

// A pattern compiled by one engine. Implementations are immutable once built, and safe to use from several threads.
class I_CompiledForm
{
public:
    // Finds the leftmost match that starts at or after start_offset. An anchored search only accepts a match that
    // starts exactly at start_offset. Text before start_offset is still visible to anchors and lookbehind.
    virtual Maybe<RegexMatch> find(const std::string &text, size_t start_offset, bool anchored) const = 0;

    virtual uint getGroupCount() const = 0;
    // Capture index => name, for named groups only.
    virtual const std::map<uint, std::string> & getGroupNames() const = 0;

    virtual ~I_CompiledForm() {}
};

// The capability every backing engine offers: turning a pattern and neutral flags into a compiled form.
// Translating the neutral flags into the engine's native options is the engine's own business.
class I_PatternEngine
{
public:
    virtual RegexEngineType getType() const = 0;
    virtual std::string getName() const = 0;

    virtual Maybe<std::unique_ptr<I_CompiledForm>, PatternSyntaxError>
    compile(const std::string &pattern, RegexFlags flags) const = 0;

    virtual ~I_PatternEngine() {}
};

} // namespace RegexCompat

#endif // __I_PATTERN_ENGINE_H__
