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

#ifndef __REGEX_FLAGS_H__
#define __REGEX_FLAGS_H__

#include <string>
#include <vector>
#include <sys/types.h>

namespace RegexCompat
{

// Engine-neutral flag bitmask. The values follow the numbering of the common backtracking dialect, so flag values
// that callers already keep for it can be passed here unchanged.
using RegexFlags = uint;

static const RegexFlags NO_FLAGS   = 0;
static const RegexFlags IGNORECASE = 2;
static const RegexFlags MULTILINE  = 8;
static const RegexFlags DOTALL     = 16;

// Reserved by the same numbering. Never set by translateFlagNames(). A raw bitmask carrying them is accepted by
// compile(): UNICODE is always on, VERBOSE is reported as unsupported.
static const RegexFlags UNICODE    = 32;
static const RegexFlags VERBOSE    = 64;

static const RegexFlags SUPPORTED_FLAGS = IGNORECASE | MULTILINE | DOTALL;

// Maps flag names ("IGNORECASE", "MULTILINE", "DOTALL", "UNICODE", "VERBOSE", the one letter aliases I/M/S/U/X,
// optionally prefixed by "re.", in any letter case) to a bitmask. UNICODE adds nothing. VERBOSE and unknown names
// add nothing and are reported with a warning.
RegexFlags translateFlagNames(const std::vector<std::string> &names);

// Multiline is not an engine option: it is applied as an inline "(?m)" directive in front of the pattern, so an
// enclosing "^(?:...)$" keeps anchoring to the whole subject.
std::string applyMultilineDirective(const std::string &pattern, RegexFlags flags);

// Warns about bits that have no effect (VERBOSE, unknown bits) and returns the supported subset.
RegexFlags sanitizeFlags(RegexFlags flags, const std::string &pattern_id);

std::string dumpFlags(RegexFlags flags);

} // namespace RegexCompat

#endif // __REGEX_FLAGS_H__
