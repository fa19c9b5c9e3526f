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

#include "regex_compat_errors.h"

#include "common.h"

using namespace std;

namespace RegexCompat
{

PatternSyntaxError::PatternSyntaxError(
    const string &_pattern,
    const string &_compiled_text,
    const string &_engine_name,
    const string &_message,
    size_t _offset)
        :
    pattern(_pattern),
    compiled_text(_compiled_text),
    engine_name(_engine_name),
    message(_message),
    offset(_offset)
{
}

bool
PatternSyntaxError::operator==(const PatternSyntaxError &other) const
{
    return
        pattern == other.pattern &&
        compiled_text == other.compiled_text &&
        engine_name == other.engine_name &&
        message == other.message &&
        offset == other.offset;
}

ostream &
PatternSyntaxError::print(ostream &os) const
{
    os << "PatternSyntaxError(" << engine_name << ": " << message;
    if (offset != string::npos) os << " at offset " << offset;
    os << ", pattern " << dumpQuoted(pattern);
    if (!pattern_id.empty()) os << ", id " << pattern_id;
    return os << ")";
}

ostream &
operator<<(ostream &os, const PatternSyntaxError &err)
{
    return err.print(os);
}

ostream &
operator<<(ostream &os, const ConfigurationError &err)
{
    return err.print(os);
}

} // namespace RegexCompat
