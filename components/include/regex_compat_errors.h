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

#ifndef __REGEX_COMPAT_ERRORS_H__
#define __REGEX_COMPAT_ERRORS_H__

#include <string>
#include <ostream>
#include <stdexcept>

namespace RegexCompat
{

// A pattern that the selected engine refused to compile: malformed syntax, or a construct the engine does not
// support (lookaround and backreferences under the linear-time engine).
class PatternSyntaxError
{
public:
    PatternSyntaxError() {}
    PatternSyntaxError(
        const std::string &pattern,
        const std::string &compiled_text,
        const std::string &engine_name,
        const std::string &message,
        size_t offset = std::string::npos
    );

    const std::string & getPattern() const { return pattern; }
    const std::string & getCompiledText() const { return compiled_text; }
    const std::string & getEngineName() const { return engine_name; }
    const std::string & getMessage() const { return message; }
    size_t getOffset() const { return offset; }

    // The raw pattern is only known to the compiler, engines report the text they were given.
    void setPattern(const std::string &_pattern) { pattern = _pattern; }
    void setPatternId(const std::string &_pattern_id) { pattern_id = _pattern_id; }
    const std::string & getPatternId() const { return pattern_id; }

    bool operator==(const PatternSyntaxError &other) const;

    std::ostream & print(std::ostream &os) const;

private:
    std::string pattern;
    std::string compiled_text;
    std::string engine_name;
    std::string message;
    std::string pattern_id;
    size_t offset = std::string::npos;
};

// An engine preference or configuration that the running process cannot satisfy.
class ConfigurationError
{
public:
    ConfigurationError() {}
    ConfigurationError(const std::string &_message) : message(_message) {}

    const std::string & getMessage() const { return message; }

    bool operator==(const ConfigurationError &other) const { return message == other.message; }

    std::ostream & print(std::ostream &os) const { return os << "ConfigurationError(" << message << ")"; }

private:
    std::string message;
};

std::ostream & operator<<(std::ostream &os, const PatternSyntaxError &err);
std::ostream & operator<<(std::ostream &os, const ConfigurationError &err);

// For callers that would rather see an exception: compile(...).verify<RegexCompatException>()
class RegexCompatException : public std::runtime_error
{
public:
    RegexCompatException(const std::string &what) : std::runtime_error(what) {}
};

} // namespace RegexCompat

#endif // __REGEX_COMPAT_ERRORS_H__
