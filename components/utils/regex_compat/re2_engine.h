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

#ifndef __RE2_ENGINE_H__
#define __RE2_ENGINE_H__

#ifdef USE_RE2
#include <map>
#include <memory>
#include <string>
#include <boost/noncopyable.hpp>

#include "re2/re2.h"
#include "i_pattern_engine.h"

namespace RegexCompat
{

class Re2CompiledForm : public I_CompiledForm, boost::noncopyable
{
public:
    explicit Re2CompiledForm(std::unique_ptr<RE2> &&_re);

    Maybe<RegexMatch> find(const std::string &text, size_t start_offset, bool anchored) const override;

    uint getGroupCount() const override { return group_count; }
    const std::map<uint, std::string> & getGroupNames() const override { return group_names; }

private:
    std::unique_ptr<RE2> re;
    uint group_count;
    std::map<uint, std::string> group_names;
};

class Re2Engine : public I_PatternEngine
{
public:
    RegexEngineType getType() const override { return RegexEngineType::LINEAR; }
    std::string getName() const override { return "re2"; }

    Maybe<std::unique_ptr<I_CompiledForm>, PatternSyntaxError>
    compile(const std::string &pattern, RegexFlags flags) const override;

    // Multiline is not part of the options, see applyMultilineDirective().
    static RE2::Options translateFlags(RegexFlags flags);
};

} // namespace RegexCompat

#endif // USE_RE2

#endif // __RE2_ENGINE_H__
