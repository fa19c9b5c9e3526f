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

#ifndef __PCRE2_ENGINE_H__
#define __PCRE2_ENGINE_H__

#define PCRE2_CODE_UNIT_WIDTH 8

#include <map>
#include <memory>
#include <string>
#include <pcre2.h>
#include <boost/noncopyable.hpp>

#include "i_pattern_engine.h"

namespace RegexCompat
{

class Pcre2CompiledForm : public I_CompiledForm, boost::noncopyable
{
public:
    class PCREDelete
    {
    public:
        void
        operator()(pcre2_code *ptr)
        {
            pcre2_code_free(ptr);
        }
    };

    class PCREContextDelete
    {
    public:
        void
        operator()(pcre2_match_context *ptr)
        {
            pcre2_match_context_free(ptr);
        }
    };

    class PCREResultDelete
    {
    public:
        void
        operator()(pcre2_match_data *ptr)
        {
            pcre2_match_data_free(ptr);
        }
    };

    Pcre2CompiledForm(
        std::unique_ptr<pcre2_code, PCREDelete> &&_code,
        std::unique_ptr<pcre2_match_context, PCREContextDelete> &&_match_context
    );

    Maybe<RegexMatch> find(const std::string &text, size_t start_offset, bool anchored) const override;

    uint getGroupCount() const override { return group_count; }
    const std::map<uint, std::string> & getGroupNames() const override { return group_names; }

private:
    void loadGroupNames();

    std::unique_ptr<pcre2_code, PCREDelete> code;
    std::unique_ptr<pcre2_match_context, PCREContextDelete> match_context;
    uint group_count = 0;
    std::map<uint, std::string> group_names;
};

class Pcre2Engine : public I_PatternEngine
{
public:
    // A match limit of 0 keeps the library's default backtracking budget.
    explicit Pcre2Engine(uint _match_limit = 0) : match_limit(_match_limit) {}

    RegexEngineType getType() const override { return RegexEngineType::BACKTRACKING; }
    std::string getName() const override { return "pcre2"; }

    Maybe<std::unique_ptr<I_CompiledForm>, PatternSyntaxError>
    compile(const std::string &pattern, RegexFlags flags) const override;

    uint getMatchLimit() const { return match_limit; }

    // Multiline is not part of the options, see applyMultilineDirective().
    static uint32_t translateFlags(RegexFlags flags);

private:
    uint match_limit;
};

} // namespace RegexCompat

#endif // __PCRE2_ENGINE_H__
