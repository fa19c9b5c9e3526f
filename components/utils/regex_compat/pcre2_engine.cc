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

#include "pcre2_engine.h"

#include <vector>

#include "debug.h"

using namespace std;

USE_DEBUG_FLAG(D_REGEX_PCRE2);

namespace RegexCompat
{

static string
getPcre2ErrorMessage(int error_code)
{
    PCRE2_UCHAR buffer[256];
    int length = pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    if (length < 0) return "Unknown PCRE2 error " + to_string(error_code);
    return string(reinterpret_cast<const char *>(buffer), length);
}

Pcre2CompiledForm::Pcre2CompiledForm(
    unique_ptr<pcre2_code, PCREDelete> &&_code,
    unique_ptr<pcre2_match_context, PCREContextDelete> &&_match_context)
        :
    code(move(_code)),
    match_context(move(_match_context))
{
    uint32_t capture_count = 0;
    pcre2_pattern_info(code.get(), PCRE2_INFO_CAPTURECOUNT, &capture_count);
    group_count = capture_count;
    loadGroupNames();
}

void
Pcre2CompiledForm::loadGroupNames()
{
    uint32_t name_count = 0;
    uint32_t entry_size = 0;
    PCRE2_SPTR name_table = nullptr;
    pcre2_pattern_info(code.get(), PCRE2_INFO_NAMECOUNT, &name_count);
    if (name_count == 0) return;

    pcre2_pattern_info(code.get(), PCRE2_INFO_NAMEENTRYSIZE, &entry_size);
    pcre2_pattern_info(code.get(), PCRE2_INFO_NAMETABLE, &name_table);

    // Each entry is a big endian group number followed by the zero terminated name
    PCRE2_SPTR entry = name_table;
    for (uint32_t i = 0; i < name_count; i++, entry += entry_size) {
        uint group_index = (entry[0] << 8) | entry[1];
        group_names[group_index] = string(reinterpret_cast<const char *>(entry + 2));
    }
}

Maybe<RegexMatch>
Pcre2CompiledForm::find(const string &text, size_t start_offset, bool anchored) const
{
    if (start_offset > text.size()) return genError("Start offset is beyond the end of the text");

    unique_ptr<pcre2_match_data, PCREResultDelete> match_data(
        pcre2_match_data_create_from_pattern(code.get(), nullptr)
    );
    if (match_data == nullptr) {
        dbgError(D_REGEX_PCRE2) << "Failed to allocate PCRE2 results container";
        return genError("Failed to allocate PCRE2 results container");
    }

    int result = pcre2_match(
        code.get(),
        reinterpret_cast<PCRE2_SPTR>(text.data()),
        text.size(),
        start_offset,
        anchored ? PCRE2_ANCHORED : 0,
        match_data.get(),
        match_context.get()
    );

    if (result == PCRE2_ERROR_NOMATCH) return genError("No match");
    if (result < 0) {
        string message = getPcre2ErrorMessage(result);
        dbgWarning(D_REGEX_PCRE2) << "Matching stopped with error " << result << ": " << message;
        return genError(message);
    }

    PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(match_data.get());
    uint ovector_pairs = pcre2_get_ovector_count(match_data.get());

    vector<RegexMatch::MatchGroup> groups;
    groups.reserve(group_count + 1);
    for (uint index = 0; index <= group_count; index++) {
        auto name = group_names.find(index);
        const string &group_name = name == group_names.end() ? "" : name->second;

        if (index >= ovector_pairs || ovector[2 * index] == PCRE2_UNSET) {
            groups.emplace_back(index, group_name);
            continue;
        }

        size_t start = ovector[2 * index];
        size_t end = ovector[2 * index + 1];
        // \K can report a match that ends before it starts
        if (end < start) end = start;
        groups.emplace_back(index, group_name, text.substr(start, end - start), start, end);
    }

    return RegexMatch(move(groups));
}

uint32_t
Pcre2Engine::translateFlags(RegexFlags flags)
{
    // $ only matches at the very end, as it does in the linear-time engine
    uint32_t options = PCRE2_UTF | PCRE2_UCP | PCRE2_MATCH_INVALID_UTF | PCRE2_DOLLAR_ENDONLY;
    if (flags & IGNORECASE) options |= PCRE2_CASELESS;
    if (flags & DOTALL)     options |= PCRE2_DOTALL;
    return options;
}

Maybe<unique_ptr<I_CompiledForm>, PatternSyntaxError>
Pcre2Engine::compile(const string &pattern, RegexFlags flags) const
{
    dbgTrace(D_REGEX_PCRE2) << "Compiling pattern " << dumpQuoted(pattern) << " with flags " << dumpFlags(flags);

    int error;
    PCRE2_SIZE error_offset;
    unique_ptr<pcre2_code, Pcre2CompiledForm::PCREDelete> code(
        pcre2_compile(
            reinterpret_cast<PCRE2_SPTR>(pattern.data()),
            pattern.size(),
            translateFlags(flags),
            &error,
            &error_offset,
            nullptr
        )
    );

    if (code == nullptr) {
        string message = getPcre2ErrorMessage(error);
        dbgDebug(D_REGEX_PCRE2)
            << "pcre2_compile failed: error ("
            << error
            << "), "
            << message
            << ", at offset "
            << error_offset
            << " in pattern "
            << dumpQuoted(pattern);
        return genError(PatternSyntaxError("", pattern, getName(), message, error_offset));
    }

    int jit_result = pcre2_jit_compile(code.get(), PCRE2_JIT_COMPLETE);
    if (jit_result < 0) {
        dbgDebug(D_REGEX_PCRE2)
            << "pcre2_jit_compile failed ("
            << getPcre2ErrorMessage(jit_result)
            << "), matching will use the interpreter";
    }

    unique_ptr<pcre2_match_context, Pcre2CompiledForm::PCREContextDelete> match_context;
    if (match_limit > 0) {
        match_context.reset(pcre2_match_context_create(nullptr));
        if (match_context == nullptr) {
            return genError(
                PatternSyntaxError("", pattern, getName(), "Failed to allocate PCRE2 match context")
            );
        }
        pcre2_set_match_limit(match_context.get(), match_limit);
    }

    unique_ptr<I_CompiledForm> compiled = make_unique<Pcre2CompiledForm>(move(code), move(match_context));
    return move(compiled);
}

} // namespace RegexCompat
