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

#ifndef __MOCK_PATTERN_ENGINE_H__
#define __MOCK_PATTERN_ENGINE_H__

#include "i_pattern_engine.h"
#include "cptest.h"

namespace RegexCompat
{

// Mocked calls print their results, and printing a Maybe prints its value
inline std::ostream &
operator<<(std::ostream &os, const std::unique_ptr<I_CompiledForm> &form)
{
    return os << "unique_ptr<I_CompiledForm>(" << form.get() << ")";
}

} // namespace RegexCompat

class MockPatternEngine : public RegexCompat::I_PatternEngine
{
public:
    using CompileResult = Maybe<std::unique_ptr<RegexCompat::I_CompiledForm>, RegexCompat::PatternSyntaxError>;

    MOCK_CONST_METHOD0(getType, RegexCompat::RegexEngineType());
    MOCK_CONST_METHOD0(getName, std::string());
    MOCK_CONST_METHOD2(compile, CompileResult(const std::string &, RegexCompat::RegexFlags));
};

#endif // __MOCK_PATTERN_ENGINE_H__
