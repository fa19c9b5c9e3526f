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

#ifndef __DEBUG_EX_H__
#define __DEBUG_EX_H__

#include "debug.h"

enum class Debug::DebugFlags
{
    D_ALL,

#define DEFINE_FLAG(flag_name, parent_name) \
    flag_name,
#include "debug_flags.h"
#undef DEFINE_FLAG

    COUNT
};

class Debug::DebugStream
{
public:
    DebugStream(std::ostream *_stream) : stream(_stream) {}
    virtual ~DebugStream() {}

    virtual void
    printHeader(DebugLevel curr_level, const std::string &file_name, const std::string &func_name, uint line);

    virtual void finishMessage() { *stream << std::endl; }

    std::ostream * getStream() const { return stream; }

private:
    std::ostream *stream;
};

#endif // __DEBUG_EX_H__
