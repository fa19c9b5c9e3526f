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

#ifndef __COMMON_H__
#define __COMMON_H__

#define CP_LIKELY(cond)    __builtin_expect((bool)(cond), 1)

#include <memory>
#include <string>
#include <sstream>
#include <utility>
#include <cctype>
#include <sys/types.h>

namespace std
{

#if __cplusplus < 201402L

template<typename ConstructedType, typename... Args>
unique_ptr<ConstructedType>
make_unique(Args&&... args)
{
    return unique_ptr<ConstructedType>(new ConstructedType(forward<Args>(args)...));
}

#endif // __cplusplus < 201402L

template <typename Iterable>
string
makeSeparatedStr(const Iterable &data, const string &separator)
{
    ostringstream os;
    bool not_first = false;
    for (const auto &element : data) {
        if (not_first) os << separator;
        os << element;
        not_first = true;
    }
    return os.str();
}

// Printable form of a pattern or subject: non-printable bytes become \xNN, a quote or backslash is escaped.
// Bytes of multi-byte UTF-8 sequences are kept as they are.
template <typename CharIterable>
string
dumpQuoted(const CharIterable &arg, char quote = '\'')
{
    ostringstream stream;
    stream << quote;
    for (uint8_t ch : arg) {
        if (ch == '\\' || ch == static_cast<uint8_t>(quote)) {
            stream << '\\' << ch;
        } else if (ch >= 0x80 || (isprint(ch) && (!isspace(ch) || ch == ' '))) {
            stream << ch;
        } else {
            static const char hex_digits[] = "0123456789abcdef";
            stream << "\\x" << hex_digits[ch >> 4] << hex_digits[ch & 0xf];
        }
    }
    stream << quote;
    return stream.str();
}

} // namespace std

#endif // __COMMON_H__
