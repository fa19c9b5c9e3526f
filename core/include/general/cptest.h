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

#if !defined(__CP_TEST_H__)
#define __CP_TEST_H__

//
// CP definitions which are useful in many unit tests
//

#include <string>
#include <sstream>

#include "cptest/cptest_basic.h"
#include "cptest/cptest_maybe.h"
#include "tostring.h"

// Captures every debug message printed while the object is alive, and restores stdout when it is destroyed.
class CPTestDebugCapture
{
public:
    CPTestDebugCapture();
    ~CPTestDebugCapture();

    std::string getOutput() const { return output.str(); }
    void clear() { output.str(""); }

private:
    std::ostringstream output;
};

#endif // __CP_TEST_H__
