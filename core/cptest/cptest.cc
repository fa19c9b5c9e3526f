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

#include "cptest.h"

#include <iostream>

#include "debug.h"

using namespace std;

void
cptestPrepareToDie()
{
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    Debug::setNewDefaultStdout(&cerr);
}

CPTestDebugCapture::CPTestDebugCapture()
{
    Debug::setNewDefaultStdout(&output);
}

CPTestDebugCapture::~CPTestDebugCapture()
{
    Debug::setNewDefaultStdout(&cout);
}
