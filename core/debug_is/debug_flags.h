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

// Flag hierarchy: DEFINE_FLAG(flag, parent). A parent must be declared before its children.

DEFINE_FLAG(D_REGEX_COMPAT, D_ALL)
    DEFINE_FLAG(D_REGEX_NORMALIZER, D_REGEX_COMPAT)
    DEFINE_FLAG(D_REGEX_FLAGS, D_REGEX_COMPAT)
    DEFINE_FLAG(D_REGEX_ENGINE_SELECTOR, D_REGEX_COMPAT)
    DEFINE_FLAG(D_REGEX_RE2, D_REGEX_COMPAT)
    DEFINE_FLAG(D_REGEX_PCRE2, D_REGEX_COMPAT)
