// SPDX-FileCopyrightText: Copyright (c) 2024-2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Stand-in for the on-device model backend on hosts that do not ship one.
// Every generation fails through the normal error path so callers see ModelNotAvailable.
#include "fmbind/fm_ffi.h"

extern "C" {

static const char* const kStubUnavailable = "Foundation model not available on this platform";

bool fm_check_availability(void)
{
    return false;
}

void fm_response(const char* prompt,
                 void* user_data,
                 fm_chunk_callback_t on_chunk,
                 fm_done_callback_t on_done,
                 fm_error_callback_t on_error)
{
    (void)prompt;
    (void)on_chunk;
    (void)on_done;
    if (on_error != nullptr)
    {
        on_error(kStubUnavailable, user_data);
    }
}

void fm_start_stream(const char* prompt,
                     void* user_data,
                     fm_chunk_callback_t on_chunk,
                     fm_done_callback_t on_done,
                     fm_error_callback_t on_error)
{
    (void)prompt;
    (void)on_chunk;
    (void)on_done;
    if (on_error != nullptr)
    {
        on_error(kStubUnavailable, user_data);
    }
}

void fm_stop_stream(void) {}
}
