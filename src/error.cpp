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

#include "fmbind/error.hpp"

#include <string>
#include <utility>

namespace fmbind {

namespace {

// Substring the backend uses when the model cannot serve the request
constexpr const char* kUnavailableMarker = "not available";

std::string render(ErrorKind kind, const std::string& message)
{
    switch (kind)
    {
        case ErrorKind::kModelNotAvailable:
            return "Foundation model not available. Enable the on-device model in system settings.";
        case ErrorKind::kGenerationError:
            return "Generation error: " + message;
        case ErrorKind::kInvalidInput:
            return "Invalid input: " + message;
        case ErrorKind::kInternalError:
            return "Internal error: " + message;
        case ErrorKind::kPoisonError:
            if (message.empty())
            {
                return "Synchronization state poisoned by an exception while it was held";
            }
            return "Synchronization state poisoned by an exception while it was held: " + message;
    }
    return message;
}

}  // namespace

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::kModelNotAvailable:
            return "ModelNotAvailable";
        case ErrorKind::kGenerationError:
            return "GenerationError";
        case ErrorKind::kInvalidInput:
            return "InvalidInput";
        case ErrorKind::kInternalError:
            return "InternalError";
        case ErrorKind::kPoisonError:
            return "PoisonError";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, std::string message) :
  std::runtime_error(render(kind, message)),
  m_kind(kind),
  m_message(std::move(message))
{}

Error classify_foreign_error(const std::string& message)
{
    if (message.find(kUnavailableMarker) != std::string::npos)
    {
        return Error(ErrorKind::kModelNotAvailable, message);
    }
    return Error(ErrorKind::kGenerationError, message);
}

std::optional<Error> validate_prompt(const std::string& prompt)
{
    if (prompt.empty())
    {
        return Error(ErrorKind::kInvalidInput, "Prompt cannot be empty");
    }
    // the backend receives a C string; an embedded terminator would truncate it
    if (prompt.find('\0') != std::string::npos)
    {
        return Error(ErrorKind::kInvalidInput, "Prompt contains null byte");
    }
    return std::nullopt;
}

}  // namespace fmbind
