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

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace fmbind {

enum class ErrorKind
{
    kModelNotAvailable,  // probe returned false, or the backend reported the model as unavailable
    kGenerationError,    // any other failure reported by the backend
    kInvalidInput,       // rejected before crossing the boundary
    kInternalError,      // bridge invariant violated
    kPoisonError,        // shared state was left inconsistent by an exception while held
};

const char* to_string(ErrorKind kind);

/// Error surfaced by every consumer-facing call.
/// `message()` holds the raw detail (the backend's text for generation errors);
/// `what()` renders it for humans.
class Error : public std::runtime_error
{
  public:
    Error(ErrorKind kind, std::string message = {});

    ErrorKind kind() const noexcept
    {
        return m_kind;
    }

    const std::string& message() const noexcept
    {
        return m_message;
    }

  private:
    ErrorKind m_kind;
    std::string m_message;
};

// Maps a raw backend error string onto ModelNotAvailable or GenerationError.
// This is a substring heuristic; replace it if the backend grows structured error codes.
Error classify_foreign_error(const std::string& message);

// Returns an InvalidInput error if the prompt cannot be sent to the backend.
std::optional<Error> validate_prompt(const std::string& prompt);

}  // namespace fmbind
