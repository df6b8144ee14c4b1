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

#include "fmbind/error.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace fmbind {

struct SessionConfig
{
    // error | warn | info | debug | trace; anything else means error
    std::string log_level = "error";

    // re-run the availability probe before every generation call
    bool probe_before_generate = false;

    static SessionConfig from_json(const std::string& config_json);
    std::string to_json() const;
};

/// Receives each text delta of a streamed response, on the backend's thread.
/// Must not block indefinitely and must not call back into the same session call.
using StreamSink = std::function<void(std::string_view)>;

/// Capability token for the on-device language model.
///
/// Constructing a session proves that the availability probe succeeded at that instant.
/// Availability can change afterwards, so every generation call can still fail with
/// ErrorKind::kModelNotAvailable. Sessions are cheap to copy and carry no per-call state.
class LanguageModelSession
{
  public:
    // throws Error(kModelNotAvailable) if the probe fails
    explicit LanguageModelSession(SessionConfig config = {});

    // accepts a JSON document understood by SessionConfig::from_json
    explicit LanguageModelSession(const std::string& config_json);

    /// Generates a complete response, blocking until the backend finishes.
    /// An empty string is a valid result. Partial text is discarded on error.
    std::string response(const std::string& prompt) const;

    /// Generates a response, forwarding each delta to `sink` as it arrives, and blocks
    /// until the backend finishes. On error the sink may already have seen some chunks.
    void stream_response(const std::string& prompt, StreamSink sink) const;

    /// Asks the backend to stop the current stream.
    /// The signal is global: with concurrent streams there is no way to pick which one
    /// stops. Safe to call from any thread, including when no stream is active.
    void cancel_stream() const;

    const SessionConfig& config() const
    {
        return m_config;
    }

    // raw availability probe; does not require a session
    static bool is_available();

  private:
    void check_available() const;

    SessionConfig m_config;
};

}  // namespace fmbind
