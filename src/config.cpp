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
#include "fmbind/session.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

namespace fmbind {

// Custom to_json function
inline void to_json(json& j, const SessionConfig& c)
{
    j = json{{"log_level", c.log_level}, {"probe_before_generate", c.probe_before_generate}};
}

// Custom from_json function
inline void from_json(const json& j, SessionConfig& c)
{
    j.at("log_level").get_to(c.log_level);

    if (j.contains("probe_before_generate"))
    {
        c.probe_before_generate = j.at("probe_before_generate").get<bool>();
    }
    else
    {
        c.probe_before_generate = false;
    }
}

SessionConfig SessionConfig::from_json(const std::string& config_json)
{
    try
    {
        return json::parse(config_json).get<SessionConfig>();
    } catch (const json::exception& e)
    {
        throw Error(ErrorKind::kInvalidInput, std::string("invalid session config: ") + e.what());
    }
}

std::string SessionConfig::to_json() const
{
    return json(*this).dump();
}

}  // namespace fmbind
