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

#include "api/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace fmbind::detail {

namespace {

std::shared_ptr<spdlog::logger> fmbind_logger()
{
    static std::once_flag installed;
    std::call_once(installed, [] {
        auto logger = spdlog::get("fmbind");
        if (!logger)
        {
            logger = spdlog::stdout_color_mt("fmbind");
        }
        spdlog::set_default_logger(logger);
    });
    return spdlog::get("fmbind");
}

}  // namespace

spdlog::level::level_enum parse_log_level(const std::string& log_level)
{
    if (log_level == "error")
    {
        return spdlog::level::err;
    }
    else if (log_level == "warn")
    {
        return spdlog::level::warn;
    }
    else if (log_level == "info")
    {
        return spdlog::level::info;
    }
    else if (log_level == "debug")
    {
        return spdlog::level::debug;
    }
    else if (log_level == "trace")
    {
        return spdlog::level::trace;
    }
    return spdlog::level::err;
}

void configure_logging(const std::string& log_level)
{
    auto level  = parse_log_level(log_level);
    auto logger = fmbind_logger();

    // only our logger: other loggers in the host process keep their own levels
    if (logger)
    {
        logger->set_level(level);
    }
}

}  // namespace fmbind::detail
