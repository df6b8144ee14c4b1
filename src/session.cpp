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

// Public API for the session
#include "fmbind/completion_cell.hpp"
#include "fmbind/error.hpp"
#include "fmbind/fm_ffi.h"
#include "fmbind/session.hpp"

// Internal Private Implementation
#include "api/boundary.hpp"
#include "api/logging.hpp"
#include "api/text.hpp"

// Third-party
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace fmbind {

namespace detail {

// Binding for response(): the accumulator lives inside the cell
struct ResponseBinding
{
    std::shared_ptr<CompletionCell<std::string>> cell;
};

// Binding for stream_response(): the cell counts chunks, the sink is the accumulator
struct StreamBinding
{
    std::shared_ptr<CompletionCell<std::size_t>> cell;
    StreamSink sink;
};

using ResponseHandles = HandleTable<ResponseBinding>;
using StreamHandles   = HandleTable<StreamBinding>;

std::string foreign_error_message(const char* error)
{
    if (error == nullptr)
    {
        spdlog::warn("error callback received a null message");
        return "unknown error";
    }
    return copy_foreign_text(error);
}

// Settles the cell of a reclaimed binding; nothing may escape into the backend.
template <typename Cell>
void settle(const char* which, Cell& cell, std::optional<std::string> error)
{
    try
    {
        if (!cell.fulfill(std::move(error)))
        {
            spdlog::warn("{}: cell was already settled", which);
        }
    } catch (const std::exception& e)
    {
        spdlog::error("{}: {}", which, e.what());
    }
}

std::size_t live_boundary_handles()
{
    return ResponseHandles::instance().live_count() + StreamHandles::instance().live_count();
}

}  // namespace detail

// C callbacks for response()

extern "C" {

static void fmbind_response_chunk(const char* chunk, void* user_data)
{
    if (chunk == nullptr || user_data == nullptr)
    {
        spdlog::warn("response chunk callback: null pointer ignored");
        return;
    }

    auto binding = detail::ResponseHandles::instance().borrow(user_data);
    if (!binding)
    {
        spdlog::warn("response chunk callback: handle already reclaimed; chunk dropped");
        return;
    }

    try
    {
        auto text = detail::copy_foreign_text(chunk);
        binding->cell->update([&text](std::string& accumulated) { accumulated.append(text); });
    } catch (const std::exception& e)
    {
        spdlog::error("response chunk callback: {}", e.what());
    }
}

static void fmbind_response_done(void* user_data)
{
    if (user_data == nullptr)
    {
        spdlog::warn("response done callback: null context ignored");
        return;
    }

    auto binding = detail::ResponseHandles::instance().reclaim(user_data);
    if (!binding)
    {
        spdlog::warn("response done callback: duplicate terminal callback ignored");
        return;
    }
    spdlog::trace("response done");
    detail::settle("response done callback", *binding->cell, std::nullopt);
}

static void fmbind_response_error(const char* error, void* user_data)
{
    if (user_data == nullptr)
    {
        spdlog::warn("response error callback: null context ignored");
        return;
    }

    auto binding = detail::ResponseHandles::instance().reclaim(user_data);
    if (!binding)
    {
        spdlog::warn("response error callback: duplicate terminal callback ignored");
        return;
    }

    try
    {
        auto message = detail::foreign_error_message(error);
        spdlog::trace("response error: {}", message);
        detail::settle("response error callback", *binding->cell, std::move(message));
    } catch (const std::exception& e)
    {
        // copying the message failed; the waiter must still be released
        spdlog::error("response error callback: {}", e.what());
        detail::settle("response error callback", *binding->cell, std::string("unknown error"));
    }
}

// C callbacks for stream_response()

static void fmbind_stream_chunk(const char* chunk, void* user_data)
{
    if (chunk == nullptr || user_data == nullptr)
    {
        spdlog::warn("stream chunk callback: null pointer ignored");
        return;
    }

    auto binding = detail::StreamHandles::instance().borrow(user_data);
    if (!binding)
    {
        spdlog::warn("stream chunk callback: handle already reclaimed; chunk dropped");
        return;
    }

    try
    {
        auto text = detail::copy_foreign_text(chunk);
        // running the sink under the cell lock keeps deliveries for one call sequential
        binding->cell->update([&](std::size_t& delivered) {
            binding->sink(text);
            ++delivered;
        });
    } catch (const Error& e)
    {
        if (e.kind() != ErrorKind::kPoisonError)
        {
            spdlog::error("stream chunk callback: {}", e.what());
            fm_stop_stream();
            return;
        }
        spdlog::debug("stream chunk callback: call already failed; chunk dropped");
    } catch (const std::exception& e)
    {
        // the sink failed: nothing more can be delivered, so have the backend wind down
        spdlog::error("stream chunk callback: {}", e.what());
        fm_stop_stream();
    }
}

static void fmbind_stream_done(void* user_data)
{
    if (user_data == nullptr)
    {
        spdlog::warn("stream done callback: null context ignored");
        return;
    }

    auto binding = detail::StreamHandles::instance().reclaim(user_data);
    if (!binding)
    {
        spdlog::warn("stream done callback: duplicate terminal callback ignored");
        return;
    }
    spdlog::trace("stream done");
    detail::settle("stream done callback", *binding->cell, std::nullopt);
}

static void fmbind_stream_error(const char* error, void* user_data)
{
    if (user_data == nullptr)
    {
        spdlog::warn("stream error callback: null context ignored");
        return;
    }

    auto binding = detail::StreamHandles::instance().reclaim(user_data);
    if (!binding)
    {
        spdlog::warn("stream error callback: duplicate terminal callback ignored");
        return;
    }

    try
    {
        auto message = detail::foreign_error_message(error);
        spdlog::trace("stream error: {}", message);
        detail::settle("stream error callback", *binding->cell, std::move(message));
    } catch (const std::exception& e)
    {
        spdlog::error("stream error callback: {}", e.what());
        detail::settle("stream error callback", *binding->cell, std::string("unknown error"));
    }
}

}  // extern "C"

// Public Session Impl

LanguageModelSession::LanguageModelSession(SessionConfig config) : m_config(std::move(config))
{
    detail::configure_logging(m_config.log_level);

    if (!is_available())
    {
        spdlog::debug("availability probe failed; session not created");
        throw Error(ErrorKind::kModelNotAvailable);
    }
    spdlog::debug("session created");
}

LanguageModelSession::LanguageModelSession(const std::string& config_json) :
  LanguageModelSession(SessionConfig::from_json(config_json))
{}

bool LanguageModelSession::is_available()
{
    return fm_check_availability();
}

void LanguageModelSession::check_available() const
{
    if (m_config.probe_before_generate && !is_available())
    {
        spdlog::debug("availability probe failed before generation");
        throw Error(ErrorKind::kModelNotAvailable);
    }
}

std::string LanguageModelSession::response(const std::string& prompt) const
{
    if (auto invalid = validate_prompt(prompt))
    {
        throw *invalid;
    }
    check_available();

    auto cell    = CompletionCell<std::string>::create();
    auto binding = std::make_unique<detail::ResponseBinding>(detail::ResponseBinding{cell});

    spdlog::trace("response - prompt bytes: {}", prompt.size());

    // from here until a terminal callback the binding belongs to the backend
    void* context = detail::ResponseHandles::instance().release(std::move(binding));
    fm_response(prompt.c_str(),
                context,
                fmbind_response_chunk,
                fmbind_response_done,
                fmbind_response_error);

    auto outcome = cell->wait();
    if (outcome.error)
    {
        spdlog::trace("response failed after {} bytes; partial text discarded", outcome.payload.size());
        throw classify_foreign_error(*outcome.error);
    }

    spdlog::trace("response complete - {} bytes", outcome.payload.size());
    return std::move(outcome.payload);
}

void LanguageModelSession::stream_response(const std::string& prompt, StreamSink sink) const
{
    if (auto invalid = validate_prompt(prompt))
    {
        throw *invalid;
    }
    if (!sink)
    {
        throw Error(ErrorKind::kInvalidInput, "Stream sink cannot be empty");
    }
    check_available();

    auto cell    = CompletionCell<std::size_t>::create();
    auto binding = std::make_unique<detail::StreamBinding>(detail::StreamBinding{cell, std::move(sink)});

    spdlog::trace("stream_response - prompt bytes: {}", prompt.size());

    void* context = detail::StreamHandles::instance().release(std::move(binding));
    fm_start_stream(prompt.c_str(), context, fmbind_stream_chunk, fmbind_stream_done, fmbind_stream_error);

    auto outcome = cell->wait();
    if (outcome.error)
    {
        spdlog::trace("stream failed after {} chunks", outcome.payload);
        throw classify_foreign_error(*outcome.error);
    }
    spdlog::trace("stream complete - {} chunks", outcome.payload);
}

void LanguageModelSession::cancel_stream() const
{
    spdlog::debug("cancel_stream requested");
    fm_stop_stream();
}

}  // namespace fmbind
