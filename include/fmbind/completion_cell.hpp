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

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace fmbind {

/// Single-assignment synchronized cell used to turn a terminal callback into a blocking wait.
///
/// The cell is shared between the calling thread, which blocks in `wait()`, and the
/// backend's invocation thread, which mutates the payload through `update()` and then
/// settles the cell exactly once through `fulfill()`. Everything written before
/// `fulfill()` is visible to the waiter once `wait()` returns.
///
/// If a mutation throws while the lock is held the cell is poisoned. Poisoning does not
/// release the waiter: it keeps blocking until `fulfill()` settles the cell, so the
/// terminal callback has reclaimed its boundary state before the caller returns. After
/// that `wait()` reports ErrorKind::kPoisonError, as do `update()` and `fulfill()`.
template <typename T>
class CompletionCell
{
  public:
    struct Outcome
    {
        T payload;
        std::optional<std::string> error;
    };

    CompletionCell() = default;
    explicit CompletionCell(T initial) : m_payload(std::move(initial)) {}

    CompletionCell(const CompletionCell&)            = delete;
    CompletionCell& operator=(const CompletionCell&) = delete;

    static std::shared_ptr<CompletionCell> create()
    {
        return std::make_shared<CompletionCell>();
    }

    /// Applies `fn` to the payload under the lock.
    /// Returns false, without calling `fn`, once the cell has been fulfilled.
    template <typename Fn>
    bool update(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        throw_if_poisoned();
        if (m_finished)
        {
            return false;
        }
        try
        {
            std::forward<Fn>(fn)(m_payload);
        } catch (const std::exception& e)
        {
            poison(e.what());
            throw;
        } catch (...)
        {
            poison("non-standard exception");
            throw;
        }
        return true;
    }

    /// Settles the cell and wakes every waiter.
    /// Returns true for the single transition to finished; later calls change nothing.
    /// On a poisoned cell the first call still settles it, then throws kPoisonError.
    bool fulfill(std::optional<std::string> error = std::nullopt)
    {
        std::optional<std::string> poison_reason;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_finished)
            {
                throw_if_poisoned();
                return false;
            }
            m_finished = true;
            if (m_poisoned)
            {
                poison_reason = m_poison_reason;
            }
            else
            {
                m_error = std::move(error);
            }
        }
        m_cv.notify_all();
        if (poison_reason)
        {
            throw Error(ErrorKind::kPoisonError, *poison_reason);
        }
        return true;
    }

    /// Blocks until the cell is fulfilled, then moves the outcome out.
    Outcome wait()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_finished; });
        throw_if_poisoned();
        return Outcome{std::move(m_payload), std::move(m_error)};
    }

    bool is_finished() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_finished;
    }

  private:
    // requires m_mutex
    void throw_if_poisoned() const
    {
        if (m_poisoned)
        {
            throw Error(ErrorKind::kPoisonError, m_poison_reason);
        }
    }

    // requires m_mutex
    void poison(std::string reason)
    {
        m_poisoned      = true;
        m_poison_reason = std::move(reason);
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    T m_payload{};
    std::optional<std::string> m_error;
    bool m_finished = false;
    bool m_poisoned = false;
    std::string m_poison_reason;
};

}  // namespace fmbind
