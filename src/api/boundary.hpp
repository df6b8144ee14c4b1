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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace fmbind::detail {

/// Owns the per-call bindings while they are on the far side of the C boundary.
///
/// `release()` moves a binding into the table and returns the opaque context handed to
/// the backend. The chunk callback `borrow()`s it; exactly one terminal callback
/// `reclaim()`s it. Tokens are never reused, so a duplicate terminal callback or a chunk
/// that arrives after the terminal one finds nothing and is ignored instead of touching
/// freed memory.
template <typename Binding>
class HandleTable
{
  public:
    static HandleTable& instance()
    {
        static HandleTable table;
        return table;
    }

    void* release(std::unique_ptr<Binding> binding)
    {
        auto token = m_next_token.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_live.emplace(token, std::shared_ptr<Binding>(std::move(binding)));
        return reinterpret_cast<void*>(token);
    }

    /// Shared access for the chunk callback; ownership stays in the table.
    std::shared_ptr<Binding> borrow(void* context) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_live.find(to_token(context));
        if (it == m_live.end())
        {
            return nullptr;
        }
        return it->second;
    }

    /// Takes ownership back; returns null if the handle was already reclaimed.
    std::shared_ptr<Binding> reclaim(void* context)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_live.find(to_token(context));
        if (it == m_live.end())
        {
            return nullptr;
        }
        auto binding = std::move(it->second);
        m_live.erase(it);
        return binding;
    }

    std::size_t live_count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_live.size();
    }

  private:
    HandleTable() = default;

    static std::uintptr_t to_token(void* context)
    {
        return reinterpret_cast<std::uintptr_t>(context);
    }

    // token 0 would be indistinguishable from a null context
    std::atomic<std::uintptr_t> m_next_token{1};
    mutable std::mutex m_mutex;
    std::unordered_map<std::uintptr_t, std::shared_ptr<Binding>> m_live;
};

// Handles currently held by the backend, summed over both bridges
std::size_t live_boundary_handles();

}  // namespace fmbind::detail
