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

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "fmbind/error.hpp"
#include "fmbind/session.hpp"
#include "session_fixture.hpp"

using fmbind::Error;
using fmbind::ErrorKind;
using fmbind::LanguageModelSession;
using fmbind::SessionConfig;
using fmbind::testing::Script;
using fmbind::testing::SessionTest;
using fmbind::testing::terminal_ordering_name;
using fmbind::testing::terminal_orderings;
using fmbind::testing::TerminalOrdering;

namespace {

ErrorKind kind_of_response_failure(const LanguageModelSession& session, const std::string& prompt)
{
    try
    {
        session.response(prompt);
    } catch (const Error& e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "response(\"" << prompt << "\") was expected to throw";
    return ErrorKind::kInternalError;
}

}  // namespace

// =============================================================================
// SESSION CREATION
// =============================================================================

TEST_F(SessionTest, CreationFailsWhenProbeFails)
{
    Script script;
    script.available = false;
    backend().load(script);

    try
    {
        LanguageModelSession session;
        FAIL() << "session must not exist without a successful probe";
    } catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::kModelNotAvailable);
    }
}

TEST_F(SessionTest, CreationFromJsonConfig)
{
    LanguageModelSession session(std::string(R"({"log_level": "error", "probe_before_generate": true})"));
    EXPECT_TRUE(session.config().probe_before_generate);
    EXPECT_TRUE(LanguageModelSession::is_available());
}

TEST_F(SessionTest, SessionsAreCopyable)
{
    LanguageModelSession session;
    LanguageModelSession copy = session;

    Script script;
    script.chunks = {"ok"};
    backend().load(script);

    EXPECT_EQ(copy.response("hi"), "ok");
}

// =============================================================================
// BLOCKING RESPONSE
// =============================================================================

TEST_F(SessionTest, ResponseAssemblesChunksInOrder)
{
    LanguageModelSession session;

    Script script;
    script.chunks = {"Hel", "lo", "!"};
    backend().load(script);

    EXPECT_EQ(session.response("Say hello"), "Hello!");
    EXPECT_EQ(backend().response_calls(), 1);
    EXPECT_EQ(backend().last_prompt(), "Say hello");
}

TEST_F(SessionTest, ResponseWithoutChunksIsEmptySuccess)
{
    LanguageModelSession session;
    backend().load(Script{});

    EXPECT_EQ(session.response("Say nothing"), "");
}

TEST_F(SessionTest, EmptyPromptFailsWithoutCrossingTheBoundary)
{
    LanguageModelSession session;

    EXPECT_EQ(kind_of_response_failure(session, ""), ErrorKind::kInvalidInput);
    EXPECT_EQ(backend().response_calls(), 0);
}

TEST_F(SessionTest, PromptWithNullByteFailsWithoutCrossingTheBoundary)
{
    LanguageModelSession session;

    EXPECT_EQ(kind_of_response_failure(session, std::string("a\0b", 3)), ErrorKind::kInvalidInput);
    EXPECT_EQ(backend().response_calls(), 0);
}

TEST_F(SessionTest, AvailabilityErrorAfterChunkDiscardsPartialText)
{
    LanguageModelSession session;

    Script script;
    script.chunks = {"Par"};
    script.error  = "not available";
    backend().load(script);

    try
    {
        session.response("Tell me something");
        FAIL() << "expected ModelNotAvailable";
    } catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::kModelNotAvailable);
        EXPECT_EQ(e.message().find("Par"), std::string::npos);
    }
}

TEST_F(SessionTest, OtherBackendErrorsAreGenerationErrors)
{
    LanguageModelSession session;

    Script script;
    script.error = "Generation error: guardrail violation";
    backend().load(script);

    try
    {
        session.response("Tell me something");
        FAIL() << "expected GenerationError";
    } catch (const Error& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::kGenerationError);
        EXPECT_EQ(e.message(), "Generation error: guardrail violation");
    }
}

TEST_F(SessionTest, NullErrorMessageStillTerminates)
{
    LanguageModelSession session;

    Script script;
    script.null_error = true;
    backend().load(script);

    EXPECT_EQ(kind_of_response_failure(session, "prompt"), ErrorKind::kGenerationError);
}

TEST_F(SessionTest, NullChunkIsIgnored)
{
    LanguageModelSession session;

    Script script;
    script.null_chunk = true;
    script.chunks     = {"a", "b"};
    backend().load(script);

    EXPECT_EQ(session.response("prompt"), "ab");
}

TEST_F(SessionTest, ResponseWhenCallbacksOutliveTheEntryPoint)
{
    LanguageModelSession session;

    Script script;
    script.chunks                 = {"late ", "but ", "complete"};
    script.return_before_delivery = true;
    backend().load(script);

    EXPECT_EQ(session.response("prompt"), "late but complete");
}

TEST_F(SessionTest, InvalidUtf8ChunksAreDecodedLossily)
{
    LanguageModelSession session;

    Script script;
    script.chunks = {"caf\xC3", "!"};
    backend().load(script);

    EXPECT_EQ(session.response("prompt"), "caf\xEF\xBF\xBD!");
}

TEST_F(SessionTest, ProbeBeforeGenerateFailsFastWhenAvailabilityFlips)
{
    SessionConfig config;
    config.probe_before_generate = true;
    LanguageModelSession session(config);

    Script script;
    script.available = false;
    backend().load(script);

    EXPECT_EQ(kind_of_response_failure(session, "prompt"), ErrorKind::kModelNotAvailable);
    EXPECT_EQ(backend().response_calls(), 0);
}

TEST_F(SessionTest, WithoutProbeBeforeGenerateTheBackendDecides)
{
    LanguageModelSession session;

    Script script;
    script.available = false;
    script.error     = "Generation error: model not available";
    backend().load(script);

    EXPECT_EQ(kind_of_response_failure(session, "prompt"), ErrorKind::kModelNotAvailable);
    EXPECT_EQ(backend().response_calls(), 1);
}

TEST_F(SessionTest, ConcurrentResponsesDoNotMixText)
{
    LanguageModelSession session;

    Script script;
    script.echo_chunks            = 5;
    script.return_before_delivery = true;
    backend().load(script);

    std::vector<std::string> results(8);
    std::vector<std::thread> callers;
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        callers.emplace_back([&session, &results, i] { results[i] = session.response("p" + std::to_string(i)); });
    }
    for (auto& caller : callers)
    {
        caller.join();
    }

    for (std::size_t i = 0; i < results.size(); ++i)
    {
        auto p = "p" + std::to_string(i);
        EXPECT_EQ(results[i], p + ":0" + p + ":1" + p + ":2" + p + ":3" + p + ":4");
    }
}

// =============================================================================
// BOUNDARY SAFETY
// =============================================================================

class TerminalOrderingTest : public SessionTest, public ::testing::WithParamInterface<TerminalOrdering>
{};

TEST_P(TerminalOrderingTest, HandleIsReclaimedExactlyOnce)
{
    LanguageModelSession session;
    backend().load(GetParam().script);

    if (GetParam().expect_success)
    {
        EXPECT_EQ(session.response("prompt"), "xy");
    }
    else
    {
        EXPECT_THROW(session.response("prompt"), Error);
    }

    // the fixture teardown asserts nothing is left in the handle table
    backend().join_deliveries();
    EXPECT_EQ(fmbind::detail::live_boundary_handles(), 0u);
}

INSTANTIATE_TEST_SUITE_P(Orderings,
                         TerminalOrderingTest,
                         ::testing::ValuesIn(terminal_orderings()),
                         terminal_ordering_name);
