//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: Task.h
// Purpose: Coroutine return type for tool bodies, resource readers and UnleashClient continuations
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace flagbridge {
namespace async {

//==========================================================================================================
// Task<T>
// Purpose: Lets a tool or resource reader be written as straight-line co_await code over IRemoteClient
//          futures while still handing ToolHandler / ResourceReader the std::future they expect.
// Notes:
//   - The body starts running on the calling thread and continues on whichever thread completed the
//     awaited remote future.
//   - Anything thrown in the body (RemoteApiError, InvalidInputError, ...) lands in the future, where
//     ToolDispatcher and the resources/read handler normalize it.
//   - Every Task in this code base produces a value (CallToolResult or JSONValue); there is no Task<void>.
//==========================================================================================================
template <typename T>
class Task {
public:
    struct promise_type {
        std::promise<T> result;

        Task get_return_object() { return Task{result.get_future()}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { result.set_exception(std::current_exception()); }

        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& value) { result.set_value(std::forward<U>(value)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Valid once; the Task is empty afterwards.
    std::future<T> toFuture() { return std::move(outcome); }

private:
    explicit Task(std::future<T> f) : outcome(std::move(f)) {}

    std::future<T> outcome;
};

} // namespace async
} // namespace flagbridge
