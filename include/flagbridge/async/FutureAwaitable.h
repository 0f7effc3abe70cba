//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// Copyright (c) 2026 flagbridge contributors
// File: FutureAwaitable.h
// Purpose: co_await support for the std::future values returned by IRemoteClient
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <utility>

namespace flagbridge {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: Suspends a Task until an Unleash call finishes.
// Notes:
//   - Futures that are already resolved (dry-run simulations, test stubs, cached reads) continue
//     inline without a thread.
//   - Otherwise one detached thread waits for the HTTP exchange and resumes the coroutine on it.
//   - RemoteApiError and transport failures are rethrown at the co_await.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : pending(std::move(f)) {}

    bool await_ready() const noexcept { return isResolved(); }

    // Returning false resumes immediately when the future resolved between await_ready and here.
    bool await_suspend(std::coroutine_handle<> coroutine) {
        if (isResolved()) {
            return false;
        }
        std::thread([this, coroutine]() {
            pending.wait();
            coroutine.resume();
        }).detach();
        return true;
    }

    T await_resume() { return pending.get(); }

private:
    bool isResolved() const { return pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }

    std::future<T> pending;
};

template <typename T>
FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace flagbridge
