#pragma once

#include <functional>
#include <future>
#include <optional>
#include <utility>

namespace ms::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Optional future for reporting completion
    virtual std::optional<std::future<void>> getFuture() { return std::nullopt; }
};

// Runs a callable and fulfils its promise, forwarding whatever the callable threw.
struct PromisedTask : Task {
    std::function<void()> fn;
    std::promise<void> promise;

    explicit PromisedTask(std::function<void()> f) : fn(std::move(f)) {}

    std::optional<std::future<void>> getFuture() override { return promise.get_future(); }

    void operator()() override {
        try {
            fn();
            promise.set_value();
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
