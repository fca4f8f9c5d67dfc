#pragma once

#include "sharding/shard_adapter.h"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

namespace sams::sharding {

// Upper bound on unfinished calls per adapter, abandoned ones included
constexpr size_t kMaxInFlightCalls = 64;

/**
 * One reserved in-flight slot of an adapter. Released exactly once, either
 * explicitly or on destruction.
 */
class InFlightSlot {
public:
    explicit InFlightSlot(std::atomic<size_t>& counter) : counter_(&counter) {}
    InFlightSlot(InFlightSlot&& other) noexcept : counter_(other.counter_) { other.counter_ = nullptr; }
    InFlightSlot(const InFlightSlot&) = delete;
    InFlightSlot& operator=(const InFlightSlot&) = delete;
    InFlightSlot& operator=(InFlightSlot&&) = delete;
    ~InFlightSlot() { release(); }

    void release() noexcept {
        if (counter_) {
            counter_->fetch_sub(1);
            counter_ = nullptr;
        }
    }

private:
    std::atomic<size_t>* counter_;
};

/**
 * Run one adapter call with a deadline.
 *
 * The call runs on a worker thread that shares ownership of the adapter, so
 * a backend that hangs past the deadline cannot outlive its adapter. The
 * callable is copied into the worker: capture arguments by value.
 *
 * A worker holds one of the adapter's in-flight slots until the call
 * returns. When all `max_in_flight` slots are taken the call is refused
 * without starting a thread.
 *
 * @throws AdapterError(TIMEOUT) if the call does not finish in time;
 *         AdapterError if the adapter has no free slot;
 *         otherwise rethrows whatever the call threw
 */
template<typename Fn>
auto callWithTimeout(const std::shared_ptr<ShardAdapter>& adapter,
                     std::chrono::milliseconds timeout,
                     const std::string& operation,
                     Fn fn,
                     size_t max_in_flight = kMaxInFlightCalls) -> std::invoke_result_t<Fn, ShardAdapter&> {
    using R = std::invoke_result_t<Fn, ShardAdapter&>;

    if (!adapter) {
        throw AdapterError("No adapter for " + operation);
    }

    auto& in_flight = adapter->inFlight();
    if (in_flight.fetch_add(1) >= max_in_flight) {
        in_flight.fetch_sub(1);
        throw AdapterError(operation + " refused: " + std::to_string(max_in_flight) +
                           " calls already in flight");
    }
    InFlightSlot slot(in_flight);

    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();

    std::thread([adapter, promise, fn = std::move(fn), slot = std::move(slot)]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                fn(*adapter);
                slot.release();
                promise->set_value();
            } else {
                R value = fn(*adapter);
                slot.release();
                promise->set_value(std::move(value));
            }
        } catch (...) {
            slot.release();
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        throw AdapterError(ErrorCode::TIMEOUT,
                           operation + " timed out after " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

} // namespace sams::sharding
