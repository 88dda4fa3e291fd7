/*
 * Event channel - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace ideshell {

// Multi-producer / single-consumer queue a session publishes its events into.
// The producer closes it after the last event; next() then drains what is
// left and returns nullopt.
template <typename T>
class Channel {
public:
    // false if the channel was already closed (item dropped).
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_closed) return false;
            m_items.push_back(std::move(item));
        }
        m_cv.notify_all();
        return true;
    }

    void close() {
        { std::lock_guard<std::mutex> lk(m_mutex); m_closed = true; }
        m_cv.notify_all();
    }

    bool closed() const { std::lock_guard<std::mutex> lk(m_mutex); return m_closed; }

    // Blocks until an item is available or the channel is closed and empty.
    std::optional<T> next() {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv.wait(lk, [&]{ return !m_items.empty() || m_closed; });
        return pop_locked();
    }

    // Like next() but gives up after timeout (nullopt also when merely empty).
    template <typename Rep, typename Period>
    std::optional<T> next_for(std::chrono::duration<Rep,Period> timeout) {
        std::unique_lock<std::mutex> lk(m_mutex);
        m_cv.wait_for(lk, timeout, [&]{ return !m_items.empty() || m_closed; });
        return pop_locked();
    }

    std::optional<T> try_next() {
        std::lock_guard<std::mutex> lk(m_mutex);
        return pop_locked();
    }

    // Convenience for tests and batch consumers: everything until close.
    std::vector<T> collect() {
        std::vector<T> all;
        while (auto it = next()) all.push_back(std::move(*it));
        return all;
    }

    // True once closed and fully consumed.
    bool exhausted() const { std::lock_guard<std::mutex> lk(m_mutex); return m_closed && m_items.empty(); }

private:
    std::optional<T> pop_locked() {
        if (m_items.empty()) return std::nullopt;
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_items;
    bool m_closed = false;
};

// Handed to the consumer of a session's events; cancels whatever operation
// feeds the channel. Safe to call more than once.
class CancelHandle {
public:
    CancelHandle() = default;
    explicit CancelHandle(std::function<bool()> fn) : m_fn(std::move(fn)) {}
    bool cancel() const { return m_fn ? m_fn() : false; }
    explicit operator bool() const { return static_cast<bool>(m_fn); }
private:
    std::function<bool()> m_fn;
};

} // namespace ideshell
