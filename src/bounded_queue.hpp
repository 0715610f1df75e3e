#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <cstddef>
#include <condition_variable>

namespace voipcap {

// Fixed-capacity channel. push() blocks while full, pop() blocks while
// empty and returns nullopt once the queue is closed and drained.
template <typename T>
class BoundedQueue {

public:
explicit BoundedQueue(size_t capacity) : _capacity(capacity) {}

// False when the queue was closed before the item could be queued.
bool push(T item)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _not_full.wait(lock, [&]() { return _closed || _items.size() < _capacity; });
    if (_closed) {
        return false;
    }
    _items.push_back(std::move(item));
    _not_empty.notify_one();
    return true;
}

std::optional<T> pop()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _not_empty.wait(lock, [&]() { return _closed || !_items.empty(); });
    if (_items.empty()) {
        return std::nullopt;
    }
    T item = std::move(_items.front());
    _items.pop_front();
    _not_full.notify_one();
    return item;
}

void close()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _closed = true;
    _not_full.notify_all();
    _not_empty.notify_all();
}

size_t size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
}

size_t capacity() const { return _capacity; }

private:
const size_t _capacity;
mutable std::mutex _mutex;
std::condition_variable _not_full;
std::condition_variable _not_empty;
std::deque<T> _items;
bool _closed = false;

};

}
