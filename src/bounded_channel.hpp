#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace agnt {

// Bounded multi-producer / single-consumer queue shared between threads.
// Senders block while the queue is full; a send fails once the receiver is
// gone. The receiver sees Disconnected once every sender is gone and the
// queue is drained.

enum class TryRecv { Item, Empty, Disconnected };

namespace detail {

template<typename T>
struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<T> queue;
    size_t capacity;
    size_t senders = 0;
    bool receiver_alive = true;
};

} // namespace detail

template<typename T>
class Receiver;

template<typename T>
class Sender {
public:
    Sender() = default;

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->senders++;
    }

    Sender(const Sender& other) : state_(other.state_) {
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->senders++;
        }
    }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~Sender() { release(); }

    // Blocks while the queue is full. Returns false if the receiver has
    // been dropped; the value is discarded in that case.
    bool send(T value) {
        if (!state_) return false;
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_full.wait(lock, [this] {
            return !state_->receiver_alive ||
                   state_->queue.size() < state_->capacity;
        });
        if (!state_->receiver_alive) return false;
        state_->queue.push_back(std::move(value));
        state_->not_empty.notify_one();
        return true;
    }

    // Never blocks. Returns false if the queue is full or the receiver has
    // been dropped; the value is discarded in either case.
    bool try_send(T value) {
        if (!state_) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive || state_->queue.size() >= state_->capacity)
            return false;
        state_->queue.push_back(std::move(value));
        state_->not_empty.notify_one();
        return true;
    }

    // True once the receiving side has been dropped.
    bool is_closed() const {
        if (!state_) return true;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return !state_->receiver_alive;
    }

    // Drop this sender early (same as destruction).
    void close() { release(); }

private:
    void release() {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->senders--;
        }
        state_->not_empty.notify_all();
        state_.reset();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
class Receiver {
public:
    Receiver() = default;

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}

    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    // Non-blocking poll.
    TryRecv try_recv(T& out) {
        if (!state_) return TryRecv::Disconnected;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->queue.empty()) {
            out = std::move(state_->queue.front());
            state_->queue.pop_front();
            state_->not_full.notify_one();
            return TryRecv::Item;
        }
        return state_->senders == 0 ? TryRecv::Disconnected : TryRecv::Empty;
    }

    // Blocks until a value arrives. nullopt once all senders are gone and
    // the queue is drained.
    std::optional<T> recv() {
        if (!state_) return std::nullopt;
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_empty.wait(lock, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    // Like recv() but gives up after `timeout`; nullopt on timeout as well.
    std::optional<T> recv_for(std::chrono::milliseconds timeout) {
        if (!state_) return std::nullopt;
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->not_empty.wait_for(lock, timeout, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        return pop_locked();
    }

    // Drop the receiving side; pending and future sends fail.
    void close() {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->receiver_alive = false;
            state_->queue.clear();
        }
        state_->not_full.notify_all();
        state_.reset();
    }

    bool is_open() const { return state_ != nullptr; }

private:
    std::optional<T> pop_locked() {
        if (state_->queue.empty()) return std::nullopt;
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        state_->not_full.notify_one();
        return value;
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(size_t capacity) {
    if (capacity == 0)
        throw std::invalid_argument("channel capacity must be positive");
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace agnt
