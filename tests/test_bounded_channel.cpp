#include <catch2/catch_test_macros.hpp>
#include "bounded_channel.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace agnt;
using namespace std::chrono_literals;

// ── Basic send / receive ────────────────────────────────────────

TEST_CASE("Channel: values arrive in send order", "[channel]") {
    auto [tx, rx] = make_channel<int>(8);
    REQUIRE(tx.send(1));
    REQUIRE(tx.send(2));
    REQUIRE(tx.send(3));

    REQUIRE(rx.recv() == std::optional<int>(1));
    REQUIRE(rx.recv() == std::optional<int>(2));
    REQUIRE(rx.recv() == std::optional<int>(3));
}

TEST_CASE("Channel: zero capacity is rejected", "[channel]") {
    REQUIRE_THROWS_AS(make_channel<int>(0), std::invalid_argument);
}

TEST_CASE("Channel: try_recv reports empty while senders remain", "[channel]") {
    auto [tx, rx] = make_channel<std::string>(2);
    std::string out;
    REQUIRE(rx.try_recv(out) == TryRecv::Empty);

    REQUIRE(tx.send("a"));
    REQUIRE(rx.try_recv(out) == TryRecv::Item);
    REQUIRE(out == "a");
    REQUIRE(rx.try_recv(out) == TryRecv::Empty);
}

// ── Sender lifetime ─────────────────────────────────────────────

TEST_CASE("Channel: queued values drain after last sender is gone", "[channel]") {
    auto [tx, rx] = make_channel<int>(4);
    REQUIRE(tx.send(7));
    REQUIRE(tx.send(8));
    tx.close();

    int out = 0;
    REQUIRE(rx.try_recv(out) == TryRecv::Item);
    REQUIRE(out == 7);
    REQUIRE(rx.recv() == std::optional<int>(8));
    REQUIRE(rx.try_recv(out) == TryRecv::Disconnected);
    REQUIRE_FALSE(rx.recv().has_value());
}

TEST_CASE("Channel: copied senders keep the channel connected", "[channel]") {
    auto [tx, rx] = make_channel<int>(4);
    {
        Sender<int> copy = tx;
        tx.close();
        int out = 0;
        REQUIRE(rx.try_recv(out) == TryRecv::Empty);
        REQUIRE(copy.send(5));
    }
    int out = 0;
    REQUIRE(rx.try_recv(out) == TryRecv::Item);
    REQUIRE(out == 5);
    REQUIRE(rx.try_recv(out) == TryRecv::Disconnected);
}

TEST_CASE("Channel: recv wakes when the last sender leaves", "[channel]") {
    auto [tx, rx] = make_channel<int>(1);
    std::thread producer([sender = std::move(tx)]() mutable {
        std::this_thread::sleep_for(20ms);
        sender.close();
    });
    REQUIRE_FALSE(rx.recv().has_value());
    producer.join();
}

TEST_CASE("Channel: recv_for times out on an idle channel", "[channel]") {
    auto [tx, rx] = make_channel<int>(1);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(rx.recv_for(20ms).has_value());
    REQUIRE(std::chrono::steady_clock::now() - start >= 15ms);
    REQUIRE(tx.send(1));
    REQUIRE(rx.recv_for(20ms) == std::optional<int>(1));
}

// ── Receiver lifetime ───────────────────────────────────────────

TEST_CASE("Channel: send fails once receiver is closed", "[channel]") {
    auto [tx, rx] = make_channel<int>(4);
    REQUIRE_FALSE(tx.is_closed());
    rx.close();
    REQUIRE(tx.is_closed());
    REQUIRE_FALSE(tx.send(1));
    REQUIRE_FALSE(rx.is_open());
}

TEST_CASE("Channel: send fails once receiver is destroyed", "[channel]") {
    auto tx = [] {
        auto [sender, receiver] = make_channel<int>(4);
        return std::move(sender);
    }();
    REQUIRE(tx.is_closed());
    REQUIRE_FALSE(tx.send(1));
}

TEST_CASE("Channel: default constructed ends are disconnected", "[channel]") {
    Sender<int> tx;
    Receiver<int> rx;
    int out = 0;
    REQUIRE_FALSE(tx.send(1));
    REQUIRE(tx.is_closed());
    REQUIRE(rx.try_recv(out) == TryRecv::Disconnected);
    REQUIRE_FALSE(rx.recv().has_value());
}

// ── Backpressure ────────────────────────────────────────────────

TEST_CASE("Channel: full queue blocks sender until consumer reads", "[channel]") {
    auto [tx, rx] = make_channel<int>(2);
    std::atomic<int> sent{0};

    std::thread producer([&sent, sender = std::move(tx)]() mutable {
        for (int i = 0; i < 5; ++i) {
            if (!sender.send(i)) break;
            sent++;
        }
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE(sent.load() == 2);

    std::vector<int> got;
    while (auto v = rx.recv()) got.push_back(*v);
    producer.join();

    REQUIRE(sent.load() == 5);
    REQUIRE(got == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("Channel: try_send never blocks on a full queue", "[channel]") {
    auto [tx, rx] = make_channel<int>(2);
    REQUIRE(tx.try_send(1));
    REQUIRE(tx.try_send(2));
    REQUIRE_FALSE(tx.try_send(3));

    REQUIRE(rx.recv() == std::optional<int>(1));
    REQUIRE(tx.try_send(4));
    REQUIRE(rx.recv() == std::optional<int>(2));
    REQUIRE(rx.recv() == std::optional<int>(4));

    rx.close();
    REQUIRE_FALSE(tx.try_send(5));
}

TEST_CASE("Channel: closing receiver unblocks a waiting sender", "[channel]") {
    auto [tx, rx] = make_channel<int>(1);
    REQUIRE(tx.send(0));

    std::atomic<bool> result{true};
    std::thread producer([&result, sender = std::move(tx)]() mutable {
        result = sender.send(1);
    });

    std::this_thread::sleep_for(20ms);
    rx.close();
    producer.join();
    REQUIRE_FALSE(result.load());
}

TEST_CASE("Channel: many producers deliver every value", "[channel]") {
    auto [tx, rx] = make_channel<int>(3);
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([p, sender = tx]() mutable {
            for (int i = 0; i < 25; ++i) sender.send(p * 100 + i);
        });
    }
    tx.close();

    int count = 0;
    long sum = 0;
    while (auto v = rx.recv()) {
        count++;
        sum += *v;
    }
    for (auto& t : producers) t.join();

    REQUIRE(count == 100);
    // sum over p of (25 * 100p + 0..24)
    REQUIRE(sum == 25 * 100 * (0 + 1 + 2 + 3) + 4 * 300);
}
