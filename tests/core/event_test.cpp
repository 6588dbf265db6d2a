#include <gtest/gtest.h>
#include <peerlink/core/event.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace peerlink::core::test {

TEST(EventTest, BasicEventHandling) {
    EventEmitter<int, const std::string&> emitter;
    std::vector<std::string> seen;

    emitter.addListener([&](int value, const std::string& text) {
        seen.push_back(std::to_string(value) + ":" + text);
    });

    emitter.emit(42, "answer");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "42:answer");
}

TEST(EventTest, MultipleListeners) {
    EventEmitter<> emitter;
    int counter1 = 0;
    int counter2 = 0;

    emitter.addListener([&]() { counter1++; });
    emitter.addListener([&]() { counter2++; });

    emitter.emit();
    emitter.emit();

    EXPECT_EQ(counter1, 2);
    EXPECT_EQ(counter2, 2);
    EXPECT_EQ(emitter.listenerCount(), 2u);
}

TEST(EventTest, RemoveListener) {
    EventEmitter<int> emitter;
    int total = 0;

    auto id = emitter.addListener([&](int v) { total += v; });
    emitter.emit(5);
    emitter.removeListener(id);
    emitter.emit(5);

    EXPECT_EQ(total, 5);
    EXPECT_EQ(emitter.listenerCount(), 0u);
}

// Listener boleh melepas dirinya sendiri saat emit
TEST(EventTest, ListenerRemovesItselfDuringEmit) {
    EventEmitter<> emitter;
    int calls = 0;
    ListenerId id = 0;

    id = emitter.addListener([&]() {
        calls++;
        emitter.removeListener(id);
    });

    emitter.emit();
    emitter.emit();
    EXPECT_EQ(calls, 1);
}

TEST(EventTest, ThrowingListenerDoesNotStopOthers) {
    EventEmitter<> emitter;
    bool second_called = false;

    emitter.addListener([]() { throw std::runtime_error("boom"); });
    emitter.addListener([&]() { second_called = true; });

    EXPECT_NO_THROW(emitter.emit());
    EXPECT_TRUE(second_called);
}

} // namespace peerlink::core::test
