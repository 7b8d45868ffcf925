/**
 * @file test_progress_collector.cpp
 * @brief Unit tests for progress_collector
 */

#include <gtest/gtest.h>

#include <kcenon/object_storage/transfer/progress_collector.h>

#include <map>
#include <thread>
#include <vector>

namespace kcenon::object_storage::test {

namespace {

auto make_event(uint32_t chunk, uint64_t bytes,
                progress_event_kind kind = progress_event_kind::chunk_progress) -> progress_event {
    progress_event event;
    event.kind = kind;
    event.key = "k";
    event.chunk_index = chunk;
    event.bytes_transferred = bytes;
    event.total_bytes = 100;
    return event;
}

}  // namespace

TEST(ProgressCollectorTest, DrainsInFifoOrder) {
    progress_collector collector;
    collector.enqueue(make_event(0, 10, progress_event_kind::chunk_started));
    collector.enqueue(make_event(0, 20));
    collector.enqueue(make_event(0, 100, progress_event_kind::chunk_completed));
    EXPECT_EQ(collector.pending(), 3u);

    auto events = collector.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].kind, progress_event_kind::chunk_started);
    EXPECT_EQ(events[1].bytes_transferred, 20u);
    EXPECT_EQ(events[2].kind, progress_event_kind::chunk_completed);
    EXPECT_EQ(collector.pending(), 0u);
    EXPECT_TRUE(collector.drain().empty());
}

TEST(ProgressCollectorTest, DrainWithHandler) {
    progress_collector collector;
    collector.enqueue(make_event(1, 5));
    collector.enqueue(make_event(2, 7));

    uint64_t total = 0;
    auto dispatched = collector.drain([&](const progress_event& e) {
        total += e.bytes_transferred;
    });
    EXPECT_EQ(dispatched, 2u);
    EXPECT_EQ(total, 12u);
}

TEST(ProgressCollectorTest, FullQueueDropsNewEvents) {
    progress_collector collector(2);
    EXPECT_EQ(collector.capacity(), 2u);

    collector.enqueue(make_event(0, 1));
    collector.enqueue(make_event(0, 2));
    collector.enqueue(make_event(0, 3));

    EXPECT_EQ(collector.dropped_count(), 1u);
    auto events = collector.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].bytes_transferred, 2u);

    collector.enqueue(make_event(0, 4));
    EXPECT_EQ(collector.pending(), 1u);
}

TEST(ProgressCollectorTest, ZeroCapacityUsesDefault) {
    progress_collector collector(0);
    EXPECT_EQ(collector.capacity(), progress_collector::default_capacity);
}

TEST(ProgressCollectorTest, ConcurrentProducersKeepPerChunkOrder) {
    progress_collector collector;
    constexpr uint32_t producers = 4;
    constexpr uint64_t per_producer = 500;

    std::vector<std::thread> threads;
    for (uint32_t p = 0; p < producers; ++p) {
        threads.emplace_back([&collector, p] {
            for (uint64_t i = 1; i <= per_producer; ++i) {
                collector.enqueue(make_event(p, i));
            }
        });
    }

    std::vector<progress_event> events;
    while (events.size() < producers * per_producer) {
        auto batch = collector.drain();
        events.insert(events.end(), batch.begin(), batch.end());
        std::this_thread::yield();
    }
    for (auto& t : threads) {
        t.join();
    }

    std::map<uint32_t, uint64_t> last;
    for (const auto& e : events) {
        auto& previous = last[*e.chunk_index];
        EXPECT_GT(e.bytes_transferred, previous);
        previous = e.bytes_transferred;
    }
    EXPECT_EQ(collector.dropped_count(), 0u);
}

TEST(ProgressEventKindTest, ToString) {
    EXPECT_STREQ(to_string(progress_event_kind::chunk_failed), "chunk_failed");
    EXPECT_STREQ(to_string(progress_event_kind::transfer_completed), "transfer_completed");
}

}  // namespace kcenon::object_storage::test
