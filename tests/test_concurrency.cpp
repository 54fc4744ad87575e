#include <gtest/gtest.h>
#include "hashcons/intern.hpp"

#include <atomic>
#include <latch>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace hashcons;

// ============================================================================
// Concurrent intern / gc tests
// ============================================================================

TEST(ConcurrencyTest, ConcurrentDedupRace) {
    InternStore store;
    constexpr int THREADS = 16;

    std::vector<std::optional<Interned<std::string>>> results(THREADS);
    std::vector<std::thread> threads;
    std::latch start(THREADS);

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&store, &results, &start, i]() {
            start.arrive_and_wait();
            results[i] = store.intern(std::string("race:value"));
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store.size<std::string>(), 1u);
    for (int i = 1; i < THREADS; ++i) {
        ASSERT_TRUE(results[i].has_value());
        EXPECT_EQ(*results[0], *results[i]);
    }
    EXPECT_EQ(results[0]->useCount(), THREADS + 1);
}

TEST(ConcurrencyTest, AlphaScenario) {
    InternStore store;
    std::optional<Interned<std::string>> first;
    std::optional<Interned<std::string>> second;

    std::thread t1([&]() { first = store.intern(std::string("alpha")); });
    std::thread t2([&]() { second = store.intern(std::string("alpha")); });
    t1.join();
    t2.join();

    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(store.size<std::string>(), 1u);

    first.reset();
    second.reset();
    store.gc();
    EXPECT_EQ(store.size<std::string>(), 0u);

    auto again = store.intern(std::string("alpha"));
    EXPECT_EQ(*again, "alpha");
    EXPECT_EQ(store.size<std::string>(), 1u);
}

TEST(ConcurrencyTest, ManyValuesFromManyThreads) {
    InternStore store;
    constexpr int THREADS = 8;
    constexpr int VALUES = 10;

    std::vector<std::thread> threads;
    std::vector<std::vector<Interned<std::string>>> perThread(THREADS);

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&store, &perThread, t]() {
            for (int i = 0; i < 100; ++i) {
                perThread[t].push_back(
                    store.intern("thread_test:value_" + std::to_string(i % VALUES)));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store.size<std::string>(), static_cast<size_t>(VALUES));

    // Same strings (i % VALUES) share a slot across all threads
    for (int t = 1; t < THREADS; ++t) {
        for (int i = 0; i < 100; ++i) {
            EXPECT_EQ(perThread[0][i % VALUES], perThread[t][i]);
        }
    }
}

TEST(ConcurrencyTest, GcConcurrentWithInternKeepsHeldValues) {
    InternStore store;
    auto pinned = store.intern(std::string("pinned"));

    std::atomic<bool> stop{false};
    std::thread collector([&]() {
        while (!stop.load()) {
            store.gc();
        }
    });

    constexpr int WORKERS = 4;
    std::vector<std::thread> workers;
    std::atomic<int> mismatches{0};
    for (int w = 0; w < WORKERS; ++w) {
        workers.emplace_back([&store, &pinned, &mismatches, w]() {
            for (int i = 0; i < 2000; ++i) {
                auto h = store.intern("churn:" + std::to_string((i + w) % 50));
                if (h->rfind("churn:", 0) != 0) {
                    mismatches++;
                }
                auto p = store.intern(std::string("pinned"));
                if (p != pinned) {
                    mismatches++;
                }
            }
        });
    }

    for (auto& w : workers) {
        w.join();
    }
    stop = true;
    collector.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(*pinned, "pinned");

    // Only the pinned value survives a final sweep
    store.gc();
    EXPECT_EQ(store.size<std::string>(), 1u);
    EXPECT_TRUE(store.contains(std::string("pinned")));
}

TEST(ConcurrencyTest, DifferentTypesInternInParallel) {
    InternStore store;
    std::thread strings([&]() {
        for (int i = 0; i < 500; ++i) {
            static_cast<void>(store.intern(std::to_string(i)));
        }
    });
    std::thread ints([&]() {
        for (int i = 0; i < 500; ++i) {
            static_cast<void>(store.intern(i));
        }
    });
    std::thread sweeper([&]() {
        for (int i = 0; i < 50; ++i) {
            store.gc();
        }
    });

    strings.join();
    ints.join();
    sweeper.join();

    EXPECT_EQ(store.bucketCount(), 2u);
    EXPECT_LE(store.size<std::string>(), 500u);
    store.gc();
    EXPECT_EQ(store.size(), 0u);
}

TEST(ConcurrencyTest, HandleCopiesAcrossThreads) {
    InternStore store;
    auto h = store.intern(std::string("shared"));

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([h]() {
            for (int j = 0; j < 1000; ++j) {
                auto copy = h;
                EXPECT_EQ(*copy, "shared");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(h.useCount(), 2);
}
