/*
 * Part of the FilterHub (FH) project.
 *
 * SPDX-FileCopyrightText: 2025 FilterHub contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fh/mem_filter_store.hpp"
#include "fake_filter.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using fh::Context;
using fh::Errc;
using fh::FilterPtr;
using fh::MemFilterStore;
using fh::test::fake;
using fh::test::id_of;
using clk = fh::Filter::clock;

TEST(MemFilterStoreTest, AddThenGetReturnsSameFilter) {
    MemFilterStore store(10);
    auto f = fake(1);
    ASSERT_EQ(store.add(Context{}, f), Errc::Ok);

    FilterPtr got;
    ASSERT_EQ(store.get(Context{}, f->id(), got), Errc::Ok);
    EXPECT_EQ(got.get(), f.get());
    EXPECT_EQ(store.size(), 1u);
}

TEST(MemFilterStoreTest, DuplicateIdIsRejectedAndOriginalKept) {
    MemFilterStore store(10);
    auto first  = fake(7);
    auto second = fake(7);
    ASSERT_EQ(store.add(Context{}, first), Errc::Ok);
    EXPECT_EQ(store.add(Context{}, second), Errc::AlreadyRegistered);

    FilterPtr got;
    ASSERT_EQ(store.get(Context{}, id_of(7), got), Errc::Ok);
    EXPECT_EQ(got.get(), first.get());
    EXPECT_EQ(store.size(), 1u);
}

TEST(MemFilterStoreTest, CapacityCeiling) {
    const std::size_t n = 5;
    MemFilterStore store(n);
    for (unsigned i = 0; i < n; ++i) {
        ASSERT_EQ(store.add(Context{}, fake(i)), Errc::Ok) << i;
    }
    EXPECT_EQ(store.add(Context{}, fake(100)), Errc::MaxFilters);
    EXPECT_EQ(store.size(), n);

    ASSERT_EQ(store.remove(Context{}, id_of(2)), Errc::Ok);
    EXPECT_EQ(store.add(Context{}, fake(100)), Errc::Ok);
    EXPECT_EQ(store.size(), n);
}

TEST(MemFilterStoreTest, CapacityIsCheckedBeforeUniqueness) {
    MemFilterStore store(1);
    ASSERT_EQ(store.add(Context{}, fake(1)), Errc::Ok);
    EXPECT_EQ(store.add(Context{}, fake(1)), Errc::MaxFilters);
}

TEST(MemFilterStoreTest, ZeroCapacityRejectsEverything) {
    MemFilterStore store(0);
    EXPECT_EQ(store.add(Context{}, fake(1)), Errc::MaxFilters);
    EXPECT_EQ(store.size(), 0u);
}

TEST(MemFilterStoreTest, RemoveThenGetIsNotFound) {
    MemFilterStore store(4);
    auto f = fake(3);
    ASSERT_EQ(store.add(Context{}, f), Errc::Ok);
    ASSERT_EQ(store.remove(Context{}, f->id()), Errc::Ok);

    FilterPtr got;
    EXPECT_EQ(store.get(Context{}, f->id(), got), Errc::NotFound);
    EXPECT_EQ(got, nullptr);
}

TEST(MemFilterStoreTest, RemoveAbsentIsNotFoundAndLeavesStoreAlone) {
    MemFilterStore store(4);
    ASSERT_EQ(store.add(Context{}, fake(1)), Errc::Ok);
    ASSERT_EQ(store.add(Context{}, fake(2)), Errc::Ok);

    EXPECT_EQ(store.remove(Context{}, id_of(9)), Errc::NotFound);
    EXPECT_EQ(store.remove(Context{}, id_of(9)), Errc::NotFound);
    EXPECT_EQ(store.size(), 2u);

    FilterPtr got;
    EXPECT_EQ(store.get(Context{}, id_of(1), got), Errc::Ok);
    EXPECT_EQ(store.get(Context{}, id_of(2), got), Errc::Ok);
}

TEST(MemFilterStoreTest, RemovedIdCanBeRegisteredAgain) {
    MemFilterStore store(4);
    ASSERT_EQ(store.add(Context{}, fake(1)), Errc::Ok);
    ASSERT_EQ(store.remove(Context{}, id_of(1)), Errc::Ok);
    EXPECT_EQ(store.add(Context{}, fake(1)), Errc::Ok);
}

TEST(MemFilterStoreTest, NullFilterThrows) {
    MemFilterStore store(4);
    EXPECT_THROW(store.add(Context{}, nullptr), std::invalid_argument);
}

TEST(MemFilterStoreTest, NotTakenSinceIsStrictlyBefore) {
    MemFilterStore store(10);
    const auto base = clk::now();
    const auto t1 = base - 30s;
    const auto t2 = base - 20s;
    const auto t3 = base - 10s;
    auto f1 = fake(1, t1);
    auto f2 = fake(2, t2);
    auto f3 = fake(3, t3);
    ASSERT_EQ(store.add(Context{}, f1), Errc::Ok);
    ASSERT_EQ(store.add(Context{}, f2), Errc::Ok);
    ASSERT_EQ(store.add(Context{}, f3), Errc::Ok);

    // q == t3: f3 is not strictly before q
    auto stale = store.not_taken_since(t3);
    ASSERT_EQ(stale.size(), 2u);
    std::vector<fh::FilterID> ids;
    for (auto& f : stale) ids.push_back(f->id());
    std::sort(ids.begin(), ids.end());
    std::vector<fh::FilterID> want{f1->id(), f2->id()};
    std::sort(want.begin(), want.end());
    EXPECT_EQ(ids, want);

    EXPECT_TRUE(store.not_taken_since(t1).empty());
    EXPECT_EQ(store.not_taken_since(base).size(), 3u);
}

TEST(MemFilterStoreTest, NotTakenSinceSeesUpdatedLastTaken) {
    MemFilterStore store(10);
    const auto base = clk::now();
    auto f = fake(1, base - 1h);
    ASSERT_EQ(store.add(Context{}, f), Errc::Ok);
    EXPECT_EQ(store.not_taken_since(base - 1min).size(), 1u);

    f->set_last_taken(base);
    EXPECT_TRUE(store.not_taken_since(base - 1min).empty());
}

TEST(MemFilterStoreTest, NotTakenSinceOnEmptyStore) {
    MemFilterStore store(10);
    EXPECT_TRUE(store.not_taken_since(clk::now()).empty());
}

TEST(MemFilterStoreTest, ContextIgnoredByDefault) {
    MemFilterStore store(4);
    Context ctx;
    ctx.cancel();
    ASSERT_EQ(store.add(ctx, fake(1)), Errc::Ok);

    FilterPtr got;
    EXPECT_EQ(store.get(ctx, id_of(1), got), Errc::Ok);
    EXPECT_EQ(store.remove(ctx, id_of(1)), Errc::Ok);
}

TEST(MemFilterStoreTest, HonoredContextRejectsWithoutMutation) {
    fh::StoreConfig cfg;
    cfg.max_filters = 4;
    cfg.honor_context = true;
    MemFilterStore store(cfg);
    ASSERT_EQ(store.add(Context{}, fake(1)), Errc::Ok);

    Context cancelled;
    cancelled.cancel();
    EXPECT_EQ(store.add(cancelled, fake(2)), Errc::Cancelled);
    EXPECT_EQ(store.remove(cancelled, id_of(1)), Errc::Cancelled);
    FilterPtr got;
    EXPECT_EQ(store.get(cancelled, id_of(1), got), Errc::Cancelled);
    EXPECT_EQ(store.size(), 1u);

    Context expired = Context::with_deadline(Context::clock::now() - 1s);
    EXPECT_EQ(store.add(expired, fake(3)), Errc::Cancelled);

    Context live = Context::with_timeout(10s);
    EXPECT_EQ(store.add(live, fake(4)), Errc::Ok);
    EXPECT_EQ(store.size(), 2u);
}

TEST(MemFilterStoreTest, CancelIsSharedBetweenCopies) {
    Context a;
    Context b = a;
    EXPECT_FALSE(b.done());
    a.cancel();
    EXPECT_TRUE(b.done());
}

TEST(MemFilterStoreTest, ConcurrentAddsStopExactlyAtCapacity) {
    const std::size_t cap = 64;
    const unsigned n = 500;
    MemFilterStore store(cap);

    std::atomic<unsigned> ok{0}, full{0}, other{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    const unsigned per_thread = 50;
    for (unsigned t = 0; t < n / per_thread; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load()) std::this_thread::yield();
            for (unsigned i = 0; i < per_thread; ++i) {
                const Errc rc = store.add(Context{}, fake(t * per_thread + i));
                if (rc == Errc::Ok) ++ok;
                else if (rc == Errc::MaxFilters) ++full;
                else ++other;
            }
        });
    }
    go = true;
    for (auto& th : threads) th.join();

    EXPECT_EQ(ok.load(), cap);
    EXPECT_EQ(full.load(), n - cap);
    EXPECT_EQ(other.load(), 0u);
    EXPECT_EQ(store.size(), cap);
}

TEST(MemFilterStoreTest, ConcurrentMixedOperations) {
    MemFilterStore store(1000);
    std::vector<std::thread> threads;
    for (unsigned t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t] {
            for (unsigned i = 0; i < 200; ++i) {
                const unsigned n = t * 1000 + i;
                ASSERT_EQ(store.add(Context{}, fake(n)), Errc::Ok);
                FilterPtr got;
                ASSERT_EQ(store.get(Context{}, id_of(n), got), Errc::Ok);
                (void)store.not_taken_since(clk::now());
                if (i % 2 == 0) {
                    ASSERT_EQ(store.remove(Context{}, id_of(n)), Errc::Ok);
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(store.size(), 8u * 100u);
}

} // namespace
