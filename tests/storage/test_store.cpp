/*
 * test_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "storage/store.hpp"

using namespace codepage::storage;

struct Record {
    std::string project;
    int age{0};
};

class InMemoryStoreTest : public ::testing::Test {
protected:
    InMemoryStore<Record> store;
};

TEST_F(InMemoryStoreTest, PutGetOverwrite) {
    EXPECT_FALSE(store.get("r1").has_value());

    store.put("r1", {"alpha", 1});
    store.put("r1", {"alpha", 2});

    auto record = store.get("r1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->age, 2);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(InMemoryStoreTest, ListFiltersInKeyOrder) {
    store.put("b", {"alpha", 1});
    store.put("a", {"beta", 2});
    store.put("c", {"alpha", 3});

    auto all = store.list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].project, "beta");

    auto alpha = store.list([](const Record& r) { return r.project == "alpha"; });
    ASSERT_EQ(alpha.size(), 2u);
    EXPECT_EQ(alpha[0].age, 1);
    EXPECT_EQ(alpha[1].age, 3);
}

TEST_F(InMemoryStoreTest, RemoveAndRemoveIf) {
    store.put("a", {"alpha", 10});
    store.put("b", {"alpha", 40});
    store.put("c", {"alpha", 50});

    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));
    EXPECT_EQ(store.removeIf([](const Record& r) { return r.age > 30; }), 2u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(InMemoryStoreTest, ConcurrentPuts) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 100; ++i) {
                store.put(std::to_string(t) + "-" + std::to_string(i),
                          {"p", i});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.size(), 400u);
}
