//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <llbs/lru_cache.hpp>
//
#include <llbs/lru_cache.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <random>
#include <vector>

namespace {

using namespace llbs::int_types;

using ::testing::ElementsAre;
using ::testing::IsEmpty;

template <typename V>
std::vector<V> contents_of(const llbs::LruCache<V>& lru)
{
  std::vector<V> values;
  lru.for_each([&values](const V& v) {
    values.emplace_back(v);
  });
  return values;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, NewIsEmpty)
{
  llbs::LruCache<u8> lru{10};

  EXPECT_TRUE(lru.empty());
  EXPECT_EQ(lru.size(), 0u);
  EXPECT_EQ(lru.max_size(), 10u);
  EXPECT_THAT(contents_of(lru), IsEmpty());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, InsertDoesNotDeduplicate)
{
  llbs::LruCache<u8> lru{10};

  lru.insert(0);
  lru.insert(1);
  lru.insert(2);
  lru.insert(2);
  lru.insert(3);

  EXPECT_EQ(lru.size(), 5u);
  EXPECT_THAT(contents_of(lru), ElementsAre(3, 2, 2, 1, 0));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, InsertOverflowEvictsLeastRecentlyUsed)
{
  std::vector<u8> evicted;
  llbs::LruCache<u8> lru{10, [&evicted](u8&& v) {
                           evicted.emplace_back(v);
                         }};

  for (u8 i = 0; i < 10; ++i) {
    lru.insert(i);
  }
  EXPECT_THAT(contents_of(lru), ElementsAre(9, 8, 7, 6, 5, 4, 3, 2, 1, 0));
  EXPECT_THAT(evicted, IsEmpty());

  lru.insert(10);

  EXPECT_THAT(contents_of(lru), ElementsAre(10, 9, 8, 7, 6, 5, 4, 3, 2, 1));
  EXPECT_THAT(evicted, ElementsAre(0));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, FindPromotes)
{
  llbs::LruCache<u8> lru{10};

  for (u8 i = 0; i < 10; ++i) {
    lru.insert(i);
  }

  u8* found = lru.find([](u8 v) {
    return v == 4;
  });

  ASSERT_NE(found, nullptr);
  EXPECT_EQ(*found, 4);
  EXPECT_THAT(contents_of(lru), ElementsAre(4, 9, 8, 7, 6, 5, 3, 2, 1, 0));

  // Promotion changes which value is evicted next.
  //
  lru.insert(10);
  EXPECT_THAT(contents_of(lru), ElementsAre(10, 4, 9, 8, 7, 6, 5, 3, 2, 1));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, FindMissLeavesOrderUnchanged)
{
  llbs::LruCache<u8> lru{10};

  for (u8 i = 0; i < 5; ++i) {
    lru.insert(i);
  }

  EXPECT_EQ(lru.find([](u8 v) {
    return v == 42;
  }),
            nullptr);
  EXPECT_THAT(contents_of(lru), ElementsAre(4, 3, 2, 1, 0));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, FindReturnsFirstMatchInRecencyOrder)
{
  llbs::LruCache<std::pair<int, int>> lru{10};

  lru.insert({7, 1});
  lru.insert({8, 2});
  lru.insert({7, 3});

  auto* found = lru.find([](const std::pair<int, int>& p) {
    return p.first == 7;
  });

  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->second, 3);
  EXPECT_EQ(lru.size(), 3u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, InsertWithEvictCountsOverflow)
{
  std::atomic<usize> evict_count{0};
  {
    llbs::LruCache<u8> lru{10, [&evict_count](u8&&) {
                             evict_count.fetch_add(1);
                           }};

    for (usize i = 0; i < 100; ++i) {
      lru.insert(static_cast<u8>(i));
      EXPECT_LE(lru.size(), 10u);
    }

    EXPECT_THAT(contents_of(lru), ElementsAre(99, 98, 97, 96, 95, 94, 93, 92, 91, 90));
    EXPECT_EQ(evict_count.load(), 90u);
  }
  EXPECT_EQ(evict_count.load(), 100u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, EvictAllOnDestroyTailFirst)
{
  std::vector<u8> evicted;
  {
    llbs::LruCache<u8> lru{10, [&evicted](u8&& v) {
                             evicted.emplace_back(v);
                           }};
    for (u8 i = 0; i < 10; ++i) {
      lru.insert(i);
    }
    EXPECT_THAT(evicted, IsEmpty());
  }
  EXPECT_THAT(evicted, ElementsAre(0, 1, 2, 3, 4, 5, 6, 7, 8, 9));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, DefaultEvictionReleasesValue)
{
  auto value = std::make_shared<int>(5);
  std::weak_ptr<int> weak_value = value;
  {
    llbs::LruCache<std::shared_ptr<int>> lru{1};

    lru.insert(std::move(value));
    EXPECT_FALSE(weak_value.expired());

    lru.insert(std::make_shared<int>(6));
    EXPECT_TRUE(weak_value.expired());
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LruCacheTest, RandomOpsNeverExceedMaxSize)
{
  std::default_random_engine rng{1};

  for (usize max_size = 1; max_size < 16; ++max_size) {
    usize inserted = 0;
    usize evicted = 0;
    {
      llbs::LruCache<int> lru{max_size, [&evicted](int&&) {
                                ++evicted;
                              }};

      std::uniform_int_distribution<int> pick_value{0, 31};
      std::uniform_int_distribution<int> pick_op{0, 1};

      for (usize i = 0; i < 1000; ++i) {
        const int value = pick_value(rng);
        if (pick_op(rng) == 0) {
          lru.insert(value);
          ++inserted;
        } else {
          int* found = lru.find([value](int v) {
            return v == value;
          });
          if (found) {
            EXPECT_EQ(*found, value);
            EXPECT_EQ(contents_of(lru).front(), value);
          }
        }
        ASSERT_LE(lru.size(), max_size);
        ASSERT_EQ(lru.size() + evicted, inserted);
      }
    }
    EXPECT_EQ(evicted, inserted);
  }
}

}  // namespace
