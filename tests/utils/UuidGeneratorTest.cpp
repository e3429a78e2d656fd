#include <gtest/gtest.h>
#include "utils/UuidGenerator.hpp"

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using bank::utils::UuidGenerator;

TEST(UuidGeneratorTest, Generate_CanonicalV4Layout) {
    auto id = UuidGenerator::generate();

    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos) << id;
    EXPECT_TRUE(UuidGenerator::isValid(id)) << id;
}

TEST(UuidGeneratorTest, IsValid_RejectsMalformed) {
    EXPECT_TRUE(UuidGenerator::isValid("123e4567-e89b-42d3-a456-426614174000"));

    EXPECT_FALSE(UuidGenerator::isValid(""));
    EXPECT_FALSE(UuidGenerator::isValid("123e4567-e89b-12d3-a456-426614174000"));  // version 1
    EXPECT_FALSE(UuidGenerator::isValid("123e4567-e89b-42d3-c456-426614174000"));  // variant
    EXPECT_FALSE(UuidGenerator::isValid("123E4567-E89B-42D3-A456-426614174000"));
    EXPECT_FALSE(UuidGenerator::isValid("123e4567e89b42d3a456426614174000"));
    EXPECT_FALSE(UuidGenerator::isValid("123e4567-e89b-42d3-a456-42661417400g"));
}

TEST(UuidGeneratorTest, Generate_UniqueAcrossThreads) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 2000;

    std::mutex mutex;
    std::set<std::string> ids;
    std::vector<std::thread> workers;

    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            std::vector<std::string> local;
            for (int i = 0; i < PER_THREAD; ++i) {
                local.push_back(UuidGenerator::generate());
            }
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(ids.size(), static_cast<size_t>(THREADS * PER_THREAD));
}
