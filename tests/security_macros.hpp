#pragma once

#include <gtest/gtest.h>
#include <thread>
#include <vector>

// Runs `code` on num_threads threads and expects every result to match a
// single-threaded run.
#define EXPECT_THREAD_SAFE(code, num_threads)                                         \
    do {                                                                               \
        auto expected_ = code;                                                         \
        std::vector<decltype(expected_)> results_(num_threads);                        \
        std::vector<std::thread> threads_;                                             \
        threads_.reserve(num_threads);                                                 \
        for (int i_ = 0; i_ < (num_threads); ++i_) {                                   \
            threads_.emplace_back([&, i_]() { results_[i_] = code; });                 \
        }                                                                              \
        for (auto& t_ : threads_) {                                                    \
            t_.join();                                                                 \
        }                                                                              \
        for (const auto& r_ : results_) {                                              \
            EXPECT_EQ(r_, expected_) << "Race condition detected";                    \
        }                                                                              \
    } while (0)

// Expects `code` to neither create nor destroy any of `asset` on `ledger`.
#define EXPECT_VALUE_CONSERVED(ledger, asset, code)                                   \
    do {                                                                               \
        auto before_ = (ledger).total_value(asset);                                    \
        { code; }                                                                      \
        EXPECT_EQ((ledger).total_value(asset), before_)                                \
            << "value of " << (asset) << " not conserved";                             \
    } while (0)
