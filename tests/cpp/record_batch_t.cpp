#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "ipod/data/record_batch.hpp"

using ipod::data::RecordBatch;

namespace {

RecordBatch<int> make_range(int start, int end) {
    std::vector<int> rows;
    for (int i = start; i < end; ++i) {
        rows.push_back(i);
    }
    return RecordBatch<int>(std::move(rows));
}

} // namespace

TEST_CASE("RecordBatch append", "[record_batch]") {
    SECTION("Blocks are transferred") {
        auto total = make_range(0, 4);
        auto chunk = make_range(4, 6);
        total.append(std::move(chunk));
        REQUIRE(total.size() == 6);
        REQUIRE(total.num_blocks() == 2);
        REQUIRE(chunk.empty()); // NOLINT(bugprone-use-after-move)
        REQUIRE(total.to_vector() == std::vector<int>{0, 1, 2, 3, 4, 5});
    }
    SECTION("Empty batches add no blocks") {
        auto total = make_range(0, 4);
        total.append(RecordBatch<int>());
        REQUIRE(total.num_blocks() == 1);
        RecordBatch<int> empty;
        empty.append(make_range(0, 2));
        REQUIRE(empty.size() == 2);
    }
    SECTION("Copy append leaves the source intact") {
        auto total       = make_range(0, 2);
        const auto chunk = make_range(2, 3);
        total.append(chunk);
        REQUIRE(chunk.size() == 1);
        REQUIRE(total.size() == 3);
    }
}

TEST_CASE("RecordBatch indexing and iteration", "[record_batch]") {
    RecordBatch<int> batch = make_range(0, 3);
    batch.append(make_range(3, 5));
    batch.append(make_range(5, 6));
    REQUIRE(batch[0] == 0);
    REQUIRE(batch[3] == 3);
    REQUIRE(batch[5] == 5);
    REQUIRE_THROWS_AS(batch[6], std::out_of_range);

    int expected = 0;
    for (const auto row : batch) {
        REQUIRE(row == expected);
        ++expected;
    }
    REQUIRE(expected == 6);
    REQUIRE(RecordBatch<int>().begin() == RecordBatch<int>().end());
}

TEST_CASE("RecordBatch compaction", "[record_batch]") {
    SECTION("Small tail is merged") {
        RecordBatch<int> batch = make_range(0, 4);
        batch.append(make_range(4, 7));
        REQUIRE(batch.fragmented());
        batch.compact();
        REQUIRE_FALSE(batch.fragmented());
        REQUIRE(batch.num_blocks() == 1);
        REQUIRE(batch.to_vector() == make_range(0, 7).to_vector());
    }
    SECTION("Geometric layout is kept") {
        RecordBatch<int> batch = make_range(0, 10);
        batch.append(make_range(10, 12));
        REQUIRE_FALSE(batch.fragmented());
        batch.compact();
        REQUIRE(batch.num_blocks() == 2);
    }
    SECTION("Block count stays logarithmic under single-row appends") {
        RecordBatch<int> total;
        for (int i = 0; i < 1000; ++i) {
            ipod::data::concatenate_into(total, RecordBatch<int>{i});
            REQUIRE_FALSE(total.fragmented());
        }
        REQUIRE(total.size() == 1000);
        REQUIRE(total.num_blocks() <= 10);
        REQUIRE(total.to_vector() == make_range(0, 1000).to_vector());
    }
    SECTION("Multi-block chunks are flattened") {
        RecordBatch<int> chunk = make_range(0, 1);
        chunk.append(make_range(1, 3));
        RecordBatch<int> total = make_range(10, 30);
        ipod::data::concatenate_into(total, std::move(chunk));
        REQUIRE(total.num_blocks() == 2);
        REQUIRE(total.size() == 23);
    }
    SECTION("Defragment") {
        RecordBatch<int> batch = make_range(0, 10);
        batch.append(make_range(10, 12));
        batch.defragment();
        REQUIRE(batch.num_blocks() == 1);
        REQUIRE(batch.to_vector() == make_range(0, 12).to_vector());
    }
}

TEST_CASE("RecordBatch release and filter", "[record_batch]") {
    RecordBatch<int> batch = make_range(0, 3);
    batch.append(make_range(3, 6));
    const auto evens = batch.filter([](int row) { return row % 2 == 0; });
    REQUIRE(evens.to_vector() == std::vector<int>{0, 2, 4});

    auto rows = std::move(batch).release();
    REQUIRE(rows == std::vector<int>{0, 1, 2, 3, 4, 5});
    REQUIRE(batch.empty()); // NOLINT(bugprone-use-after-move)
    REQUIRE(batch.num_blocks() == 0);
}
