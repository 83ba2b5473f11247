#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <ifreader/common/constants.h>
#include <ifreader/common/thread_pool.h>
#include <ifreader/indexer/error.h>
#include <ifreader/indexer/line_index.h>
#include <ifreader/indexer/line_index_builder.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace ifreader;
using namespace ifr_test;

// Offsets of every line start, plus the end of the file
static std::vector<std::uint64_t> expected_offsets(const std::string &content) {
    std::vector<std::uint64_t> offsets{0};
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            offsets.push_back(i + 1);
        }
    }
    if (offsets.back() != content.size()) {
        offsets.push_back(content.size());
    }
    return offsets;
}

static std::vector<std::uint64_t> to_vector(const LineOffsetSet &offsets) {
    return std::vector<std::uint64_t>(offsets.begin(), offsets.end());
}

TEST_CASE("LineIndex - Accessors") {
    LineIndex index(std::vector<std::uint64_t>{0, 10, 25, 31});
    CHECK(index.size() == 4);
    CHECK(index.num_lines() == 3);
    CHECK_FALSE(index.empty());
    CHECK(index.offset(1) == 0);
    CHECK(index.offset(3) == 25);
    CHECK(index.offset(4) == 31);
    CHECK_THROWS_AS(index.offset(0), std::out_of_range);
    CHECK_THROWS_AS(index.offset(5), std::out_of_range);

    CHECK(index.is_complete(31));
    CHECK_FALSE(index.is_complete(40));

    LineIndex empty;
    CHECK(empty.empty());
    CHECK(empty.num_lines() == 0);
    CHECK_FALSE(empty.is_complete(0));

    CHECK_THROWS_AS(LineIndex(std::vector<std::uint64_t>{0, 5, 5}),
                    std::invalid_argument);
    CHECK_THROWS_AS(LineIndex(std::vector<std::uint64_t>{0, 7, 3}),
                    std::invalid_argument);

    LineIndex from_set(LineOffsetSet{31, 0, 10});
    CHECK(from_set.offsets() == std::vector<std::uint64_t>{0, 10, 31});
}

TEST_CASE("LineIndexBuilder - Threshold computation") {
    const std::uint64_t min = constants::indexer::MIN_FORK_THRESHOLD;

    CHECK(LineIndexBuilder::compute_threshold(0, 1) == min);
    CHECK(LineIndexBuilder::compute_threshold(500, 1) == min);
    CHECK(LineIndexBuilder::compute_threshold(8 * min, 1) == 8 * min);
    CHECK(LineIndexBuilder::compute_threshold(8 * min, 4) == 2 * min);
    CHECK(LineIndexBuilder::compute_threshold(8 * min, 64) == min);

    try {
        LineIndexBuilder::compute_threshold(100, 0);
        FAIL("Exception not thrown");
    } catch (const IndexerError &e) {
        CHECK(e.get_type() == IndexerError::INVALID_ARGUMENT);
    }
}

TEST_CASE("LineIndexBuilder - Fixture file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string path = env.create_test_file();
    REQUIRE(!path.empty());

    LineIndex index = build_line_index(path);
    REQUIRE(index.num_lines() == 50);
    CHECK(index.offset(1) == 0);

    std::uint64_t expected = 0;
    for (std::size_t i = 1; i <= 50; ++i) {
        CHECK(index.offset(i) == expected);
        expected += fixture_line(i).size() + 1;
    }
    CHECK(index.offset(51) == expected);
    CHECK(index.is_complete(expected));
}

TEST_CASE("LineIndexBuilder - Split ranges agree with a sequential scan") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string content;
    std::string path = env.create_random_file("random.txt", 6000, 42, content);
    REQUIRE(!path.empty());
    const auto expected = expected_offsets(content);
    const std::uint64_t length = content.size();

    ThreadPool pool(4);

    SUBCASE("Whole file in one range") {
        LineIndexBuilder builder(path, length + 1, pool);
        CHECK(builder.get_threshold() == length + 1);
        CHECK_FALSE(builder.is_strict());
        CHECK(to_vector(builder.build(0, length)) == expected);
    }

    SUBCASE("Various thresholds") {
        for (std::uint64_t threshold : {std::uint64_t(1), std::uint64_t(7),
                                        std::uint64_t(64),
                                        std::uint64_t(4096)}) {
            CAPTURE(threshold);
            LineIndexBuilder builder(path, threshold, pool, true, 64);
            CHECK(builder.get_threshold() == threshold);
            CHECK(builder.is_strict());
            CHECK(to_vector(builder.build(0, length)) == expected);
        }
    }

    SUBCASE("Split count through the convenience function") {
        LineIndex index = build_line_index(path, 8, &pool);
        CHECK(index.offsets() == expected);
        CHECK(index.is_complete(length));
    }
}

TEST_CASE("LineIndexBuilder - Single worker handles deep recursion") {
    TestEnvironment env;
    REQUIRE(env.is_valid());

    std::string content;
    std::string path = env.create_random_file("random.txt", 2000, 7, content);
    REQUIRE(!path.empty());

    ThreadPool pool(1);
    LineIndexBuilder builder(path, 16, pool, true, 32);
    CHECK(to_vector(builder.build(0, content.size())) ==
          expected_offsets(content));
}

TEST_CASE("LineIndexBuilder - CRLF and unterminated lines") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string path = env.create_file("crlf.txt", "ab\r\ncd\r\n\r\nend");

    ThreadPool pool(2);
    for (std::uint64_t threshold : {std::uint64_t(1), std::uint64_t(3),
                                    std::uint64_t(100)}) {
        CAPTURE(threshold);
        LineIndexBuilder builder(path, threshold, pool);
        CHECK(to_vector(builder.build(0, 13)) ==
              std::vector<std::uint64_t>{0, 4, 8, 10, 13});
    }
}

TEST_CASE("LineIndexBuilder - Empty file") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    std::string path = env.create_file("empty.txt", "");

    LineIndex index = build_line_index(path);
    CHECK(index.offsets() == std::vector<std::uint64_t>{0});
    CHECK(index.num_lines() == 0);
    CHECK(index.is_complete(0));
}

TEST_CASE("LineIndexBuilder - Error handling") {
    TestEnvironment env;
    REQUIRE(env.is_valid());
    ThreadPool pool(2);
    std::string missing = env.get_dir() + "/missing.txt";

    SUBCASE("Zero threshold") {
        std::string path = env.create_file("a.txt", "a\n");
        try {
            LineIndexBuilder builder(path, 0, pool);
            FAIL("Exception not thrown");
        } catch (const IndexerError &e) {
            CHECK(e.get_type() == IndexerError::INVALID_ARGUMENT);
        }
    }

    SUBCASE("Inverted range") {
        std::string path = env.create_file("a.txt", "a\n");
        LineIndexBuilder builder(path, 10, pool);
        try {
            builder.build(2, 1);
            FAIL("Exception not thrown");
        } catch (const IndexerError &e) {
            CHECK(e.get_type() == IndexerError::INVALID_ARGUMENT);
        }
    }

    SUBCASE("Unreadable file is skipped when lenient") {
        LineIndexBuilder builder(missing, 4, pool);
        CHECK(builder.build(0, 16).empty());
    }

    SUBCASE("Unreadable file fails when strict") {
        LineIndexBuilder builder(missing, 4, pool, true);
        try {
            builder.build(0, 16);
            FAIL("Exception not thrown");
        } catch (const IndexerError &e) {
            CHECK(e.get_type() == IndexerError::BUILD_ERROR);
            CHECK(std::string(e.what()).find("[BUILD]") != std::string::npos);
        }
    }

    SUBCASE("Missing file in the convenience function") {
        try {
            build_line_index(missing);
            FAIL("Exception not thrown");
        } catch (const IndexerError &e) {
            CHECK(e.get_type() == IndexerError::FILE_ERROR);
        }
    }
}
