#ifndef IFREADER_INDEXER_LINE_INDEX_BUILDER_H
#define IFREADER_INDEXER_LINE_INDEX_BUILDER_H

#include <ifreader/common/constants.h>
#include <ifreader/common/thread_pool.h>
#include <ifreader/indexer/line_index.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace ifreader {

/**
 * Computes the line-start offsets of a file by recursively halving byte
 * ranges. Ranges shorter than the threshold are scanned directly with a
 * private BufferedRandomAccessFile; larger ones are split at the midpoint,
 * one half forked onto the pool and the other computed on the calling
 * thread.
 *
 * A range may begin in the middle of a line. Its first read_line() then
 * consumes the tail of that line and the position it reports is the next
 * real line start. Neighbouring ranges can therefore report the same
 * boundary, and the set merge drops the duplicate.
 */
class LineIndexBuilder {
   public:
    /**
     * @param path File to index
     * @param threshold Ranges shorter than this many bytes are scanned
     *                  directly (must be >= 1)
     * @param pool Pool used for the forked halves
     * @param strict Rethrow scan failures as IndexerError instead of
     *               returning the offsets gathered so far
     * @param buffer_size Read-ahead buffer size of each scanning reader
     * @throws IndexerError(INVALID_ARGUMENT) if threshold is 0
     */
    LineIndexBuilder(
        const std::string &path, std::uint64_t threshold, ThreadPool &pool,
        bool strict = false,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE);

    /**
     * Collect the line-start offsets discovered in [start, end)
     * @throws IndexerError(INVALID_ARGUMENT) if end < start
     * @throws IndexerError(BUILD_ERROR) on I/O failure in strict mode
     */
    LineOffsetSet build(std::uint64_t start, std::uint64_t end) const;

    /**
     * max(MIN_FORK_THRESHOLD, file_length / split_count)
     * @throws IndexerError(INVALID_ARGUMENT) if split_count is 0
     */
    static std::uint64_t compute_threshold(std::uint64_t file_length,
                                           std::size_t split_count);

    std::uint64_t get_threshold() const { return threshold_; }
    bool is_strict() const { return strict_; }

   private:
    LineOffsetSet scan(std::uint64_t start, std::uint64_t end) const;

    std::string path_;
    std::uint64_t threshold_;
    ThreadPool &pool_;
    bool strict_;
    std::size_t buffer_size_;
};

/**
 * Index a whole file
 * @param path File to index
 * @param split_count How many pieces the file may be divided into for
 *                    parallel indexing; the threshold never drops below
 *                    MIN_FORK_THRESHOLD
 * @param pool Pool to fork onto; nullptr selects ThreadPool::shared()
 * @param strict See LineIndexBuilder
 */
LineIndex build_line_index(
    const std::string &path,
    std::size_t split_count = constants::indexer::DEFAULT_SPLIT_COUNT,
    ThreadPool *pool = nullptr, bool strict = false);

}  // namespace ifreader

#endif  // IFREADER_INDEXER_LINE_INDEX_BUILDER_H
