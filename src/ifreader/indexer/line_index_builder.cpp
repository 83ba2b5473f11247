#include <ifreader/common/logging.h>
#include <ifreader/indexer/error.h>
#include <ifreader/indexer/line_index_builder.h>
#include <ifreader/reader/buffered_file.h>
#include <ifreader/reader/error.h>
#include <ifreader/utils/filesystem.h>
#include <ifreader/utils/timer.h>

#include <algorithm>
#include <exception>
#include <string>

namespace ifreader {

LineIndexBuilder::LineIndexBuilder(const std::string &path,
                                   std::uint64_t threshold, ThreadPool &pool,
                                   bool strict, std::size_t buffer_size)
    : path_(path),
      threshold_(threshold),
      pool_(pool),
      strict_(strict),
      buffer_size_(buffer_size) {
    if (threshold_ == 0) {
        throw IndexerError(IndexerError::INVALID_ARGUMENT,
                           "threshold must be greater than 0");
    }
}

std::uint64_t LineIndexBuilder::compute_threshold(std::uint64_t file_length,
                                                  std::size_t split_count) {
    if (split_count == 0) {
        throw IndexerError(IndexerError::INVALID_ARGUMENT,
                           "split_count must be greater than 0");
    }
    return std::max<std::uint64_t>(constants::indexer::MIN_FORK_THRESHOLD,
                                   file_length / split_count);
}

LineOffsetSet LineIndexBuilder::build(std::uint64_t start,
                                      std::uint64_t end) const {
    if (end < start) {
        throw IndexerError(IndexerError::INVALID_ARGUMENT,
                           "end (" + std::to_string(end) +
                               ") must be greater than or equal to start (" +
                               std::to_string(start) + ")");
    }

    std::uint64_t length = end - start;
    if (length < threshold_ || length < 2) {
        return scan(start, end);
    }

    std::uint64_t mid = start + length / 2;
    IFREADER_LOG_TRACE("Splitting [{}, {}) at {}", start, end, mid);

    auto first_half = pool_.fork([this, start, mid]() {
        return build(start, mid);
    });

    // The forked half references this builder, so it must be joined before
    // any exception leaves this frame.
    std::exception_ptr error;
    LineOffsetSet offsets;
    try {
        offsets = build(mid, end);
    } catch (...) {
        error = std::current_exception();
    }

    LineOffsetSet first_offsets;
    try {
        first_offsets = first_half->join();
    } catch (...) {
        if (!error) error = std::current_exception();
    }

    if (error) {
        std::rethrow_exception(error);
    }

    offsets.merge(first_offsets);
    return offsets;
}

LineOffsetSet LineIndexBuilder::scan(std::uint64_t start,
                                     std::uint64_t end) const {
    LineOffsetSet offsets;
    try {
        BufferedRandomAccessFile file(path_, buffer_size_);
        file.seek(start);

        // Only the range that begins at the true start of the file records
        // the first line
        if (start == 0) {
            offsets.insert(0);
        }

        std::string line;
        while (file.get_position() < end) {
            if (!file.read_line(line)) {
                break;
            }
            offsets.insert(file.get_position());
        }
    } catch (const ReaderError &e) {
        if (strict_) {
            throw IndexerError(IndexerError::BUILD_ERROR,
                               "Failed to index range [" +
                                   std::to_string(start) + ", " +
                                   std::to_string(end) + ") of " + path_ +
                                   ": " + e.what());
        }
        IFREADER_LOG_WARN(
            "Indexing range [{}, {}) of {} stopped early after {} offsets: {}",
            start, end, path_, offsets.size(), e.what());
    }
    return offsets;
}

LineIndex build_line_index(const std::string &path, std::size_t split_count,
                           ThreadPool *pool, bool strict) {
    std::uint64_t file_length = 0;
    try {
        file_length = utils::file_size(path);
    } catch (const fs::filesystem_error &e) {
        throw IndexerError(IndexerError::FILE_ERROR,
                           "Cannot determine size of " + path + ": " +
                               e.what());
    }

    std::uint64_t threshold =
        LineIndexBuilder::compute_threshold(file_length, split_count);
    ThreadPool &executor = pool ? *pool : ThreadPool::shared();

    IFREADER_LOG_DEBUG(
        "Indexing {} ({} bytes) with threshold={} on {} threads", path,
        file_length, threshold, executor.size());

    Timer timer("build_line_index");
    LineIndexBuilder builder(path, threshold, executor, strict);
    LineIndex index(builder.build(0, file_length));
    timer.stop();

    IFREADER_LOG_DEBUG("[{}] Indexed {} lines of {} in {:.3f} ms",
                       timer.name(), index.num_lines(), path,
                       timer.elapsed());
    return index;
}

}  // namespace ifreader
