#ifndef IFREADER_INDEXER_LINE_INDEX_H
#define IFREADER_INDEXER_LINE_INDEX_H

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace ifreader {

// Offsets collected while indexing; ordered and free of duplicates
using LineOffsetSet = std::set<std::uint64_t>;

/**
 * Immutable ascending sequence of line-start byte offsets.
 *
 * Entry k-1 is the offset of line k (1-based). The last entry is a sentinel
 * equal to the file length, so a complete index over a file with N lines has
 * N + 1 entries.
 */
class LineIndex {
   public:
    LineIndex() = default;
    explicit LineIndex(const LineOffsetSet &offsets);
    explicit LineIndex(std::vector<std::uint64_t> offsets);

    /**
     * Number of entries, sentinel included
     */
    std::size_t size() const { return offsets_.size(); }
    bool empty() const { return offsets_.empty(); }

    /**
     * Number of lines described by the index
     */
    std::size_t num_lines() const {
        return offsets_.empty() ? 0 : offsets_.size() - 1;
    }

    /**
     * Byte offset at which a line starts
     * @param line 1-based line number in [1, size()]
     * @throws std::out_of_range if line is outside the index
     */
    std::uint64_t offset(std::size_t line) const;

    /**
     * Whether the index covers a file of the given length: it starts at 0 and
     * ends with a sentinel equal to file_length
     */
    bool is_complete(std::uint64_t file_length) const;

    const std::vector<std::uint64_t> &offsets() const { return offsets_; }

   private:
    std::vector<std::uint64_t> offsets_;
};

}  // namespace ifreader

#endif  // IFREADER_INDEXER_LINE_INDEX_H
