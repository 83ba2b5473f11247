#ifndef IFREADER_READER_READER_IMPL_H
#define IFREADER_READER_READER_IMPL_H

#include <ifreader/indexer/line_index.h>
#include <ifreader/reader/buffered_file.h>
#include <ifreader/reader/encoding.h>
#include <ifreader/reader/reader.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace ifreader {

struct IndexedFileReaderImplementor {
    std::string path;
    Encoding encoding;
    LineIndex index;
    // Shared cursor; every query holds `lock` while touching it
    BufferedRandomAccessFile file;
    std::mutex lock;

    IndexedFileReaderImplementor(const std::string &path,
                                 const std::string &encoding,
                                 std::size_t split_count, ThreadPool *pool,
                                 bool strict);
    IndexedFileReaderImplementor(const std::string &path, LineIndex index,
                                 const std::string &encoding, bool strict);

    LineMap read_lines(std::size_t from, std::size_t to);
    LineMap head(std::size_t n);
    LineMap tail(std::size_t n);
    LineMap find(std::size_t from, std::size_t to, const re2::RE2 &pattern);

    inline std::size_t get_num_lines() const { return index.num_lines(); }
    inline std::uint64_t get_max_bytes() const { return file.length(); }

   private:
    void check_index(bool strict) const;
    void validate_range(std::size_t from, std::size_t to) const;
    LineMap scan_lines(
        std::size_t from, std::size_t to,
        const std::function<bool(const std::string &)> &accept);
};

}  // namespace ifreader

#endif  // IFREADER_READER_READER_IMPL_H
