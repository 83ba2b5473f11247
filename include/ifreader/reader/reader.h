#ifndef IFREADER_READER_READER_H
#define IFREADER_READER_READER_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

/**
 * Opaque handle for an indexed file reader
 */
typedef void *ifr_reader_handle_t;

/**
 * Line callback used by the C API
 * @param line_number 1-based line number
 * @param text Decoded line, not NUL-terminated
 * @param length Length of text in bytes
 * @param user_data Pointer passed through from the caller
 * @return 0 to continue, non-zero to stop delivering lines
 */
typedef int (*ifr_line_callback_t)(size_t line_number, const char *text,
                                   size_t length, void *user_data);

/**
 * Open and index a file
 * @param path Path to the text file
 * @param encoding Encoding name, or NULL for the platform default
 * @param split_count Number of pieces the file may be split into while
 *                    indexing (1 disables forced splitting)
 * @return Opaque handle, or NULL on failure
 */
ifr_reader_handle_t ifr_reader_create(const char *path, const char *encoding,
                                      size_t split_count);
void ifr_reader_destroy(ifr_reader_handle_t reader);
int ifr_reader_get_num_lines(ifr_reader_handle_t reader, size_t *num_lines);
int ifr_reader_get_max_bytes(ifr_reader_handle_t reader, size_t *max_bytes);

/**
 * The query functions return the number of lines delivered to callback, or
 * -1 on error (invalid arguments, I/O failure, NULL handle or pattern).
 */
int ifr_reader_read_lines(ifr_reader_handle_t reader, size_t from, size_t to,
                          ifr_line_callback_t callback, void *user_data);
int ifr_reader_head(ifr_reader_handle_t reader, size_t n,
                    ifr_line_callback_t callback, void *user_data);
int ifr_reader_tail(ifr_reader_handle_t reader, size_t n,
                    ifr_line_callback_t callback, void *user_data);
int ifr_reader_find(ifr_reader_handle_t reader, size_t from, size_t to,
                    const char *pattern, ifr_line_callback_t callback,
                    void *user_data);

#ifdef __cplusplus
}  // extern "C"

#include <ifreader/common/constants.h>
#include <ifreader/indexer/line_index.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace re2 {
class RE2;
}

namespace ifreader {

class ThreadPool;
struct IndexedFileReaderImplementor;

// Line number (1-based) to decoded line text, ascending
using LineMap = std::map<std::size_t, std::string>;

/**
 * Reads lines of a text file by line number.
 *
 * The file is indexed once during construction; later changes to the file
 * are not reflected. Files larger than MIN_FORK_THRESHOLD can be indexed in
 * parallel by passing a split_count greater than 1.
 *
 * Thread-safe: queries share one file handle and are serialized by a lock.
 *
 * Example usage:
 * ```cpp
 * try {
 *     ifreader::IndexedFileReader reader("server.log");
 *     auto last = reader.tail(10);
 *     auto errors = reader.find(1, reader.get_num_lines(), ".*ERROR.*");
 * } catch (const ifreader::ReaderError &e) {
 *     // Handle error
 * }
 * ```
 */
class IndexedFileReader {
   public:
    /**
     * Open and index a file
     * @param path Path to the text file
     * @param encoding Encoding name; empty selects the platform default
     *        (UTF-8)
     * @param split_count Number of pieces the file may be split into for
     *                    parallel indexing
     * @param pool Pool used for indexing; nullptr selects the shared pool
     * @param strict Fail construction instead of keeping a partial index
     *               when indexing hits an I/O error
     * @throws ReaderError if the file cannot be opened or the encoding is
     *         unknown
     * @throws IndexerError if indexing fails in strict mode
     */
    explicit IndexedFileReader(
        const std::string &path,
        const std::string &encoding = constants::reader::DEFAULT_ENCODING,
        std::size_t split_count = constants::indexer::DEFAULT_SPLIT_COUNT,
        ThreadPool *pool = nullptr, bool strict = false);

    /**
     * Open a file with an index built earlier, e.g. by another reader of
     * the same file (see get_index())
     * @param strict Fail instead of warning when index does not cover the
     *               whole file
     * @throws ReaderError if the file cannot be opened or the encoding is
     *         unknown
     * @throws IndexerError(BUILD_ERROR) in strict mode if the index does not
     *         end at the file length
     */
    IndexedFileReader(
        const std::string &path, LineIndex index,
        const std::string &encoding = constants::reader::DEFAULT_ENCODING,
        bool strict = false);
    ~IndexedFileReader();

    IndexedFileReader(const IndexedFileReader &) = delete;
    IndexedFileReader &operator=(const IndexedFileReader &) = delete;
    IndexedFileReader(IndexedFileReader &&other) noexcept;
    IndexedFileReader &operator=(IndexedFileReader &&other) noexcept;

    /**
     * Read lines [from, to]. Stops quietly at end of file when to exceeds
     * the number of lines.
     * @throws ReaderError(INVALID_ARGUMENT) if from < 1, to < from or from
     *         is beyond the last line
     */
    LineMap read_lines(std::size_t from, std::size_t to);

    /**
     * Read the first n lines
     * @throws ReaderError(INVALID_ARGUMENT) if n < 1
     */
    LineMap head(std::size_t n);

    /**
     * Read the last n lines (all lines if n exceeds the line count)
     * @throws ReaderError(INVALID_ARGUMENT) if n < 1
     */
    LineMap tail(std::size_t n);

    /**
     * Read lines [from, to] and keep those whose whole text matches pattern
     * (RE2 syntax). Matching runs in time linear in the line length.
     * @throws ReaderError(INVALID_ARGUMENT) for invalid ranges, a null
     *         pattern or a pattern that does not compile
     */
    LineMap find(std::size_t from, std::size_t to, const char *pattern);
    LineMap find(std::size_t from, std::size_t to, const std::string &pattern);
    LineMap find(std::size_t from, std::size_t to, const re2::RE2 &pattern);

    std::size_t get_num_lines() const;
    std::uint64_t get_max_bytes() const;
    const std::string &get_path() const;
    const char *get_encoding() const;
    const LineIndex &get_index() const;

    /**
     * Check if the reader is valid
     * @return false once the reader has been moved from
     */
    bool is_valid() const;

   private:
    std::unique_ptr<IndexedFileReaderImplementor> p_impl_;
};

}  // namespace ifreader
#endif

#endif  // IFREADER_READER_READER_H
