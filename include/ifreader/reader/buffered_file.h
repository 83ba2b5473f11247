#ifndef IFREADER_READER_BUFFERED_FILE_H
#define IFREADER_READER_BUFFERED_FILE_H

#include <ifreader/common/constants.h>
#include <ifreader/reader/encoding.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace ifreader {

/**
 * Random-access file reader with an internal read-ahead buffer.
 *
 * Seeks that land inside the currently buffered window only move the
 * cursor; everything else performs a real seek and drops the buffer.
 * Lines are scanned on raw bytes and decoded with an Encoding.
 *
 * Not thread-safe: an instance carries a cursor and must be owned by one
 * thread at a time.
 *
 * Example usage:
 * ```cpp
 * ifreader::BufferedRandomAccessFile file("data.txt");
 * file.seek(1024);
 * std::string line;
 * while (file.read_line(line)) {
 *     // ...
 * }
 * ```
 */
class BufferedRandomAccessFile {
   public:
    /**
     * Open a file for buffered reading
     * @param path Path to the file
     * @param buffer_size Capacity of the read-ahead buffer in bytes
     * @throws ReaderError(FILE_IO_ERROR) if the file cannot be opened
     * @throws ReaderError(INVALID_ARGUMENT) if buffer_size is 0
     */
    explicit BufferedRandomAccessFile(
        const std::string &path,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE);
    ~BufferedRandomAccessFile();

    BufferedRandomAccessFile(const BufferedRandomAccessFile &) = delete;
    BufferedRandomAccessFile &operator=(const BufferedRandomAccessFile &) =
        delete;
    BufferedRandomAccessFile(BufferedRandomAccessFile &&other) noexcept;
    BufferedRandomAccessFile &operator=(
        BufferedRandomAccessFile &&other) noexcept;

    /**
     * Current logical offset in the file, in bytes. Does no I/O.
     */
    std::uint64_t get_position() const {
        return real_pos_ - (buffer_end_ - buffer_pos_);
    }

    /**
     * Move the cursor to an absolute offset. Positions past the end of the
     * file are accepted; the next read reports end of file.
     * @throws ReaderError(FILE_IO_ERROR) if the underlying seek fails
     */
    void seek(std::uint64_t position);

    /**
     * Read one byte
     * @return the byte as 0-255, or -1 at end of file
     * @throws ReaderError(READ_ERROR) on I/O failure
     */
    int read_byte();

    /**
     * Read up to length bytes into buffer
     * @return number of bytes read, smaller than length only at end of file
     * @throws ReaderError(READ_ERROR) on I/O failure
     */
    std::size_t read(char *buffer, std::size_t length);

    /**
     * Read the next line. "\n" and "\r\n" terminate a line and are not
     * part of the result; a lone "\r" is kept as content.
     * @param line Receives the decoded line
     * @param encoding Encoding used to decode the line bytes
     * @return false if end of file was hit before reading any byte
     * @throws ReaderError(READ_ERROR) on I/O failure
     */
    bool read_line(std::string &line, const Encoding &encoding = Encoding());

    /**
     * Length of the file at the time it was opened
     */
    std::uint64_t length() const { return length_; }

    const std::string &get_path() const { return path_; }
    std::size_t get_buffer_size() const { return buffer_.size(); }
    bool is_open() const { return file_ != nullptr; }

    void close();

   private:
    std::size_t fill_buffer();
    void invalidate(std::uint64_t position);

    std::string path_;
    FILE *file_;
    std::uint64_t length_;
    std::vector<char> buffer_;
    std::size_t buffer_end_;
    std::size_t buffer_pos_;
    // File offset of the byte just past buffer_[buffer_end_ - 1]
    std::uint64_t real_pos_;
    std::string scratch_;
};

}  // namespace ifreader

#endif  // IFREADER_READER_BUFFERED_FILE_H
