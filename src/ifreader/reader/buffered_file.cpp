#include <ifreader/common/platform_compat.h>

#include <ifreader/common/logging.h>
#include <ifreader/reader/buffered_file.h>
#include <ifreader/reader/error.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace ifreader {

static std::string errno_message(const std::string &what,
                                 const std::string &path) {
    return what + " " + path + ": " + std::strerror(errno);
}

BufferedRandomAccessFile::BufferedRandomAccessFile(const std::string &path,
                                                   std::size_t buffer_size)
    : path_(path),
      file_(nullptr),
      length_(0),
      buffer_end_(0),
      buffer_pos_(0),
      real_pos_(0) {
    if (buffer_size == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "buffer_size must be greater than 0");
    }

    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          errno_message("Failed to open file", path));
    }

    // Reads are buffered here; a second stdio buffer would only add copies
    std::setvbuf(file_, nullptr, _IONBF, 0);

    if (fseeko(file_, 0, SEEK_END) != 0) {
        std::string message = errno_message("Failed to seek in file", path);
        std::fclose(file_);
        file_ = nullptr;
        throw ReaderError(ReaderError::FILE_IO_ERROR, message);
    }
    off_t end = ftello(file_);
    if (end < 0 || fseeko(file_, 0, SEEK_SET) != 0) {
        std::string message =
            errno_message("Failed to determine size of file", path);
        std::fclose(file_);
        file_ = nullptr;
        throw ReaderError(ReaderError::FILE_IO_ERROR, message);
    }
    length_ = static_cast<std::uint64_t>(end);

    buffer_.resize(buffer_size);
    scratch_.reserve(constants::reader::LINE_RESERVE_SIZE);

    IFREADER_LOG_TRACE("Opened {} ({} bytes) with a {} byte buffer", path_,
                       length_, buffer_size);
}

BufferedRandomAccessFile::~BufferedRandomAccessFile() { close(); }

BufferedRandomAccessFile::BufferedRandomAccessFile(
    BufferedRandomAccessFile &&other) noexcept
    : path_(std::move(other.path_)),
      file_(other.file_),
      length_(other.length_),
      buffer_(std::move(other.buffer_)),
      buffer_end_(other.buffer_end_),
      buffer_pos_(other.buffer_pos_),
      real_pos_(other.real_pos_),
      scratch_(std::move(other.scratch_)) {
    other.file_ = nullptr;
    other.buffer_end_ = 0;
    other.buffer_pos_ = 0;
    other.real_pos_ = 0;
}

BufferedRandomAccessFile &BufferedRandomAccessFile::operator=(
    BufferedRandomAccessFile &&other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        file_ = other.file_;
        length_ = other.length_;
        buffer_ = std::move(other.buffer_);
        buffer_end_ = other.buffer_end_;
        buffer_pos_ = other.buffer_pos_;
        real_pos_ = other.real_pos_;
        scratch_ = std::move(other.scratch_);
        other.file_ = nullptr;
        other.buffer_end_ = 0;
        other.buffer_pos_ = 0;
        other.real_pos_ = 0;
    }
    return *this;
}

void BufferedRandomAccessFile::close() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    buffer_end_ = 0;
    buffer_pos_ = 0;
}

void BufferedRandomAccessFile::seek(std::uint64_t position) {
    if (position <= real_pos_ && real_pos_ - position <= buffer_end_) {
        buffer_pos_ =
            buffer_end_ - static_cast<std::size_t>(real_pos_ - position);
        return;
    }

    if (!file_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "File is not open: " + path_);
    }
    if (fseeko(file_, static_cast<off_t>(position), SEEK_SET) != 0) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          errno_message("Failed to seek to offset " +
                                            std::to_string(position) + " in",
                                        path_));
    }
    invalidate(position);
}

int BufferedRandomAccessFile::read_byte() {
    if (buffer_pos_ >= buffer_end_ && fill_buffer() == 0) {
        return -1;
    }
    return static_cast<unsigned char>(buffer_[buffer_pos_++]);
}

std::size_t BufferedRandomAccessFile::read(char *buffer, std::size_t length) {
    std::size_t total = 0;
    while (total < length) {
        if (buffer_pos_ >= buffer_end_ && fill_buffer() == 0) {
            break;
        }
        std::size_t chunk = std::min(length - total, buffer_end_ - buffer_pos_);
        std::memcpy(buffer + total, buffer_.data() + buffer_pos_, chunk);
        buffer_pos_ += chunk;
        total += chunk;
    }
    return total;
}

bool BufferedRandomAccessFile::read_line(std::string &line,
                                         const Encoding &encoding) {
    if (buffer_pos_ >= buffer_end_ && fill_buffer() == 0) {
        return false;
    }

    // Fast path: the terminator is already buffered
    const char *begin = buffer_.data() + buffer_pos_;
    std::size_t available = buffer_end_ - buffer_pos_;
    const char *newline =
        static_cast<const char *>(std::memchr(begin, '\n', available));
    if (newline) {
        std::size_t consumed = static_cast<std::size_t>(newline - begin) + 1;
        std::size_t size = consumed - 1;
        if (size > 0 && begin[size - 1] == '\r') {
            --size;
        }
        encoding.decode_into(begin, size, line);
        buffer_pos_ += consumed;
        return true;
    }

    // Slow path: the line spans buffer refills or ends at EOF
    scratch_.clear();
    bool terminated = false;
    while (true) {
        if (buffer_pos_ >= buffer_end_ && fill_buffer() == 0) {
            break;
        }
        begin = buffer_.data() + buffer_pos_;
        available = buffer_end_ - buffer_pos_;
        newline =
            static_cast<const char *>(std::memchr(begin, '\n', available));
        if (newline) {
            std::size_t size = static_cast<std::size_t>(newline - begin);
            scratch_.append(begin, size);
            buffer_pos_ += size + 1;
            terminated = true;
            break;
        }
        scratch_.append(begin, available);
        buffer_pos_ = buffer_end_;
    }

    if (terminated && !scratch_.empty() && scratch_.back() == '\r') {
        scratch_.pop_back();
    }
    encoding.decode_into(scratch_.data(), scratch_.size(), line);
    return true;
}

std::size_t BufferedRandomAccessFile::fill_buffer() {
    if (!file_) {
        throw ReaderError(ReaderError::FILE_IO_ERROR,
                          "File is not open: " + path_);
    }

    std::size_t n = std::fread(buffer_.data(), 1, buffer_.size(), file_);
    if (n == 0 && std::ferror(file_)) {
        std::clearerr(file_);
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to read from file " + path_ + " at offset " +
                              std::to_string(real_pos_));
    }

    real_pos_ += n;
    buffer_end_ = n;
    buffer_pos_ = 0;
    return n;
}

void BufferedRandomAccessFile::invalidate(std::uint64_t position) {
    buffer_end_ = 0;
    buffer_pos_ = 0;
    real_pos_ = position;
}

}  // namespace ifreader
