#include <ifreader/common/logging.h>
#include <ifreader/reader/error.h>
#include <ifreader/reader/reader.h>
#include <ifreader/reader/reader_impl.h>
#include <re2/re2.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace ifreader {

static std::unique_ptr<re2::RE2> compile_pattern(const char *pattern) {
    if (pattern == nullptr) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Argument 'pattern' must not be null");
    }
    re2::RE2::Options options;
    options.set_log_errors(false);
    auto regex = std::make_unique<re2::RE2>(pattern, options);
    if (!regex->ok()) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Invalid pattern '" + std::string(pattern) +
                              "': " + regex->error());
    }
    return regex;
}

static void check_reader_state(
    const std::unique_ptr<IndexedFileReaderImplementor> &impl) {
    if (!impl) {
        throw ReaderError(ReaderError::INITIALIZATION_ERROR,
                          "Reader is not valid");
    }
}

IndexedFileReader::IndexedFileReader(const std::string &path,
                                     const std::string &encoding,
                                     std::size_t split_count, ThreadPool *pool,
                                     bool strict)
    : p_impl_(new IndexedFileReaderImplementor(path, encoding, split_count,
                                               pool, strict)) {}

IndexedFileReader::IndexedFileReader(const std::string &path, LineIndex index,
                                     const std::string &encoding, bool strict)
    : p_impl_(new IndexedFileReaderImplementor(path, std::move(index),
                                               encoding, strict)) {}

IndexedFileReader::~IndexedFileReader() = default;

IndexedFileReader::IndexedFileReader(IndexedFileReader &&other) noexcept
    : p_impl_(std::move(other.p_impl_)) {}

IndexedFileReader &IndexedFileReader::operator=(
    IndexedFileReader &&other) noexcept {
    if (this != &other) {
        p_impl_ = std::move(other.p_impl_);
    }
    return *this;
}

LineMap IndexedFileReader::read_lines(std::size_t from, std::size_t to) {
    check_reader_state(p_impl_);
    return p_impl_->read_lines(from, to);
}

LineMap IndexedFileReader::head(std::size_t n) {
    check_reader_state(p_impl_);
    return p_impl_->head(n);
}

LineMap IndexedFileReader::tail(std::size_t n) {
    check_reader_state(p_impl_);
    return p_impl_->tail(n);
}

LineMap IndexedFileReader::find(std::size_t from, std::size_t to,
                                const char *pattern) {
    check_reader_state(p_impl_);
    auto regex = compile_pattern(pattern);
    return p_impl_->find(from, to, *regex);
}

LineMap IndexedFileReader::find(std::size_t from, std::size_t to,
                                const std::string &pattern) {
    return find(from, to, pattern.c_str());
}

LineMap IndexedFileReader::find(std::size_t from, std::size_t to,
                                const re2::RE2 &pattern) {
    check_reader_state(p_impl_);
    if (!pattern.ok()) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Invalid pattern '" + pattern.pattern() +
                              "': " + pattern.error());
    }
    return p_impl_->find(from, to, pattern);
}

std::size_t IndexedFileReader::get_num_lines() const {
    check_reader_state(p_impl_);
    return p_impl_->get_num_lines();
}

std::uint64_t IndexedFileReader::get_max_bytes() const {
    check_reader_state(p_impl_);
    return p_impl_->get_max_bytes();
}

const std::string &IndexedFileReader::get_path() const {
    check_reader_state(p_impl_);
    return p_impl_->path;
}

const char *IndexedFileReader::get_encoding() const {
    check_reader_state(p_impl_);
    return p_impl_->encoding.name();
}

const LineIndex &IndexedFileReader::get_index() const {
    check_reader_state(p_impl_);
    return p_impl_->index;
}

bool IndexedFileReader::is_valid() const { return p_impl_ != nullptr; }

}  // namespace ifreader

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

using ifreader::IndexedFileReader;
using ifreader::LineMap;

static int deliver_lines(const LineMap &lines, ifr_line_callback_t callback,
                         void *user_data) {
    int delivered = 0;
    for (const auto &entry : lines) {
        ++delivered;
        if (callback(entry.first, entry.second.data(), entry.second.size(),
                     user_data) != 0) {
            break;
        }
    }
    return delivered;
}

template <typename Query>
static int run_query(ifr_reader_handle_t reader, ifr_line_callback_t callback,
                     void *user_data, Query query) {
    if (!reader || !callback) {
        return -1;
    }
    try {
        auto *r = static_cast<IndexedFileReader *>(reader);
        return deliver_lines(query(*r), callback, user_data);
    } catch (const std::exception &e) {
        IFREADER_LOG_ERROR("Query failed: {}", e.what());
        return -1;
    }
}

extern "C" {

ifr_reader_handle_t ifr_reader_create(const char *path, const char *encoding,
                                      size_t split_count) {
    if (!path) {
        IFREADER_LOG_ERROR("Invalid path: NULL");
        return nullptr;
    }

    try {
        auto *reader = new IndexedFileReader(
            path,
            encoding ? encoding : ifreader::constants::reader::DEFAULT_ENCODING,
            split_count);
        return static_cast<ifr_reader_handle_t>(reader);
    } catch (const std::exception &e) {
        IFREADER_LOG_ERROR("Failed to create reader for {}: {}", path,
                           e.what());
        return nullptr;
    }
}

void ifr_reader_destroy(ifr_reader_handle_t reader) {
    if (reader) {
        delete static_cast<IndexedFileReader *>(reader);
    }
}

int ifr_reader_get_num_lines(ifr_reader_handle_t reader, size_t *num_lines) {
    if (!reader || !num_lines) {
        return -1;
    }
    *num_lines = static_cast<IndexedFileReader *>(reader)->get_num_lines();
    return 0;
}

int ifr_reader_get_max_bytes(ifr_reader_handle_t reader, size_t *max_bytes) {
    if (!reader || !max_bytes) {
        return -1;
    }
    *max_bytes = static_cast<size_t>(
        static_cast<IndexedFileReader *>(reader)->get_max_bytes());
    return 0;
}

int ifr_reader_read_lines(ifr_reader_handle_t reader, size_t from, size_t to,
                          ifr_line_callback_t callback, void *user_data) {
    return run_query(reader, callback, user_data,
                     [from, to](IndexedFileReader &r) {
                         return r.read_lines(from, to);
                     });
}

int ifr_reader_head(ifr_reader_handle_t reader, size_t n,
                    ifr_line_callback_t callback, void *user_data) {
    return run_query(reader, callback, user_data,
                     [n](IndexedFileReader &r) { return r.head(n); });
}

int ifr_reader_tail(ifr_reader_handle_t reader, size_t n,
                    ifr_line_callback_t callback, void *user_data) {
    return run_query(reader, callback, user_data,
                     [n](IndexedFileReader &r) { return r.tail(n); });
}

int ifr_reader_find(ifr_reader_handle_t reader, size_t from, size_t to,
                    const char *pattern, ifr_line_callback_t callback,
                    void *user_data) {
    if (!pattern) {
        return -1;
    }
    return run_query(reader, callback, user_data,
                     [from, to, pattern](IndexedFileReader &r) {
                         return r.find(from, to, pattern);
                     });
}

}  // extern "C"
