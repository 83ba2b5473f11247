#include <ifreader/common/logging.h>
#include <ifreader/indexer/error.h>
#include <ifreader/indexer/line_index_builder.h>
#include <ifreader/reader/error.h>
#include <ifreader/reader/reader_impl.h>
#include <re2/re2.h>

#include <string>
#include <utility>

namespace ifreader {

static void validate_count(std::size_t n) {
    if (n < 1) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Argument 'n' must be greater than or equal to 1");
    }
}

IndexedFileReaderImplementor::IndexedFileReaderImplementor(
    const std::string &path_, const std::string &encoding_,
    std::size_t split_count, ThreadPool *pool, bool strict)
    : path(path_), encoding(Encoding::from_name(encoding_)), file(path_) {
    index = build_line_index(path, split_count, pool, strict);
    check_index(strict);
}

IndexedFileReaderImplementor::IndexedFileReaderImplementor(
    const std::string &path_, LineIndex index_, const std::string &encoding_,
    bool strict)
    : path(path_),
      encoding(Encoding::from_name(encoding_)),
      index(std::move(index_)),
      file(path_) {
    check_index(strict);
}

void IndexedFileReaderImplementor::check_index(bool strict) const {
    if (!index.is_complete(file.length())) {
        std::string message =
            "Index of " + path + " is incomplete: " +
            std::to_string(index.size()) + " offsets for " +
            std::to_string(file.length()) + " bytes";
        if (strict) {
            throw IndexerError(IndexerError::BUILD_ERROR, message);
        }
        IFREADER_LOG_WARN("{}", message);
    }

    IFREADER_LOG_DEBUG("Created reader for {}: {} lines, {} bytes, {}", path,
                       index.num_lines(), file.length(), encoding.name());
}

void IndexedFileReaderImplementor::validate_range(std::size_t from,
                                                  std::size_t to) const {
    if (from < 1) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Argument 'from' must be greater than or equal to 1");
    }
    if (to < from) {
        throw ReaderError(
            ReaderError::INVALID_ARGUMENT,
            "Argument 'to' must be greater than or equal to 'from'");
    }
    if (from > index.num_lines()) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "Argument 'from' must not exceed the file's number "
                          "of lines (" +
                              std::to_string(index.num_lines()) + ")");
    }
}

LineMap IndexedFileReaderImplementor::scan_lines(
    std::size_t from, std::size_t to,
    const std::function<bool(const std::string &)> &accept) {
    LineMap lines;
    std::lock_guard<std::mutex> guard(lock);

    file.seek(index.offset(from));
    std::string line;
    for (std::size_t i = from; i <= to; ++i) {
        if (!file.read_line(line, encoding)) {
            break;
        }
        if (accept(line)) {
            lines.emplace(i, line);
        }
    }

    IFREADER_LOG_TRACE("Scanned lines [{}, {}] of {}: {} kept", from, to, path,
                       lines.size());
    return lines;
}

LineMap IndexedFileReaderImplementor::read_lines(std::size_t from,
                                                 std::size_t to) {
    validate_range(from, to);
    return scan_lines(from, to, [](const std::string &) { return true; });
}

LineMap IndexedFileReaderImplementor::head(std::size_t n) {
    validate_count(n);
    return read_lines(1, n);
}

LineMap IndexedFileReaderImplementor::tail(std::size_t n) {
    validate_count(n);
    std::size_t num_lines = index.num_lines();
    if (num_lines == 0) {
        throw ReaderError(ReaderError::INVALID_ARGUMENT,
                          "File " + path + " has no lines");
    }
    std::size_t from = num_lines >= n ? num_lines - n + 1 : 1;
    return read_lines(from, num_lines);
}

LineMap IndexedFileReaderImplementor::find(std::size_t from, std::size_t to,
                                           const re2::RE2 &pattern) {
    validate_range(from, to);
    return scan_lines(from, to, [&pattern](const std::string &line) {
        return re2::RE2::FullMatch(line, pattern);
    });
}

}  // namespace ifreader
