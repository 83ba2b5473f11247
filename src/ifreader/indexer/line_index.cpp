#include <ifreader/indexer/line_index.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace ifreader {

LineIndex::LineIndex(const LineOffsetSet &offsets)
    : offsets_(offsets.begin(), offsets.end()) {}

LineIndex::LineIndex(std::vector<std::uint64_t> offsets)
    : offsets_(std::move(offsets)) {
    for (std::size_t i = 1; i < offsets_.size(); ++i) {
        if (offsets_[i] <= offsets_[i - 1]) {
            throw std::invalid_argument(
                "Line offsets must be strictly increasing (entry " +
                std::to_string(i) + ")");
        }
    }
}

std::uint64_t LineIndex::offset(std::size_t line) const {
    if (line == 0 || line > offsets_.size()) {
        throw std::out_of_range("Line " + std::to_string(line) +
                                " is outside the index (" +
                                std::to_string(offsets_.size()) + " entries)");
    }
    return offsets_[line - 1];
}

bool LineIndex::is_complete(std::uint64_t file_length) const {
    return !offsets_.empty() && offsets_.front() == 0 &&
           offsets_.back() == file_length;
}

}  // namespace ifreader
