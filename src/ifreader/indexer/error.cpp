#include <ifreader/indexer/error.h>

namespace ifreader {

std::string IndexerError::format_message(Type type,
                                         const std::string &message) {
    std::string prefix;
    switch (type) {
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case FILE_ERROR:
            prefix = "[FILE]";
            break;
        case BUILD_ERROR:
            prefix = "[BUILD]";
            break;
        case UNKNOWN_ERROR:
            prefix = "[UNKNOWN]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace ifreader
