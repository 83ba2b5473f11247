#include <ifreader/reader/error.h>

namespace ifreader {

std::string ReaderError::format_message(Type type, const std::string &message) {
    std::string prefix;
    switch (type) {
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case FILE_IO_ERROR:
            prefix = "[FILE_IO]";
            break;
        case READ_ERROR:
            prefix = "[READ]";
            break;
        case INITIALIZATION_ERROR:
            prefix = "[INITIALIZATION]";
            break;
        case UNKNOWN_ERROR:
            prefix = "[UNKNOWN]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace ifreader
