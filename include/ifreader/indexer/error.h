#ifndef IFREADER_INDEXER_ERROR_H
#define IFREADER_INDEXER_ERROR_H

#include <stdexcept>
#include <string>

namespace ifreader {

class IndexerError : public std::runtime_error {
   public:
    enum Type { INVALID_ARGUMENT, FILE_ERROR, BUILD_ERROR, UNKNOWN_ERROR };

    IndexerError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    Type type_;

    static std::string format_message(Type type, const std::string &message);
};

}  // namespace ifreader

#endif  // IFREADER_INDEXER_ERROR_H
