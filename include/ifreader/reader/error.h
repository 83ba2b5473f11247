#ifndef IFREADER_READER_ERROR_H
#define IFREADER_READER_ERROR_H

#include <stdexcept>
#include <string>

namespace ifreader {

class ReaderError : public std::runtime_error {
   public:
    enum Type {
        INVALID_ARGUMENT,
        FILE_IO_ERROR,
        READ_ERROR,
        INITIALIZATION_ERROR,
        UNKNOWN_ERROR
    };

    ReaderError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    Type type_;

    static std::string format_message(Type type, const std::string &message);
};

}  // namespace ifreader

#endif  // IFREADER_READER_ERROR_H
