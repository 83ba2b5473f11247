#ifndef IFREADER_READER_ENCODING_H
#define IFREADER_READER_ENCODING_H

#include <cstddef>
#include <string>

namespace ifreader {

/**
 * Byte-oriented text encoding used to decode lines into UTF-8 strings.
 *
 * Only encodings in which '\n' is the single byte 0x0A are supported, since
 * line scanning happens on raw bytes before decoding.
 */
class Encoding {
   public:
    enum Kind { UTF_8, US_ASCII, ISO_8859_1 };

    Encoding() : kind_(UTF_8) {}
    explicit Encoding(Kind kind) : kind_(kind) {}

    /**
     * Resolve an encoding by name (case insensitive)
     * @param name "UTF-8", "US-ASCII", "ISO-8859-1" or one of their aliases;
     *             empty or "default" selects the platform default (UTF-8)
     * @throws ReaderError(INVALID_ARGUMENT) for unsupported names
     */
    static Encoding from_name(const std::string &name);

    /**
     * Decode raw line bytes into a UTF-8 string
     */
    std::string decode(const char *data, std::size_t size) const;

    /**
     * Decode raw bytes in place into out, replacing its contents
     */
    void decode_into(const char *data, std::size_t size,
                     std::string &out) const;

    Kind kind() const { return kind_; }
    const char *name() const;

    bool operator==(const Encoding &other) const {
        return kind_ == other.kind_;
    }
    bool operator!=(const Encoding &other) const { return !(*this == other); }

   private:
    Kind kind_;
};

}  // namespace ifreader

#endif  // IFREADER_READER_ENCODING_H
