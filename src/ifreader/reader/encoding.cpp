#include <ifreader/reader/encoding.h>
#include <ifreader/reader/error.h>

#include <cctype>

namespace ifreader {

static const char UTF8_REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";

static std::string normalize_name(const std::string &name) {
    std::string lower;
    lower.reserve(name.size());
    for (unsigned char c : name) {
        if (c == '-' || c == '_') continue;
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    return lower;
}

Encoding Encoding::from_name(const std::string &name) {
    std::string key = normalize_name(name);
    if (key.empty() || key == "default" || key == "utf8") {
        return Encoding(UTF_8);
    }
    if (key == "usascii" || key == "ascii") {
        return Encoding(US_ASCII);
    }
    if (key == "iso88591" || key == "latin1" || key == "l1") {
        return Encoding(ISO_8859_1);
    }
    throw ReaderError(ReaderError::INVALID_ARGUMENT,
                      "Unsupported encoding: " + name);
}

const char *Encoding::name() const {
    switch (kind_) {
        case US_ASCII:
            return "US-ASCII";
        case ISO_8859_1:
            return "ISO-8859-1";
        case UTF_8:
        default:
            return "UTF-8";
    }
}

std::string Encoding::decode(const char *data, std::size_t size) const {
    std::string out;
    decode_into(data, size, out);
    return out;
}

void Encoding::decode_into(const char *data, std::size_t size,
                           std::string &out) const {
    switch (kind_) {
        case UTF_8:
            out.assign(data, size);
            return;
        case US_ASCII:
            out.clear();
            out.reserve(size);
            for (std::size_t i = 0; i < size; ++i) {
                unsigned char c = static_cast<unsigned char>(data[i]);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.append(UTF8_REPLACEMENT_CHAR);
                }
            }
            return;
        case ISO_8859_1:
            out.clear();
            out.reserve(size);
            for (std::size_t i = 0; i < size; ++i) {
                unsigned char c = static_cast<unsigned char>(data[i]);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return;
    }
}

}  // namespace ifreader
