#ifndef ASYNCFS_ENCODING_H
#define ASYNCFS_ENCODING_H

#include <string>

namespace asyncfs {

// How filenames handed back to the caller are represented.
enum class Encoding { Utf8, Buffer, Hex };

bool parse_encoding(const std::string& text, Encoding& out);
const char *encoding_name(Encoding enc);

// Converts a raw name from the OS into the requested representation.
// Utf8 replaces malformed sequences with U+FFFD, Buffer passes the bytes
// through, Hex renders two lowercase digits per byte.
std::string encode_name(const std::string& raw, Encoding enc);

} // namespace asyncfs

#endif
