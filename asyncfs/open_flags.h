#ifndef ASYNCFS_OPEN_FLAGS_H
#define ASYNCFS_OPEN_FLAGS_H

#include <string>

namespace asyncfs {

enum class OpenFlags {
    Read,                   // r
    ReadWrite,              // r+
    Write,                  // w
    WriteRead,              // w+
    WriteExclusive,         // wx
    ReadWriteExclusive,     // wx+
    Append,                 // a
    AppendRead,             // a+
    AppendExclusive,        // ax
    AppendReadExclusive     // ax+
};

bool parse_open_flags(const std::string& text, OpenFlags& out);
const char *open_flags_name(OpenFlags flags);
int to_posix_flags(OpenFlags flags);
bool is_append(OpenFlags flags);

} // namespace asyncfs

#endif
