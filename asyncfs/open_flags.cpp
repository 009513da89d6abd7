#include "asyncfs/open_flags.h"
#include <fcntl.h>

namespace asyncfs {

namespace {

struct FlagEntry {
    const char *text;
    OpenFlags flags;
    int posix;
};

const FlagEntry flag_table[] = {
    {"r", OpenFlags::Read, O_RDONLY},
    {"r+", OpenFlags::ReadWrite, O_RDWR},
    {"w", OpenFlags::Write, O_WRONLY | O_CREAT | O_TRUNC},
    {"w+", OpenFlags::WriteRead, O_RDWR | O_CREAT | O_TRUNC},
    {"wx", OpenFlags::WriteExclusive, O_WRONLY | O_CREAT | O_TRUNC | O_EXCL},
    {"wx+", OpenFlags::ReadWriteExclusive, O_RDWR | O_CREAT | O_TRUNC | O_EXCL},
    {"a", OpenFlags::Append, O_WRONLY | O_CREAT | O_APPEND},
    {"a+", OpenFlags::AppendRead, O_RDWR | O_CREAT | O_APPEND},
    {"ax", OpenFlags::AppendExclusive, O_WRONLY | O_CREAT | O_APPEND | O_EXCL},
    {"ax+", OpenFlags::AppendReadExclusive, O_RDWR | O_CREAT | O_APPEND | O_EXCL},
};

const FlagEntry *find_entry(OpenFlags flags) {
    for (const auto& e : flag_table) {
        if (e.flags == flags) return &e;
    }
    return nullptr;
}

} // namespace

bool parse_open_flags(const std::string& text, OpenFlags& out) {
    // "xw" style spellings are accepted as aliases
    std::string norm = text;
    if (norm.size() >= 2 && norm[0] == 'x') norm = norm.substr(1, 1) + "x" + norm.substr(2);
    for (const auto& e : flag_table) {
        if (norm == e.text) {
            out = e.flags;
            return true;
        }
    }
    return false;
}

const char *open_flags_name(OpenFlags flags) {
    const FlagEntry *e = find_entry(flags);
    return e ? e->text : "r";
}

int to_posix_flags(OpenFlags flags) {
    const FlagEntry *e = find_entry(flags);
    return (e ? e->posix : O_RDONLY) | O_CLOEXEC;
}

bool is_append(OpenFlags flags) {
    return flags == OpenFlags::Append || flags == OpenFlags::AppendRead ||
           flags == OpenFlags::AppendExclusive || flags == OpenFlags::AppendReadExclusive;
}

} // namespace asyncfs
