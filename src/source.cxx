/*
    Brisk - A small brainfuck interpreter
    Program source and console input helpers
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "source.hxx"

#include <cctype>
#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>

#include "vm.hxx"

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
#ifndef _WIN32
// Read-only mapping of a whole file, released on destruction
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }

    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};

bool mapFileReadOnly(const std::string& path, MappedFile& mf) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    struct stat st{};
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return false;
    }
    mf.fd = fd;
    if (st.st_size == 0) return true;
    void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (view == MAP_FAILED) {
        mf.close();
        return false;
    }
    mf.data = static_cast<const char*>(view);
    mf.size = static_cast<size_t>(st.st_size);
    return true;
}
#endif
}  // namespace

namespace brisk {

bool readBfFileCompacted(const std::string& filename, std::string& out, std::string& err) {
#ifndef _WIN32
    MappedFile mf;
    if (mapFileReadOnly(filename, mf)) {
        if (mf.size == 0 || mf.data == nullptr) {
            out.clear();
            return true;
        }
        out = compact(std::string_view(mf.data, mf.size));
        return true;
    }
#endif
    // Fallback: stream and compact
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened";
        return false;
    }
    std::string compacted;
    compacted.reserve(1 << 16);
    char c;
    while (in.get(c)) {
        if (isBfChar(c)) compacted.push_back(c);
    }
    if (!in.eof() && in.fail()) {
        err = "Error while reading file";
        return false;
    }
    out.swap(compacted);
    return true;
}

LineInputBuf::int_type LineInputBuf::underflow() {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    std::string line;
    if (!std::getline(upstream_, line)) return traits_type::eof();
    size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i == line.size()) return traits_type::eof();
    current_ = line[i];
    setg(&current_, &current_, &current_ + 1);
    return traits_type::to_int_type(current_);
}

}  // namespace brisk
