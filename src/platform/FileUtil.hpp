#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <string>

namespace snarp {

// Percent-decoding of a file URL path. Malformed escapes pass through.
inline std::string urlDecode(const std::string& in) {
    auto nibble = [](char c) -> int {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return -1;
        }
        return std::isdigit(static_cast<unsigned char>(c))
                   ? c - '0'
                   : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    };
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] == '%' && i + 2 < in.size() && nibble(in[i + 1]) >= 0 &&
            nibble(in[i + 2]) >= 0) {
            out += static_cast<char>(nibble(in[i + 1]) * 16 + nibble(in[i + 2]));
            i += 3;
        } else {
            out += in[i] == '+' ? ' ' : in[i];
            ++i;
        }
    }
    return out;
}

// file:///a/b and file://localhost/a/b to /a/b; anything else is returned
// unchanged.
inline std::string fileUrlToPath(const std::string& uri) {
    static const std::string kScheme = "file://";
    static const std::string kLocalhost = "localhost";
    if (uri.compare(0, kScheme.size(), kScheme) != 0) {
        return uri;
    }
    size_t start = kScheme.size();
    if (uri.compare(start, kLocalhost.size(), kLocalhost) == 0) {
        start += kLocalhost.size();
    }
    std::string path = uri.substr(start);
    if (path.empty() || path.front() != '/') {
        path = "/" + path;
    }
    return urlDecode(path);
}

inline bool isWritableDirectory(const std::string& path, std::string* err) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (err) {
            *err = "directory does not exist: " + path;
        }
        return false;
    }
    if (!S_ISDIR(st.st_mode)) {
        if (err) {
            *err = "not a directory: " + path;
        }
        return false;
    }
    if (::access(path.c_str(), W_OK) != 0) {
        if (err) {
            *err = "directory is not writable: " + path;
        }
        return false;
    }
    return true;
}

// <dir>/<prefix>_<timestamp>.<extension>
inline std::string makeOutputPath(const std::string& dir,
                                  const std::string& prefix,
                                  const std::string& timestamp,
                                  const std::string& extension) {
    std::string path = dir.empty() ? std::string(".") : dir;
    if (path.back() != '/') {
        path.push_back('/');
    }
    path += prefix + "_" + timestamp + "." + extension;
    return path;
}

inline std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

}  // namespace snarp
