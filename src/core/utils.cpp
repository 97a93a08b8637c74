#include <codegate/core/utils.hpp>
#include <codegate/core/logger.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <openssl/rand.h>

namespace codegate {

// ============ Time utilities ============

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size(); ) {
        unsigned char c = static_cast<unsigned char>(s[i]);

        int expected = 0;
        if (c < 0x80) {
            // ASCII range: allow tab, newline and printable chars
            if (c == 0x09 || c == 0x0A || c >= 0x20) {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back(' ');
            }
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            expected = 2;
        } else if ((c & 0xF0) == 0xE0) {
            expected = 3;
        } else if ((c & 0xF8) == 0xF0) {
            expected = 4;
        } else {
            out += "\xEF\xBF\xBD"; // U+FFFD
            ++i;
            continue;
        }

        bool valid = true;
        if (i + expected > s.size()) {
            valid = false;
        } else {
            for (int j = 1; j < expected; ++j) {
                if ((static_cast<unsigned char>(s[i + j]) & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
            }
        }

        if (valid) {
            out.append(s, i, expected);
            i += expected;
        } else {
            out += "\xEF\xBF\xBD"; // U+FFFD
            ++i;
        }
    }

    return out;
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component

    std::string dir = filepath.substr(0, pos);

    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }

    return true;
}

std::string default_temp_dir() {
    const char* tmp = getenv("TMPDIR");
    if (tmp && tmp[0] != '\0') {
        return std::string(tmp);
    }
    return "/tmp";
}

// ============ UUID utilities ============

void fallback_random_bytes(unsigned char* out, size_t len) {
    static std::atomic<uint64_t> counter(0);

    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    uint64_t state = static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL
                   + static_cast<uint64_t>(ts.tv_nsec);
    state ^= static_cast<uint64_t>(getpid()) << 32;
    state += counter.fetch_add(1) * 0x9E3779B97F4A7C15ULL;

    // splitmix64
    for (size_t i = 0; i < len; i += 8) {
        state += 0x9E3779B97F4A7C15ULL;
        uint64_t z = state;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        z ^= z >> 31;
        for (size_t j = 0; j < 8 && i + j < len; ++j) {
            out[i + j] = static_cast<unsigned char>(z >> (8 * j));
        }
    }
}

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        LOG_WARN("[Utils] RAND_bytes failed, task id is not cryptographically random");
        fallback_random_bytes(bytes, sizeof(bytes));
    }

    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

} // namespace codegate
