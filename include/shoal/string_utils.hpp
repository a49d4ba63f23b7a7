#ifndef SHOAL_STRING_UTILS_HEADER
#define SHOAL_STRING_UTILS_HEADER

#include <cstdint>
#include <cstdio> // std::snprintf
#include <iterator> // std::begin, std::end
#include <memory> // std::unique_ptr
#include <string>

namespace shoal {
namespace util {

template <typename Bytes>
std::string to_hex(const Bytes& data)
{
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex_str;
    const size_t size = std::end(data) - std::begin(data);
    hex_str.reserve(size * 2);
    for(size_t i = 0; i < size; ++i) {
        const uint8_t byte = data[i];
        hex_str += hex_chars[byte >> 4];
        hex_str += hex_chars[byte & 0xf];
    }
    return hex_str;
}

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

/**
 * Soulseek shares paths with either separator, so the last component after '\' or '/'
 * is the file's name.
 */
inline std::string remote_file_name(const std::string& remote_path)
{
    const auto pos = remote_path.find_last_of("\\/");
    if(pos == std::string::npos) {
        return remote_path;
    }
    return remote_path.substr(pos + 1);
}

} // namespace util
} // namespace shoal

#endif // SHOAL_STRING_UTILS_HEADER
