
#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <charconv>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <type_traits>

#define US_PER_MS 1000
#define US_PER_S  1000000

#define LOGFILE_NAME "si8080.log"

#ifdef __clang__
    #define PUSH_WARNINGS _Pragma("clang diagnostic push")
    #define POP_WARNINGS  _Pragma("clang diagnostic pop")
    #define IGNORE_WFORMAT_NONLITERAL \
    _Pragma("clang diagnostic ignored \"-Wformat-nonliteral\"")
#elif defined(__GNUC__)
    #define PUSH_WARNINGS _Pragma("GCC diagnostic push")
    #define POP_WARNINGS  _Pragma("GCC diagnostic pop")
    #define IGNORE_WFORMAT_NONLITERAL \
    _Pragma("GCC diagnostic ignored \"-Wformat-nonliteral\"")
#else
    #define PUSH_WARNINGS
    #define POP_WARNINGS
    #define IGNORE_WFORMAT_NONLITERAL
#endif

namespace fs = std::filesystem;
namespace tim = std::chrono;

using clk = tim::steady_clock;
using uint = unsigned int;

// Open the log file. Until this is called,
// messages only go to the console.
int log_init();

void logERROR(const char* fmt, ...);
void logWARNING(const char* fmt, ...);
void logMESSAGE(const char* fmt, ...);


using file_ptr = std::unique_ptr<std::FILE, int(*)(std::FILE*)>;

#define SAFE_FOPEN(fname, mode) file_ptr(std::fopen(fname, mode), std::fclose)

template <typename T>
inline void set_bit(T* ptr, int bit, bool val)
{
    *ptr = T((*ptr & ~(0x1 << bit)) | (val << bit));
}

template <typename T>
inline bool get_bit(T word, int bit)
{
    return (word & (0x1 << bit)) != 0;
}

// C-locale
constexpr bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

template <typename T>
bool parse_num(std::string_view str, T& val)
{
    const char* beg = str.data();
    const char* end = str.data() + str.length();
    while (beg != end && is_ws(*beg)) { beg++; }
    while (end != beg && is_ws(*(end - 1))) { end--; }

    auto res = std::from_chars(beg, end, val);
    return res.ec == std::errc() && res.ptr == end;
}

// Read-only ini file.
// [Section]
// key = value
struct inireader
{
    inireader(const fs::path& path);

    bool ok() const { return m_ok; }

    const char* path_cstr() const { return m_pathstr.c_str(); }

    std::optional<std::string> get_string(std::string_view section, std::string_view key) const
    {
        auto str = get_value_sv(section, key);
        if (!str.data()) {
            return {};
        }
        return std::string(str);
    }

    template <typename T> requires std::is_arithmetic_v<T>
    std::optional<T> get_num(std::string_view section, std::string_view key) const
    {
        T value;
        auto str = get_value_sv(section, key);
        if (!str.data() || !parse_num(str, value)) {
            return {};
        }
        return value;
    }

    // True if the key exists, even if its value is not a number.
    bool has_key(std::string_view section, std::string_view key) const {
        return get_value_sv(section, key).data() != nullptr;
    }

private:
    // not null-terminated!
    std::string_view get_value_sv(std::string_view section, std::string_view key) const;

private:
    using section_t = std::unordered_map<std::string_view, std::string_view>;
    using map_t = std::unordered_map<std::string_view, section_t>;

    map_t m_map;
    std::string m_pathstr;
    std::unique_ptr<char[]> m_filebuf;
    bool m_ok;
};

#endif
