#include "utils.hpp"
#include <cstdarg>
#include <cstdlib>

#if defined(__unix__) || defined(__unix) || (defined(__APPLE__) && defined(__MACH__))
    #include <unistd.h>
    #if defined(_POSIX_VERSION) && _POSIX_VERSION >= 200112L
        #define HAS_POSIX_2001 1
    #endif
#endif

#ifdef HAS_POSIX_2001
static bool posix_has_term_colors()
{
    if (!isatty(STDOUT_FILENO) || !isatty(STDERR_FILENO)) {
        return false;
    }
    const char* term = std::getenv("TERM");
    if (!term) {
        return false;
    }

    static const char* COLOR_TERMS[] = {
        "xterm",
        "screen",
        "tmux",
        "linux"
    };
    for (const char* color_term : COLOR_TERMS) {
        if (std::string_view(term).find(color_term) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}
#endif

static file_ptr LOGFILE(nullptr, nullptr);
static bool LOG_COLOR_CONSOLE = false;

int log_init()
{
    LOGFILE = SAFE_FOPEN(LOGFILE_NAME, "w");
    if (!LOGFILE) {
        // can't log an error
        std::fprintf(stderr, "Error: Could not create log file %s\n", LOGFILE_NAME);
        return -1;
    }
#ifdef HAS_POSIX_2001
    LOG_COLOR_CONSOLE = posix_has_term_colors();
#endif
    return 0;
}

static inline void do_log(std::FILE* stream,
    const char* prefix, const char* fmt, std::va_list vlist)
{
PUSH_WARNINGS
IGNORE_WFORMAT_NONLITERAL
    if (prefix) {
        std::fputs(prefix, stream);
    }
    std::vfprintf(stream, fmt, vlist);
    std::fputs("\n", stream);
POP_WARNINGS
}

#define GEN_LOG(stream, fmt, prefix, prefix_color)  \
do {                                                \
    std::va_list vlist;                             \
                                                    \
    if (LOGFILE) {                                  \
        va_start(vlist, fmt);                       \
        do_log(LOGFILE.get(), prefix, fmt, vlist);  \
        va_end(vlist);                              \
        std::fflush(LOGFILE.get());                 \
    }                                               \
                                                    \
    va_start(vlist, fmt);                           \
    do_log(stream, LOG_COLOR_CONSOLE ?              \
        prefix_color : prefix, fmt, vlist);         \
    va_end(vlist);                                  \
} while(0)

void logERROR(const char* fmt, ...)
{
    GEN_LOG(stderr, fmt, "Error: ", "\033[1;31mError:\033[0m ");
}

void logWARNING(const char* fmt, ...)
{
    GEN_LOG(stderr, fmt, "Warning: ", "\033[1;33mWarning:\033[0m ");
}

void logMESSAGE(const char* fmt, ...)
{
    GEN_LOG(stdout, fmt, nullptr, nullptr);
}

static std::string_view trim(std::string_view str)
{
    const char* beg = str.data();
    const char* end = str.data() + str.length();

    while (beg != end && is_ws(*beg)) { ++beg; }
    while (end != beg && is_ws(*(end - 1))) { --end; }

    return { beg, end };
}

// Split src at the first delim. Returns false if src is empty.
static bool extract_str(std::string_view& src, std::string_view& str, char delim)
{
    if (src.size() == 0) { return false; }

    size_t i = src.find(delim);
    size_t endpos = (i != src.npos) ? i : src.size();
    size_t nread = (i != src.npos) ? i + 1 : src.size(); // skip delim

    str = trim({ src.data(), endpos });
    src.remove_prefix(nread);
    return true;
}

inireader::inireader(const fs::path& path) :
    m_pathstr(path.string()), m_ok(false)
{
    file_ptr file = SAFE_FOPEN(path.c_str(), "rb");
    if (!file) {
        logERROR("Could not open file %s", path_cstr());
        return;
    }
    std::error_code ec;
    size_t filesize = size_t(fs::file_size(path, ec));
    if (ec) {
        logERROR("Could not get size of file %s: %s", path_cstr(), ec.message().c_str());
        return;
    }
    m_filebuf = std::make_unique<char[]>(filesize);

    if (std::fread(m_filebuf.get(), 1, filesize, file.get()) != filesize) {
        logERROR("Could not read from file %s", path_cstr());
        return;
    }

    int lineno = 0;
    std::string_view line, section;
    std::string_view filedata(m_filebuf.get(), filesize);

    while (extract_str(filedata, line, '\n'))
    {
        lineno++;
        if (line.empty() || line.starts_with(';') || line.starts_with('#')) {
            continue;
        }
        if (line.starts_with('[') && line.ends_with(']')) {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        std::string_view key, value;
        if (!extract_str(line, key, '=') || key.empty() ||
            !extract_str(line, value, '\n') || value.empty()) {
            logERROR("%s: Invalid entry on line %d", path_cstr(), lineno);
            return;
        }
        m_map[section][key] = value;
    }

    m_ok = true;
}

std::string_view inireader::get_value_sv(std::string_view section, std::string_view key) const
{
    auto sectitr = m_map.find(section);
    if (sectitr != m_map.end())
    {
        auto& entries = sectitr->second;
        auto valueitr = entries.find(key);
        if (valueitr != entries.end()) {
            return valueitr->second;
        }
    }
    return {};
}
