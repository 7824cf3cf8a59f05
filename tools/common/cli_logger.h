#pragma once

#include <algorithm>
#include <iostream>
#include <string_view>
#include <utility>

#include "console_unicode.h"

namespace srctools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline VerbosityLevel verbosity_level() { return current_level; }

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }
inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "VERBOSE";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "VERBOSE";
}

constexpr const char* level_emoji(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "🔇";
        case VerbosityLevel::Verbose: return "🔈";
        case VerbosityLevel::Debug: return "🐞";
    }
    return "🔈";
}

inline bool supports_utf() {
    static const bool value = []() {
        auto caps = consoleu::detect_capabilities();
        return caps.has_native_unicode_console || caps.utf8_configured;
    }();
    return value;
}

// marker picks a status glyph for summary lines: "✔"/"[ok]" and friends.
inline std::string_view marker(std::string_view utf8, std::string_view ascii) {
    return supports_utf() ? utf8 : ascii;
}

template <typename... Args>
void write_line(std::ostream& stream, Args&&... args) {
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    if (supports_utf())
        stream << '[' << level_emoji(min_level) << "] ";
    else
        stream << '[' << level_name(min_level) << "] ";
    write_line(stream, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    std::cerr << marker("⚠️ ", "[WARN] ");
    write_line(std::cerr, std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    std::cerr << marker("❌ ", "[ERROR] ");
    write_line(std::cerr, std::forward<Args>(args)...);
}

// print writes program output (tables, JSON) to stdout.
template <typename... Args> void print(Args&&... args) {
    write_line(std::cout, std::forward<Args>(args)...);
}

// log_plain writes an unprefixed line to stderr regardless of verbosity.
template <typename... Args> void log_plain(Args&&... args) {
    write_line(std::cerr, std::forward<Args>(args)...);
}

} // namespace srctools::log

namespace srctools::cli {
    using namespace srctools::log;
}

#define LOGI(...) ::srctools::log::info(__VA_ARGS__)
#define LOGW(...) ::srctools::log::warn(__VA_ARGS__)
#define LOGE(...) ::srctools::log::error(__VA_ARGS__)

#if SRCTOOLS_DEBUG
    #define LOGD(...) ::srctools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
