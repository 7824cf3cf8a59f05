#include "console_unicode.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#include <io.h>
#else
#include <langinfo.h>
#include <locale.h>
#include <strings.h>
#include <unistd.h>
#endif

namespace consoleu {

namespace {

bool is_utf8_codeset(const char* codeset) {
    if (!codeset) return false;
    std::string s;
    for (const char* p = codeset; *p; ++p) {
        if (*p != '-') s += static_cast<char>(std::tolower(static_cast<unsigned char>(*p)));
    }
    return s == "utf8";
}

} // namespace

Capabilities detect_capabilities() {
    static const Capabilities cached = []() {
        Capabilities caps;

#if defined(_WIN32)
        caps.stderr_is_tty = _isatty(_fileno(stderr));
        HANDLE h = GetStdHandle(STD_ERROR_HANDLE);
        DWORD mode = 0;
        bool has_console = h != INVALID_HANDLE_VALUE && GetConsoleMode(h, &mode);
        caps.has_native_unicode_console = caps.stderr_is_tty && has_console;
        caps.utf8_configured = GetConsoleOutputCP() == 65001;
        auto* wt = std::getenv("WT_SESSION");
        caps.likely_emoji_ok = caps.has_native_unicode_console && (caps.utf8_configured || (wt && wt[0]));
        std::ostringstream os;
        os << "CP=" << GetConsoleOutputCP() << " console=" << (has_console ? "yes" : "no");
        caps.details = os.str();
#else
        caps.stderr_is_tty = isatty(STDERR_FILENO);
        setlocale(LC_CTYPE, "");
        auto codeset = nl_langinfo(CODESET);
        caps.utf8_configured = is_utf8_codeset(codeset);
        auto* term = std::getenv("TERM");
        bool term_ok = term && term[0] && strcasecmp(term, "dumb") != 0;
        caps.likely_emoji_ok = caps.stderr_is_tty && caps.utf8_configured && term_ok;
        std::ostringstream os;
        os << "codeset=" << (codeset ? codeset : "unknown") << " term=" << (term ? term : "unset");
        caps.details = os.str();
#endif
        return caps;
    }();
    return cached;
}

std::string_view pick(std::string_view utf8_preferred, std::string_view ascii_fallback, EmojiMode mode) {
    switch (mode) {
        case EmojiMode::On: return utf8_preferred;
        case EmojiMode::Off: return ascii_fallback;
        case EmojiMode::Auto: break;
    }
    return detect_capabilities().likely_emoji_ok ? utf8_preferred : ascii_fallback;
}

} // namespace consoleu
