#pragma once

#include <string>
#include <string_view>

namespace consoleu {

enum class EmojiMode { Auto, On, Off };

struct Capabilities {
    bool stderr_is_tty = false;
    bool utf8_configured = false;
    bool has_native_unicode_console = false;
    bool likely_emoji_ok = false;
    std::string details;
};

// detect_capabilities inspects the terminal attached to stderr, where the
// tools write their log. The result is computed once.
Capabilities detect_capabilities();

// pick returns utf8_preferred when the console can show it, else ascii_fallback.
std::string_view pick(std::string_view utf8_preferred, std::string_view ascii_fallback,
                      EmojiMode mode = EmojiMode::Auto);

} // namespace consoleu
