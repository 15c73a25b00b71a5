#include "UnicodeNormalizer.hpp"

#include <utf8proc.h>
#include <plog/Log.h>

#include <cstdlib>

namespace philoglot::text
{

std::string to_nfc(std::string_view text)
{
    if (text.empty())
        return std::string();

    // Pure ASCII is already in NFC
    bool ascii = true;
    for (unsigned char c : text)
    {
        if (c >= 0x80)
        {
            ascii = false;
            break;
        }
    }
    if (ascii)
        return std::string(text);

    utf8proc_uint8_t* normalized = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &normalized,
                                        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE));
    if (len < 0 || !normalized)
    {
        PLOG_DEBUG << "NFC normalization failed (" << utf8proc_errmsg(len) << "), keeping original bytes";
        return std::string(text);
    }

    std::string out(reinterpret_cast<char*>(normalized), static_cast<std::size_t>(len));
    std::free(normalized);
    return out;
}

bool is_valid_utf8(std::string_view text)
{
    const auto* p = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t remaining = static_cast<utf8proc_ssize_t>(text.size());
    while (remaining > 0)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t n = utf8proc_iterate(p, remaining, &codepoint);
        if (n <= 0 || codepoint < 0)
            return false;
        p += n;
        remaining -= n;
    }
    return true;
}

} // namespace philoglot::text
