#pragma once

#include <string>
#include <string_view>

namespace philoglot::text
{

// Canonical composition (NFC). Vector tables and token lookups both pass
// through this so that precomposed and combining-mark spellings of the same
// word (common in polytonic Greek and IAST Sanskrit) share one key.
// Invalid UTF-8 is returned unchanged.
[[nodiscard]] std::string to_nfc(std::string_view text);

// True when every byte sequence in text is valid UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view text);

} // namespace philoglot::text
