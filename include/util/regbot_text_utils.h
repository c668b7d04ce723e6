#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace regbot {

// Small string helpers shared by the gateway, the sheet reader and the bot.

std::string Trim(const std::string& text);
std::string ToLower(const std::string& text);
std::vector<std::string> Split(const std::string& text, char delimiter);
bool StartsWith(const std::string& text, const std::string& prefix);
bool EndsWith(const std::string& text, const std::string& suffix);
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

// Decodes &amp; &lt; &gt; &quot; &#39; and numeric entities
std::string DecodeHtmlEntities(const std::string& text);

std::string Base64Encode(const std::vector<uint8_t>& data);

// Truncates to at most max_bytes without splitting a UTF-8 sequence
std::string TruncateUtf8(const std::string& text, size_t max_bytes);

}  // namespace regbot
