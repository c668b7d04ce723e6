#include "regbot_text_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace regbot {

std::string Trim(const std::string& text) {
  size_t start = text.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\n\r\f\v");
  return text.substr(start, end - start + 1);
}

// ASCII folding only; multi-byte UTF-8 sequences pass through unchanged
std::string ToLower(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<std::string> Split(const std::string& text, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

static void AppendUtf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x110000) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string DecodeHtmlEntities(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }

    size_t semi = text.find(';', i);
    if (semi == std::string::npos || semi - i > 10) {
      out.push_back(text[i++]);
      continue;
    }

    std::string entity = text.substr(i + 1, semi - i - 1);
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos" || entity == "#39") {
      out.push_back('\'');
    } else if (entity == "nbsp") {
      out.push_back(' ');
    } else if (entity.size() > 1 && entity[0] == '#') {
      bool hex = entity[1] == 'x' || entity[1] == 'X';
      const char* digits = entity.c_str() + (hex ? 2 : 1);
      char* end = nullptr;
      unsigned long cp = std::strtoul(digits, &end, hex ? 16 : 10);
      if (end == digits || *end != '\0') {
        out.append(text, i, semi - i + 1);
      } else {
        AppendUtf8(out, cp);
      }
    } else {
      out.append(text, i, semi - i + 1);
    }
    i = semi + 1;
  }

  return out;
}

std::string Base64Encode(const std::vector<uint8_t>& data) {
  static const char base64_chars[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz"
      "0123456789+/";

  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  for (size_t i = 0; i < data.size(); i += 3) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16);
    if (i + 1 < data.size()) triple |= (static_cast<uint32_t>(data[i + 1]) << 8);
    if (i + 2 < data.size()) triple |= data[i + 2];

    encoded.push_back(base64_chars[(triple >> 18) & 0x3F]);
    encoded.push_back(base64_chars[(triple >> 12) & 0x3F]);
    encoded.push_back((i + 1 < data.size()) ? base64_chars[(triple >> 6) & 0x3F] : '=');
    encoded.push_back((i + 2 < data.size()) ? base64_chars[triple & 0x3F] : '=');
  }

  return encoded;
}

std::string TruncateUtf8(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t cut = max_bytes;
  // Back off continuation bytes (10xxxxxx)
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

}  // namespace regbot
