#include "source_index.h"

// Decode one UTF-8 sequence at text[i]. Malformed input decodes as U+FFFD
// consuming a single byte.
static uint32_t decodeUtf8(const std::string& text, size_t i, size_t& len) {
  unsigned char c = (unsigned char)text[i];
  size_t n = text.size();
  auto cont = [&](size_t k) -> bool {
    return i + k < n && ((unsigned char)text[i + k] & 0xC0) == 0x80;
  };
  len = 1;
  if (c < 0x80) return c;
  if ((c & 0xE0) == 0xC0 && cont(1)) {
    uint32_t cp = ((c & 0x1Fu) << 6) | ((unsigned char)text[i + 1] & 0x3Fu);
    if (cp >= 0x80) { len = 2; return cp; }
  } else if ((c & 0xF0) == 0xE0 && cont(1) && cont(2)) {
    uint32_t cp = ((c & 0x0Fu) << 12) | (((unsigned char)text[i + 1] & 0x3Fu) << 6) |
                  ((unsigned char)text[i + 2] & 0x3Fu);
    if (cp >= 0x800 && (cp < 0xD800 || cp > 0xDFFF)) { len = 3; return cp; }
  } else if ((c & 0xF8) == 0xF0 && cont(1) && cont(2) && cont(3)) {
    uint32_t cp = ((c & 0x07u) << 18) | (((unsigned char)text[i + 1] & 0x3Fu) << 12) |
                  (((unsigned char)text[i + 2] & 0x3Fu) << 6) | ((unsigned char)text[i + 3] & 0x3Fu);
    if (cp >= 0x10000 && cp <= 0x10FFFF) { len = 4; return cp; }
  }
  return 0xFFFD;
}

SourceIndex::SourceIndex(const std::string& text) {
  units_.reserve(text.size());
  unitToByte_.reserve(text.size() + 1);
  lineStarts_.push_back(0);

  size_t i = 0;
  while (i < text.size()) {
    size_t len = 0;
    uint32_t cp = decodeUtf8(text, i, len);
    if (cp >= 0x10000) {
      cp -= 0x10000;
      units_.push_back(char16_t(0xD800 + (cp >> 10)));
      units_.push_back(char16_t(0xDC00 + (cp & 0x3FF)));
      unitToByte_.push_back((uint32_t)i);
      unitToByte_.push_back((uint32_t)i);
    } else {
      units_.push_back(char16_t(cp));
      unitToByte_.push_back((uint32_t)i);
    }
    i += len;

    // \r\n is a single terminator; the line starts after the \n
    bool crlf = cp == '\r' && i < text.size() && text[i] == '\n';
    if ((cp == '\n' || cp == '\r' || cp == 0x2028 || cp == 0x2029) && !crlf)
      lineStarts_.push_back((uint32_t)units_.size());
  }
  unitToByte_.push_back((uint32_t)text.size());
}

bool SourceIndex::toOffset(unsigned line, unsigned column, size_t& out) const {
  if (line == 0 || line > lineStarts_.size()) return false;
  size_t unit = (size_t)lineStarts_[line - 1] + column;
  if (unit >= unitToByte_.size()) return false;
  out = unitToByte_[unit];
  return true;
}

std::string utf16ToUtf8(const std::u16string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    uint32_t cp = in[i];
    if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < in.size() &&
        in[i + 1] >= 0xDC00 && in[i + 1] <= 0xDFFF) {
      cp = 0x10000 + ((cp - 0xD800) << 10) + (in[i + 1] - 0xDC00);
      ++i;
    } else if (cp >= 0xD800 && cp <= 0xDFFF) {
      cp = 0xFFFD;  // lone surrogate
    }
    if (cp < 0x80) {
      out.push_back((char)cp);
    } else if (cp < 0x800) {
      out.push_back((char)(0xC0 | (cp >> 6)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back((char)(0xE0 | (cp >> 12)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
      out.push_back((char)(0xF0 | (cp >> 18)));
      out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}
