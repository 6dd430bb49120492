#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Maps a UTF-8 source buffer onto the UTF-16 code units the JS engine sees,
// so parser positions (line, UTF-16 column) can be turned back into byte
// offsets into the original snapshot.
class SourceIndex {
public:
  explicit SourceIndex(const std::string& text);

  const std::u16string& utf16() const { return units_; }
  size_t lineCount() const { return lineStarts_.size(); }

  // line is 1-based, column is 0-based in UTF-16 units
  bool toOffset(unsigned line, unsigned column, size_t& out) const;

private:
  std::u16string units_;
  std::vector<uint32_t> unitToByte_;  // units_.size() + 1 entries
  std::vector<uint32_t> lineStarts_;  // unit index of each line start
};

std::string utf16ToUtf8(const std::u16string& in);
