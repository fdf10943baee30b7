#include "grapheme.hpp"
#include <memory>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>

static icu::BreakIterator* character_iterator() {
  thread_local std::unique_ptr<icu::BreakIterator> it;
  thread_local bool tried = false;
  if (!tried) {
    tried = true;
    UErrorCode status = U_ZERO_ERROR;
    it.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status)) it.reset();
  }
  return it.get();
}

std::vector<std::size_t> codepoint_bounds(std::string_view s) {
  std::vector<std::size_t> out;
  out.reserve(s.size() + 1);
  for (std::size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80 || i == 0) out.push_back(i);
  }
  out.push_back(s.size());
  return out;
}

std::vector<std::size_t> grapheme_bounds(std::string_view s) {
  if (s.empty()) return {0};
  icu::BreakIterator* bi = character_iterator();
  if (!bi) return codepoint_bounds(s);
  UErrorCode status = U_ZERO_ERROR;
  // UTF-8 backed UText makes the iterator report native (byte) offsets.
  UText* ut = utext_openUTF8(nullptr, s.data(), static_cast<int64_t>(s.size()), &status);
  if (U_FAILURE(status)) { utext_close(ut); return codepoint_bounds(s); }
  bi->setText(ut, status);
  if (U_FAILURE(status)) { utext_close(ut); return codepoint_bounds(s); }
  std::vector<std::size_t> out;
  out.reserve(s.size() / 2 + 2);
  for (int32_t p = bi->first(); p != icu::BreakIterator::DONE; p = bi->next()) {
    out.push_back(static_cast<std::size_t>(p));
  }
  // the iterator keeps a shallow clone; it is re-pointed on the next call
  utext_close(ut);
  if (out.empty() || out.front() != 0) out.insert(out.begin(), 0);
  if (out.back() != s.size()) out.push_back(s.size());
  return out;
}

std::size_t grapheme_count(std::string_view s) {
  return grapheme_bounds(s).size() - 1;
}

std::vector<std::string_view> split_graphemes(std::string_view s) {
  auto b = grapheme_bounds(s);
  std::vector<std::string_view> out;
  out.reserve(b.size() - 1);
  for (std::size_t i = 0; i + 1 < b.size(); ++i) out.push_back(s.substr(b[i], b[i + 1] - b[i]));
  return out;
}
