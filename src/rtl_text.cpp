#include "rtl_text.hpp"

#include <spdlog/spdlog.h>

#include <unicode/ubidi.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/ushape.h>

#include <memory>
#include <vector>

namespace {

struct BidiCloser {
  void operator()(UBiDi* bidi) const { ubidi_close(bidi); }
};

bool isRtlCodepoint(UChar32 c) {
  UCharDirection dir = u_charDirection(c);
  return dir == U_RIGHT_TO_LEFT || dir == U_RIGHT_TO_LEFT_ARABIC;
}

// Returns false and leaves out untouched on any ICU error.
bool shapeArabic(const icu::UnicodeString& in, icu::UnicodeString& out) {
  UErrorCode err = U_ZERO_ERROR;
  const int32_t len = in.length();
  std::vector<UChar> buf(static_cast<size_t>(len) + 1);
  int32_t written = u_shapeArabic(in.getBuffer(), len, buf.data(), len + 1,
                                  U_SHAPE_LETTERS_SHAPE | U_SHAPE_TEXT_DIRECTION_LOGICAL, &err);
  if (U_FAILURE(err)) return false;
  out = icu::UnicodeString(buf.data(), written);
  return true;
}

} // namespace

bool containsRtlText(const std::string& utf8) {
  icu::UnicodeString text = icu::UnicodeString::fromUTF8(utf8);
  for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
    if (isRtlCodepoint(text.char32At(i))) return true;
  }
  return false;
}

std::string fixRtlText(const std::string& utf8) {
  if (utf8.empty() || !containsRtlText(utf8)) return utf8;

  icu::UnicodeString logical = icu::UnicodeString::fromUTF8(utf8);
  icu::UnicodeString shaped;
  if (!shapeArabic(logical, shaped)) {
    spdlog::warn("Arabic shaping failed; reordering unshaped text");
    shaped = logical;
  }

  UErrorCode err = U_ZERO_ERROR;
  std::unique_ptr<UBiDi, BidiCloser> bidi(ubidi_open());
  if (!bidi) return utf8;
  ubidi_setPara(bidi.get(), shaped.getBuffer(), shaped.length(), UBIDI_DEFAULT_LTR, nullptr, &err);
  if (U_FAILURE(err)) {
    spdlog::error("Error fixing RTL text: {}", u_errorName(err));
    return utf8;
  }

  const int32_t capacity = shaped.length() * 2 + 1;
  std::vector<UChar> visual(static_cast<size_t>(capacity));
  int32_t written = ubidi_writeReordered(bidi.get(), visual.data(), capacity,
                                         UBIDI_DO_MIRRORING | UBIDI_REMOVE_BIDI_CONTROLS, &err);
  if (U_FAILURE(err)) {
    spdlog::error("Error fixing RTL text: {}", u_errorName(err));
    return utf8;
  }

  std::string out;
  icu::UnicodeString(visual.data(), written).toUTF8String(out);
  return out;
}
