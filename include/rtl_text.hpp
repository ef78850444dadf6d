#pragma once

#include <string>

// True if the UTF-8 string contains any strong right-to-left codepoint
// (Hebrew, Arabic, Syriac, Thaana, ...).
bool containsRtlText(const std::string& utf8);

// Shapes Arabic letters into their joining forms, then reorders the text from
// logical to visual order with the Unicode bidi algorithm (paragraph direction
// taken from the first strong character). Text without RTL codepoints is returned
// unchanged, as is text ICU fails to process.
std::string fixRtlText(const std::string& utf8);
