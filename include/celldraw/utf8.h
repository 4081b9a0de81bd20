#pragma once

#include <string>
#include <string_view>

namespace celldraw {

// Decode UTF-8 into code points. Malformed or truncated sequences become
// U+FFFD so that one bad byte costs one replacement glyph, not the run.
std::u32string utf8ToUtf32(std::string_view utf8);

} // namespace celldraw
