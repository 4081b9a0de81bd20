#pragma once

typedef struct FT_LibraryRec_* FT_Library;

namespace celldraw::font {

/// Thread-local FreeType library singleton.
/// FT_Library is not thread-safe, so one instance per thread.
/// Null when FreeType failed to initialize. Holders that may outlive the
/// calling thread take their own reference with FT_Reference_Library.
FT_Library ftLibrary();

} // namespace celldraw::font
