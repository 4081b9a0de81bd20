#include <celldraw/font/freetype.h>
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace celldraw::font {

FT_Library ftLibrary() {
    thread_local struct FTLib {
        FT_Library lib = nullptr;
        FTLib() {
            if (FT_Error err = FT_Init_FreeType(&lib); err) {
                yerror("FreeType: FT_Init_FreeType failed with code {}", err);
                lib = nullptr;
            }
        }
        ~FTLib() { if (lib) FT_Done_FreeType(lib); }
    } instance;
    return instance.lib;
}

} // namespace celldraw::font
