#pragma once

#include <celldraw/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace celldraw {

// Messages the view sends back to the host process
enum class HostMessageId : int32_t {
    SetFont = 1,
};

struct SetFontMessage {
    float pointSize = 0.0f;
    std::string name;
};

// float pointSize, u32 length (including the terminating NUL), UTF-8 name, NUL
std::vector<uint8_t> encodeSetFontMessage(std::string_view name, float pointSize);

Result<SetFontMessage> decodeSetFontMessage(const uint8_t* data, size_t size);

} // namespace celldraw
