#include <celldraw/host-message.h>

#include <cstring>

namespace celldraw {

std::vector<uint8_t> encodeSetFontMessage(std::string_view name, float pointSize) {
    auto length = static_cast<uint32_t>(name.size() + 1);

    std::vector<uint8_t> bytes(sizeof(float) + sizeof(uint32_t) + length, 0);
    uint8_t* out = bytes.data();
    std::memcpy(out, &pointSize, sizeof(float));
    out += sizeof(float);
    std::memcpy(out, &length, sizeof(uint32_t));
    out += sizeof(uint32_t);
    std::memcpy(out, name.data(), name.size());
    // trailing NUL already zeroed
    return bytes;
}

Result<SetFontMessage> decodeSetFontMessage(const uint8_t* data, size_t size) {
    constexpr size_t header = sizeof(float) + sizeof(uint32_t);
    if (!data || size < header) {
        return Err<SetFontMessage>("SetFont message too short (" + std::to_string(size) + " bytes)");
    }

    SetFontMessage msg;
    uint32_t length = 0;
    std::memcpy(&msg.pointSize, data, sizeof(float));
    std::memcpy(&length, data + sizeof(float), sizeof(uint32_t));

    if (length == 0 || size - header < length) {
        return Err<SetFontMessage>("SetFont message: bad name length " + std::to_string(length));
    }
    const char* name = reinterpret_cast<const char*>(data + header);
    if (name[length - 1] != '\0') {
        return Err<SetFontMessage>("SetFont message: name is not NUL terminated");
    }
    msg.name.assign(name, length - 1);
    return Ok(std::move(msg));
}

} // namespace celldraw
