#pragma once

#include <celldraw/draw-command.h>
#include <celldraw/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace celldraw {

//-----------------------------------------------------------------------------
// BatchDecoder - single-pass reader over one draw batch
//
// Each next() consumes exactly one record. The buffer carries no lengths, so
// a record that cannot be decoded (unknown tag, or cut short by the end of
// the buffer) leaves the reader unable to find the next record: the decoder
// latches into the failed state and every later next() returns the error.
//-----------------------------------------------------------------------------
class BatchDecoder {
public:
    BatchDecoder(const uint8_t* data, size_t size)
        : _data(data), _size(data ? size : 0) {}

    bool atEnd() const { return _offset >= _size; }
    bool failed() const { return _failed; }
    size_t offset() const { return _offset; }
    size_t size() const { return _size; }

    // Tag of the record that stopped decoding, if it was unknown
    std::optional<int32_t> unknownTag() const { return _unknownTag; }

    Result<DrawCommand> next();

private:
    template<typename T>
    bool read(T& out);
    bool readColor(Color& out, bool withAlpha);

    Result<DrawCommand> fail(std::string message);

    const uint8_t* _data;
    size_t _size;
    size_t _offset = 0;
    bool _failed = false;
    std::optional<int32_t> _unknownTag;
    Error _error;
};

} // namespace celldraw
