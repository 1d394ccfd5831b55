#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace DriveSync {

/**
 * @brief One direction of a streaming codec (compress, decompress, encrypt, ...)
 *
 * update() may be called any number of times; finish() exactly once.
 * Produced bytes are appended to @p out.
 */
class CodecStream {
public:
    virtual ~CodecStream() = default;

    virtual void update(const uint8_t* data, size_t length, std::vector<uint8_t>& out) = 0;
    virtual void finish(std::vector<uint8_t>& out) = 0;
};

} // namespace DriveSync
