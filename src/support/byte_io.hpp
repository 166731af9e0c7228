//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/byte_io.hpp
// Purpose: Little-endian integer packing shared by the persisted formats.
// Key invariants: Readers never touch bytes past the end of their input.
// Ownership/Lifetime: Stateless helpers plus a non-owning cursor.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace talus::support
{

inline void putU8(std::string &out, uint8_t v)
{
    out.push_back(static_cast<char>(v));
}

inline void putU32(std::string &out, uint32_t v)
{
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

inline void putU64(std::string &out, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

/// @brief Read @p width little-endian bytes starting at @p pos.
/// @pre pos + width <= bytes.size()
inline uint64_t getLE(std::string_view bytes, size_t pos, size_t width)
{
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i)
        v |= static_cast<uint64_t>(static_cast<unsigned char>(bytes[pos + i])) << (8 * i);
    return v;
}

/// @brief Bounds-checked sequential reader over a byte string.
/// @details Every read reports failure instead of running off the end, so a
///          truncated payload is detected at the first short field.
class ByteReader
{
  public:
    explicit ByteReader(std::string_view bytes) : bytes_(bytes) {}

    bool u8(uint8_t &out)
    {
        uint64_t v = 0;
        if (!take(1, v))
            return false;
        out = static_cast<uint8_t>(v);
        return true;
    }

    bool u32(uint32_t &out)
    {
        uint64_t v = 0;
        if (!take(4, v))
            return false;
        out = static_cast<uint32_t>(v);
        return true;
    }

    bool u64(uint64_t &out)
    {
        return take(8, out);
    }

    bool str(size_t size, std::string &out)
    {
        if (bytes_.size() - pos_ < size)
            return false;
        out.assign(bytes_.substr(pos_, size));
        pos_ += size;
        return true;
    }

    bool atEnd() const
    {
        return pos_ == bytes_.size();
    }

  private:
    bool take(size_t width, uint64_t &out)
    {
        if (bytes_.size() - pos_ < width)
            return false;
        out = getLE(bytes_, pos_, width);
        pos_ += width;
        return true;
    }

    std::string_view bytes_;
    size_t pos_ = 0;
};

} // namespace talus::support
