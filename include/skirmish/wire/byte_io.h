#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::wire {

using Byte = std::uint8_t;
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<const Byte>;

// Coordinates and other fractional values travel as zigzag varints in 1/1000 units.
inline constexpr double kMilliScale = 1000.0;

class ByteWriter final {
public:
    const ByteBuffer& Buffer() const;
    ByteBuffer TakeBuffer();

    void WriteU8(Byte value);
    void WriteVarUInt(std::uint64_t value);
    void WriteVarInt(std::int64_t value);
    void WriteMilli(double value);
    // Length-prefixed UTF-8 bytes.
    void WriteString(std::string_view text);

private:
    ByteBuffer buffer_;
};

// Every Read* leaves the output untouched on failure and never reads past the span.
class ByteReader final {
public:
    explicit ByteReader(ByteSpan bytes);

    bool IsFullyConsumed() const;

    bool ReadU8(Byte& out_value);
    bool ReadVarUInt(std::uint64_t& out_value);
    bool ReadVarInt(std::int64_t& out_value);
    bool ReadMilli(double& out_value);
    bool ReadString(std::string& out_text);

private:
    ByteSpan bytes_;
    std::size_t offset_ = 0;
};

inline ByteSpan AsSpan(const ByteBuffer& buffer) {
    return ByteSpan(buffer.data(), buffer.size());
}

}  // namespace skirmish::wire
