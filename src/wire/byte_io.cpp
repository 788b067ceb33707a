#include "wire/byte_io.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace skirmish::wire {
namespace {

constexpr std::size_t kMaxVarIntBytes = 10;

// Largest milli magnitude that still converts to int64 exactly.
constexpr double kMaxMilliMagnitude = 9.0e15;

std::uint64_t ToZigZag(std::int64_t value) {
    const std::uint64_t bits = static_cast<std::uint64_t>(value);
    return value < 0 ? ~(bits << 1U) : bits << 1U;
}

std::int64_t FromZigZag(std::uint64_t encoded) {
    const std::uint64_t magnitude = encoded >> 1U;
    return static_cast<std::int64_t>((encoded & 1U) != 0 ? ~magnitude : magnitude);
}

}  // namespace

const ByteBuffer& ByteWriter::Buffer() const {
    return buffer_;
}

ByteBuffer ByteWriter::TakeBuffer() {
    ByteBuffer taken;
    taken.swap(buffer_);
    return taken;
}

void ByteWriter::WriteU8(Byte value) {
    buffer_.push_back(value);
}

void ByteWriter::WriteVarUInt(std::uint64_t value) {
    do {
        Byte chunk = static_cast<Byte>(value & 0x7FU);
        value >>= 7U;
        if (value != 0) {
            chunk |= 0x80U;
        }
        buffer_.push_back(chunk);
    } while (value != 0);
}

void ByteWriter::WriteVarInt(std::int64_t value) {
    WriteVarUInt(ToZigZag(value));
}

void ByteWriter::WriteMilli(double value) {
    double scaled = std::round(value * kMilliScale);
    if (!std::isfinite(scaled)) {
        scaled = 0.0;
    }
    scaled = std::clamp(scaled, -kMaxMilliMagnitude, kMaxMilliMagnitude);
    WriteVarInt(static_cast<std::int64_t>(scaled));
}

void ByteWriter::WriteString(std::string_view text) {
    WriteVarUInt(text.size());
    buffer_.insert(buffer_.end(), text.begin(), text.end());
}

ByteReader::ByteReader(ByteSpan bytes) : bytes_(bytes) {}

bool ByteReader::IsFullyConsumed() const {
    return offset_ == bytes_.size();
}

bool ByteReader::ReadU8(Byte& out_value) {
    if (offset_ >= bytes_.size()) {
        return false;
    }
    out_value = bytes_[offset_++];
    return true;
}

bool ByteReader::ReadVarUInt(std::uint64_t& out_value) {
    std::uint64_t value = 0;
    std::size_t cursor = offset_;
    for (std::size_t index = 0; index < kMaxVarIntBytes; ++index) {
        if (cursor >= bytes_.size()) {
            return false;
        }
        const Byte chunk = bytes_[cursor++];
        const unsigned shift = static_cast<unsigned>(index * 7);
        const std::uint64_t payload = static_cast<std::uint64_t>(chunk & 0x7FU);
        // The tenth byte may only carry the top bit of a 64-bit value.
        if (index == kMaxVarIntBytes - 1 && payload > 1) {
            return false;
        }
        value |= payload << shift;
        if ((chunk & 0x80U) == 0) {
            offset_ = cursor;
            out_value = value;
            return true;
        }
    }
    return false;
}

bool ByteReader::ReadVarInt(std::int64_t& out_value) {
    std::uint64_t encoded = 0;
    if (!ReadVarUInt(encoded)) {
        return false;
    }
    out_value = FromZigZag(encoded);
    return true;
}

bool ByteReader::ReadMilli(double& out_value) {
    std::int64_t scaled = 0;
    if (!ReadVarInt(scaled)) {
        return false;
    }
    out_value = static_cast<double>(scaled) / kMilliScale;
    return true;
}

bool ByteReader::ReadString(std::string& out_text) {
    const std::size_t start = offset_;
    std::uint64_t length = 0;
    if (!ReadVarUInt(length)) {
        return false;
    }
    if (length > bytes_.size() - offset_) {
        offset_ = start;
        return false;
    }

    const auto* first = reinterpret_cast<const char*>(bytes_.data() + offset_);
    out_text.assign(first, static_cast<std::size_t>(length));
    offset_ += static_cast<std::size_t>(length);
    return true;
}

}  // namespace skirmish::wire
