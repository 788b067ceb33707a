#include "wire/byte_io.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

}  // namespace

int main() {
    bool passed = true;

    skirmish::wire::ByteWriter writer;
    writer.WriteVarUInt(300);
    passed &= Expect(writer.Buffer().size() == 2, "Varuint 300 should take two bytes.");
    passed &= Expect(
        writer.Buffer()[0] == 0xAC && writer.Buffer()[1] == 0x02,
        "Varuint 300 should be encoded little-endian base-128.");

    writer.WriteVarInt(-1);
    writer.WriteMilli(1999.5);
    writer.WriteMilli(-0.0004);
    writer.WriteMilli(std::numeric_limits<double>::quiet_NaN());
    writer.WriteString("p1");
    const skirmish::wire::ByteBuffer buffer = writer.TakeBuffer();
    passed &= Expect(writer.Buffer().empty(), "TakeBuffer should leave writer empty.");

    skirmish::wire::ByteReader reader(skirmish::wire::AsSpan(buffer));
    std::uint64_t unsigned_value = 0;
    std::int64_t signed_value = 0;
    double milli_value = 0.0;
    std::string text;
    passed &= Expect(reader.ReadVarUInt(unsigned_value) && unsigned_value == 300, "Varuint should decode.");
    passed &= Expect(reader.ReadVarInt(signed_value) && signed_value == -1, "Zigzag varint should decode.");
    passed &= Expect(
        reader.ReadMilli(milli_value) && std::fabs(milli_value - 1999.5) < 1e-9,
        "Milli value should keep three decimals.");
    passed &= Expect(
        reader.ReadMilli(milli_value) && milli_value == 0.0,
        "Sub-milli magnitude should round to zero.");
    passed &= Expect(
        reader.ReadMilli(milli_value) && milli_value == 0.0,
        "Non-finite value should travel as zero.");
    passed &= Expect(reader.ReadString(text) && text == "p1", "String should decode.");
    passed &= Expect(reader.IsFullyConsumed(), "Reader should be fully consumed.");
    passed &= Expect(!reader.ReadVarUInt(unsigned_value), "Reading past the end should fail.");

    const skirmish::wire::ByteBuffer truncated_string{0x05, 'a', 'b'};
    skirmish::wire::ByteReader truncated_reader(skirmish::wire::AsSpan(truncated_string));
    passed &= Expect(
        !truncated_reader.ReadString(text),
        "String longer than the remaining payload should fail.");

    const skirmish::wire::ByteBuffer overlong(11, 0xFF);
    skirmish::wire::ByteReader overlong_reader(skirmish::wire::AsSpan(overlong));
    passed &= Expect(
        !overlong_reader.ReadVarUInt(unsigned_value),
        "Varuint longer than ten bytes should fail.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_byte_io_tests\n";
    return 0;
}
