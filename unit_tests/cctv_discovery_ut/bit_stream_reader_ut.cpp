#include <gtest/gtest.h>

#include <cctv/discovery/media/bit_stream_reader.h>

namespace cctv {
namespace discovery {
namespace media {
namespace test {

TEST(BitStreamReader, reads_bits_msb_first)
{
    BitStreamReader reader(QByteArray::fromHex("b5f0"));

    ASSERT_EQ(1U, reader.getBits(1));
    ASSERT_EQ(0x3U, reader.getBits(3));
    ASSERT_EQ(0x5fU, reader.getBits(8));
    ASSERT_EQ(4, reader.bitsLeft());
}

TEST(BitStreamReader, reads_unsigned_golomb)
{
    BitStreamReader reader(QByteArray::fromHex("a640"));

    ASSERT_EQ(0U, reader.getGolomb());
    ASSERT_EQ(1U, reader.getGolomb());
    ASSERT_EQ(2U, reader.getGolomb());
    ASSERT_EQ(3U, reader.getGolomb());
}

TEST(BitStreamReader, reads_signed_golomb)
{
    // ue values 1, 2, 3, 4 map to se values 1, -1, 2, -2.
    BitStreamReader reader(QByteArray::fromHex("4c85"));

    ASSERT_EQ(1, reader.getSignedGolomb());
    ASSERT_EQ(-1, reader.getSignedGolomb());
    ASSERT_EQ(2, reader.getSignedGolomb());
    ASSERT_EQ(-2, reader.getSignedGolomb());
}

TEST(BitStreamReader, reading_past_end_throws)
{
    BitStreamReader reader(QByteArray::fromHex("ff"));
    reader.skipBits(6);

    ASSERT_THROW(reader.getBits(3), BitStreamException);
    ASSERT_THROW(reader.skipBits(3), BitStreamException);
    ASSERT_EQ(2, reader.bitsLeft());
}

TEST(BitStreamReader, golomb_without_terminating_bit_throws)
{
    BitStreamReader reader(QByteArray::fromHex("0000"));
    ASSERT_THROW(reader.getGolomb(), BitStreamException);
}

TEST(BitStreamReader, emulation_prevention_bytes_are_removed)
{
    ASSERT_EQ(
        QByteArray::fromHex("6700000100000201"),
        BitStreamReader::toRbsp(QByteArray::fromHex("670000030100000302" "01")));
    ASSERT_EQ(
        QByteArray::fromHex("670003"),
        BitStreamReader::toRbsp(QByteArray::fromHex("670003")));
}

} // namespace test
} // namespace media
} // namespace discovery
} // namespace cctv
