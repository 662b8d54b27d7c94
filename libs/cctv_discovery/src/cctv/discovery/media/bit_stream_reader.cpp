#include "bit_stream_reader.h"

namespace cctv {
namespace discovery {
namespace media {

namespace {

static const int kMaxGolombLeadingZeros = 31;

} // namespace

BitStreamReader::BitStreamReader(const QByteArray& data):
    m_data(data)
{
}

quint32 BitStreamReader::getBits(int count)
{
    if (count < 0 || count > 32 || count > bitsLeft())
        throw BitStreamException();

    quint32 result = 0;
    for (int i = 0; i < count; ++i)
    {
        const quint8 byte = static_cast<quint8>(m_data[m_bitPos / 8]);
        const int bit = (byte >> (7 - m_bitPos % 8)) & 1;
        result = (result << 1) | static_cast<quint32>(bit);
        ++m_bitPos;
    }
    return result;
}

void BitStreamReader::skipBits(int count)
{
    if (count < 0 || count > bitsLeft())
        throw BitStreamException();
    m_bitPos += count;
}

quint32 BitStreamReader::getGolomb()
{
    int leadingZeros = 0;
    while (!getBit())
    {
        if (++leadingZeros > kMaxGolombLeadingZeros)
            throw BitStreamException();
    }

    if (leadingZeros == 0)
        return 0;
    return ((quint32(1) << leadingZeros) - 1) + getBits(leadingZeros);
}

qint32 BitStreamReader::getSignedGolomb()
{
    const quint32 value = getGolomb();
    const qint32 magnitude = static_cast<qint32>((value + 1) / 2);
    return (value & 1) ? magnitude : -magnitude;
}

QByteArray BitStreamReader::toRbsp(const QByteArray& nalUnit)
{
    QByteArray result;
    result.reserve(nalUnit.size());
    int zeroCount = 0;
    for (const char ch: nalUnit)
    {
        if (zeroCount >= 2 && ch == 0x03)
        {
            zeroCount = 0;
            continue;
        }

        result.append(ch);
        zeroCount = ch == 0 ? zeroCount + 1 : 0;
    }
    return result;
}

} // namespace media
} // namespace discovery
} // namespace cctv
