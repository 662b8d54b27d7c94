#pragma once

#include <stdexcept>

#include <QtCore/QByteArray>

namespace cctv {
namespace discovery {
namespace media {

class BitStreamException:
    public std::runtime_error
{
public:
    BitStreamException(): std::runtime_error("Unexpected end of bit stream") {}
    explicit BitStreamException(const char* message): std::runtime_error(message) {}
};

/**
 * MSB-first reader of H.264/H.265 RBSP data.
 */
class BitStreamReader
{
public:
    explicit BitStreamReader(const QByteArray& data);

    /**
     * @param count At most 32.
     * @throws BitStreamException
     */
    quint32 getBits(int count);
    bool getBit() { return getBits(1) != 0; }
    void skipBits(int count);

    /** Unsigned exp-Golomb, ue(v). */
    quint32 getGolomb();

    /** Signed exp-Golomb, se(v). */
    qint32 getSignedGolomb();

    int bitsLeft() const { return m_data.size() * 8 - m_bitPos; }

    /**
     * Drops emulation prevention bytes (0x03 following 0x00 0x00).
     */
    static QByteArray toRbsp(const QByteArray& nalUnit);

private:
    QByteArray m_data;
    int m_bitPos = 0;
};

} // namespace media
} // namespace discovery
} // namespace cctv
