#include <chrono>

#include <gtest/gtest.h>

#include <QtCore/QElapsedTimer>

#include <cctv/network/hardware_address_resolver.h>
#include <cctv/network/mac_address.h>

namespace cctv {
namespace network {
namespace test {

TEST(MacAddress, normalization)
{
    ASSERT_EQ("A4:14:37:11:22:33", normalizeMac("a4-14-37-11-22-33"));
    ASSERT_EQ("A4:14:37:11:22:33", normalizeMac("A41437112233"));
    ASSERT_EQ("00:0F:7C:AB:CD:EF", normalizeMac("00:0f:7c:ab:cd:ef"));
}

TEST(MacAddress, text_that_is_not_a_mac_is_returned_unchanged)
{
    ASSERT_EQ("incomplete", normalizeMac("incomplete"));
    ASSERT_EQ("00:11:22:33:44", normalizeMac("00:11:22:33:44"));
    ASSERT_EQ("00:11:22:33:44:GG", normalizeMac("00:11:22:33:44:GG"));
}

TEST(MacAddress, prefix)
{
    ASSERT_EQ(QString("BC:AD:28"), macPrefix("bc-ad-28-01-02-03").get_value_or(QString()));
    ASSERT_EQ(QString("BC:AD:28"), macPrefix("BCAD28010203").get_value_or(QString()));
    ASSERT_FALSE(macPrefix("BCAD28"));
    ASSERT_FALSE(macPrefix("not a mac at all"));
}

TEST(MacAddress, first_mac_shaped_token_is_found)
{
    ASSERT_EQ(QString("3C:EF:8C:01:02:03"),
        findMac("? (192.168.1.64) at 3c:ef:8c:1:2:3 on en0 and 3c:ef:8c:01:02:03 [ether]")
            .get_value_or(QString()));
    ASSERT_FALSE(findMac("192.168.1.64 (incomplete)"));
}

TEST(NeighborTableResolver, windows_output)
{
    const QString output =
        "\r\nInterface: 192.168.1.10 --- 0x7\r\n"
        "  Internet Address      Physical Address      Type\r\n"
        "  192.168.1.1           e4-8d-8c-aa-bb-cc     dynamic\r\n"
        "  192.168.1.64          c0-56-e3-01-02-03     dynamic\r\n";

    ASSERT_EQ(QString("C0:56:E3:01:02:03"),
        NeighborTableResolver::extractMac(output, "192.168.1.64").get_value_or(QString()));
}

TEST(NeighborTableResolver, unix_output)
{
    const QString output =
        "Address                  HWtype  HWaddress           Flags Mask            Iface\n"
        "192.168.1.108            ether   4c:11:bf:10:20:30   C                     eth0\n";

    ASSERT_EQ(QString("4C:11:BF:10:20:30"),
        NeighborTableResolver::extractMac(output, "192.168.1.108").get_value_or(QString()));
}

TEST(NeighborTableResolver, address_must_match_exactly)
{
    const QString output =
        "192.168.1.10             ether   4c:11:bf:10:20:30   C                     eth0\n"
        "192.168.1.100            ether   4c:11:bf:aa:bb:cc   C                     eth0\n";

    ASSERT_EQ(QString("4C:11:BF:AA:BB:CC"),
        NeighborTableResolver::extractMac(output, "192.168.1.100").get_value_or(QString()));
    ASSERT_FALSE(NeighborTableResolver::extractMac(output, "192.168.1.1"));
}

TEST(NeighborTableResolver, incomplete_entry_gives_no_mac)
{
    ASSERT_FALSE(NeighborTableResolver::extractMac(
        "192.168.1.77                     (incomplete)                              eth0\n",
        "192.168.1.77"));
}

#if defined(Q_OS_UNIX)

TEST(NeighborTableResolver, command_output_is_returned)
{
    const auto output = NeighborTableResolver::runCommand(
        "echo", {"192.168.1.64 ether 44:19:b6:12:34:56"}, std::chrono::seconds(5));

    ASSERT_EQ(
        "192.168.1.64 ether 44:19:b6:12:34:56\n",
        output.get_value_or(QByteArray()));
}

TEST(NeighborTableResolver, one_deadline_covers_whole_command)
{
    QElapsedTimer timer;
    timer.start();

    const auto output = NeighborTableResolver::runCommand(
        "sleep", {"10"}, std::chrono::milliseconds(500));

    ASSERT_FALSE(static_cast<bool>(output));
    ASSERT_LT(timer.elapsed(), 1000);
}

#endif

TEST(NeighborTableResolver, missing_program_gives_no_output)
{
    ASSERT_FALSE(static_cast<bool>(NeighborTableResolver::runCommand(
        "cctv-no-such-program", {}, std::chrono::milliseconds(500))));
}

} // namespace test
} // namespace network
} // namespace cctv
