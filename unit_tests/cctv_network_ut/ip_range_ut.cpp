#include <gtest/gtest.h>

#include <cctv/network/ip_range.h>

namespace cctv {
namespace network {
namespace test {

TEST(Ipv4Range, cidr_excludes_network_and_broadcast_addresses)
{
    const auto range = Ipv4Range::fromCidr("192.168.1.0/24");

    ASSERT_EQ(254U, range.size());
    ASSERT_EQ("192.168.1.1", ipv4ToString(range.first()));
    ASSERT_EQ("192.168.1.254", ipv4ToString(range.last()));
}

TEST(Ipv4Range, cidr_base_address_is_masked)
{
    const auto range = Ipv4Range::fromCidr("10.1.2.77/30");

    const auto addresses = range.addresses();
    ASSERT_EQ(2U, addresses.size());
    ASSERT_EQ("10.1.2.77", addresses[0]);
    ASSERT_EQ("10.1.2.78", addresses[1]);
}

TEST(Ipv4Range, cidr_31_and_32_have_no_host_addresses)
{
    ASSERT_TRUE(Ipv4Range::fromCidr("10.0.0.0/31").isEmpty());
    ASSERT_TRUE(Ipv4Range::fromCidr("10.0.0.7/32").isEmpty());
}

TEST(Ipv4Range, malformed_cidr_is_rejected)
{
    ASSERT_THROW(Ipv4Range::fromCidr("192.168.1.0"), ValidationError);
    ASSERT_THROW(Ipv4Range::fromCidr("192.168.1.0/33"), ValidationError);
    ASSERT_THROW(Ipv4Range::fromCidr("192.168.1.256/24"), ValidationError);
    ASSERT_THROW(Ipv4Range::fromCidr("192.168.1/24"), ValidationError);
    ASSERT_THROW(Ipv4Range::fromCidr("camera/24"), ValidationError);

    ASSERT_FALSE(Ipv4Range::isValidCidr("1.2.3.4/-1"));
    ASSERT_TRUE(Ipv4Range::isValidCidr("1.2.3.4/16"));
}

TEST(Ipv4Range, bounds_are_inclusive)
{
    const auto addresses = Ipv4Range::fromBounds("10.0.0.254", "10.0.1.1").addresses();

    const std::vector<QString> expected{"10.0.0.254", "10.0.0.255", "10.0.1.0", "10.0.1.1"};
    ASSERT_EQ(expected, addresses);
}

TEST(Ipv4Range, single_address_bounds)
{
    const auto range = Ipv4Range::fromBounds("172.16.0.9", "172.16.0.9");

    ASSERT_EQ(1U, range.size());
    ASSERT_EQ("172.16.0.9", ipv4ToString(range.first()));
}

TEST(Ipv4Range, start_after_end_is_rejected)
{
    ASSERT_THROW(Ipv4Range::fromBounds("10.0.0.10", "10.0.0.9"), ValidationError);
    ASSERT_THROW(Ipv4Range::fromBounds("10.0.0.1", "10.0.0"), ValidationError);
}

TEST(Ipv4Range, parse_accepts_all_notations)
{
    ASSERT_EQ(14U, Ipv4Range::parse(" 10.0.0.0/28 ").size());
    ASSERT_EQ(3U, Ipv4Range::parse("10.0.0.1-10.0.0.3").size());
    ASSERT_EQ(1U, Ipv4Range::parse("10.0.0.1").size());
    ASSERT_THROW(Ipv4Range::parse("10.0.0.+1"), ValidationError);
}

TEST(Ipv4, strict_dotted_quad)
{
    quint32 address = 0;
    ASSERT_TRUE(parseIpv4("255.255.255.255", &address));
    ASSERT_EQ(0xFFFFFFFFU, address);

    ASSERT_FALSE(parseIpv4("1.2.3", &address));
    ASSERT_FALSE(parseIpv4("1.2.3.4.5", &address));
    ASSERT_FALSE(parseIpv4("1.2.3.1000", &address));
    ASSERT_FALSE(parseIpv4("1. 2.3.4", &address));
    ASSERT_FALSE(parseIpv4("", &address));
}

//-------------------------------------------------------------------------------------------------

class RangeExpander:
    public ::testing::Test
{
protected:
    void whenAdd(const QString& text)
    {
        m_expander.add(text);
    }

    void thenAddressesAre(const std::vector<QString>& expected)
    {
        ASSERT_EQ(expected.size(), m_expander.count());
        ASSERT_EQ(expected, m_expander.expand());
    }

    network::RangeExpander m_expander;
};

TEST_F(RangeExpander, overlapping_ranges_are_merged_and_sorted)
{
    whenAdd("10.0.0.5-10.0.0.7");
    whenAdd("10.0.0.1-10.0.0.6");
    whenAdd("10.0.0.3");

    thenAddressesAre({
        "10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4", "10.0.0.5", "10.0.0.6", "10.0.0.7"});
}

TEST_F(RangeExpander, disjoint_ranges_keep_numeric_order)
{
    whenAdd("192.168.0.10");
    whenAdd("10.0.0.2");
    whenAdd("192.168.0.2");

    thenAddressesAre({"10.0.0.2", "192.168.0.2", "192.168.0.10"});
}

TEST_F(RangeExpander, adjacent_ranges_are_joined)
{
    whenAdd("10.0.0.1-10.0.0.2");
    whenAdd("10.0.0.3-10.0.0.4");
    whenAdd("10.0.0.0/30");

    thenAddressesAre({"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4"});
}

TEST_F(RangeExpander, count_does_not_materialize_addresses)
{
    whenAdd("10.0.0.0/8");
    whenAdd("10.20.0.0/16");

    ASSERT_EQ(16777214U, m_expander.count());

    quint32 address = 0;
    ASSERT_TRUE(parseIpv4("10.20.30.40", &address));
    ASSERT_TRUE(m_expander.contains(address));
    ASSERT_TRUE(parseIpv4("11.0.0.1", &address));
    ASSERT_FALSE(m_expander.contains(address));
}

TEST_F(RangeExpander, invalid_text_leaves_expander_unchanged)
{
    whenAdd("10.0.0.1");

    ASSERT_THROW(m_expander.add(QStringList{"10.0.0.9-10.0.0.8"}), ValidationError);

    thenAddressesAre({"10.0.0.1"});
}

} // namespace test
} // namespace network
} // namespace cctv
