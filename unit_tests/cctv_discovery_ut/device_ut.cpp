#include <gtest/gtest.h>

#include <cctv/discovery/device.h>

namespace cctv {
namespace discovery {
namespace test {

TEST(DeviceStatus, names)
{
    ASSERT_EQ("PENDING", toString(DeviceStatus::pending));
    ASSERT_EQ("AUTHENTICATING", toString(DeviceStatus::authenticating));
    ASSERT_EQ("AUTH_FAILED", toString(DeviceStatus::authFailed));
    ASSERT_EQ("ERROR", toString(DeviceStatus::error));
}

TEST(DeviceStatus, graph_is_forward_only)
{
    ASSERT_TRUE(isTransitionAllowed(DeviceStatus::pending, DeviceStatus::scanning));
    ASSERT_TRUE(isTransitionAllowed(DeviceStatus::scanning, DeviceStatus::authenticating));
    ASSERT_TRUE(isTransitionAllowed(DeviceStatus::authenticating, DeviceStatus::analyzing));
    ASSERT_TRUE(isTransitionAllowed(DeviceStatus::authenticating, DeviceStatus::authFailed));
    ASSERT_TRUE(isTransitionAllowed(DeviceStatus::analyzing, DeviceStatus::completed));

    ASSERT_FALSE(isTransitionAllowed(DeviceStatus::pending, DeviceStatus::authenticating));
    ASSERT_FALSE(isTransitionAllowed(DeviceStatus::analyzing, DeviceStatus::scanning));
    ASSERT_FALSE(isTransitionAllowed(DeviceStatus::scanning, DeviceStatus::authFailed));
}

TEST(DeviceStatus, any_running_status_may_fail)
{
    for (const auto status: {DeviceStatus::pending, DeviceStatus::scanning,
        DeviceStatus::authenticating, DeviceStatus::analyzing})
    {
        ASSERT_FALSE(isTerminal(status));
        ASSERT_TRUE(isTransitionAllowed(status, DeviceStatus::error));
    }
}

TEST(DeviceStatus, terminal_statuses_are_final)
{
    for (const auto status: {DeviceStatus::completed, DeviceStatus::authFailed,
        DeviceStatus::error})
    {
        ASSERT_TRUE(isTerminal(status));
        ASSERT_FALSE(isTransitionAllowed(status, DeviceStatus::error));
        ASSERT_FALSE(isTransitionAllowed(status, DeviceStatus::pending));
    }
}

//-------------------------------------------------------------------------------------------------

class Device:
    public ::testing::Test
{
protected:
    void givenDeviceIn(DeviceStatus status)
    {
        if (status == DeviceStatus::pending)
            return;
        ASSERT_TRUE(m_device.transitionTo(DeviceStatus::scanning));
        if (status == DeviceStatus::scanning)
            return;
        ASSERT_TRUE(m_device.transitionTo(DeviceStatus::authenticating));
        if (status == DeviceStatus::authenticating)
            return;
        ASSERT_TRUE(m_device.transitionTo(DeviceStatus::analyzing));
    }

    void thenStatusIs(DeviceStatus status)
    {
        ASSERT_TRUE(m_device.status() == status) << toString(m_device.status()).toStdString();
    }

    discovery::Device m_device{"192.168.1.10"};
};

TEST_F(Device, starts_pending_without_error)
{
    thenStatusIs(DeviceStatus::pending);
    ASSERT_FALSE(static_cast<bool>(m_device.errorMessage()));
    ASSERT_FALSE(m_device.hasOpenPorts());
}

TEST_F(Device, illegal_transition_keeps_status)
{
    givenDeviceIn(DeviceStatus::scanning);

    ASSERT_FALSE(m_device.transitionTo(DeviceStatus::completed));
    thenStatusIs(DeviceStatus::scanning);
}

TEST_F(Device, failure_requires_message)
{
    givenDeviceIn(DeviceStatus::scanning);

    ASSERT_FALSE(m_device.transitionTo(DeviceStatus::error, "  "));
    thenStatusIs(DeviceStatus::scanning);

    ASSERT_TRUE(m_device.transitionTo(DeviceStatus::error, "Service did not respond"));
    thenStatusIs(DeviceStatus::error);
    ASSERT_EQ("Service did not respond", m_device.errorMessage().get_value_or(QString()));
}

TEST_F(Device, auth_failure_records_reason)
{
    givenDeviceIn(DeviceStatus::authenticating);

    ASSERT_TRUE(m_device.transitionTo(DeviceStatus::authFailed, "Rejected"));
    thenStatusIs(DeviceStatus::authFailed);
    ASSERT_EQ("Rejected", m_device.errorMessage().get_value_or(QString()));

    ASSERT_FALSE(m_device.transitionTo(DeviceStatus::error, "Late failure"));
    ASSERT_EQ("Rejected", m_device.errorMessage().get_value_or(QString()));
}

TEST_F(Device, completion_has_no_error)
{
    givenDeviceIn(DeviceStatus::analyzing);

    ASSERT_TRUE(m_device.transitionTo(DeviceStatus::completed));
    thenStatusIs(DeviceStatus::completed);
    ASSERT_FALSE(static_cast<bool>(m_device.errorMessage()));
}

TEST_F(Device, any_port_group_counts_as_open)
{
    m_device.specialPorts.insert(37777);
    ASSERT_TRUE(m_device.hasOpenPorts());
}

} // namespace test
} // namespace discovery
} // namespace cctv
