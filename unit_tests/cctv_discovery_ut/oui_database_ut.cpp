#include <gtest/gtest.h>

#include <QtCore/QBuffer>
#include <QtCore/QTemporaryFile>

#include <cctv/discovery/oui_database.h>

namespace cctv {
namespace discovery {
namespace test {

class OuiDatabase:
    public ::testing::Test
{
protected:
    int whenLoad(const QByteArray& csv)
    {
        QByteArray data = csv;
        QBuffer buffer(&data);
        buffer.open(QIODevice::ReadOnly);
        return m_database.loadCsv(&buffer);
    }

    discovery::OuiDatabase m_database;
};

TEST_F(OuiDatabase, built_in_vendors_are_known)
{
    ASSERT_EQ("Hikvision", m_database.lookup("44:19:b6:01:02:03"));
    ASSERT_EQ("Dahua", m_database.lookup("3C-EF-8C-AA-BB-CC"));
    ASSERT_EQ("Axis", m_database.lookup("00408cabcdef"));
}

TEST_F(OuiDatabase, unknown_prefix_and_short_address)
{
    const QString unknown = discovery::OuiDatabase::kUnknownManufacturer;
    ASSERT_EQ(unknown, m_database.lookup("02:00:00:00:00:01"));
    ASSERT_EQ(unknown, m_database.lookup("44:19"));
    ASSERT_EQ(unknown, m_database.lookup(""));
}

TEST_F(OuiDatabase, csv_entries_are_added_and_override)
{
    const int sizeBefore = m_database.size();

    const int added = whenLoad(
        "# prefix,manufacturer\n"
        "\n"
        "00:11:22,Example Cameras\n"
        "44-19-B6, Hikvision Digital Technology\n"
        "no comma here\n"
        "zz:zz:zz,Broken\n"
        "A1B2C3,\n");

    ASSERT_EQ(2, added);
    ASSERT_EQ(sizeBefore + 1, m_database.size());
    ASSERT_EQ("Example Cameras", m_database.lookup("00:11:22:33:44:55"));
    ASSERT_EQ("Hikvision Digital Technology", m_database.lookup("44:19:B6:00:00:01"));
}

TEST_F(OuiDatabase, csv_file)
{
    QTemporaryFile file;
    ASSERT_TRUE(file.open());
    file.write("AA:BB:CC,Test Vendor\n");
    file.close();

    ASSERT_EQ(1, m_database.loadCsvFile(file.fileName()));
    ASSERT_EQ("Test Vendor", m_database.lookup("aa:bb:cc:dd:ee:ff"));
}

TEST_F(OuiDatabase, missing_file_is_reported)
{
    ASSERT_EQ(-1, m_database.loadCsvFile("/nonexistent/oui.csv"));
}

TEST(OuiDatabaseManufacturer, cctv_vendors_are_recognized)
{
    ASSERT_TRUE(discovery::OuiDatabase::isCctvManufacturer("Hikvision"));
    ASSERT_TRUE(discovery::OuiDatabase::isCctvManufacturer("Zhejiang Dahua Technology"));
    ASSERT_TRUE(discovery::OuiDatabase::isCctvManufacturer("CP PLUS GmbH"));
    ASSERT_FALSE(discovery::OuiDatabase::isCctvManufacturer("Raspberry Pi Foundation"));
    ASSERT_FALSE(discovery::OuiDatabase::isCctvManufacturer(
        discovery::OuiDatabase::kUnknownManufacturer));
}

} // namespace test
} // namespace discovery
} // namespace cctv
