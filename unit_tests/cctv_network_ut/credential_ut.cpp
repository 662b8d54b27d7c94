#include <gtest/gtest.h>

#include <QtCore/QSet>

#include <cctv/network/auth/credential.h>

namespace cctv {
namespace network {
namespace auth {
namespace test {

TEST(Credential, password_is_masked)
{
    ASSERT_EQ("", Credential::maskPassword(""));
    ASSERT_EQ("**", Credential::maskPassword("a"));
    ASSERT_EQ("**", Credential::maskPassword("ab"));
    ASSERT_EQ("a***c", Credential::maskPassword("abc"));
    ASSERT_EQ("1***5", Credential::maskPassword("12345"));
}

TEST(Credential, loggable_form_never_contains_password)
{
    const Credential credential("admin", "Secret123");

    ASSERT_EQ("admin:S***3", credential.toString());
    ASSERT_FALSE(credential.toString().contains("Secret123"));
    ASSERT_EQ("admin:Secret123", credential.toDisplayString());
}

TEST(Credential, parse)
{
    Credential credential;
    ASSERT_TRUE(Credential::parse("admin:pa:ss", &credential));
    ASSERT_EQ("admin", credential.username());
    ASSERT_EQ("pa:ss", credential.password());

    ASSERT_TRUE(Credential::parse("guest:", &credential));
    ASSERT_EQ("guest", credential.username());
    ASSERT_TRUE(credential.password().isEmpty());

    ASSERT_FALSE(Credential::parse("admin", &credential));
    ASSERT_FALSE(Credential::parse(":12345", &credential));
}

TEST(Credential, equality_and_hash_cover_both_fields)
{
    ASSERT_TRUE(Credential("admin", "12345") == Credential("admin", "12345"));
    ASSERT_TRUE(Credential("admin", "12345") != Credential("admin", "54321"));
    ASSERT_TRUE(Credential("admin", "12345") != Credential("root", "12345"));

    QSet<Credential> credentials;
    credentials.insert(Credential("admin", "12345"));
    credentials.insert(Credential("admin", "12345"));
    credentials.insert(Credential("admin", ""));
    ASSERT_EQ(2, credentials.size());
}

} // namespace test
} // namespace auth
} // namespace network
} // namespace cctv
