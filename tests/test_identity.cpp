#include <gtest/gtest.h>
#include "core/identity.h"
#include "crypto/crypto.h"
#include "utils/utils.h"

using namespace stakerep::core;
using stakerep::crypto::base64EncodeString;
using stakerep::utils::Formatter;

TEST(IdentityTest, PlainNamesAreTrimmedAndLowercased) {
    EXPECT_EQ(normalizeIdentity("Alice"), "alice");
    EXPECT_EQ(normalizeIdentity("  Bob  "), "bob");
    EXPECT_EQ(normalizeIdentity(""), "");
}

TEST(IdentityTest, CommonNameExtractedFromDistinguishedName) {
    EXPECT_EQ(normalizeIdentity("CN=Alice,OU=client,O=Org1"), "alice");
    EXPECT_EQ(normalizeIdentity("/C=US/O=Org1/CN=Carol"), "carol");
    EXPECT_EQ(normalizeIdentity("ou=client, cn=Dave"), "dave");
}

TEST(IdentityTest, X509BundleUsesSubjectNotIssuer) {
    std::string raw = "x509::CN=Alice,OU=client,O=Org1::CN=ca.org1.example.com,O=org1.example.com";
    EXPECT_EQ(normalizeIdentity(raw), "alice");
}

TEST(IdentityTest, Base64EncodedBundleDecoded) {
    std::string raw = "x509::CN=Alice,OU=client::CN=ca,O=Org1";
    std::string encoded = base64EncodeString(raw);
    EXPECT_EQ(normalizeIdentity(encoded), "alice");
    EXPECT_TRUE(sameIdentity(raw, encoded));
    EXPECT_TRUE(sameIdentity("alice", encoded));
}

TEST(IdentityTest, Base64WithoutMarkerLeftAlone) {
    // "abcd" is valid base64 but decodes to binary
    EXPECT_EQ(normalizeIdentity("abcd"), "abcd");
    std::string encodedPlain = base64EncodeString("hello world!");
    EXPECT_EQ(normalizeIdentity(encodedPlain), Formatter::toLower(encodedPlain));
}

TEST(IdentityTest, Idempotent) {
    std::vector<std::string> inputs = {
        "Alice",
        "CN=Bob,OU=x",
        "x509::CN=Carol::CN=ca",
        base64EncodeString("x509::CN=Dave,O=Org::CN=ca"),
        "CN=cn=Eve",
        "  ",
    };
    for (const auto& in : inputs) {
        std::string once = normalizeIdentity(in);
        EXPECT_EQ(normalizeIdentity(once), once) << in;
    }
}

TEST(IdentityTest, DifferentActorsStayDistinct) {
    EXPECT_FALSE(sameIdentity("CN=alice", "CN=bob"));
    EXPECT_FALSE(sameIdentity("x509::CN=alice::CN=ca", "x509::CN=ca::CN=alice"));
}
