#include <gtest/gtest.h>
#include "crypto/crypto.h"
#include "utils/serialize.h"
#include "utils/utils.h"
#include <cmath>
#include <stdexcept>

using namespace stakerep;

TEST(CryptoTest, Sha256KnownVectors) {
    EXPECT_EQ(crypto::sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(crypto::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(crypto::sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    std::string million(1000000, 'a');
    EXPECT_EQ(crypto::toHex(crypto::sha256(million)),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(CryptoTest, HexIsLowercase) {
    std::vector<uint8_t> bytes = {0x00, 0x7f, 0x80, 0xff};
    EXPECT_EQ(crypto::toHex(bytes.data(), bytes.size()), "007f80ff");
    EXPECT_EQ(crypto::toHex(bytes.data(), 2), "007f");
}

TEST(CryptoTest, Base64) {
    EXPECT_EQ(crypto::base64EncodeString(""), "");
    EXPECT_EQ(crypto::base64EncodeString("f"), "Zg==");
    EXPECT_EQ(crypto::base64EncodeString("fo"), "Zm8=");
    EXPECT_EQ(crypto::base64EncodeString("foobar"), "Zm9vYmFy");

    std::string encoded = "eDUwOTo6Q049Qm9i";
    std::vector<uint8_t> raw(encoded.begin(), encoded.end());
    auto decoded = crypto::base64Decode(raw);
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "x509::CN=Bob");
}

TEST(CryptoTest, StrictBase64Check) {
    EXPECT_TRUE(crypto::isBase64("Zm9vYmFy"));
    EXPECT_TRUE(crypto::isBase64("Zm8="));
    EXPECT_FALSE(crypto::isBase64("Zm8"));
    EXPECT_FALSE(crypto::isBase64("Zm=8"));
    EXPECT_FALSE(crypto::isBase64("Zm9v YmFy"));
    EXPECT_FALSE(crypto::isBase64(""));
}

TEST(ByteBufferTest, ReadsBackInOrder) {
    utils::ByteBuffer out;
    out.writeUint8(1);
    out.writeInt64(-42);
    out.writeDouble(0.3);
    out.writeString("quality");
    out.writeStringList({"a", "", "c"});
    out.writeVarInt(300);

    utils::ByteBuffer in(out.data());
    EXPECT_EQ(in.readUint8(), 1u);
    EXPECT_EQ(in.readInt64(), -42);
    EXPECT_DOUBLE_EQ(in.readDouble(), 0.3);
    EXPECT_EQ(in.readString(), "quality");
    EXPECT_EQ(in.readStringList(), (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(in.readVarInt(), 300u);
    EXPECT_EQ(in.remaining(), 0u);
    EXPECT_THROW(in.readUint8(), std::runtime_error);
}

TEST(ByteBufferTest, TruncatedInputThrows) {
    utils::ByteBuffer out;
    out.writeString("truncated");
    std::vector<uint8_t> data = out.data();
    data.resize(data.size() - 3);

    utils::ByteBuffer in(data);
    EXPECT_THROW(in.readString(), std::runtime_error);
}

TEST(FormatterTest, Json) {
    EXPECT_EQ(utils::Formatter::formatJson("k", "a\"b\n"), "\"k\":\"a\\\"b\\n\"");
    EXPECT_EQ(utils::Formatter::formatJsonDouble("s", 0.5), "\"s\":0.500000");
    EXPECT_EQ(utils::Formatter::formatDouble(NAN), "null");
}

TEST(FormatterTest, Strings) {
    EXPECT_EQ(utils::Formatter::trim("  a b \t"), "a b");
    EXPECT_EQ(utils::Formatter::toLower("CN=Bob"), "cn=bob");
    EXPECT_TRUE(utils::Formatter::startsWithIgnoreCase("X509::cn", "x509::"));
    EXPECT_EQ(utils::Formatter::splitAny("CN=Bob,OU=a/O=b", ",/").size(), 3u);
    EXPECT_EQ(utils::Formatter::join({"x", "y"}, ", "), "x, y");
}
