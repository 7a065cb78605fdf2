#include <gtest/gtest.h>
#include <ssh/socks5.hpp>
#include <cstring>

// Serves bytes from a fixed buffer; fails once it runs dry.
class ByteReader {
public:
    explicit ByteReader(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    socks5::ReadExact fn() {
        return [this](uint8_t* buf, size_t n) {
            if (pos_ + n > bytes_.size()) return false;
            std::memcpy(buf, bytes_.data() + pos_, n);
            pos_ += n;
            return true;
        };
    }

    size_t remaining() const { return bytes_.size() - pos_; }

private:
    std::vector<uint8_t> bytes_;
    size_t pos_ = 0;
};

// ── Server side ─────────────────────────────────────────────

TEST(Socks5, GreetingOffersNoAuth) {
    ByteReader r({0x05, 0x02, 0x02, 0x00});
    auto g = socks5::read_greeting(r.fn());
    ASSERT_TRUE(g.is_ok());
    EXPECT_TRUE(g.value);
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(Socks5, GreetingWithoutNoAuth) {
    ByteReader r({0x05, 0x01, 0x02});
    auto g = socks5::read_greeting(r.fn());
    ASSERT_TRUE(g.is_ok());
    EXPECT_FALSE(g.value);
}

TEST(Socks5, GreetingWrongVersion) {
    ByteReader r({0x04, 0x01, 0x00});
    EXPECT_TRUE(socks5::read_greeting(r.fn()).is_err());
}

TEST(Socks5, GreetingTruncated) {
    ByteReader r({0x05, 0x03, 0x00});
    EXPECT_TRUE(socks5::read_greeting(r.fn()).is_err());
}

TEST(Socks5, RequestIPv4) {
    ByteReader r({0x05, 0x01, 0x00, 0x01, 203, 0, 113, 7, 0x00, 0x50});
    socks5::Reply reply;
    auto req = socks5::read_request(r.fn(), reply);
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.host, "203.0.113.7");
    EXPECT_EQ(req.value.port, 80);
    EXPECT_EQ(reply, socks5::Reply::Succeeded);
}

TEST(Socks5, RequestDomain) {
    std::vector<uint8_t> bytes = {0x05, 0x01, 0x00, 0x03, 13};
    for (char c : std::string("api.ipify.org")) bytes.push_back(static_cast<uint8_t>(c));
    bytes.push_back(0x01);
    bytes.push_back(0xBB);

    ByteReader r(bytes);
    socks5::Reply reply;
    auto req = socks5::read_request(r.fn(), reply);
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.host, "api.ipify.org");
    EXPECT_EQ(req.value.port, 443);
}

TEST(Socks5, RequestIPv6) {
    std::vector<uint8_t> bytes = {0x05, 0x01, 0x00, 0x04};
    std::vector<uint8_t> addr(16, 0);
    addr[15] = 1;
    bytes.insert(bytes.end(), addr.begin(), addr.end());
    bytes.push_back(0x1F);
    bytes.push_back(0x90);

    ByteReader r(bytes);
    socks5::Reply reply;
    auto req = socks5::read_request(r.fn(), reply);
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.host, "::1");
    EXPECT_EQ(req.value.port, 8080);
}

TEST(Socks5, RequestBindIsNotSupported) {
    ByteReader r({0x05, 0x02, 0x00, 0x01, 127, 0, 0, 1, 0x00, 0x50});
    socks5::Reply reply;
    EXPECT_TRUE(socks5::read_request(r.fn(), reply).is_err());
    EXPECT_EQ(reply, socks5::Reply::CommandNotSupported);
}

TEST(Socks5, RequestUnknownAddressType) {
    ByteReader r({0x05, 0x01, 0x00, 0x09, 0x00});
    socks5::Reply reply;
    EXPECT_TRUE(socks5::read_request(r.fn(), reply).is_err());
    EXPECT_EQ(reply, socks5::Reply::AddressTypeNotSupported);
}

TEST(Socks5, ReplyEncoding) {
    auto bytes = socks5::encode_reply(socks5::Reply::HostUnreachable);
    ASSERT_EQ(bytes.size(), 10u);
    EXPECT_EQ(bytes[0], 0x05);
    EXPECT_EQ(bytes[1], 0x04);
    EXPECT_EQ(bytes[3], socks5::ATYP_IPV4);
}

// ── Client side ─────────────────────────────────────────────

TEST(Socks5, ConnectEncodingPicksAddressType) {
    auto v4 = socks5::encode_connect("203.0.113.7", 80);
    ASSERT_EQ(v4.size(), 10u);
    EXPECT_EQ(v4[3], socks5::ATYP_IPV4);
    EXPECT_EQ(v4[4], 203);
    EXPECT_EQ(v4[8], 0x00);
    EXPECT_EQ(v4[9], 0x50);

    auto name = socks5::encode_connect("api.ipify.org", 443);
    ASSERT_EQ(name.size(), 4u + 1 + 13 + 2);
    EXPECT_EQ(name[3], socks5::ATYP_DOMAIN);
    EXPECT_EQ(name[4], 13);

    auto v6 = socks5::encode_connect("2001:db8::1", 22);
    ASSERT_EQ(v6.size(), 4u + 16 + 2);
    EXPECT_EQ(v6[3], socks5::ATYP_IPV6);
}

TEST(Socks5, ClientRequestIsReadableByServer) {
    ByteReader r(socks5::encode_connect("example.com", 8443));
    socks5::Reply reply;
    auto req = socks5::read_request(r.fn(), reply);
    ASSERT_TRUE(req.is_ok()) << req.error;
    EXPECT_EQ(req.value.host, "example.com");
    EXPECT_EQ(req.value.port, 8443);
}

TEST(Socks5, ReadReplyConsumesBoundAddress) {
    std::vector<uint8_t> bytes = {0x05, 0x00, 0x00, 0x03, 4, 'h', 'o', 's', 't', 0x00, 0x50, 0xAA};
    ByteReader r(bytes);
    auto reply = socks5::read_reply(r.fn());
    ASSERT_TRUE(reply.is_ok()) << reply.error;
    EXPECT_EQ(reply.value, socks5::Reply::Succeeded);
    EXPECT_EQ(r.remaining(), 1u);
}

TEST(Socks5, ReadReplyFailureCode) {
    ByteReader r(socks5::encode_reply(socks5::Reply::ConnectionRefused));
    auto reply = socks5::read_reply(r.fn());
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value, socks5::Reply::ConnectionRefused);
}
