#include <gtest/gtest.h>

#include "streaming/protocol.hpp"

#include <cstring>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

TEST(StreamingProtocol, pack_sample_layout) {
    aqwave::DataSample s{1234.5, 1, 200, -7, 72, 98};
    uint8_t buf[aqwave::WIRE_SAMPLE_SIZE];
    ASSERT_EQ(aqwave::pack_sample(buf, s, 42), 32u);

    double ts;
    uint32_t num;
    int32_t fields[5];
    std::memcpy(&ts, buf, 8);
    std::memcpy(&num, buf + 8, 4);
    std::memcpy(fields, buf + 12, 20);

    EXPECT_DOUBLE_EQ(ts, 1234.5);
    EXPECT_EQ(num, 42u);
    EXPECT_EQ(fields[0], 1);
    EXPECT_EQ(fields[1], 200);
    EXPECT_EQ(fields[2], -7);
    EXPECT_EQ(fields[3], 72);
    EXPECT_EQ(fields[4], 98);
}

TEST(StreamingProtocol, metadata_json) {
    aqwave::DeviceInfo info;
    info.device = "AQWave";
    info.product = "RX\"101";
    info.manufacturer = "ReFleX";

    char buf[1024];
    int n = aqwave::build_metadata_json(buf, sizeof(buf), info);
    ASSERT_GT(n, 0);
    ASSERT_LT(n, static_cast<int>(sizeof(buf)));
    std::string json(buf, static_cast<size_t>(n));

    EXPECT_EQ(json.back(), '\n');
    EXPECT_NE(json.find("\"format\":\"binary_lz4\""), std::string::npos);
    EXPECT_NE(json.find("\"batch_size\":10"), std::string::npos);
    EXPECT_NE(json.find("\"sample_size\":32"), std::string::npos);
    EXPECT_NE(json.find("\"sample_struct\":\"<dI5i\""), std::string::npos);
    EXPECT_NE(json.find("\"device\":\"AQWave\""), std::string::npos);
    // Quote stripped from the device-supplied string
    EXPECT_NE(json.find("\"product\":\"RX101\""), std::string::npos);
}

TEST(StreamingProtocol, send_all_over_socketpair) {
    int sv[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, sv), 0);

    const uint8_t msg[] = {1, 2, 3, 4, 5};
    EXPECT_TRUE(aqwave::send_all(sv[0], msg, sizeof(msg), 1.0));

    uint8_t got[8] = {};
    ASSERT_EQ(::read(sv[1], got, sizeof(got)), 5);
    EXPECT_EQ(std::memcmp(got, msg, 5), 0);

    ::close(sv[1]);
    EXPECT_FALSE(aqwave::send_all(sv[0], msg, sizeof(msg), 0.2));
    ::close(sv[0]);
}
