#include <gtest/gtest.h>
#include "protocol.hpp"

static std::vector<uint8_t> bytes(const std::string &str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

TEST(ProtocolTest, RoundTripsEveryPacketKind) {
    RequestPacket rrq;
    rrq.kind = RequestPacket::READ;
    rrq.filename = "boot/kernel.img";
    rrq.mode = "octet";
    rrq.options = {{OptionType::TransferSize, 0}, {OptionType::BlockSize, 1428}};

    RequestPacket wrq;
    wrq.kind = RequestPacket::WRITE;
    wrq.filename = "upload.bin";
    wrq.mode = "netascii";

    DataPacket data;
    data.block_num = 65535;
    data.payload = {0x00, 0xff, 0x10, 0x00, 0x42};

    DataPacket empty;
    empty.block_num = 3;

    AckPacket ack;
    ack.block_num = 0;

    ErrorPacket error;
    error.code = ErrorCode::OptionNegotiationFailed;
    error.message = "bad option";

    OptionAckPacket oack;
    oack.options = {{OptionType::Timeout, 3}, {OptionType::TransferSize, 1ULL << 40}, {OptionType::BlockSize, 8}};

    std::vector<Packet> packets = {rrq, wrq, data, empty, ack, error, oack};
    for (const Packet &packet : packets) {
        EXPECT_EQ(decode(encode(packet)), packet);
    }
}

TEST(ProtocolTest, EncodesDataAndAckBigEndian) {
    DataPacket data;
    data.block_num = 0x0102;
    data.payload = {'h', 'i'};
    EXPECT_EQ(encode(data), (std::vector<uint8_t>{0, 3, 1, 2, 'h', 'i'}));

    AckPacket ack;
    ack.block_num = 0xfffe;
    EXPECT_EQ(encode(ack), (std::vector<uint8_t>{0, 4, 0xff, 0xfe}));
}

TEST(ProtocolTest, EncodesErrorWithTerminator) {
    ErrorPacket error;
    error.code = ErrorCode::FileNotFound;
    error.message = "file not found";
    std::vector<uint8_t> expected = {0, 5, 0, 1};
    std::vector<uint8_t> msg = bytes("file not found");
    expected.insert(expected.end(), msg.begin(), msg.end());
    expected.push_back(0);
    EXPECT_EQ(encode(error), expected);
}

TEST(ProtocolTest, EncodesOptionAckAsTextPairs) {
    OptionAckPacket oack;
    oack.options = {{OptionType::BlockSize, 1024}, {OptionType::TransferSize, 1500}};
    std::vector<uint8_t> expected = {0, 6};
    std::vector<uint8_t> body = bytes(std::string("blksize\0" "1024\0" "tsize\0" "1500\0", 24));
    expected.insert(expected.end(), body.begin(), body.end());
    EXPECT_EQ(encode(oack), expected);
}

TEST(ProtocolTest, DecodesOptionsInAnyOrderAndCase) {
    std::vector<uint8_t> buf = {0, 1};
    std::vector<uint8_t> body = bytes(std::string("f\0octet\0TIMEOUT\0" "2\0BlkSize\0" "600\0", 30));
    buf.insert(buf.end(), body.begin(), body.end());

    RequestPacket req = std::get<RequestPacket>(decode(buf));
    EXPECT_EQ(req.kind, RequestPacket::READ);
    EXPECT_EQ(req.filename, "f");
    EXPECT_EQ(req.mode, "octet");
    ASSERT_EQ(req.options.size(), 2u);
    EXPECT_EQ(req.options[0], (TransferOption{OptionType::Timeout, 2}));
    EXPECT_EQ(req.options[1], (TransferOption{OptionType::BlockSize, 600}));
}

TEST(ProtocolTest, SkipsUnknownOptions) {
    std::vector<uint8_t> buf = {0, 6};
    std::vector<uint8_t> body = bytes(std::string("windowsize\0" "4\0tsize\0" "99\0", 22));
    buf.insert(buf.end(), body.begin(), body.end());

    OptionAckPacket oack = std::get<OptionAckPacket>(decode(buf));
    ASSERT_EQ(oack.options.size(), 1u);
    EXPECT_EQ(oack.options[0], (TransferOption{OptionType::TransferSize, 99}));
}

TEST(ProtocolTest, UnknownErrorCodeDecodesAsUndefined) {
    std::vector<uint8_t> buf = {0, 5, 0, 42, 'x', 0};
    ErrorPacket error = std::get<ErrorPacket>(decode(buf));
    EXPECT_EQ(error.code, ErrorCode::Undefined);
    EXPECT_EQ(error.message, "x");
}

TEST(ProtocolTest, RejectsMalformedInput) {
    std::vector<std::vector<uint8_t>> bad = {
        {},
        {0},
        {0, 9, 0, 1},                                  // unknown opcode
        {0, 0},
        {0, 3, 0},                                     // truncated data header
        {0, 4, 0, 1, 0},                               // oversized ack
        {0, 4, 0},                                     // truncated ack
        {0, 5, 0, 1, 'n', 'o'},                        // error text not terminated
        {0, 5, 0, 1},                                  // error without text
        {0, 1, 'f', 0},                                // request without mode
        {0, 1, 'f', 0, 'o', 'c'},                      // mode not terminated
        {0, 6, 'b', 'l', 'k', 's', 'i', 'z', 'e', 0},  // option without value
        {0, 6, 't', 's', 'i', 'z', 'e', 0, '1', 'x', 0},  // non-numeric value
        {0, 6, 't', 's', 'i', 'z', 'e', 0, 0},         // empty value
    };
    for (const auto &buf : bad) {
        EXPECT_THROW(decode(buf), MalformedPacket);
    }
}

TEST(ProtocolTest, RejectsOverflowingOptionValue) {
    std::vector<uint8_t> buf = {0, 6};
    std::vector<uint8_t> body = bytes(std::string("tsize\0" "99999999999999999999\0", 27));
    buf.insert(buf.end(), body.begin(), body.end());
    EXPECT_THROW(decode(buf), MalformedPacket);
}

TEST(ProtocolTest, TruncatedPacketsNeverDecodeWrongly) {
    RequestPacket req;
    req.filename = "name";
    req.options = {{OptionType::BlockSize, 512}, {OptionType::Timeout, 5}};
    ErrorPacket error;
    error.code = ErrorCode::DiskFull;
    error.message = "full";

    for (const Packet &packet : std::vector<Packet>{req, error}) {
        std::vector<uint8_t> buf = encode(packet);
        for (size_t len = 0; len < buf.size(); len++) {
            try {
                Packet decoded = decode(buf.data(), len);
                EXPECT_NE(decoded, packet);
            } catch (const MalformedPacket &) {
            }
        }
    }
}

TEST(ProtocolTest, BlockNumbersWrap) {
    EXPECT_EQ(next_block(0), 1);
    EXPECT_EQ(next_block(1), 2);
    EXPECT_EQ(next_block(65534), 65535);
    EXPECT_EQ(next_block(65535), 0);
}

TEST(ProtocolTest, ErrorCodesMatchRfc) {
    EXPECT_EQ(error_code_value(ErrorCode::Undefined), 0);
    EXPECT_EQ(error_code_value(ErrorCode::FileNotFound), 1);
    EXPECT_EQ(error_code_value(ErrorCode::IllegalOperation), 4);
    EXPECT_EQ(error_code_value(ErrorCode::NoSuchUser), 7);
    EXPECT_EQ(error_code_value(ErrorCode::OptionNegotiationFailed), 8);
}
