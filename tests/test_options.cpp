#include <gtest/gtest.h>
#include "errors.hpp"
#include "options.hpp"

static const std::chrono::milliseconds DEFAULT_TIMEOUT(5000);

TEST(OptionsTest, DefaultsWithoutOptions) {
    NegotiatedParameters params = negotiate({}, TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.block_size, 512u);
    EXPECT_EQ(params.transfer_size, 0u);
    EXPECT_EQ(params.timeout, DEFAULT_TIMEOUT);
    EXPECT_TRUE(params.acknowledged.empty());
}

TEST(OptionsTest, DefaultTimeoutComesFromCaller) {
    NegotiatedParameters params = negotiate({}, TransferDirection::send(10), std::chrono::milliseconds(250));
    EXPECT_EQ(params.timeout, std::chrono::milliseconds(250));
}

TEST(OptionsTest, BlockSizeIsStored) {
    NegotiatedParameters params = negotiate({{OptionType::BlockSize, 1428}},
        TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.block_size, 1428u);
    ASSERT_EQ(params.acknowledged.size(), 1u);
    EXPECT_EQ(params.acknowledged[0], (TransferOption{OptionType::BlockSize, 1428}));
}

TEST(OptionsTest, BlockSizeOutOfRangeIsRejected) {
    for (uint64_t value : {0ULL, 7ULL, 65465ULL, 1ULL << 33}) {
        try {
            negotiate({{OptionType::BlockSize, value}}, TransferDirection::receive(), DEFAULT_TIMEOUT);
            FAIL() << "blksize " << value << " accepted";
        } catch (const TransferError &e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidOption);
        }
    }
    EXPECT_EQ(negotiate({{OptionType::BlockSize, 8}}, TransferDirection::receive(), DEFAULT_TIMEOUT).block_size, 8u);
    EXPECT_EQ(negotiate({{OptionType::BlockSize, 65464}}, TransferDirection::receive(), DEFAULT_TIMEOUT).block_size, 65464u);
}

TEST(OptionsTest, TimeoutIsStoredInSeconds) {
    NegotiatedParameters params = negotiate({{OptionType::Timeout, 3}},
        TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.timeout, std::chrono::seconds(3));
}

TEST(OptionsTest, ZeroTimeoutIsRejected) {
    try {
        negotiate({{OptionType::BlockSize, 1024}, {OptionType::Timeout, 0}},
            TransferDirection::send(100), DEFAULT_TIMEOUT);
        FAIL() << "zero timeout accepted";
    } catch (const TransferError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidOption);
        EXPECT_STREQ(e.what(), "Invalid timeout value 0");
    }
}

TEST(OptionsTest, SendSubstitutesLocalFileSize) {
    const std::vector<TransferOption> requested = {
        {OptionType::BlockSize, 1024}, {OptionType::TransferSize, 0}, {OptionType::Timeout, 2}};
    NegotiatedParameters params = negotiate(requested, TransferDirection::send(1500), DEFAULT_TIMEOUT);

    EXPECT_EQ(params.transfer_size, 1500u);
    std::vector<TransferOption> expected = {
        {OptionType::BlockSize, 1024}, {OptionType::TransferSize, 1500}, {OptionType::Timeout, 2}};
    EXPECT_EQ(params.acknowledged, expected);
    // the caller's list is untouched
    EXPECT_EQ(requested[1].value, 0u);
}

TEST(OptionsTest, ReceiveKeepsDeclaredSize) {
    NegotiatedParameters params = negotiate({{OptionType::TransferSize, 4096}},
        TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.transfer_size, 4096u);
    ASSERT_EQ(params.acknowledged.size(), 1u);
    EXPECT_EQ(params.acknowledged[0].value, 4096u);
}

TEST(OptionsTest, UnknownKindIsIgnored) {
    std::vector<TransferOption> requested = {
        {static_cast<OptionType>(42), 7}, {OptionType::BlockSize, 600}};
    NegotiatedParameters params = negotiate(requested, TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.block_size, 600u);
    ASSERT_EQ(params.acknowledged.size(), 1u);
    EXPECT_EQ(params.acknowledged[0].kind, OptionType::BlockSize);
}

TEST(OptionsTest, RepeatedOptionIsAcknowledgedOnce) {
    NegotiatedParameters params = negotiate(
        {{OptionType::BlockSize, 1024}, {OptionType::Timeout, 2}, {OptionType::BlockSize, 600}},
        TransferDirection::receive(), DEFAULT_TIMEOUT);
    EXPECT_EQ(params.block_size, 600u);
    EXPECT_EQ(params.acknowledged, (std::vector<TransferOption>{
        {OptionType::BlockSize, 600}, {OptionType::Timeout, 2}}));
}
