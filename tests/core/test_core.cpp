// DIRGATE - Core Types and Encoding Tests
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include <gtest/gtest.h>

#include "dirgate/core/encoding.h"
#include "dirgate/core/outcome.h"
#include "dirgate/core/types.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace dirgate {
namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// ============================================================================
// Validation Outcome
// ============================================================================

TEST(ValidationOutcomeTest, Valid) {
    auto outcome = ValidationOutcome<std::string>::Valid("docs/a.txt");
    EXPECT_TRUE(outcome.IsValid());
    EXPECT_TRUE(static_cast<bool>(outcome));
    EXPECT_EQ(outcome.Value(), "docs/a.txt");
    EXPECT_TRUE(outcome.Reason().empty());

    std::string taken = outcome.TakeValue();
    EXPECT_EQ(taken, "docs/a.txt");
}

TEST(ValidationOutcomeTest, InvalidCarriesReason) {
    auto outcome = ValidationOutcome<int>::Invalid("Invalid file name");
    EXPECT_FALSE(outcome.IsValid());
    EXPECT_EQ(outcome.Reason(), "Invalid file name");
    EXPECT_THROW(outcome.Value(), std::logic_error);
    EXPECT_THROW(outcome.TakeValue(), std::logic_error);
}

// ============================================================================
// Operation Result
// ============================================================================

TEST(OperationResultTest, Ok) {
    auto result = OperationResult<int>::Ok(42);
    EXPECT_TRUE(result.IsOk());
    EXPECT_EQ(result.Error(), ErrorKind::None);
    EXPECT_EQ(result.Value(), 42);
    EXPECT_TRUE(result.Message().empty());
}

TEST(OperationResultTest, Fail) {
    auto result = OperationResult<int>::Fail(ErrorKind::NotFound, "File not found");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.Error(), ErrorKind::NotFound);
    EXPECT_EQ(result.Message(), "File not found");
    EXPECT_THROW(result.Value(), std::logic_error);
}

TEST(OperationResultTest, FailWithNoneBecomesInternal) {
    auto result = OperationResult<int>::Fail(ErrorKind::None, "oops");
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.Error(), ErrorKind::Internal);
}

TEST(TypesTest, KindNames) {
    EXPECT_STREQ(OperationKindToString(OperationKind::List), "list");
    EXPECT_STREQ(OperationKindToString(OperationKind::Search), "search");
    EXPECT_STREQ(OperationKindToString(OperationKind::Move), "move");

    EXPECT_STREQ(ErrorKindToString(ErrorKind::InvalidInput), "InvalidInput");
    EXPECT_STREQ(ErrorKindToString(ErrorKind::AccessDenied), "AccessDenied");
    EXPECT_STREQ(ErrorKindToString(ErrorKind::RateLimited), "RateLimited");
}

// ============================================================================
// Hex
// ============================================================================

TEST(EncodingTest, Hex) {
    std::vector<uint8_t> data{0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fa5ff");
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>()), "");
}

// ============================================================================
// Base64
// ============================================================================

TEST(EncodingTest, Base64Encode) {
    EXPECT_EQ(Base64Encode(Bytes("")), "");
    EXPECT_EQ(Base64Encode(Bytes("f")), "Zg==");
    EXPECT_EQ(Base64Encode(Bytes("fo")), "Zm8=");
    EXPECT_EQ(Base64Encode(Bytes("foo")), "Zm9v");
    EXPECT_EQ(Base64Encode(Bytes("foobar")), "Zm9vYmFy");
}

TEST(EncodingTest, Base64DecodeHandlesPadding) {
    auto one = Base64Decode("Zg==");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(*one, Bytes("f"));

    auto two = Base64Decode("Zm8=");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(*two, Bytes("fo"));

    auto three = Base64Decode("Zm9vYmFy");
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(*three, Bytes("foobar"));

    auto empty = Base64Decode("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(EncodingTest, Base64DecodeIgnoresWhitespace) {
    auto decoded = Base64Decode("Zm9v\r\nYmFy ");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, Bytes("foobar"));
}

TEST(EncodingTest, Base64DecodeRejectsMalformed) {
    EXPECT_FALSE(Base64Decode("Zm9").has_value());
    EXPECT_FALSE(Base64Decode("Zm!v").has_value());
    EXPECT_FALSE(Base64Decode("Zg=a").has_value());
    EXPECT_FALSE(Base64Decode("====").has_value());
    EXPECT_FALSE(Base64Decode("Z===").has_value());
    EXPECT_FALSE(Base64Decode("Zg==Zm9v").has_value());
}

TEST(EncodingTest, Base64BinaryData) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<uint8_t>(i));
    }
    auto decoded = Base64Decode(Base64Encode(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

// ============================================================================
// SHA-256
// ============================================================================

TEST(EncodingTest, Sha256KnownVectors) {
    EXPECT_EQ(Sha256Hex(Bytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Sha256Hex(Bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

} // namespace
} // namespace dirgate
