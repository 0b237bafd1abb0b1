#include <gtest/gtest.h>
#include <chmdfinder_internal.hpp>

#include <cstring>
#include <string>

class FixedStringCopyTest: public ::testing::Test {
protected:
    void SetUp() override {
        memset(buffer, 0xAA, sizeof(buffer)); // Known pattern
    }

    static constexpr size_t BUFFER_SIZE = 32;
    char buffer[BUFFER_SIZE];
};

TEST_F(FixedStringCopyTest, Copy) {
    std::string source = "Valve Index HMD";
    uint32_t buffer_size = BUFFER_SIZE;

    auto result = fixedStringCopy(buffer, &buffer_size, source);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), source.length());
    EXPECT_STREQ(buffer, "Valve Index HMD");
    EXPECT_EQ(buffer_size, source.length() + 1); // Includes the terminator
}

TEST_F(FixedStringCopyTest, EmptyString) {
    uint32_t buffer_size = BUFFER_SIZE;

    auto result = fixedStringCopy(buffer, &buffer_size, "");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 0);
    EXPECT_EQ(buffer_size, 1);
    EXPECT_EQ(buffer[0], '\0');
}

TEST_F(FixedStringCopyTest, ExactFit) {
    std::string source(BUFFER_SIZE - 1, 'S');
    uint32_t buffer_size = BUFFER_SIZE;

    auto result = fixedStringCopy(buffer, &buffer_size, source);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), BUFFER_SIZE - 1);
    EXPECT_EQ(buffer_size, BUFFER_SIZE);
    EXPECT_EQ(buffer[BUFFER_SIZE - 1], '\0');
}

TEST_F(FixedStringCopyTest, Truncates) {
    std::string source = "No Serial Number";
    uint32_t buffer_size = 6;

    auto result = fixedStringCopy(buffer, &buffer_size, source);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 5);
    EXPECT_EQ(buffer_size, 6);
    EXPECT_STREQ(buffer, "No Se");
    // Untouched past the given size
    EXPECT_EQ(static_cast<unsigned char>(buffer[6]), 0xAA);
}

TEST_F(FixedStringCopyTest, OnlyRoomForTerminator) {
    uint32_t buffer_size = 1;

    auto result = fixedStringCopy(buffer, &buffer_size, "Beyond");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 0);
    EXPECT_EQ(buffer_size, 1);
    EXPECT_STREQ(buffer, "");
}

TEST_F(FixedStringCopyTest, ClearsBuffer) {
    uint32_t buffer_size = 12;

    auto result = fixedStringCopy(buffer, &buffer_size, "Vive");

    ASSERT_TRUE(result.has_value());
    for (size_t i = 4; i < 12; ++i) {
        EXPECT_EQ(buffer[i], 0) << "Buffer not cleared at index " << i;
    }
}

TEST_F(FixedStringCopyTest, InvalidArguments) {
    uint32_t buffer_size = BUFFER_SIZE;
    EXPECT_FALSE(fixedStringCopy<uint32_t>(nullptr, &buffer_size, "Vive").has_value());
    EXPECT_FALSE(fixedStringCopy<uint32_t>(buffer, nullptr, "Vive").has_value());

    buffer_size = 0;
    EXPECT_FALSE(fixedStringCopy(buffer, &buffer_size, "Vive").has_value());
    EXPECT_EQ(buffer_size, 0);
    EXPECT_EQ(static_cast<unsigned char>(buffer[0]), 0xAA);
}

TEST_F(FixedStringCopyTest, SizeTypes) {
    {
        uint8_t size8 = 8;
        auto result = fixedStringCopy(buffer, &size8, "HTC Vive");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result.value(), 7);
        EXPECT_EQ(size8, 8);
    }
    {
        uint64_t size64 = 16;
        auto result = fixedStringCopy(buffer, &size64, "HTC Vive");
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result.value(), 8);
        EXPECT_EQ(size64, 9);
    }
}
