#include <gtest/gtest.h>
#include "digits.hpp"
#include "normalizer.hpp"

using namespace dr;

TEST(SanitizeTest, StripsEverythingButDigits) {
  EXPECT_EQ(sanitize("+7 (923) 525-40-61"), "79235254061");
  EXPECT_EQ(sanitize("tel:104"), "104");
  EXPECT_EQ(sanitize("501"), "501");
}

TEST(SanitizeTest, EmptyResultIsRejected) {
  EXPECT_FALSE(sanitize("").has_value());
  EXPECT_FALSE(sanitize("+-() abc").has_value());
}

TEST(SanitizeTest, DoesNotBoundLength) {
  const std::string longer(40, '9');
  EXPECT_EQ(sanitize(longer), longer);
}

class NormalizerTest : public ::testing::Test {
protected:
  NumberNormalizer norm;
};

TEST_F(NormalizerTest, ShortCodePassesThrough) {
  EXPECT_EQ(norm.normalize("104"), "104");
  EXPECT_EQ(norm.normalize("999"), "999");
}

TEST_F(NormalizerTest, CityNumberGetsAreaCode) {
  EXPECT_EQ(norm.normalize("602313"), "73843602313");
}

TEST_F(NormalizerTest, TenDigitsGetTrunkDigit) {
  EXPECT_EQ(norm.normalize("4951234567"), "74951234567");
}

TEST_F(NormalizerTest, ElevenDigitsWithSevenPassThrough) {
  EXPECT_EQ(norm.normalize("79235254061"), "79235254061");
}

TEST_F(NormalizerTest, LeadingEightBecomesSeven) {
  EXPECT_EQ(norm.normalize("89235254706"), "79235254706");
  for (char d = '0'; d <= '9'; ++d) {
    const std::string tail = std::string(10, d);
    auto out = norm.normalize("8" + tail);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->front(), '7');
    EXPECT_EQ(out->substr(1), tail);
  }
}

TEST_F(NormalizerTest, OtherElevenDigitPrefixesRejected) {
  for (char d : std::string("01234569")) {
    EXPECT_FALSE(norm.normalize(std::string(1, d) + "9235254061").has_value()) << d;
  }
}

TEST_F(NormalizerTest, OnlyKnownLengthsAccepted) {
  for (size_t len = 1; len <= 15; ++len) {
    const std::string digits = "7" + std::string(len - 1, '1');
    const bool ok = len == 3 || len == 6 || len == 10 || len == 11;
    EXPECT_EQ(norm.normalize(digits).has_value(), ok) << "length " << len;
  }
}

TEST_F(NormalizerTest, NonDigitInputRejected) {
  EXPECT_FALSE(norm.normalize("10a").has_value());
  EXPECT_FALSE(norm.normalize("").has_value());
}

TEST_F(NormalizerTest, ShortCodeNeverConfusedWithCityNumber) {
  EXPECT_EQ(norm.normalize("111")->size(), 3u);
  EXPECT_EQ(norm.normalize("111111")->size(), 11u);
}

TEST(NormalizerConfigTest, CustomCityPrefix) {
  NumberNormalizer norm("74951");
  EXPECT_EQ(norm.normalize("123456"), "74951123456");
  EXPECT_EQ(norm.city_prefix(), "74951");
}

TEST(NormalizerConfigTest, BadCityPrefixThrows) {
  EXPECT_THROW(NumberNormalizer("7384"), std::invalid_argument);
  EXPECT_THROW(NumberNormalizer("738430"), std::invalid_argument);
  EXPECT_THROW(NumberNormalizer("73a43"), std::invalid_argument);
}

TEST(NormalizerConfigTest, ValidateCityPrefix) {
  EXPECT_NO_THROW(NumberNormalizer::validate_city_prefix("73843"));
  EXPECT_THROW(NumberNormalizer::validate_city_prefix(""), std::invalid_argument);
  EXPECT_THROW(NumberNormalizer::validate_city_prefix("7384x"), std::invalid_argument);
  EXPECT_THROW(NumberNormalizer::validate_city_prefix("738431"), std::invalid_argument);
}

TEST_F(NormalizerTest, FormatHintNarrowsAcceptedLengths) {
  EXPECT_EQ(norm.normalize("104", NumberFormat::ShortCode), "104");
  EXPECT_FALSE(norm.normalize("602313", NumberFormat::ShortCode).has_value());

  EXPECT_EQ(norm.normalize("602313", NumberFormat::City6), "73843602313");
  EXPECT_FALSE(norm.normalize("104", NumberFormat::City6).has_value());

  EXPECT_EQ(norm.normalize("4951234567", NumberFormat::FederalPlus), "74951234567");
  EXPECT_EQ(norm.normalize("89235254706", NumberFormat::FederalPlus), "79235254706");
  EXPECT_FALSE(norm.normalize("602313", NumberFormat::FederalPlus).has_value());

  EXPECT_EQ(norm.normalize("79235254706", NumberFormat::Federal7), "79235254706");
  EXPECT_FALSE(norm.normalize("89235254706", NumberFormat::Federal7).has_value());

  EXPECT_EQ(norm.normalize("89235254706", NumberFormat::Federal8), "79235254706");
  EXPECT_FALSE(norm.normalize("79235254706", NumberFormat::Federal8).has_value());
}

TEST_F(NormalizerTest, AnyHintMatchesPlainNormalize) {
  for (const char* d : {"104", "602313", "4951234567", "79235254061", "89235254706", "12", "19235254061"}) {
    EXPECT_EQ(norm.normalize(d, NumberFormat::Any), norm.normalize(d)) << d;
  }
}
