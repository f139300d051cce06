#include "agency/core/error.hpp"

#include "gtest/gtest.h"

using namespace agency;

TEST(ErrorTest, CodesCompareAgainstEnum) {
  std::error_code ec = Error::SecurityViolation;
  EXPECT_EQ(ec, Error::SecurityViolation);
  EXPECT_NE(ec, Error::IoError);
  EXPECT_STREQ(ec.category().name(), "agency");
  EXPECT_EQ(ec.message(), "security violation");
}

TEST(ErrorTest, DefaultCodeMatchesNoError) {
  std::error_code none;
  EXPECT_FALSE(none);
  EXPECT_NE(none, Error::FileNotFound);
  EXPECT_TRUE(make_error_code(Error::FileNotFound));
}

TEST(ErrorTest, EveryCodeHasAMessage) {
  for (int ev = std::to_underlying(Error::FileNotFound);
       ev <= std::to_underlying(Error::DatabaseQueryFailed); ++ev) {
    EXPECT_NE(error_category().message(ev), "unknown error") << ev;
  }
  EXPECT_EQ(error_category().message(0), "unknown error");
  EXPECT_EQ(error_category().message(999), "unknown error");
}

TEST(ErrorTest, ResultHelpers) {
  Result<int> good = ok(7);
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(*good, 7);

  Result<int> bad = fail(Error::CacheMiss);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::CacheMiss);

  Result<void> done = ok();
  EXPECT_TRUE(done.has_value());
}
