#include "boxrun/result.hpp"

#include <gtest/gtest.h>

namespace boxrun {

struct ArrowProbe {
  int value = 0;
  int get() const { return value; }
};

TEST(ResultTest, ErrorCategoryNameAndMessage) {
  auto code = make_error_code(errc::invalid_request);
  EXPECT_STREQ(code.category().name(), "boxrun");
  EXPECT_EQ(code.message(), "invalid launch request");
}

TEST(ResultTest, ErrcConvertsImplicitly) {
  std::error_code code = errc::empty_argv;
  EXPECT_EQ(code, make_error_code(errc::empty_argv));
  EXPECT_NE(code, make_error_code(errc::spawn_failed));
}

TEST(ResultTest, HoldsValueOrError) {
  Result<int> ok(5);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok.value(), 5);
  EXPECT_EQ(*ok, 5);

  Error err{make_error_code(errc::spawn_failed), "execve"};
  Result<int> bad(err);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, err.code);
  EXPECT_EQ(bad.error().context, "execve");
}

TEST(ResultTest, ErrorConvertsIntoResult) {
  auto fails = []() -> Result<int> {
    return Error{make_error_code(errc::kill_failed), "terminate"};
  };
  auto result = fails();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, make_error_code(errc::kill_failed));
}

TEST(ResultTest, VoidResult) {
  Result<void> ok;
  EXPECT_TRUE(ok.has_value());

  Result<void> bad(Error{make_error_code(errc::wait_failed), "waitpid"});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().context, "waitpid");
}

TEST(ResultTest, OperatorArrowProvidesMemberAccess) {
  Result<ArrowProbe> ok(ArrowProbe{42});
  EXPECT_EQ(ok->value, 42);
  EXPECT_EQ(ok->get(), 42);

  const Result<ArrowProbe> const_ok(ArrowProbe{7});
  EXPECT_EQ(const_ok->get(), 7);
}

}  // namespace boxrun
