// Unit tests for textembed/normalize.hpp

#include <gtest/gtest.h>

#include <textembed/normalize.hpp>

#include <cmath>
#include <vector>

namespace textembed::internal {
namespace {

TEST(NormalizeTest, ThreeFourFive) {
  std::vector<float> v = {3.0f, 4.0f};
  auto out = Normalize(v);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_NEAR(out[0], 0.6f, 1e-6f);
  EXPECT_NEAR(out[1], 0.8f, 1e-6f);
}

TEST(NormalizeTest, UnitLength) {
  std::vector<float> v = {0.5f, -1.25f, 2.0f, 7.0f, -0.01f};
  auto out = Normalize(v);
  EXPECT_NEAR(L2Norm(out.data(), out.size()), 1.0f, 1e-5f);
}

TEST(NormalizeTest, ZeroVectorStaysZero) {
  std::vector<float> v(16, 0.0f);
  auto out = Normalize(v);
  ASSERT_EQ(out.size(), 16u);
  for (float x : out) {
    EXPECT_EQ(x, 0.0f);
    EXPECT_FALSE(std::isnan(x));
  }
}

TEST(NormalizeTest, EmptyVector) {
  std::vector<float> v;
  EXPECT_TRUE(Normalize(v).empty());
}

TEST(NormalizeTest, PreservesDirectionAndSign) {
  std::vector<float> v = {-2.0f, 0.0f, 1.0f};
  auto out = Normalize(v);
  EXPECT_LT(out[0], 0.0f);
  EXPECT_EQ(out[1], 0.0f);
  EXPECT_GT(out[2], 0.0f);
  EXPECT_NEAR(out[0] / out[2], -2.0f, 1e-5f);
}

TEST(NormalizeTest, TinyVectorIsDampedByEpsilon) {
  // ||v|| is comparable to the epsilon, so the result is shorter than 1.
  std::vector<float> v = {1e-12f, 0.0f};
  auto out = Normalize(v);
  EXPECT_NEAR(out[0], 0.5f, 1e-3f);
}

TEST(NormalizeTest, PointerOverloadReadsOnlyRequestedRange) {
  std::vector<float> data = {3.0f, 4.0f, 1000.0f};
  auto out = Normalize(data.data(), 2);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_NEAR(out[1], 0.8f, 1e-6f);
}

}  // namespace
}  // namespace textembed::internal
