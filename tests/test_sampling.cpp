#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <radiant/math/rng.hpp>
#include <radiant/math/utils.hpp>
#include <radiant/sample/sampler.hpp>
#include <radiant/sample/warp.hpp>
#include <stdexcept>

using namespace radiant::sample;

TEST(Warp, CosineHemisphereSamplesAreUnitAndUpward) {
  IndependentSampler sampler(7, 1);
  for (int i = 0; i < 1000; ++i) {
    const Vec3 d = sample_cosine_hemisphere(sampler.next2d());
    EXPECT_NEAR(norm(d), 1.0, 1e-12);
    EXPECT_GE(d.z, 0.0);
  }
}

TEST(Warp, CosineHemispherePdfIsNonNegative) {
  IndependentSampler sampler(11, 1);
  for (int i = 0; i < 1000; ++i) {
    const Vec2 u = sampler.next2d();
    // Uniform directions on the full sphere
    const double z = 1.0 - 2.0 * u.x;
    const double r = std::sqrt(std::max(0.0, 1.0 - z * z));
    const double phi = 2.0 * PI * u.y;
    const Vec3 d{r * std::cos(phi), r * std::sin(phi), z};
    EXPECT_GE(pdf_cosine_hemisphere(d), 0.0);
    if (z <= 0.0)
      EXPECT_EQ(pdf_cosine_hemisphere(d), 0.0);
  }
}

TEST(Warp, CosineHemispherePdfIntegratesToOne) {
  IndependentSampler sampler(1234, 1);
  const int n = 200000;
  double sum = 0.0;
  for (int i = 0; i < n; ++i) {
    const Vec3 d = sample_uniform_hemisphere(sampler.next2d());
    sum += pdf_cosine_hemisphere(d) / pdf_uniform_hemisphere(d);
  }
  EXPECT_NEAR(sum / n, 1.0, 1e-2);
}

TEST(Rng, UniformStaysInUnitInterval) {
  Rng rng(3);
  for (int i = 0; i < 10000; ++i) {
    const double u = rng.uniform();
    EXPECT_GE(u, 0.0);
    EXPECT_LT(u, 1.0);
  }
}

TEST(Rng, MixSeedSeparatesStreams) {
  EXPECT_NE(mix_seed(42, 0), mix_seed(42, 1));
  EXPECT_NE(mix_seed(42, 0), mix_seed(43, 0));
  EXPECT_EQ(mix_seed(42, 5), mix_seed(42, 5));
}

TEST(IndependentSampler, ZeroSamplesIsRejected) {
  EXPECT_THROW(IndependentSampler(1, 0), std::invalid_argument);

  IndependentSampler sampler(1, 4);
  EXPECT_THROW(sampler.set_sample_count(0), std::invalid_argument);
  sampler.set_sample_count(16);
  EXPECT_EQ(sampler.sample_count(), 16u);
}

TEST(IndependentSampler, SameSeedSameSequence) {
  IndependentSampler a(99, 1);
  IndependentSampler b(99, 1);
  for (int i = 0; i < 100; ++i)
    EXPECT_EQ(a.next(), b.next());
}

TEST(IndependentSampler, CloneDoesNotDependOnConsumedState) {
  IndependentSampler fresh(5, 8);
  IndependentSampler used(5, 8);
  for (int i = 0; i < 37; ++i)
    used.next();

  auto c0 = fresh.clone_independent_stream(3);
  auto c1 = used.clone_independent_stream(3);
  auto other = fresh.clone_independent_stream(4);

  EXPECT_EQ(c0->sample_count(), 8u);
  bool differs = false;
  for (int i = 0; i < 50; ++i) {
    const double v0 = c0->next();
    EXPECT_EQ(v0, c1->next());
    if (v0 != other->next())
      differs = true;
  }
  EXPECT_TRUE(differs);
}
