// tests/unit/driver/test_samples.cpp - Unit tests for the reference programs
//

#include <gtest/gtest.h>

#include "rvir/driver/samples.hpp"
#include "rvir/graph/node.hpp"

using namespace rvir;

TEST(DriverSamples, Names)
{
  const auto names = sample_names();
  ASSERT_EQ(names.size(), 5u);
  EXPECT_EQ(names.front(), "mux");
}

TEST(DriverSamples, AllSamplesPass)
{
  ValueStore store;
  DiagnosticBag diags;
  const auto results = run_samples(store, diags);

  EXPECT_TRUE(diags.empty());
  ASSERT_EQ(results.size(), sample_names().size());
  for (const auto & r : results) {
    EXPECT_TRUE(r.passed) << r.name << ": " << r.detail;
    EXPECT_GT(r.cases, 0u) << r.name;
    EXPECT_TRUE(r.program) << r.name;
  }
}

TEST(DriverSamples, MuxCoversEveryInput)
{
  ValueStore store;
  DiagnosticBag diags;
  const auto r = run_sample("mux", store, diags);
  EXPECT_TRUE(r.passed) << r.detail;
  EXPECT_EQ(r.cases, 8u);
  EXPECT_TRUE(r.program->is<Lambda>());
}

TEST(DriverSamples, UnknownSampleIsReported)
{
  ValueStore store;
  DiagnosticBag diags;
  const auto r = run_sample("nope", store, diags);
  EXPECT_FALSE(r.passed);
  ASSERT_TRUE(diags.has_errors());
  ASSERT_TRUE(diags.all()[0].help_message.has_value());
  EXPECT_NE(diags.all()[0].help_message->find("mux"), std::string::npos);
}

TEST(DriverSamples, StoreIsReleasedAfterSamples)
{
  ValueStore store;
  {
    DiagnosticBag diags;
    const auto results = run_samples(store, diags);
    EXPECT_FALSE(store.empty());
  }
  store.collect();
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(store.region_count(), 0u);
}
