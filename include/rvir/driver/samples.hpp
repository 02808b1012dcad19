// rvir/driver/samples.hpp - Reference programs built and evaluated by the tool
//
// Each sample constructs a small program through the public constructors,
// applies it to concrete arguments and checks the reduced values.
//
#pragma once

#include <string>
#include <vector>

#include "rvir/basic/diagnostic.hpp"
#include "rvir/graph/valid.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

struct SampleResult
{
  std::string name;
  bool passed = false;

  /// Number of evaluated cases
  size_t cases = 0;

  /// Human-readable summary of the first failing case, if any
  std::string detail;

  /// The sample's main program
  ValId program;
};

/**
 * Names of the available samples, in run order.
 */
[[nodiscard]] std::vector<std::string> sample_names();

/**
 * Build and evaluate one sample.
 *
 * Construction or evaluation errors are reported to `diags` and mark the
 * sample as failed.
 *
 * @param name One of sample_names()
 * @return The result; an unknown name yields a failed result
 */
[[nodiscard]] SampleResult run_sample(
  const std::string & name, ValueStore & store, DiagnosticBag & diags);

/**
 * Run every sample against one store.
 */
[[nodiscard]] std::vector<SampleResult> run_samples(ValueStore & store, DiagnosticBag & diags);

}  // namespace rvir
