// tests/unit/basic/test_diagnostic_printer.cpp - Unit tests for diagnostic output
//

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "rvir/basic/diagnostic_printer.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/store/value_store.hpp"

using namespace rvir;

namespace
{

std::string render(const DiagnosticBag & diags)
{
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);
  return out.str();
}

}  // namespace

TEST(BasicDiagnosticPrinter, HeaderWithCode)
{
  DiagnosticBag diags;
  diags.report(Error::make(ErrorKind::TooManyArgs, "2 left over"));
  EXPECT_EQ(render(diags), "error[E005]: too many arguments: 2 left over\n\n");
}

TEST(BasicDiagnosticPrinter, HeaderWithoutCode)
{
  DiagnosticBag diags;
  diags.report_error("careful");
  EXPECT_EQ(render(diags), "error: careful\n\n");
}

TEST(BasicDiagnosticPrinter, WarningHeader)
{
  DiagnosticBag diags;
  diags.report(Error::make(ErrorKind::RelevantUnused, "x"));
  EXPECT_EQ(render(diags).rfind("warning[E008]: ", 0), 0u);
}

TEST(BasicDiagnosticPrinter, TypeMismatchWithNoteAndHelp)
{
  ValueStore store;
  DiagnosticBag diags;
  diags
    .report(Error::type_mismatch(make_bool_type(store), make_finite(store, 16), "argument #0"))
    .with_note("while running sample 'mux'")
    .with_help("pass a boolean");

  const std::string out = render(diags);
  EXPECT_NE(out.find("error[E003]: type mismatch: argument #0\n"), std::string::npos);
  EXPECT_NE(out.find("  --> #finite(16)\n"), std::string::npos);
  EXPECT_NE(out.find("      |\n"), std::string::npos);
  EXPECT_NE(out.find("      = supplied type: #finite(16)\n"), std::string::npos);
  EXPECT_NE(out.find("      = expected type: #bool\n"), std::string::npos);
  EXPECT_NE(out.find("      = note: while running sample 'mux'\n"), std::string::npos);
  EXPECT_NE(out.find("      = help: pass a boolean\n"), std::string::npos);
  EXPECT_EQ(out.find('\033'), std::string::npos);
}

TEST(BasicDiagnosticPrinter, PrintsInInsertionOrder)
{
  DiagnosticBag diags;
  diags.report_error("first");
  diags.report_error("second");
  const std::string out = render(diags);
  EXPECT_LT(out.find("error: first"), out.find("error: second"));
}
