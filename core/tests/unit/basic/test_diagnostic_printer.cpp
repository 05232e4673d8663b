// tests/unit/basic/test_diagnostic_printer.cpp - Plain-text diagnostic output
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "polyschema/basic/diagnostic_printer.hpp"

using namespace polyschema;

TEST(BasicDiagnosticPrinter, PrintsHeaderLocationLabelAndHelp)
{
  Diagnostic d;
  d.code = "S002";
  d.message = "field 'number' has the wrong type";
  d.labels.push_back(Label{"/number", "expected number, got string"});
  d.help_message = "variant 'NumberConfig' was selected";

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(d, "payload.json");

  const std::string text = out.str();
  EXPECT_NE(text.find("error[S002]: field 'number' has the wrong type\n"), std::string::npos);
  EXPECT_NE(text.find("    --> payload.json#/number\n"), std::string::npos);
  EXPECT_NE(text.find("      ^ /number: expected number, got string\n"), std::string::npos);
  EXPECT_NE(text.find("      = help: variant 'NumberConfig' was selected\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, RootLabelShownAsRoot)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = "payload must be an object";
  d.labels.push_back(Label{"", "expected object"});

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(d, "<payload>");

  const std::string text = out.str();
  EXPECT_NE(text.find("warning: payload must be an object\n"), std::string::npos);
  EXPECT_NE(text.find("    --> <payload>\n"), std::string::npos);
  EXPECT_NE(text.find("      ^ <root>: expected object\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, PrintAllOrdersByPath)
{
  DiagnosticBag bag;
  bag.report_error("/zeta", "late", "z");
  bag.report_error("/alpha", "early", "a");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, "p.json");

  const std::string text = out.str();
  const auto early = text.find("error: early");
  const auto late = text.find("error: late");
  ASSERT_NE(early, std::string::npos);
  ASSERT_NE(late, std::string::npos);
  EXPECT_LT(early, late);
}
