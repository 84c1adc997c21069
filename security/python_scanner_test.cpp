#include "security/python_scanner.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

std::vector<std::string> ImportNames(const security::PythonScan& scan) {
  std::vector<std::string> names;
  for (const auto& import : scan.imports) names.push_back(import.module);
  return names;
}

std::vector<std::string> CallNames(const security::PythonScan& scan) {
  std::vector<std::string> names;
  for (const auto& call : scan.calls) names.push_back(call.name);
  return names;
}

// NOLINTNEXTLINE
TEST(PythonScanner, Imports) {
  security::PythonScan scan;
  std::string error;
  ASSERT_TRUE(security::ScanPython(
      "import os.path, json as j\n"
      "from urllib.request import urlopen\n"
      "from . import sibling\n"
      "if True: import socket; import re\n",
      &scan, &error))
      << error;
  EXPECT_THAT(ImportNames(scan),
              ElementsAre("os.path", "json", "urllib.request", "socket", "re"));
  EXPECT_EQ(scan.imports[2].line, 2);
  EXPECT_EQ(scan.imports[3].line, 4);
}

// NOLINTNEXTLINE
TEST(PythonScanner, StringsAndCommentsAreSkipped) {
  security::PythonScan scan;
  std::string error;
  ASSERT_TRUE(security::ScanPython(
      "# eval(x)\n"
      "s = 'eval(x)'\n"
      "t = \"\"\"\n"
      "import os\n"
      "exec(y)\n"
      "\"\"\"\n"
      "u = rb'\\x00' + f\"{a}\"\n"
      "print(len(s))\n",
      &scan, &error))
      << error;
  EXPECT_THAT(scan.imports, IsEmpty());
  EXPECT_THAT(CallNames(scan), ElementsAre("print", "len"));
  EXPECT_EQ(scan.calls[0].line, 8);
}

// NOLINTNEXTLINE
TEST(PythonScanner, DottedCalls) {
  security::PythonScan scan;
  std::string error;
  ASSERT_TRUE(security::ScanPython(
      "data = pickle.loads(blob)\n"
      "obj.method().other(1)\n"
      "x = (\n"
      "    importlib.import_module('json')\n"
      ")\n",
      &scan, &error))
      << error;
  EXPECT_THAT(CallNames(scan),
              ElementsAre("pickle.loads", "obj.method", "importlib.import_module"));
  EXPECT_EQ(scan.calls[2].line, 4);
}

// NOLINTNEXTLINE
TEST(PythonScanner, RecursionWithoutBranch) {
  security::PythonScan scan;
  std::string error;
  ASSERT_TRUE(security::ScanPython(
      "def loop(n):\n"
      "    return loop(n + 1)\n"
      "\n"
      "def fact(n):\n"
      "    if n <= 1:\n"
      "        return 1\n"
      "    return n * fact(n - 1)\n"
      "\n"
      "def fib(n): return n if n < 2 else fib(n - 1) + fib(n - 2)\n"
      "\n"
      "class A:\n"
      "    def walk(self):\n"
      "        return walk()\n"
      "print(fact(5))\n",
      &scan, &error))
      << error;
  ASSERT_EQ(scan.functions.size(), 4u);
  EXPECT_EQ(scan.functions[0].name, "loop");
  EXPECT_TRUE(scan.functions[0].calls_itself);
  EXPECT_FALSE(scan.functions[0].has_branch);
  EXPECT_EQ(scan.functions[1].name, "fact");
  EXPECT_TRUE(scan.functions[1].calls_itself);
  EXPECT_TRUE(scan.functions[1].has_branch);
  EXPECT_EQ(scan.functions[2].name, "fib");
  EXPECT_TRUE(scan.functions[2].calls_itself);
  EXPECT_TRUE(scan.functions[2].has_branch);
  EXPECT_EQ(scan.functions[3].name, "walk");
  EXPECT_TRUE(scan.functions[3].calls_itself);
  EXPECT_FALSE(scan.functions[3].has_branch);
}

// NOLINTNEXTLINE
TEST(PythonScanner, CallAfterFunctionIsNotInBody) {
  security::PythonScan scan;
  std::string error;
  ASSERT_TRUE(security::ScanPython(
      "def f():\n"
      "    pass\n"
      "f()\n",
      &scan, &error))
      << error;
  ASSERT_EQ(scan.functions.size(), 1u);
  EXPECT_FALSE(scan.functions[0].calls_itself);
}

// NOLINTNEXTLINE
TEST(PythonScanner, Errors) {
  security::PythonScan scan;
  std::string error;
  EXPECT_FALSE(security::ScanPython("x = 'abc\n", &scan, &error));
  EXPECT_THAT(error, HasSubstr("unterminated string"));
  EXPECT_FALSE(security::ScanPython("print((1)\n", &scan, &error));
  EXPECT_THAT(error, HasSubstr("unclosed"));
  EXPECT_FALSE(security::ScanPython("x = 1)\n", &scan, &error));
  EXPECT_THAT(error, HasSubstr("unmatched"));
  EXPECT_FALSE(security::ScanPython(
      "if x:\n"
      "        a = 1\n"
      "    b = 2\n",
      &scan, &error));
  EXPECT_THAT(error, HasSubstr("inconsistent dedent at line 3"));
}

}  // namespace
