#include "repair/command_code_producer.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "nlohmann/json.hpp"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/codemend_testdir";

using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(ExtractCodeBlockTest, FencedBlock) {
  EXPECT_EQ(repair::ExtractCodeBlock(
                "Here is the fix:\n```python\nprint(1)\n```\nand more\n"
                "```\nprint(2)\n```"),
            "print(1)");
  EXPECT_EQ(repair::ExtractCodeBlock("```\n  x = 1\ny = 2\n```"),
            "x = 1\ny = 2");
  EXPECT_EQ(repair::ExtractCodeBlock("```cpp\nint main() {}\n```"),
            "int main() {}");
}

// NOLINTNEXTLINE
TEST(ExtractCodeBlockTest, NoBlock) {
  EXPECT_EQ(repair::ExtractCodeBlock("\n  print(1)\n"), "print(1)");
  EXPECT_EQ(repair::ExtractCodeBlock("```python\nprint(1)"), "print(1)");
  EXPECT_EQ(repair::ExtractCodeBlock(""), "");
}

// NOLINTNEXTLINE
TEST(ExtractCodeBlockTest, LargeBlock) {
  std::string code;
  while (code.size() < 200 * 1024) code += "print('line')\n";
  code.pop_back();
  EXPECT_EQ(repair::ExtractCodeBlock("```python\n" + code + "\n```\n"), code);
  EXPECT_EQ(repair::ExtractCodeBlock("```python\n" + code), code);
}

// NOLINTNEXTLINE
TEST(ExtractCodeBlockTest, EmptyBlock) {
  EXPECT_EQ(repair::ExtractCodeBlock("```\n```"), "");
  EXPECT_EQ(repair::ExtractCodeBlock("```js\r\nlet a;\r\n```"), "let a;");
}

class CommandCodeProducerTest : public ::testing::Test {
 protected:
  CommandCodeProducerTest() : tmp_(test_tmpdir) {}

  // A producer that saves its request and answers with a fenced block.
  std::string WriteScript(const std::string& body) {
    std::string path = util::File::JoinPath(tmp_.Path(), "producer");
    util::File::Write(path, "#!/bin/sh\n" + body);
    util::File::MakeExecutable(path);
    return path;
  }

  util::TempDir tmp_;
};

// NOLINTNEXTLINE
TEST_F(CommandCodeProducerTest, Repair) {
  std::string request = util::File::JoinPath(tmp_.Path(), "request");
  std::string script = WriteScript("cat > " + request +
                                   "\necho 'Fixed:'\necho '```python'\n"
                                   "echo 'print(1)'\necho '```'\n");
  repair::CommandCodeProducer producer({script}, test_tmpdir, 10);
  EXPECT_EQ(producer.Repair("print(x)", "NameError", "python"), "print(1)");

  nlohmann::json sent = nlohmann::json::parse(util::File::Read(request));
  EXPECT_EQ(sent["action"], "repair");
  EXPECT_EQ(sent["source"], "print(x)");
  EXPECT_EQ(sent["error"], "NameError");
  EXPECT_EQ(sent["language"], "python");
}

// NOLINTNEXTLINE
TEST_F(CommandCodeProducerTest, RepairWithBinaryError) {
  std::string request = util::File::JoinPath(tmp_.Path(), "request");
  std::string script =
      WriteScript("cat > " + request + "\necho 'print(1)'\n");
  repair::CommandCodeProducer producer({script}, test_tmpdir, 10);
  EXPECT_EQ(producer.Repair("print(x)", "bad byte \xff here", "python"),
            "print(1)");
  nlohmann::json sent = nlohmann::json::parse(util::File::Read(request));
  EXPECT_EQ(sent["error"], "bad byte \xef\xbf\xbd here");
}

// NOLINTNEXTLINE
TEST_F(CommandCodeProducerTest, Generate) {
  std::string request = util::File::JoinPath(tmp_.Path(), "request");
  std::string script =
      WriteScript("cat > " + request + "\necho \"$1\"\n");
  repair::CommandCodeProducer producer({script, "print(2)"}, test_tmpdir, 10);
  EXPECT_EQ(producer.Generate("print two"), "print(2)");
  nlohmann::json sent = nlohmann::json::parse(util::File::Read(request));
  EXPECT_EQ(sent["action"], "generate");
  EXPECT_EQ(sent["prompt"], "print two");
}

// NOLINTNEXTLINE
TEST_F(CommandCodeProducerTest, Failures) {
  repair::CommandCodeProducer failing(
      {WriteScript("echo quota exceeded >&2\nexit 3\n")}, test_tmpdir, 10);
  try {
    failing.Repair("x", "y", "python");
    FAIL() << "expected a producer_error";
  } catch (const repair::producer_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("exited with code 3"));
    EXPECT_THAT(e.what(), HasSubstr("quota exceeded"));
  }

  repair::CommandCodeProducer silent({WriteScript("exit 0\n")}, test_tmpdir,
                                     10);
  EXPECT_THROW(silent.Repair("x", "y", "python"), repair::producer_error);

  repair::CommandCodeProducer slow({WriteScript("sleep 10\n")}, test_tmpdir,
                                   1);
  EXPECT_THROW(slow.Generate("x"), repair::producer_error);

  repair::CommandCodeProducer missing({"codemend-no-such-producer"},
                                      test_tmpdir, 10);
  EXPECT_THROW(missing.Generate("x"), repair::producer_error);

  repair::CommandCodeProducer empty({}, test_tmpdir, 10);
  EXPECT_THROW(empty.Generate("x"), repair::producer_error);
}

}  // namespace
