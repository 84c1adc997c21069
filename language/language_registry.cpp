#include "language/language_registry.hpp"

#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "language/builtin_languages.hpp"
#include "util/file.hpp"

namespace language {

namespace {
void Validate(const proto::LanguageDescriptor& language) {
  auto fail = [&language](const std::string& what) {
    throw std::invalid_argument("Language \"" + language.id() + "\": " + what);
  };
  if (language.id().empty()) fail("missing id");
  if (absl::AsciiStrToLower(language.id()) != language.id())
    fail("ids must be lowercase");
  if (language.isolation_image().empty()) fail("missing isolation_image");
  if (language.run_command().empty()) fail("missing run_command");
  if (language.local_run_args_size() == 0) fail("missing local_run_args");
  if (!absl::StartsWith(language.file_extension(), "."))
    fail("file_extension must start with a dot");
  if (language.requires_compile() && (language.compile_command().empty() ||
                                      language.local_compile_args_size() == 0))
    fail("compiled languages need compile_command and local_compile_args");
  if (!language.requires_compile() &&
      (!language.compile_command().empty() ||
       language.local_compile_args_size() != 0))
    fail("compile settings given, but requires_compile is not set");
}
}  // namespace

LanguageRegistry::LanguageRegistry(proto::LanguageTable table)
    : table_(std::move(table)) {
  for (const proto::LanguageDescriptor& language : table_.language()) {
    Validate(language);
    std::vector<std::string> keys = {language.id()};
    for (const std::string& alias : language.aliases())
      keys.push_back(absl::AsciiStrToLower(alias));
    for (const std::string& key : keys) {
      if (!index_.emplace(key, &language).second) {
        throw std::invalid_argument("Language id or alias \"" + key +
                                    "\" is defined twice");
      }
    }
  }
  if (index_.empty()) throw std::invalid_argument("No language defined");
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::Default() {
  return FromTextProto(kBuiltinLanguages);
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::FromTextProto(
    const std::string& text) {
  proto::LanguageTable table;
  if (!google::protobuf::TextFormat::ParseFromString(text, &table)) {
    throw std::invalid_argument("Invalid language table");
  }
  return absl::WrapUnique(new LanguageRegistry(std::move(table)));
}

std::unique_ptr<LanguageRegistry> LanguageRegistry::FromFile(
    const std::string& path) {
  LOG(INFO) << "Loading languages from " << path;
  return FromTextProto(util::File::Read(path));
}

const proto::LanguageDescriptor* LanguageRegistry::Describe(
    const std::string& id) const {
  auto it = index_.find(absl::AsciiStrToLower(id));
  if (it == index_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> LanguageRegistry::SupportedLanguages() const {
  std::vector<std::string> ids;
  for (const proto::LanguageDescriptor& language : table_.language())
    ids.push_back(language.id());
  return ids;
}

std::string SourceFileName(const proto::LanguageDescriptor& descriptor) {
  std::string name =
      descriptor.source_name().empty() ? "code" : descriptor.source_name();
  return name + descriptor.file_extension();
}

}  // namespace language
