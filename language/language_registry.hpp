#ifndef LANGUAGE_LANGUAGE_REGISTRY_HPP
#define LANGUAGE_LANGUAGE_REGISTRY_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "proto/language.pb.h"

namespace language {

// Immutable table of the languages that can be executed. The content is fixed
// when the registry is built; there is no way to add a language afterwards.
// Lookups are safe from any number of threads.
class LanguageRegistry {
 public:
  // The languages compiled into the binary.
  static std::unique_ptr<LanguageRegistry> Default();

  // Parses a text-format proto::LanguageTable. Throws std::invalid_argument if
  // the text cannot be parsed or describes an inconsistent table.
  static std::unique_ptr<LanguageRegistry> FromTextProto(
      const std::string& text);

  // Same as FromTextProto, reading the table from a file.
  static std::unique_ptr<LanguageRegistry> FromFile(const std::string& path);

  // Returns the descriptor of a language given its id or one of its aliases,
  // ignoring case, or nullptr if the language is not known.
  const proto::LanguageDescriptor* Describe(const std::string& id) const;

  // Ids of all the registered languages, in registration order.
  std::vector<std::string> SupportedLanguages() const;

  LanguageRegistry(const LanguageRegistry&) = delete;
  LanguageRegistry& operator=(const LanguageRegistry&) = delete;
  LanguageRegistry(LanguageRegistry&&) = delete;
  LanguageRegistry& operator=(LanguageRegistry&&) = delete;
  ~LanguageRegistry() = default;

 private:
  explicit LanguageRegistry(proto::LanguageTable table);

  proto::LanguageTable table_;
  std::unordered_map<std::string, const proto::LanguageDescriptor*> index_;
};

// Name of the file the source of a program is written to, e.g. "code.py".
std::string SourceFileName(const proto::LanguageDescriptor& descriptor);

}  // namespace language

#endif
