#include "dcomp/identifier/type_name.hpp"

#include <cstddef>
#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>

namespace dcomp {

namespace {

struct FreeDeleter {
  void operator()(char* ptr) const {
    std::free(ptr);  // NOLINT(cppcoreguidelines-no-malloc)
  }
};

}  // namespace

auto Demangle(const char* mangled) -> std::string {
  int status = 0;
  std::unique_ptr<char, FreeDeleter> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status));
  if (status != 0 || demangled == nullptr) {
    return mangled;
  }
  return demangled.get();
}

auto SimpleName(std::string_view qualified) -> std::string_view {
  // Position just past the last "::" seen at template depth 0.
  std::size_t start = 0;
  int depth = 0;
  for (std::size_t i = 0; i < qualified.size(); ++i) {
    char c = qualified[i];
    if (c == '<' || c == '(') {
      ++depth;
    } else if (c == '>' || c == ')') {
      --depth;
    } else if (
        depth == 0 && c == ':' && i + 1 < qualified.size() &&
        qualified[i + 1] == ':') {
      start = i + 2;
      ++i;
    }
  }
  return qualified.substr(start);
}

auto QualifiedTypeName(std::type_index type) -> std::string {
  return Demangle(type.name());
}

auto TypeName(std::type_index type) -> std::string {
  return std::string(SimpleName(QualifiedTypeName(type)));
}

}  // namespace dcomp
