// polyschema/model/model.cpp - Typed layer support
#include <cxxabi.h>

#include <cstdlib>
#include <memory>

#include "polyschema/model/hierarchy.hpp"

namespace polyschema
{

std::string type_name(const std::type_info & type)
{
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
    abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return type.name();
}

}  // namespace polyschema
