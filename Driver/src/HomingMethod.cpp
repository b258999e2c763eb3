#include <HomingMethod.hpp>

#include <DriveErrors.hpp>
#include <magic_enum/magic_enum.hpp>

#include <format>

dryve::EHomingMethod resolveHomingMethod(const std::string_view name) {
  const auto method = magic_enum::enum_cast<dryve::EHomingMethod>(name);
  if (!method.has_value()) {
    throw UnknownHomingMethodError(std::format(
        "Unknown homing method '{}' (known: LSN, LSP, IEN, IEP, SCP, AAF)",
        name));
  }
  return *method;
}
