#pragma once

#include <CommonDefinitions.hpp>

#include <cstdint>
#include <string_view>

// Resolves "LSN", "LSP", "IEN", "IEP", "SCP" or "AAF" (exact, case-sensitive).
// Throws UnknownHomingMethodError for anything else.
[[nodiscard]] dryve::EHomingMethod resolveHomingMethod(std::string_view name);

// Value written to object 0x6098/1.
[[nodiscard]] constexpr std::uint8_t homingMethodCode(
    const dryve::EHomingMethod method) {
  return static_cast<std::uint8_t>(method);
}
