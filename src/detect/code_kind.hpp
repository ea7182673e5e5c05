#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/execution_types.hpp"

namespace hoya::detect {

// Extension of the url path first (.js/.mjs, .wasm), then the wasm magic.
hoya::sandbox::CodeKind DetectCodeKind(const std::string& url, const std::vector<std::uint8_t>& bytes);

bool HasWasmMagic(const std::vector<std::uint8_t>& bytes);

}  // namespace hoya::detect
