#include "detect/code_kind.hpp"

#include "utils/common.hpp"
#include "utils/url.hpp"

namespace hoya::detect {
namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool HasWasmMagic(const std::vector<std::uint8_t>& bytes) {
    return bytes.size() >= 4 && bytes[0] == 0x00 && bytes[1] == 0x61 && bytes[2] == 0x73 && bytes[3] == 0x6d;
}

hoya::sandbox::CodeKind DetectCodeKind(const std::string& url, const std::vector<std::uint8_t>& bytes) {
    using hoya::sandbox::CodeKind;
    const auto name = hoya::utils::ToLower(hoya::utils::UrlFileName(url));
    if (EndsWith(name, ".js") || EndsWith(name, ".mjs")) {
        return CodeKind::kScript;
    }
    if (EndsWith(name, ".wasm")) {
        return CodeKind::kModule;
    }
    if (HasWasmMagic(bytes)) {
        return CodeKind::kModule;
    }
    return CodeKind::kUnknown;
}

}  // namespace hoya::detect
