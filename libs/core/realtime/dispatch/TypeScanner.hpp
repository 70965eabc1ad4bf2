#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace rtmlink {

// Forward-only scan of a JSON object for one top-level string member, without building a DOM.
// Driven by nlohmann's SAX parser: members before the key are skipped structurally (nested objects
// and arrays included), so a nested "type" is never mistaken for the top-level one. Parsing stops
// at the key's value; anything after it is not read.
//
// Returns std::nullopt when the text is not an object, the key is absent, its value is not a
// string, or the input is malformed before the key is reached.
class TypeScanner {
public:
    [[nodiscard]] static std::optional<std::string> findString(std::string_view json, std::string_view key);

    [[nodiscard]] static std::optional<std::string> messageType(std::string_view json) {
        return findString(json, "type");
    }

    TypeScanner() = delete;
};

} // namespace rtmlink
