#pragma once

#include <string>

namespace matching
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Replaces look-alike characters with their canonical counterparts
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;

    // Unicode lowercase
    [[nodiscard]] virtual std::string foldCase(const std::string& text) const = 0;

    // normalize() followed by foldCase() unless case_sensitive is set
    [[nodiscard]] virtual std::string prepare(const std::string& text, bool case_sensitive) const = 0;
};

} // namespace matching
