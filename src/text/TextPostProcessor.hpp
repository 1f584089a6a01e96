// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief Switches for the clean-up applied to recognized text.
struct TextConfig
{
    /// Drops hesitation sounds and filler phrases ("um", "uh", "you know", ...).
    bool removeFillers = true;

    /// Repairs frequent recognition slips ("i am" -> "I am", "dont" -> "don't", ...).
    bool fixCommonErrors = true;

    /// Collapses immediately repeated words ("the the" -> "the").
    bool collapseRepeats = true;

    bool capitalize = true;

    /// Appends a period unless the text already ends in '.', '!' or '?'.
    bool terminalPunctuation = true;
};

/// @brief Turns raw recognizer output into text ready for insertion.
///
/// Patterns are compiled once at construction; process() is const and may be called
/// from several threads.
class TextPostProcessor
{
  public:
    explicit TextPostProcessor(TextConfig config = {});
    ~TextPostProcessor();

    TextPostProcessor(TextPostProcessor&&) noexcept;
    TextPostProcessor& operator=(TextPostProcessor&&) noexcept;

    /// @brief Applies the enabled steps. Whitespace is always normalized.
    /// @return The processed text, empty if nothing but fillers and whitespace remained.
    [[nodiscard]] auto process(std::string_view text) const -> std::string;

    [[nodiscard]] auto config() const -> const TextConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
