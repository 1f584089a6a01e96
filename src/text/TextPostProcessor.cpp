// SPDX-License-Identifier: Apache-2.0
#include "TextPostProcessor.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace talktype
{

namespace
{

    constexpr auto Flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

    // A filler takes a directly following comma with it.
    constexpr auto FillerPattern =
        R"(\b(?:u+m+|u+h+|e+r+|a+h+|h+m+|you know|actually|basically)\b,?)";

    struct Fix
    {
        char const* pattern;
        char const* replacement;
    };

    constexpr auto CommonFixes = std::array {
        Fix { R"(\bi see\b)", "I see" },     Fix { R"(\bi am\b)", "I am" },
        Fix { R"(\bi'm\b)", "I'm" },         Fix { R"(\bi'll\b)", "I'll" },
        Fix { R"(\bi've\b)", "I've" },       Fix { R"(\bi'd\b)", "I'd" },
        Fix { R"(\bwont\b)", "won't" },      Fix { R"(\bcant\b)", "can't" },
        Fix { R"(\bdont\b)", "don't" },
    };

    auto trim(std::string text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return text.substr(start, end - start + 1);
    }

    struct CompiledFix
    {
        std::regex pattern;
        std::string replacement;
    };

} // namespace

struct TextPostProcessor::Impl
{
    TextConfig config;

    std::regex filler { FillerPattern, Flags };
    std::vector<CompiledFix> fixes;
    std::regex repeatedWord { R"(\b(\w+)(?:\s+\1\b)+)", Flags };
    std::regex whitespace { R"(\s+)" };
    std::regex spaceBeforePunctuation { R"(\s+([,.!?;:]))" };
    std::regex leadingPunctuation { R"(^[\s,;:]+)" };
    std::regex trailingComma { R"([\s,;:]+$)" };

    explicit Impl(TextConfig config): config(config)
    {
        fixes.reserve(CommonFixes.size());
        for (auto const& fix: CommonFixes)
            fixes.push_back(CompiledFix { std::regex(fix.pattern, Flags), fix.replacement });
    }
};

TextPostProcessor::TextPostProcessor(TextConfig config): _impl(std::make_unique<Impl>(config))
{
}

TextPostProcessor::~TextPostProcessor() = default;
TextPostProcessor::TextPostProcessor(TextPostProcessor&&) noexcept = default;
TextPostProcessor& TextPostProcessor::operator=(TextPostProcessor&&) noexcept = default;

auto TextPostProcessor::process(std::string_view input) const -> std::string
{
    auto const& config = _impl->config;
    auto text = trim(std::string(input));
    if (text.empty())
        return text;

    if (config.removeFillers)
        text = std::regex_replace(text, _impl->filler, "");

    if (config.fixCommonErrors)
        for (auto const& fix: _impl->fixes)
            text = std::regex_replace(text, fix.pattern, fix.replacement);

    if (config.collapseRepeats)
        text = std::regex_replace(text, _impl->repeatedWord, "$1");

    text = std::regex_replace(text, _impl->whitespace, " ");
    text = std::regex_replace(text, _impl->spaceBeforePunctuation, "$1");
    text = std::regex_replace(text, _impl->leadingPunctuation, "");
    text = std::regex_replace(text, _impl->trailingComma, "");
    text = trim(std::move(text));

    if (text.empty())
        return text;

    if (config.capitalize)
        text.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));

    if (config.terminalPunctuation && text.back() != '.' && text.back() != '!' && text.back() != '?')
        text += '.';

    return text;
}

auto TextPostProcessor::config() const -> const TextConfig&
{
    return _impl->config;
}

} // namespace talktype
