#pragma once

#include <verdict/schema/prompt_style.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace verdict::grounding {

inline constexpr auto kNotFoundAnswer =
    std::string_view{"Não encontrei no contexto."};

inline constexpr auto kGroundingDirective = std::string_view{
    "Você responde em português, de forma concisa e objetiva.\n"
    "Use SOMENTE o CONTEXTO fornecido. Se a resposta não estiver no "
    "contexto, diga: 'Não encontrei no contexto'. NÃO repita a pergunta. "
    "Responda em 1–2 frases."};

inline constexpr auto kContextSeparator = std::string_view{"\n\n---\n\n"};
inline constexpr auto kMaxContextChunks = std::size_t{5};

/// Name fragments of encoder-decoder model families.
inline constexpr auto kCompactModelFamilies =
    std::array{std::string_view{"t5"}, std::string_view{"bart"},
               std::string_view{"mbart"}, std::string_view{"pegasus"}};

/// Resolve the prompt style for a configured model name (case-insensitive).
verdict::schema::prompt_style_t classify_model(std::string_view model_name);

/// Trimmed, non-empty chunks, at most kMaxContextChunks of them.
std::vector<std::string> select_context(const std::vector<std::string>& chunks);

/// select_context() joined with kContextSeparator.
std::string build_context(const std::vector<std::string>& chunks);

std::string build_prompt(verdict::schema::prompt_style_t style,
                         std::string_view context,
                         std::string_view question);

}  // namespace verdict::grounding
