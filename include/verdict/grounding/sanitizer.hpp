#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace verdict::grounding {

/// What a sanitize pass may need to know about the request.
struct sanitize_context final {
  std::string_view prompt;
  std::string_view question;
};

/// Cut points for text the model keeps generating after its answer.
/// Applied in this order, each at its first occurrence.
inline constexpr auto kSectionDelimiters =
    std::array{std::string_view{"\n###"},      std::string_view{"\n\n###"},
               std::string_view{"\n\n"},       std::string_view{"\nRESPOSTA:"},
               std::string_view{"\nResposta:"}, std::string_view{"\n#"}};

/// Answer labels the model tends to emit before the answer itself.
inline constexpr auto kLeadingAnswerLabels =
    std::array{std::string_view{"resposta:"}, std::string_view{"### resposta"},
               std::string_view{"###resposta"}, std::string_view{"answer:"},
               std::string_view{"### answer"}};

/// Fragments that only appear when the model leaks its instructions.
inline constexpr auto kLeakedInstructionFragments = std::array{
    std::string_view{"você responde em português"},
    std::string_view{"use somente o contexto"},
    std::string_view{"responda em 1–2 frases"},
    std::string_view{"### contexto"},
    std::string_view{"### resposta"},
    std::string_view{"resposta:"},
    std::string_view{"answer:"},
    std::string_view{"contexto:"},
    std::string_view{"pergunta:"}};

inline constexpr auto kEchoPasses = std::size_t{3};
inline constexpr auto kMinimumAnswerLength = std::size_t{5};
inline constexpr auto kMinimumFallbackSentence = std::size_t{15};
inline constexpr auto kFallbackPrefixLength = std::size_t{240};

std::string strip_prompt_prefix(std::string text, const sanitize_context& ctx);
std::string truncate_at_delimiters(std::string text,
                                   const sanitize_context& ctx);
std::string strip_label_lines(std::string text, const sanitize_context& ctx);
std::string strip_leading_echo(std::string text, const sanitize_context& ctx);
std::string normalize_answer(std::string text, const sanitize_context& ctx);

using sanitize_pass_t = std::string (*)(std::string, const sanitize_context&);

/// Cleanup pipeline, run front to back.
inline constexpr auto kSanitizePasses =
    std::array<sanitize_pass_t, 5>{&strip_prompt_prefix, &truncate_at_delimiters,
                                   &strip_label_lines, &strip_leading_echo,
                                   &normalize_answer};

/// Run every pass of kSanitizePasses over the decoded model output.
std::string sanitize(std::string_view decoded, const sanitize_context& ctx);

/// True when the cleaned answer is empty or carries leaked instructions.
bool looks_like_echo(std::string_view answer);

/// True when the cleaned answer cannot be returned to the caller.
bool is_unusable(std::string_view answer);

/// First sentence of at least kMinimumFallbackSentence code points, else the
/// first kFallbackPrefixLength code points. Empty for empty input.
std::string first_sentence(std::string_view text);

}  // namespace verdict::grounding
