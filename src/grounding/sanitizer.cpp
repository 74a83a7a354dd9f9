#include <verdict/common/text.hpp>
#include <verdict/common/utf8.hpp>
#include <verdict/grounding/sanitizer.hpp>
#include <verdict/ingest/segmenter.hpp>

#include <algorithm>
#include <iterator>
#include <regex>
#include <sstream>

namespace verdict::grounding {

namespace {

constexpr auto kRegexFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

const std::regex& label_line_pattern() {
  static const auto pattern = std::regex{
      R"(^(contexto|pergunta|resposta|###\s*resposta|###\s*contexto)\s*:?)",
      kRegexFlags};
  return pattern;
}

const std::regex& directive_line_pattern() {
  static const auto pattern = std::regex{
      R"(responda\s+em\s+1.?–.?2\s+frases|você responde em português)",
      kRegexFlags};
  return pattern;
}

const std::regex& inline_label_pattern() {
  static const auto pattern =
      std::regex{R"((contexto|pergunta|resposta)\s*:\s*)", kRegexFlags};
  return pattern;
}

const std::regex& whitespace_run_pattern() {
  static const auto pattern = std::regex{R"(\s{2,})", kRegexFlags};
  return pattern;
}

// Tokenizers of small seq2seq models sometimes stutter the leading letter.
const std::regex& stuttered_rag_pattern() {
  static const auto pattern = std::regex{R"(\bR{2,}AG\b)", kRegexFlags};
  return pattern;
}

}  // namespace

std::string strip_prompt_prefix(std::string text, const sanitize_context& ctx) {
  if (!ctx.prompt.empty() && std::string_view{text}.starts_with(ctx.prompt)) {
    text.erase(0, ctx.prompt.size());
  }
  return text;
}

std::string truncate_at_delimiters(std::string text,
                                   const sanitize_context& ctx) {
  static_cast<void>(ctx);
  for (const auto delimiter : kSectionDelimiters) {
    auto at = text.find(delimiter);
    if (at != std::string::npos) {
      text.resize(at);
    }
  }
  return text;
}

std::string strip_label_lines(std::string text, const sanitize_context& ctx) {
  static_cast<void>(ctx);
  if (text.empty()) {
    return text;
  }
  auto kept = std::string{};
  auto stream = std::istringstream{text};
  auto line = std::string{};
  auto first = true;
  while (std::getline(stream, line)) {
    // std::regex folds ASCII only; match against the folded line.
    auto folded = verdict::common::to_lower(verdict::common::trim(line));
    if (std::regex_search(folded, label_line_pattern()) ||
        std::regex_search(folded, directive_line_pattern())) {
      continue;
    }
    if (!first) {
      kept.push_back('\n');
    }
    kept.append(line);
    first = false;
  }
  auto out = std::string{verdict::common::trim(kept)};
  out = std::regex_replace(out, inline_label_pattern(), "");
  return std::string{verdict::common::trim(out)};
}

std::string strip_leading_echo(std::string text, const sanitize_context& ctx) {
  const auto question = verdict::common::trim(ctx.question);
  for (auto pass = std::size_t{0}; pass < kEchoPasses; ++pass) {
    auto rest = verdict::common::trim_left(text);
    for (const auto label : kLeadingAnswerLabels) {
      if (verdict::common::starts_with_icase(rest, label)) {
        rest = verdict::common::trim_left(rest.substr(label.size()));
      }
    }
    if (!question.empty() &&
        verdict::common::starts_with_icase(rest, question)) {
      rest = verdict::common::trim_left(rest.substr(question.size()), ": .-");
      rest = verdict::common::trim_left(rest);
    }
    text = std::string{rest};
  }
  return text;
}

std::string normalize_answer(std::string text, const sanitize_context& ctx) {
  static_cast<void>(ctx);
  auto out = std::string{verdict::common::trim(text, " \"'")};
  out = std::regex_replace(out, whitespace_run_pattern(), " ");
  out = std::regex_replace(out, stuttered_rag_pattern(), "RAG");
  return std::string{verdict::common::trim(out)};
}

std::string sanitize(const std::string_view decoded,
                     const sanitize_context& ctx) {
  auto text = std::string{decoded};
  for (const auto pass : kSanitizePasses) {
    text = pass(std::move(text), ctx);
  }
  return text;
}

bool looks_like_echo(const std::string_view answer) {
  if (answer.empty()) {
    return true;
  }
  return std::any_of(std::begin(kLeakedInstructionFragments),
                     std::end(kLeakedInstructionFragments),
                     [&](const std::string_view fragment) {
                       return verdict::common::contains_icase(answer, fragment);
                     });
}

bool is_unusable(const std::string_view answer) {
  return looks_like_echo(answer) ||
         verdict::common::utf8::length(answer) < kMinimumAnswerLength;
}

std::string first_sentence(const std::string_view text) {
  auto trimmed = verdict::common::trim(text);
  if (trimmed.empty()) {
    return {};
  }
  for (auto& sentence : verdict::ingest::split_sentences(trimmed)) {
    if (verdict::common::utf8::length(sentence) >= kMinimumFallbackSentence) {
      return std::move(sentence);
    }
  }
  return std::string{verdict::common::trim(
      verdict::common::utf8::prefix(trimmed, kFallbackPrefixLength))};
}

}  // namespace verdict::grounding
