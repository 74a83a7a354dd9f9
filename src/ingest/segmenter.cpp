#include <spdlog/spdlog.h>
#include <verdict/common/text.hpp>
#include <verdict/common/utf8.hpp>
#include <verdict/ingest/segmenter.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace verdict::ingest {

namespace {

bool is_terminal(const char c) {
  return c == '.' || c == '!' || c == '?';
}

std::string join(const std::vector<std::string>& parts) {
  auto out = std::string{};
  for (auto i = std::size_t{0}; i < parts.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out.append(parts[i]);
  }
  return out;
}

std::string clean(const std::string_view raw) {
  return std::string{
      verdict::common::trim(verdict::common::collapse_whitespace(raw))};
}

}  // namespace

void validate(const segmenter_options& options) {
  if (options.chunk_size <= 0) {
    throw std::invalid_argument{"chunk_size must be positive"};
  }
  if (options.overlap < 0) {
    throw std::invalid_argument{"overlap must not be negative"};
  }
  if (options.overlap >= options.chunk_size) {
    throw std::invalid_argument{"overlap must be smaller than chunk_size"};
  }
}

std::vector<std::string> split_sentences(const std::string_view raw) {
  const auto normalized = verdict::common::normalize_spaces(raw);
  const auto text = std::string_view{normalized};
  auto sentences = std::vector<std::string>{};
  auto push = [&](const std::string_view piece) {
    auto trimmed = verdict::common::trim(piece);
    if (!trimmed.empty()) {
      sentences.emplace_back(trimmed);
    }
  };

  auto start = std::size_t{0};
  auto i = std::size_t{0};
  while (i < text.size()) {
    if (is_terminal(text[i]) && i + 1 < text.size() &&
        verdict::common::is_ascii_whitespace(text[i + 1])) {
      push(text.substr(start, i + 1 - start));
      i += 1;
      while (i < text.size() && verdict::common::is_ascii_whitespace(text[i])) {
        ++i;
      }
      start = i;
      continue;
    }
    ++i;
  }
  if (start < text.size()) {
    push(text.substr(start));
  }
  return sentences;
}

std::vector<std::string> segment(const std::string_view text,
                                 const segmenter_options& options) {
  validate(options);
  if (verdict::common::trim(verdict::common::normalize_spaces(text)).empty()) {
    return {};
  }

  const auto chunk_size = static_cast<std::size_t>(options.chunk_size);
  const auto overlap = static_cast<std::size_t>(options.overlap);

  auto raw_chunks = std::vector<std::string>{};
  auto buffer = std::vector<std::string>{};
  auto current_length = std::size_t{0};

  for (auto& sentence : split_sentences(text)) {
    const auto sentence_length = verdict::common::utf8::length(sentence);
    if (current_length + sentence_length + 1 <= chunk_size) {
      buffer.push_back(std::move(sentence));
      current_length += sentence_length + 1;
      continue;
    }

    if (buffer.empty()) {
      raw_chunks.emplace_back(
          verdict::common::utf8::prefix(sentence, chunk_size));
      current_length = 0;
      continue;
    }

    auto flushed = join(buffer);
    raw_chunks.emplace_back(verdict::common::trim(flushed));
    buffer.clear();
    if (overlap > 0) {
      auto carry =
          std::string{verdict::common::utf8::suffix(flushed, overlap)};
      current_length =
          verdict::common::utf8::length(carry) + 1 + sentence_length;
      buffer.push_back(std::move(carry));
    } else {
      current_length = sentence_length;
    }
    buffer.push_back(std::move(sentence));
  }

  if (!buffer.empty()) {
    raw_chunks.emplace_back(verdict::common::trim(join(buffer)));
  }

  auto chunks = std::vector<std::string>{};
  auto seen = std::unordered_set<std::string>{};
  for (const auto& raw : raw_chunks) {
    auto cleaned = clean(raw);
    if (cleaned.empty() || seen.contains(cleaned)) {
      continue;
    }
    seen.insert(cleaned);
    chunks.push_back(std::move(cleaned));
  }
  spdlog::debug("Segmented {} byte(s) into {} chunk(s)", text.size(),
                chunks.size());
  return chunks;
}

std::vector<verdict::schema::chunk_t> make_chunks(
    const std::string_view source,
    const std::string_view text,
    const segmenter_options& options) {
  auto texts = segment(text, options);
  auto chunks = std::vector<verdict::schema::chunk_t>{};
  chunks.reserve(texts.size());
  for (auto i = std::size_t{0}; i < texts.size(); ++i) {
    const auto index = static_cast<uint32_t>(i);
    chunks.push_back(verdict::schema::chunk_t{
        .id = verdict::schema::make_chunk_id(source, index),
        .source = std::string{source},
        .index = index,
        .text = std::move(texts[i])});
  }
  return chunks;
}

}  // namespace verdict::ingest
