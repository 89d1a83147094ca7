#include "sanitizer.hpp"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace {

std::u32string to_code_points(const icu::UnicodeString& text) {
  std::u32string out;
  out.reserve(static_cast<std::size_t>(text.length()));
  for(int32_t i = 0; i < text.length();) {
    UChar32 ch = text.char32At(i);
    out.push_back(static_cast<char32_t>(ch));
    i += U16_LENGTH(ch);
  }
  return out;
}

std::u32string lower_copy(std::u32string text) {
  for(auto& ch : text) {
    ch = static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch)));
  }
  return text;
}

} // namespace

std::vector<std::string> SanitizationPolicy::default_reserved_names() {
  std::vector<std::string> names = {"CON", "PRN", "AUX", "NUL"};
  for(int i = 1; i <= 9; ++i) {
    names.push_back("COM" + std::to_string(i));
    names.push_back("LPT" + std::to_string(i));
  }
  return names;
}

Sanitizer::Sanitizer(SanitizationPolicy policy)
  : policy_(std::move(policy)),
    fallback_(U"unnamed") {
  if(policy_.normalize_unicode) {
    UErrorCode status = U_ZERO_ERROR;
    nfkc_ = icu::Normalizer2::getNFKCInstance(status);
    if(U_FAILURE(status)) {
      throw std::runtime_error(std::string("Unable to load NFKC normalization data: ") + u_errorName(status));
    }
  }

  for(char32_t ch : to_code_points(icu::UnicodeString::fromUTF8(policy_.illegal_chars))) {
    illegal_.insert(ch);
  }
  for(const auto& name : policy_.reserved_names) {
    if(name.empty()) continue;
    reserved_.insert(lower_copy(to_code_points(icu::UnicodeString::fromUTF8(name))));
  }

  if(policy_.replacement.empty()) {
    throw std::invalid_argument("replacement token must not be empty");
  }
  token_ = decode(policy_.replacement);
  if(token_ != to_code_points(icu::UnicodeString::fromUTF8(policy_.replacement))) {
    throw std::invalid_argument("replacement token '" + policy_.replacement + "' is not NFKC-normalized");
  }
  for(char32_t ch : token_) {
    if(ch == U'.' || is_unsafe(ch)) {
      throw std::invalid_argument("replacement token '" + policy_.replacement +
                                  "' contains a character it would have to replace");
    }
  }
  if(policy_.max_length < kMinMaxLength) {
    throw std::invalid_argument("max_length must be at least " + std::to_string(kMinMaxLength));
  }
}

std::string Sanitizer::sanitize(const std::string& name) const {
  return encode(run(decode(name), policy_.max_length));
}

std::string Sanitizer::sanitize_hidden(const std::string& name) const {
  const std::string body = (!name.empty() && name.front() == '.') ? name.substr(1) : name;
  return "." + encode(run(decode(body), policy_.max_length - 1));
}

// A replacement token can end up in front of a combining mark that NFKC then
// composes with it, so the steps repeat until the result is normalized.
Sanitizer::Text Sanitizer::run(Text text, std::size_t max_length) const {
  for(std::size_t pass = 0; pass < kMaxNormalizationPasses; ++pass) {
    text = replace_unsafe(text);
    if(policy_.collapse_replacement) {
      collapse(text);
    }
    text = finish(std::move(text));
    if(utf8_size(text) > max_length) {
      text = enforce_length(text, max_length);
    }
    if(!renormalize(text)) break;
  }
  return text;
}

bool Sanitizer::renormalize(Text& text) const {
  if(!nfkc_) return false;
  icu::UnicodeString unicode;
  for(char32_t ch : text) {
    unicode.append(static_cast<UChar32>(ch));
  }
  UErrorCode status = U_ZERO_ERROR;
  if(nfkc_->isNormalized(unicode, status) || U_FAILURE(status)) return false;
  status = U_ZERO_ERROR;
  icu::UnicodeString normalized = nfkc_->normalize(unicode, status);
  if(U_FAILURE(status)) return false;
  text = to_code_points(normalized);
  return true;
}

Sanitizer::Text Sanitizer::decode(const std::string& name) const {
  // Invalid UTF-8 sequences decode to U+FFFD.
  icu::UnicodeString text = icu::UnicodeString::fromUTF8(name);
  if(nfkc_) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString normalized = nfkc_->normalize(text, status);
    if(U_SUCCESS(status)) {
      text = normalized;
    }
  }
  return to_code_points(text);
}

bool Sanitizer::is_unsafe(char32_t ch) const {
  const auto cp = static_cast<UChar32>(ch);
  if(illegal_.count(ch)) return true;
  if(u_isUWhiteSpace(cp) || u_isspace(cp)) return true;
  return u_charType(cp) == U_CONTROL_CHAR;
}

Sanitizer::Text Sanitizer::replace_unsafe(const Text& text) const {
  Text out;
  out.reserve(text.size());
  for(char32_t ch : text) {
    if(is_unsafe(ch)) {
      out += token_;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

void Sanitizer::collapse(Text& text) const {
  const Text doubled = token_ + token_;
  std::size_t pos = 0;
  while((pos = text.find(doubled, pos)) != Text::npos) {
    text.erase(pos, token_.size());
  }
}

bool Sanitizer::starts_with_token(const Text& text) const {
  return text.size() >= token_.size() && text.compare(0, token_.size(), token_) == 0;
}

bool Sanitizer::ends_with_token(const Text& text) const {
  return text.size() >= token_.size() &&
         text.compare(text.size() - token_.size(), token_.size(), token_) == 0;
}

std::size_t Sanitizer::extension_pos(const Text& text) {
  auto pos = text.rfind(U'.');
  if(pos == Text::npos || pos == 0 || pos + 1 >= text.size()) return Text::npos;
  return pos;
}

Sanitizer::Text Sanitizer::trim_stem(Text stem) const {
  bool changed = true;
  while(changed && !stem.empty()) {
    changed = false;
    if(starts_with_token(stem)) {
      stem.erase(0, token_.size());
      changed = true;
    } else if(stem.front() == U'.') {
      stem.erase(0, 1);
      changed = true;
    } else if(ends_with_token(stem)) {
      stem.erase(stem.size() - token_.size());
      changed = true;
    }
  }
  return stem;
}

void Sanitizer::trim(Text& text) const {
  for(;;) {
    if(text.empty()) return;
    if(ends_with_token(text)) {
      text.erase(text.size() - token_.size());
      continue;
    }
    if(text.back() == U'.' || text.back() == U' ') {
      text.pop_back();
      continue;
    }

    auto dot = extension_pos(text);
    if(dot == Text::npos) {
      Text trimmed = trim_stem(text);
      if(trimmed == text) return;
      text = std::move(trimmed);
      continue;
    }

    Text stem = text.substr(0, dot);
    Text trimmed = trim_stem(stem);
    if(trimmed.empty()) trimmed = fallback_;
    if(trimmed == stem) return;
    text = trimmed + text.substr(dot);
  }
}

bool Sanitizer::is_reserved(const Text& text) const {
  if(reserved_.empty()) return false;
  Text base = text.substr(0, text.find(U'.'));
  return reserved_.count(lower_copy(std::move(base))) > 0;
}

// trim, fall back when empty, then protect reserved device names
Sanitizer::Text Sanitizer::finish(Text text) const {
  trim(text);
  if(text.empty()) text = fallback_;
  if(is_reserved(text)) text = token_ + text;
  return text;
}

Sanitizer::Text Sanitizer::enforce_length(const Text& text, std::size_t max) const {
  Text stem = text;
  Text ext;
  auto dot = extension_pos(text);
  if(dot != Text::npos) {
    Text candidate = text.substr(dot);
    // The extension is kept only when a fallback-sized stem still fits next to it.
    if(utf8_size(candidate) + utf8_size(fallback_) + utf8_size(token_) + 1 <= max) {
      stem = text.substr(0, dot);
      ext = std::move(candidate);
    }
  }

  const std::size_t ext_size = utf8_size(ext);
  std::size_t stem_size = utf8_size(stem);
  for(std::size_t extra = 0;; ++extra) {
    const std::size_t budget = max - ext_size > extra ? max - ext_size - extra : 0;
    while(!stem.empty() && stem_size > budget) {
      stem_size -= static_cast<std::size_t>(U8_LENGTH(static_cast<UChar32>(stem.back())));
      stem.pop_back();
    }
    Text result = finish(stem + ext);
    if(utf8_size(result) <= max) return result;
    if(stem.empty()) return fallback_;
  }
}

std::size_t Sanitizer::utf8_size(const Text& text) {
  std::size_t size = 0;
  for(char32_t ch : text) {
    size += static_cast<std::size_t>(U8_LENGTH(static_cast<UChar32>(ch)));
  }
  return size;
}

std::string Sanitizer::encode(const Text& text) {
  std::string out;
  out.reserve(text.size());
  for(char32_t ch : text) {
    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, static_cast<UChar32>(ch));
    out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(length));
  }
  return out;
}

std::string sanitize(const std::string& name, const SanitizationPolicy& policy) {
  return Sanitizer(policy).sanitize(name);
}
