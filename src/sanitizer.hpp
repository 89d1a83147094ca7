#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include <unicode/uversion.h>

U_NAMESPACE_BEGIN
class Normalizer2;
U_NAMESPACE_END

inline constexpr char kFallbackName[] = "unnamed";
inline constexpr std::size_t kMinMaxLength = 16;
// Upper bound on sanitize/re-normalize rounds; real input settles in two.
inline constexpr std::size_t kMaxNormalizationPasses = 8;

struct SanitizationPolicy {
  std::string replacement = "_";
  std::string illegal_chars = "<>:\"/\\|?*!";
  bool normalize_unicode = true;
  bool collapse_replacement = true;
  std::size_t max_length = 255;   // bytes of UTF-8
  std::vector<std::string> reserved_names = default_reserved_names();

  static std::vector<std::string> default_reserved_names();
};

// Maps arbitrary filenames onto a canonical safe form. Built once per run from
// an immutable policy; sanitize() is const, pure and safe to call from any
// number of threads.
class Sanitizer {
public:
  // Throws std::invalid_argument when the policy cannot produce stable output.
  explicit Sanitizer(SanitizationPolicy policy);

  std::string sanitize(const std::string& name) const;

  // Keeps one leading '.' and sanitizes the rest, within the same byte limit.
  std::string sanitize_hidden(const std::string& name) const;

  const SanitizationPolicy& policy() const { return policy_; }

private:
  using Text = std::u32string;

  Text decode(const std::string& name) const;
  Text run(Text text, std::size_t max_length) const;
  bool renormalize(Text& text) const;
  Text replace_unsafe(const Text& text) const;
  void collapse(Text& text) const;
  void trim(Text& text) const;
  Text trim_stem(Text stem) const;
  Text finish(Text text) const;
  Text enforce_length(const Text& text, std::size_t max_length) const;
  bool is_reserved(const Text& text) const;
  bool is_unsafe(char32_t ch) const;
  bool starts_with_token(const Text& text) const;
  bool ends_with_token(const Text& text) const;

  static std::size_t extension_pos(const Text& text);
  static std::size_t utf8_size(const Text& text);
  static std::string encode(const Text& text);

  SanitizationPolicy policy_;
  Text token_;
  Text fallback_;
  std::unordered_set<char32_t> illegal_;
  std::unordered_set<Text> reserved_;
  const icu::Normalizer2* nfkc_ = nullptr;
};

// Convenience wrapper for one-off calls; builds a Sanitizer per call.
std::string sanitize(const std::string& name, const SanitizationPolicy& policy);
