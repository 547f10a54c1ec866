#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace liftkit::model {

// Multitext maps a language tag ("en", "seh-fonipa") to literal text.
//
// - Keys are unique. set() on an existing key overwrites the text in place,
//   so a key keeps the position of its first insertion (last-wins values).
// - Insertion order is kept for deterministic regeneration but is ignored by
//   operator==.
// - A default-constructed Multitext is empty; there is no null state.
class Multitext {
 public:
  using Form = std::pair<std::string, std::string>;  // (lang, text)
  using const_iterator = std::vector<Form>::const_iterator;

  Multitext() = default;
  Multitext(std::initializer_list<Form> forms);

  void set(std::string lang, std::string text);
  bool erase(std::string_view lang);
  void clear() { forms_.clear(); }

  // find returns nullptr when no form exists for lang.
  [[nodiscard]] const std::string* find(std::string_view lang) const;
  [[nodiscard]] bool contains(std::string_view lang) const { return find(lang) != nullptr; }

  // text returns the form for lang, or an empty string when absent.
  [[nodiscard]] std::string text(std::string_view lang) const;

  [[nodiscard]] bool empty() const { return forms_.empty(); }
  [[nodiscard]] std::size_t size() const { return forms_.size(); }
  [[nodiscard]] const std::vector<Form>& forms() const { return forms_; }
  [[nodiscard]] std::vector<std::string> languages() const;

  [[nodiscard]] const_iterator begin() const { return forms_.begin(); }
  [[nodiscard]] const_iterator end() const { return forms_.end(); }

  friend bool operator==(const Multitext& a, const Multitext& b);

 private:
  std::vector<Form> forms_;
};

}  // namespace liftkit::model
