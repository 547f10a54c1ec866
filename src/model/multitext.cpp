#include "liftkit/model/multitext.h"

#include <algorithm>

namespace liftkit::model {

Multitext::Multitext(std::initializer_list<Form> forms) {
  for (const auto& [lang, text] : forms) {
    set(lang, text);
  }
}

void Multitext::set(std::string lang, std::string text) {
  auto it = std::find_if(forms_.begin(), forms_.end(),
                         [&lang](const Form& form) { return form.first == lang; });
  if (it != forms_.end()) {
    it->second = std::move(text);
    return;
  }
  forms_.emplace_back(std::move(lang), std::move(text));
}

bool Multitext::erase(std::string_view lang) {
  auto it = std::find_if(forms_.begin(), forms_.end(),
                         [lang](const Form& form) { return form.first == lang; });
  if (it == forms_.end()) {
    return false;
  }
  forms_.erase(it);
  return true;
}

const std::string* Multitext::find(std::string_view lang) const {
  for (const auto& form : forms_) {
    if (form.first == lang) {
      return &form.second;
    }
  }
  return nullptr;
}

std::string Multitext::text(std::string_view lang) const {
  const std::string* found = find(lang);
  return found != nullptr ? *found : std::string{};
}

std::vector<std::string> Multitext::languages() const {
  std::vector<std::string> langs;
  langs.reserve(forms_.size());
  for (const auto& form : forms_) {
    langs.push_back(form.first);
  }
  return langs;
}

bool operator==(const Multitext& a, const Multitext& b) {
  if (a.forms_.size() != b.forms_.size()) {
    return false;
  }
  // Keys are unique on both sides, so a one-directional containment check suffices.
  return std::all_of(a.forms_.begin(), a.forms_.end(), [&b](const Multitext::Form& form) {
    const std::string* other = b.find(form.first);
    return other != nullptr && *other == form.second;
  });
}

}  // namespace liftkit::model
