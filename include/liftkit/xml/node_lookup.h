#pragma once

#include <pugixml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liftkit::xml {

constexpr const char* kLiftNamespace = "http://fieldworks.sil.org/schemas/lift/0.13";
constexpr const char* kLiftRangesNamespace = "http://fieldworks.sil.org/schemas/lift/0.13/ranges";
constexpr const char* kLiftPrefix = "lift";

// Load flags for every LIFT input. Whitespace-only character data is kept
// everywhere: in mixed content such as
// <text><span>grass</span> <span>roots</span></text> the blank between two
// spans is part of the text.
constexpr unsigned int kLoadFlags = pugi::parse_default | pugi::parse_ws_pcdata;

// is_lift_namespace_uri accepts every LIFT schema URI (entries and ranges, any version).
[[nodiscard]] bool is_lift_namespace_uri(std::string_view uri);

// NameResolver is the single namespace-tolerant lookup primitive of the codec.
//
// pugixml is not namespace-aware, so element names arrive as written:
// "entry", "lift:entry" or "x:entry". The resolver treats an element as a LIFT
// element when it is unprefixed, or when its prefix is "lift" or is bound to
// a LIFT namespace URI anywhere in the document. Qualified and bare names are
// therefore semantically identical; elements under foreign prefixes are not
// LIFT elements.
class NameResolver {
 public:
  NameResolver();

  // for_document collects every prefix bound to a LIFT namespace URI.
  [[nodiscard]] static NameResolver for_document(const pugi::xml_node& root);

  [[nodiscard]] bool is_lift_prefix(std::string_view prefix) const;

  // local_name strips a LIFT prefix. Returns nullopt for foreign-prefixed elements
  // and for non-element nodes.
  [[nodiscard]] std::optional<std::string_view> local_name(const pugi::xml_node& node) const;

  [[nodiscard]] bool is(const pugi::xml_node& node, std::string_view local) const;

  // First child element with the given local name (empty node when none).
  [[nodiscard]] pugi::xml_node child(const pugi::xml_node& parent, std::string_view local) const;

  // Every child element with the given local name, in document order.
  [[nodiscard]] std::vector<pugi::xml_node> children(const pugi::xml_node& parent,
                                                     std::string_view local) const;

  // attribute tries the bare name first, then each LIFT-prefixed form.
  [[nodiscard]] std::optional<std::string> attribute(const pugi::xml_node& node,
                                                     std::string_view name) const;

  // declares_lift_namespace is true when the document binds any LIFT URI.
  [[nodiscard]] bool declares_lift_namespace() const { return declares_lift_; }

 private:
  std::vector<std::string> prefixes_;
  bool declares_lift_{false};
};

// ElementNamer produces element names for generation in the selected style.
class ElementNamer {
 public:
  explicit ElementNamer(bool prefixed) : prefixed_(prefixed) {}

  [[nodiscard]] std::string operator()(std::string_view local) const;
  [[nodiscard]] bool prefixed() const { return prefixed_; }

 private:
  bool prefixed_;
};

// element_path renders "/lift/entry[3]/relation[1]" for diagnostics. Indices are
// 1-based among same-named siblings.
[[nodiscard]] std::string element_path(const pugi::xml_node& node);

// collect_text concatenates all character data below node (text and CDATA).
// Inline markup such as <span> contributes its text only.
[[nodiscard]] std::string collect_text(const pugi::xml_node& node);

// prefix_of returns the part of an element or attribute name before ':' (empty
// when unprefixed).
[[nodiscard]] std::string_view prefix_of(std::string_view qualified_name);

// find_namespace_declaration looks up xmlns:prefix on node and its ancestors.
[[nodiscard]] pugi::xml_attribute find_namespace_declaration(const pugi::xml_node& node,
                                                             std::string_view prefix);

// strip_layout_whitespace removes whitespace-only character data that contains a
// line break from node's subtree. Such nodes are indentation written by a
// pretty-printer; blanks without a line break are kept.
void strip_layout_whitespace(pugi::xml_node node);

// strip_lift_prefixes renames every LIFT-prefixed element below (and including)
// node to its local name and drops LIFT namespace declarations. Used before a
// subtree is captured verbatim so that it can be re-emitted in any style.
void strip_lift_prefixes(pugi::xml_node node, const NameResolver& names);

}  // namespace liftkit::xml
