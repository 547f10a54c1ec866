#include "liftkit/xml/node_lookup.h"

#include "liftkit/core/normalization.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace liftkit::xml {

namespace {

constexpr std::string_view kLiftUriBase = "http://fieldworks.sil.org/schemas/lift/";
constexpr std::string_view kXmlnsPrefix = "xmlns:";

void collect_lift_prefixes(const pugi::xml_node& node, std::vector<std::string>& prefixes,
                           bool& declares_lift) {
  for (const pugi::xml_attribute& attr : node.attributes()) {
    const std::string_view name = attr.name();
    if (!is_lift_namespace_uri(attr.value())) {
      continue;
    }
    if (name == "xmlns") {
      declares_lift = true;
    } else if (name.starts_with(kXmlnsPrefix)) {
      declares_lift = true;
      std::string prefix{name.substr(kXmlnsPrefix.size())};
      if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
        prefixes.push_back(std::move(prefix));
      }
    }
  }
  for (const pugi::xml_node& child : node.children()) {
    if (child.type() == pugi::node_element) {
      collect_lift_prefixes(child, prefixes, declares_lift);
    }
  }
}

void append_text(const pugi::xml_node& node, std::string& out) {
  for (const pugi::xml_node& child : node.children()) {
    switch (child.type()) {
      case pugi::node_pcdata:
      case pugi::node_cdata:
        out += child.value();
        break;
      case pugi::node_element:
        append_text(child, out);
        break;
      default:
        break;
    }
  }
}

}  // namespace

bool is_lift_namespace_uri(std::string_view uri) {
  return uri.starts_with(kLiftUriBase);
}

NameResolver::NameResolver() : prefixes_{kLiftPrefix} {}

NameResolver NameResolver::for_document(const pugi::xml_node& root) {
  NameResolver resolver;
  collect_lift_prefixes(root, resolver.prefixes_, resolver.declares_lift_);
  return resolver;
}

bool NameResolver::is_lift_prefix(std::string_view prefix) const {
  return std::find(prefixes_.begin(), prefixes_.end(), prefix) != prefixes_.end();
}

std::optional<std::string_view> NameResolver::local_name(const pugi::xml_node& node) const {
  if (node.type() != pugi::node_element) {
    return std::nullopt;
  }
  const std::string_view name = node.name();
  const auto colon = name.find(':');
  if (colon == std::string_view::npos) {
    return name;
  }
  if (!is_lift_prefix(name.substr(0, colon))) {
    return std::nullopt;
  }
  return name.substr(colon + 1);
}

bool NameResolver::is(const pugi::xml_node& node, std::string_view local) const {
  const auto name = local_name(node);
  return name.has_value() && *name == local;
}

pugi::xml_node NameResolver::child(const pugi::xml_node& parent, std::string_view local) const {
  for (const pugi::xml_node& node : parent.children()) {
    if (is(node, local)) {
      return node;
    }
  }
  return {};
}

std::vector<pugi::xml_node> NameResolver::children(const pugi::xml_node& parent,
                                                   std::string_view local) const {
  std::vector<pugi::xml_node> found;
  for (const pugi::xml_node& node : parent.children()) {
    if (is(node, local)) {
      found.push_back(node);
    }
  }
  return found;
}

std::optional<std::string> NameResolver::attribute(const pugi::xml_node& node,
                                                   std::string_view name) const {
  const std::string bare{name};
  if (const pugi::xml_attribute attr = node.attribute(bare.c_str())) {
    return std::string{attr.value()};
  }
  for (const auto& prefix : prefixes_) {
    const std::string qualified = prefix + ":" + bare;
    if (const pugi::xml_attribute attr = node.attribute(qualified.c_str())) {
      return std::string{attr.value()};
    }
  }
  return std::nullopt;
}

std::string ElementNamer::operator()(std::string_view local) const {
  if (!prefixed_) {
    return std::string{local};
  }
  std::string name{kLiftPrefix};
  name += ':';
  name += local;
  return name;
}

std::string element_path(const pugi::xml_node& node) {
  std::vector<std::string> segments;
  for (pugi::xml_node current = node; current && current.type() == pugi::node_element;
       current = current.parent()) {
    int index = 1;
    for (pugi::xml_node sibling = current.previous_sibling(); sibling;
         sibling = sibling.previous_sibling()) {
      if (sibling.type() == pugi::node_element && std::strcmp(sibling.name(), current.name()) == 0) {
        ++index;
      }
    }
    std::string segment = current.name();
    if (current.parent() && current.parent().type() == pugi::node_element) {
      segment += "[" + std::to_string(index) + "]";
    }
    segments.push_back(std::move(segment));
  }

  std::string path;
  for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
    path += "/";
    path += *it;
  }
  return path;
}

std::string collect_text(const pugi::xml_node& node) {
  std::string text;
  append_text(node, text);
  return text;
}

std::string_view prefix_of(std::string_view qualified_name) {
  const auto colon = qualified_name.find(':');
  return colon == std::string_view::npos ? std::string_view{} : qualified_name.substr(0, colon);
}

pugi::xml_attribute find_namespace_declaration(const pugi::xml_node& node,
                                               std::string_view prefix) {
  const std::string attr_name = std::string{kXmlnsPrefix} + std::string{prefix};
  for (pugi::xml_node current = node; current && current.type() == pugi::node_element;
       current = current.parent()) {
    if (const pugi::xml_attribute attr = current.attribute(attr_name.c_str())) {
      return attr;
    }
  }
  return {};
}

void strip_layout_whitespace(pugi::xml_node node) {
  for (pugi::xml_node child = node.first_child(); child;) {
    pugi::xml_node next = child.next_sibling();
    if (child.type() == pugi::node_pcdata) {
      const std::string_view text = child.value();
      if (text.find_first_of("\r\n") != std::string_view::npos && core::is_blank(text)) {
        node.remove_child(child);
      }
    } else if (child.type() == pugi::node_element) {
      strip_layout_whitespace(child);
    }
    child = next;
  }
}

void strip_lift_prefixes(pugi::xml_node node, const NameResolver& names) {
  if (node.type() != pugi::node_element) {
    return;
  }
  if (const auto local = names.local_name(node); local.has_value() && *local != node.name()) {
    node.set_name(std::string{*local}.c_str());
  }

  for (pugi::xml_attribute attr = node.first_attribute(); attr;) {
    pugi::xml_attribute next = attr.next_attribute();
    const std::string_view name = attr.name();
    if ((name == "xmlns" || name.starts_with(kXmlnsPrefix)) && is_lift_namespace_uri(attr.value())) {
      node.remove_attribute(attr);
    }
    attr = next;
  }

  for (pugi::xml_node child : node.children()) {
    strip_lift_prefixes(child, names);
  }
}

}  // namespace liftkit::xml
