#pragma once

#include "liftkit/model/extension.h"
#include "liftkit/model/multitext.h"
#include "liftkit/xml/node_lookup.h"

#include <pugixml.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace liftkit::xml {

// Shared reading and writing of the LIFT building blocks that appear at every
// level: multitext forms, traits and fields. Entry, header and range codecs all
// go through these functions.

// Language used when a <form> carries no lang attribute.
constexpr const char* kUndeterminedLang = "und";

// read_multitext flattens the <form lang=""><text/></form> children of node.
// Duplicate languages are last-wins. Forms without a <text> child are ignored.
[[nodiscard]] model::Multitext read_multitext(const pugi::xml_node& node,
                                              const NameResolver& names);

// read_child_multitext reads the forms of the first child named local.
[[nodiscard]] model::Multitext read_child_multitext(const pugi::xml_node& parent,
                                                    std::string_view local,
                                                    const NameResolver& names);

// read_trait returns nullopt when the element has no name attribute.
[[nodiscard]] std::optional<model::Trait> read_trait(const pugi::xml_node& node,
                                                     const NameResolver& names);

// read_field returns nullopt when the element has neither type nor tag attribute.
[[nodiscard]] std::optional<model::Field> read_field(const pugi::xml_node& node,
                                                     const NameResolver& names);

// Writers append children to parent in the order given.
void write_multitext(pugi::xml_node parent, const model::Multitext& text,
                     const ElementNamer& namer);

// write_multitext_element appends <local> holding text's forms. Nothing is
// written for an empty multitext.
void write_multitext_element(pugi::xml_node parent, std::string_view local,
                             const model::Multitext& text, const ElementNamer& namer);

void write_traits(pugi::xml_node parent, const std::vector<model::Trait>& traits,
                  const ElementNamer& namer);
void write_fields(pugi::xml_node parent, const std::vector<model::Field>& fields,
                  const ElementNamer& namer);

// capture_element serializes node as a PreservedElement. LIFT prefixes are
// removed, an inherited binding for the element's own foreign prefix is copied
// onto it, and layout whitespace is dropped (see strip_layout_whitespace).
[[nodiscard]] model::PreservedElement capture_element(const pugi::xml_node& node,
                                                      const NameResolver& names);

// append_preserved re-inserts a captured element as the last child of parent.
// Returns false when element.xml is not well-formed.
[[nodiscard]] bool append_preserved(pugi::xml_node parent, const model::PreservedElement& element);

// append_element is append_child for std::string names.
pugi::xml_node append_element(pugi::xml_node parent, std::string_view local,
                              const ElementNamer& namer);

// set_attribute appends name="value".
void set_attribute(pugi::xml_node node, const char* name, std::string_view value);

}  // namespace liftkit::xml
