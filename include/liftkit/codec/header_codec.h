#pragma once

#include "liftkit/codec/generate_result.h"
#include "liftkit/codec/parse_options.h"
#include "liftkit/codec/parse_result.h"
#include "liftkit/model/header.h"
#include "liftkit/xml/node_lookup.h"

#include <pugixml.hpp>

#include <string>
#include <string_view>

namespace liftkit::codec {

// Header codec: the <header> block of a LIFT document.
//
//   <header>
//     <description><form lang="en"><text>...</text></form></description>
//     <ranges href="file.lift-ranges">
//       <range id="grammatical-info" href="file.lift-ranges"/>
//     </ranges>
//     <fields>
//       <field tag="cv-pattern"><form lang="en"><text>...</text></form></field>
//     </fields>
//   </header>
//
// The entry parser and generator call the node-level functions; the string
// functions serve callers that handle the header on its own.

// read_header reads a <header> element. Children the model does not cover are
// kept in Header::extensions (or FieldDeclaration::extensions) under
// kStrictLossless and dropped under kKnownSubset; either way they are noted in
// report when one is given. Inline range content under <ranges> is not part of
// the header model and is reported, not kept.
[[nodiscard]] model::Header read_header(
    const pugi::xml_node& header_node, const xml::NameResolver& names,
    ParseReport* report = nullptr,
    UnknownElementPolicy policy = UnknownElementPolicy::kStrictLossless);

// write_header appends <header> to parent. Nothing is written for an empty header.
// Returns false when a preserved element is not well-formed.
[[nodiscard]] bool write_header(pugi::xml_node parent, const model::Header& header,
                                const xml::ElementNamer& namer);

// parse_header accepts a LIFT document or a bare <header> element. A document
// without a header yields an empty Header.
[[nodiscard]] HeaderParseResult parse_header(std::string_view xml);

// generate_header renders a bare <header> element (empty string for an empty header).
[[nodiscard]] GenerateResult generate_header(const model::Header& header);

}  // namespace liftkit::codec
