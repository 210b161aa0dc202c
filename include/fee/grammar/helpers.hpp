// Base grammar shared by every verb: whitespace, glyph selectors, numbers, value records, languages.
#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace fee::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment : seq< one<'#'>, until< eolf > > {};
struct space_or_comment : sor< space, comment > {};
struct skip : star< space_or_comment > {};

template<typename Rule>
using ws = pad< Rule, space_or_comment >;

// Glyph names
struct glyph_start : sor< alnum, one<'_'> > {};
struct glyph_mid : sor< glyph_start, one<'.', '-'> > {};
struct barename : seq< glyph_start, star< glyph_mid > > {};
struct classname : seq< one<'@'>, plus< glyph_start > > {};

struct regex_char : sor< seq< one<'\\'>, not_one<' ', '\t', '\r', '\n'> >, not_one<'/', ' ', '\t', '\r', '\n'> > {};
struct regex : seq< one<'/'>, plus< regex_char >, one<'/'> > {};

struct unicodeglyph : seq< one<'U'>, one<'+'>, rep_min_max< 1, 6, xdigit > > {};
struct unicoderange : seq< unicodeglyph, string<'=', '>'>, unicodeglyph > {};

struct inlineclass : seq< one<'['>, skip, star< sor< classname, barename >, skip >, one<']'> > {};

struct glyphsuffix : seq< one<'.', '~'>, barename > {};
struct glyphselector : seq< sor< unicoderange, unicodeglyph, regex, classname, inlineclass, barename >, star< glyphsuffix > > {};

// Integers
struct signed_number : seq< opt< one<'-', '+'> >, plus< digit > > {};
struct named_integer : seq< one<'$'>, barename > {};
// Checked against the metric vocabulary when reduced.
struct metric_name : seq< alpha, star< alnum > > {};
struct glyph_value : seq< metric_name, sor< seq< one<'['>, skip, barename, skip, one<']'> >,
                                             seq< one<'('>, skip, barename, skip, one<')'> > > > {};
struct integer_container : sor< named_integer, glyph_value, signed_number > {};

// Value records
struct value_verb : sor< TAO_PEGTL_STRING("xAdvance"), TAO_PEGTL_STRING("xPlacement"),
                         TAO_PEGTL_STRING("yAdvance"), TAO_PEGTL_STRING("yPlacement") > {};
struct fee_value_pair : seq< value_verb, skip, one<'='>, skip, integer_container > {};
struct fee_value_record : seq< one<'<'>, skip, plus< fee_value_pair, skip >, one<'>'> > {};
struct fea_value_record : seq< one<'<'>, skip, integer_container, skip, integer_container, skip,
                               integer_container, skip, integer_container, skip, one<'>'> > {};
struct valuerecord : sor< fee_value_record, fea_value_record, named_integer, signed_number > {};

struct comparator : sor< string<'>', '='>, string<'<', '='>, string<'=', '='>, string<'!', '='>, one<'<'>, one<'>'>, one<'='> > {};
struct metric_comparison : seq< metric_name, skip, comparator, skip, integer_container > {};

// Language systems: <<lang/script ...>>
struct lang_tag : sor< rep_min_max< 3, 4, alpha >, one<'*'> > {};
struct language_pair : seq< lang_tag, one<'/'>, lang_tag > {};
struct languages : seq< string<'<', '<'>, skip, plus< language_pair, skip >, string<'>', '>'> > {};

// Generic identifier for verb-specific keywords and names
struct identifier : seq< sor< alpha, one<'_'> >, star< sor< alnum, one<'_', '.', '-'> > > > {};

// Nodes kept in the parse tree for every helper-enabled verb
using helper_nodes = parse_tree::store_content::on<
    barename, classname, regex, unicodeglyph, unicoderange, inlineclass, glyphsuffix, glyphselector,
    signed_number, named_integer, metric_name, glyph_value, integer_container,
    value_verb, fee_value_pair, fee_value_record, fea_value_record, valuerecord,
    comparator, metric_comparison, lang_tag, language_pair, languages >;

} // namespace fee::pegtl_front::grammar
