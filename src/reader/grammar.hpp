#pragma once
#include <tao/pegtl.hpp>

namespace ntup::reader::grammar {
using namespace tao::pegtl;

// Whitespace, commas and ; line comments separate forms
struct comment : seq< one<';'>, until< eolf > > {};
struct sep : sor< space, one<','>, comment > {};
struct skip : star< sep > {};

struct sym_start : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&'> > {};
struct sym_char : sor< sym_start, digit, one<'.','#'> > {};

struct escaped : seq< one<'\\'>, any > {};
struct str_char : sor< escaped, not_one<'"','\\'> > {};
struct string_body : star< str_char > {};
struct string_close : one<'"'> {};
struct string_lit : if_must< one<'"'>, string_body, string_close > {};

struct sign : one<'+','-'> {};
struct frac : seq< one<'.'>, star< digit > > {};
struct expo : seq< one<'e','E'>, opt< sign >, plus< digit > > {};
struct number : seq< opt< sign >, plus< digit >, opt< frac >, opt< expo >, not_at< sym_char > > {};

struct keyword_tok : seq< one<':'>, plus< sym_char > > {};
struct symbol_tok : seq< sym_start, star< sym_char > > {};

struct value;

struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct map_open : one<'{'> {};
struct map_close : one<'}'> {};
struct tag_open : one<'#'> {};
struct tag_name : seq< sym_start, star< sym_char > > {};

struct list_form : if_must< list_open, skip, star< value, skip >, list_close > {};
struct vector_form : if_must< vector_open, skip, star< value, skip >, vector_close > {};
struct map_form : if_must< map_open, skip, star< value, skip >, map_close > {};
struct tagged_form : if_must< tag_open, tag_name, skip, value > {};

struct value : sor< string_lit, number, keyword_tok, symbol_tok, list_form, vector_form, map_form, tagged_form > {};

struct file : seq< skip, star< value, skip >, must< eof > > {};

} // namespace ntup::reader::grammar
