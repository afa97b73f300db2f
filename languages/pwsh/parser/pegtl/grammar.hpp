#pragma once
#include <tao/pegtl.hpp>

namespace pwsh::pegtl_front::grammar {
using namespace tao::pegtl;

// Whitespace. Newlines terminate statements, so they are kept apart from blanks.
struct comment : seq< one<'#'>, star< not_one<'\n'> > > {};
struct line_continuation : seq< one<'`'>, opt< one<'\r'> >, one<'\n'> > {};
struct blank : sor< one<' ','\t','\r'>, comment, line_continuation > {};
struct sp : star< blank > {};
struct newline : one<'\n'> {};
struct ws_nl : star< sor< blank, newline > > {};
struct ws_sep : star< sor< blank, newline, one<';'> > > {};

// Identifiers and keywords (case-insensitive)
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct name_char : sor< ident_rest, one<'-'> > {};

template<typename Word>
struct keyword : seq< Word, not_at< name_char > > {};
struct kw_if : keyword< istring<'i','f'> > {};
struct kw_elseif : keyword< istring<'e','l','s','e','i','f'> > {};
struct kw_else : keyword< istring<'e','l','s','e'> > {};
struct kw_function : keyword< istring<'f','u','n','c','t','i','o','n'> > {};
struct kw_return : keyword< istring<'r','e','t','u','r','n'> > {};
struct kw_true : keyword< istring<'t','r','u','e'> > {};
struct kw_false : keyword< istring<'f','a','l','s','e'> > {};
struct any_keyword : sor< kw_elseif, kw_else, kw_if, kw_function, kw_return, kw_true, kw_false > {};

// Where-Object, ForEach-Object, Add
struct command_name : seq< not_at< any_keyword >, ident_first, star< sor< ident_rest, seq< one<'-'>, ident_first > > > > {};

// forward decls so we can reference before definitions
struct pipeline;
struct statement;
struct expression;
struct unary;

// Numbers: 42, 3.14, .5, 1e3
struct digits : plus< digit > {};
struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, digits > {};
struct number : seq< sor< seq< digits, opt< one<'.'>, digits > >, seq< one<'.'>, digits > >, opt< exponent >, not_at< ident_first > > {};

// 'literal' ('' is a quote)
struct sq_text : star< sor< two<'\''>, not_one<'\''> > > {};
struct sq_string : if_must< one<'\''>, sq_text, one<'\''> > {};

// $name, $global:name, $_
struct var_part : plus< ident_rest > {};
struct var_name : sor< seq< var_part, one<':'>, var_part >, var_part > {};
struct variable : seq< one<'$'>, var_name > {};
struct subexpr : seq< one<'$'>, if_must< one<'('>, ws_nl, pipeline, ws_nl, one<')'> > > {};

// "text $var $(expr) \n `t"
struct dq_escape : sor< seq< one<'\\','`'>, any >, two<'"'> > {};
struct dq_text : plus< sor< not_one<'"','$','\\','`'>, seq< one<'$'>, not_at< sor< ident_rest, one<'('> > > > > > {};
struct dq_part : sor< subexpr, variable, dq_escape, dq_text > {};
struct dq_string : if_must< one<'"'>, star< dq_part >, one<'"'> > {};

struct true_lit : keyword< istring<'t','r','u','e'> > {};
struct false_lit : keyword< istring<'f','a','l','s','e'> > {};

// @{ Name = "John"; Age = 30 }
struct hash_key : plus< name_char > {};
struct hash_entry : seq< sor< hash_key, sq_string, dq_string >, sp, one<'='>, ws_nl, expression > {};
struct hash_sep : plus< sor< blank, newline, one<';'> > > {};
struct hash_literal : if_must< seq< one<'@'>, one<'{'> >, ws_sep, opt< hash_entry, star< hash_sep, hash_entry > >, ws_sep, one<'}'> > {};

// @( 1, 2, 3 )
struct array_sep : seq< sp, sor< one<','>, one<';'>, newline >, ws_sep > {};
struct array_literal : if_must< seq< one<'@'>, one<'('> >, ws_sep, opt< expression, star< array_sep, expression > >, ws_sep, one<')'> > {};

// { statements }
struct stmt_sep : seq< sp, sor< one<';'>, newline >, ws_sep > {};
struct statement_list : seq< ws_sep, opt< statement, star< stmt_sep, statement > >, ws_sep > {};
struct block : if_must< one<'{'>, statement_list, one<'}'> > {};

struct paren_expr : if_must< one<'('>, ws_nl, pipeline, ws_nl, one<')'> > {};

// Primary forms and member access
struct value_primary : sor< paren_expr, subexpr, hash_literal, array_literal, block, number, sq_string, dq_string, variable, true_lit, false_lit > {};
struct member_name : plus< ident_rest > {};
struct member_suffix : seq< one<'.'>, member_name > {};
struct postfix : seq< value_primary, star< member_suffix > > {};

// Operators
struct cmp_word : sor< istring<'e','q'>, istring<'n','e'>, istring<'g','t'>, istring<'g','e'>, istring<'l','t'>, istring<'l','e'> > {};
struct cmp_op : seq< one<'-'>, cmp_word, not_at< name_char > > {};
struct not_word : seq< one<'-'>, istring<'n','o','t'>, not_at< name_char > > {};
struct mul_op : one<'*','/','%'> {};
struct add_op : sor< one<'+'>, seq< one<'-'>, not_at< ident_first > > > {};

// Command arguments: positional values, -Name value, -Name:value, bare -Switch
struct bareword : seq< ident_first, star< sor< ident_rest, one<'-','.'> > > > {};
struct unary_minus;
struct arg_atom : sor< unary_minus, postfix, bareword > {};
struct arg_list : seq< arg_atom, star< sp, one<','>, ws_nl, arg_atom > > {};
struct param_name : plus< ident_rest > {};
struct named_value : sor< seq< one<':'>, sp, arg_list >, seq< plus< blank >, not_at< one<'-'>, ident_first >, arg_list > > {};
struct named_arg : seq< not_at< cmp_op >, not_at< not_word >, one<'-'>, at< ident_first >, param_name, opt< named_value > > {};
struct command_arg : sor< named_arg, arg_list > {};
struct command : seq< command_name, star< plus< blank >, command_arg > > {};

struct operand : sor< postfix, command > {};
struct unary_not : seq< sor< one<'!'>, not_word >, sp, unary > {};
struct unary_minus : seq< one<'-'>, not_at< ident_first >, sp, unary > {};
struct unary : sor< unary_not, unary_minus, operand > {};

// Precedence: comparison < additive < multiplicative < unary < member access
struct mul_expr : seq< unary, star< sp, mul_op, ws_nl, unary > > {};
struct add_expr : seq< mul_expr, star< sp, add_op, ws_nl, mul_expr > > {};
struct cmp_expr : seq< add_expr, star< sp, cmp_op, ws_nl, add_expr > > {};
struct expression : seq< cmp_expr > {};

// Stages joined by |
struct pipe_sep : seq< sp, one<'|'>, ws_nl > {};
struct pipeline : seq< expression, star< pipe_sep, expression > > {};

// function Name($a, $b = 1) { ... }
struct param_decl : seq< one<'$'>, var_name, opt< sp, one<'='>, ws_nl, expression > > {};
struct param_sep : seq< ws_nl, one<','>, ws_nl > {};
struct param_list : if_must< one<'('>, ws_nl, opt< param_decl, star< param_sep, param_decl > >, ws_nl, one<')'> > {};
struct function_def : if_must< kw_function, plus< blank >, command_name, sp, opt< param_list >, ws_nl, block > {};

// if (cond) { } elseif (cond) { } else { }
struct condition : if_must< one<'('>, ws_nl, pipeline, ws_nl, one<')'> > {};
struct elseif_clause : seq< ws_nl, kw_elseif, sp, condition, ws_nl, block > {};
struct else_clause : seq< ws_nl, kw_else, ws_nl, block > {};
struct if_stmt : if_must< kw_if, sp, condition, ws_nl, block, star< elseif_clause >, opt< else_clause > > {};

struct return_stmt : seq< kw_return, sp, opt< pipeline > > {};

struct assign_op : seq< one<'='>, not_at< one<'='> > > {};
struct assignment : seq< variable, sp, assign_op, ws_nl, pipeline > {};

struct statement : sor< function_def, if_stmt, return_stmt, assignment, pipeline > {};

struct script : must< statement_list, eof > {};

} // namespace pwsh::pegtl_front::grammar
