#ifndef LEXER_H
#define LEXER_H

#include <string>
#include <cstdint>

// The lexer returns tokens [0-255] if it is an unknown character, otherwise one
// of these for known things.
enum Token {
  tok_eof = -1,

  // declarations
  tok_namespace = -2,       // namespace
  tok_struct = -3,          // struct
  tok_class = -4,           // class
  tok_enum = -5,            // enum
  tok_typedef = -6,         // typedef
  tok_using = -7,           // using alias declaration

  // specifiers
  tok_const = -8,           // const
  tok_static = -9,          // static
  tok_extern = -10,         // extern
  tok_inline = -11,         // inline
  tok_public = -12,         // public
  tok_private = -13,        // private
  tok_protected = -14,      // protected

  // control flow
  tok_return = -15,         // return statement
  tok_if = -16,             // if statement
  tok_else = -17,           // else statement
  tok_while = -18,          // while loop

  // builtin type keywords
  tok_void = -19,
  tok_bool = -20,
  tok_char = -21,
  tok_short = -22,
  tok_int = -23,
  tok_long = -24,
  tok_signed = -25,
  tok_unsigned = -26,
  tok_float = -27,
  tok_double = -28,

  // primary
  tok_identifier = -29,     // e.g. foo, bar, baz
  tok_number = -30,         // e.g. 12345, 0x1F
  tok_true = -31,           // true
  tok_false = -32,          // false
  tok_nullptr = -33,        // nullptr
  tok_this = -34,           // this
  tok_sizeof = -35,         // sizeof

  // multi-character punctuation
  tok_scope = -36,          // ::
  tok_arrow = -37,          // ->
  tok_eq = -38,             // ==
  tok_ne = -39,             // !=
  tok_le = -40,             // <=
  tok_ge = -41,             // >=
  tok_and = -42,            // &&
  tok_or = -43,             // ||

  // error token
  tok_error = -100          // error during lexing
};

// gettok - Return the next token from the active lexer input.
int gettok();

#endif // LEXER_H
