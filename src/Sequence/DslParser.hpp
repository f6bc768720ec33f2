/*****************************************************************
 * File:      DslParser.hpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    Line-level parser for the show DSL. Each non-blank line is
 *    a single call  identifier ( literal, literal, ... )
 *    with integer, decimal or quoted string literals.
 *****************************************************************/

#ifndef DMXSEQ_SRC_SEQUENCE_DSL_PARSER_HPP_
#define DMXSEQ_SRC_SEQUENCE_DSL_PARSER_HPP_

#include <stdint.h>
#include <string>
#include <vector>

namespace dmxseq::sequence::dsl{

/** A literal argument */
struct Literal{
  enum class Kind : uint8_t{
    INTEGER,
    NUMBER,
    STRING,
    INVALID     // Not a literal (identifier, expression, ...)
  };

  Kind kind = Kind::INVALID;
  int64_t integer = 0;
  double number = 0.0;      // Valid for INTEGER and NUMBER
  std::string text;         // Decoded STRING contents
  std::string raw;          // Source spelling

  bool isNumeric() const{ return kind == Kind::INTEGER || kind == Kind::NUMBER; }
};

/** Result of parsing one source line */
struct ParsedLine{
  enum class Kind : uint8_t{
    BLANK,      // Empty or comment only
    CALL,       // Well-formed call
    MALFORMED   // Not a call
  };

  Kind kind = Kind::BLANK;
  std::string statement;    // Line with comment and surrounding blanks removed
  std::string name;
  std::vector<Literal> args;
};

/** Parse one line (without its line terminator) */
ParsedLine parseLine(const std::string& line);

/** Split text on '\n', dropping one trailing '\r' per line */
std::vector<std::string> splitLines(const std::string& text);

} // namespace dmxseq::sequence::dsl

#endif // DMXSEQ_SRC_SEQUENCE_DSL_PARSER_HPP_
