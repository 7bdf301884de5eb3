#ifndef __TUPLE_PARSER__
#define __TUPLE_PARSER__

#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>


// Parsing of coordinate tuples such as "1.5, 2", "(1; 2)", "1 2" or "1,5 2,5".
//
// Grammar, after leading/trailing whitespace is removed:
//   tuple      := '(' coords ')' | coords
//   coords     := coordinate (separator coordinate)*     (exactly n coordinates)
//   separator  := ' '* [,; ] ' '*
//   coordinate := [+-]? (digits ([.,] digits)? | [.,] digits) ([eE] [+-]? digits)?
//
// Both '.' and ',' are decimal separators, so a comma may belong to a number or
//   separate two of them. Text is only accepted when exactly one way of splitting
//   it into n coordinates exists; "1,2,3" as a pair is rejected, not guessed at.
// Conversion is independent of the process locale.
// Every failure is reported the same way: none.

namespace Text {


boost::optional<std::pair<double, double>> parse_pair(const std::string& text);
boost::optional<std::vector<double>>       parse_tuple(const std::string& text, size_t n);

// Converts one coordinate (decimal comma allowed) using the classic "C" locale.
// The whole string must be consumed.
boost::optional<double> to_double(const std::string& coordinate);


// Functions used internally, exposed for testing
namespace Internal {
  // Is s one coordinate, as a whole?
  bool is_coordinate(const std::string& s);

  // Is s one separator, as a whole?
  bool is_separator(const std::string& s);

  // Every distinct way of reading s (already trimmed, parentheses removed) as n
  //   coordinates joined by separators. Stops looking once `limit` have been found.
  std::vector<std::vector<std::string>> find_splits(const std::string& s, size_t n, size_t limit = 2);
}


}

#endif // __TUPLE_PARSER__
