#ifndef __SERIALIZE_INTERNAL__
#define __SERIALIZE_INTERNAL__


#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "serialization.hpp"


// Functions used internally, not intended to be part of the public interface
namespace Serialization { namespace Internal {
  typedef std::vector<std::pair<std::string, std::string>> PropList;
  typedef std::vector<std::pair<std::string, GeomType>>    PropSpec;

  // Finds the bounds of data (the information in the next pair of square braces).
  // Returns the pair <start, end> on success, <-1, -1> on failure
  std::pair<int,int> find_data_bounds(const std::string& outer, uint32_t start = 0);

  // Finds the next geom type in the string, if one exists
  std::pair<GeomType, ErrorType> find_geom_type(const std::string& s, uint32_t idx = 0);

  // Finds the next key:value pair in the string.
  // Returns <last character index of pair, key:value>
  // On error, returns <-1, "">
  // If no next pair exists but no syntax error is present, returns <-2, "">
  std::pair<int, std::string> find_next_pair(const std::string& s, uint32_t start = 0, uint32_t max = UINT32_MAX);

  // Finds all property:value pairs inside a data string, in the order they appear
  // Data string should be of the format "name[prop:val, prop:val, ...]"
  // Returns pair of pairs and was_error
  std::pair<PropList, bool> find_pairs(const std::string& s);

  // Parse a string to the next valid float (optionally with an exponent)
  // Returns pair <index of last char in float, returned value> if it works,
  // <-1, {undefined}> if not
  std::pair<int, double> parse_double(const std::string& s, uint32_t start = 0);

  // Skips enclosing nodes that hold exactly one child until a node with a geometry name is found.
  // Returns <node string, NoError>, or <"", error> if there is no such node.
  std::pair<std::string, ErrorType> unwrap(const std::string& s);
  // As above, but the node found must also be of type `target` (InvalidName otherwise).
  std::pair<std::string, ErrorType> unwrap(const std::string& s, GeomType target);

  // Parses geometry items
  // The required_props argument lists the name of each k:v pair with the desired geometry type.
  // With `ordered`, the pairs must appear in the listed order.
  // If no error, will return all of the requested properties with the requested type, so it's ok to assume they're the right type for casting etc
  // In case of error, returns the string "*" mapped to GeomResult containing error
  std::unordered_map<std::string, GeomResult> parse_geometry(const std::string& s, const PropSpec& required_props, bool ordered = false);
} }


#endif //__SERIALIZE_INTERNAL__
