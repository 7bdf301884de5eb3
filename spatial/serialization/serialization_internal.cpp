#include "serialization.hpp"
#include "serialization_internal.hpp"
#include "tuple_parser.hpp"
#include "errors.hpp"
#include "debug.hpp"

#include <cctype>
#include <iostream>
#include <boost/regex.hpp>


using namespace std;


namespace Serialization { namespace Internal {


pair<int,int> find_data_bounds(const string& outer, uint32_t start) {
  int end = -1,
      paren_count = 1;

  while (start < outer.length() && outer[start] != '[') {
    if (!isalnum(outer[start])) {
      return make_pair(-1, -1);
    }
    start++;
  }
  if (start == outer.length()) {
    return make_pair(-1, -1);
  }

  for (uint32_t i = start+1; i < outer.length(); i++) {
    if (outer[i] == '[')
      paren_count++;
    else if (outer[i] == ']')
      paren_count--;

    if (paren_count == 0) {
      end = i;
      break;
    }
  }

  if (end == -1) {
    return make_pair(-1, -1);
  } else {
    return make_pair(start, end);
  }
}


pair<GeomType, ErrorType> find_geom_type(const string& s, uint32_t idx) {
  uint32_t start = idx;

  while (idx < s.length() && s[idx] != '[') idx++;
  if (idx == s.length()) {
    return make_pair(GeomTypes::Invalid, ErrorType::SyntaxError);
  }

  auto geom_name = s.substr(start, idx-start);
  auto res = GeomTypes::GEOM_MAP.find(geom_name);

  if (res == GeomTypes::GEOM_MAP.end()) {
    DEBUG_COUT("Name '" << geom_name << "' not found in map.");
    return make_pair(GeomTypes::Invalid, ErrorType::InvalidName);
  }
  else {
    return make_pair(res->second, ErrorType::NoError);
  }
}


pair<int, string> find_next_pair(const string& s, uint32_t start, uint32_t max) {
  string kv;
  uint32_t i = start;
  if (start < s.length() && s[start] == ']') {
    return make_pair(-2, "");
  }
  while (i < s.length() && i < max && s[i] != ':') {
    if (s[i] == ']' || s[i] == '[' || s[i] == ',') {
      // a key can't contain structure
      return make_pair(-1, "");
    }
    kv.push_back(s[i]);
    i++;
  }
  if (i == max) {
    return make_pair(-2, "");
  }
  else if (i == s.length()) {
    return make_pair(-1, "");
  }
  kv.push_back(':');
  i++; // i now points to the start of the second item

  int paren_count = 0;
  while (i < s.length() && i < max) {
    if (s[i] == '[')
      paren_count++;
    else if (s[i] == ']')
      paren_count--;

    if (paren_count == -1) // we've reached the end of the parent data string
      break;
    else if (paren_count == 0 && s[i] == ',')
      break;

    kv.push_back(s[i]);
    i++;
  }

  if (i == max || i == s.length()) {
    return make_pair(-1, "");
  }

  return make_pair(static_cast<int>(i), kv);
}


pair<PropList, bool> find_pairs(const string& s) {
  PropList props;

  auto bounds = find_data_bounds(s);
  if (bounds.first == -1) return make_pair(props, true);

  // only look inside this node's brackets
  uint32_t max = bounds.second + 1;
  uint32_t i = bounds.first + 1;
  while (i < max) {
    auto pair = find_next_pair(s, i, max);

    if (pair.first == -1) {
      return make_pair(props, true);
    }
    else if (pair.first == -2) {
      break;
    }

    auto str = pair.second;
    auto idx = str.find(':');

    if (idx == string::npos) {
      return make_pair(props, true);
    }

    props.push_back(make_pair(str.substr(0, idx), str.substr(idx+1)));

    i = pair.first + 1;
  }

  return make_pair(props, false);
}


pair<int, double> parse_double(const string& s, uint32_t start) {
  static const boost::regex number("[+-]?(?:\\d+(?:\\.\\d+)?|\\.\\d+)(?:[eE][+-]?\\d+)?");

  if (start >= s.length()) {
    return make_pair(-1, 0);
  }

  boost::smatch m;
  if (!boost::regex_search(s.begin() + start, s.end(), m, number, boost::match_continuous)) {
    return make_pair(-1, 0);
  }

  uint32_t end = start + m.length(0);
  if (end < s.length() && (s[end] == '.' || s[end] == '-' || s[end] == '+' || isdigit(s[end]))) {
    // a malformed number, not the end of one
    return make_pair(-1, 0);
  }

  auto d = Text::to_double(m.str(0));
  if (!d) {
    return make_pair(-1, 0);
  }
  return make_pair(static_cast<int>(end) - 1, *d);
}


pair<string, ErrorType> unwrap(const string& s) {
  string node = s;

  while (true) {
    auto type = find_geom_type(node);
    if (type.second != InvalidName) {
      return make_pair(type.second == NoError ? node : string(), type.second);
    }

    auto props = find_pairs(node);
    if (props.second) {
      return make_pair(string(), SyntaxError);
    }
    if (props.first.size() != 1 || props.first[0].second.find('[') == string::npos) {
      // not a wrapper, and not geometry either
      return make_pair(string(), InvalidName);
    }

    DEBUG_COUT("Skipping wrapper '" << props.first[0].first << "'");
    node = props.first[0].second;
  }
}


pair<string, ErrorType> unwrap(const string& s, GeomType target) {
  auto node = unwrap(s);
  if (node.second != NoError) {
    return node;
  }
  if (find_geom_type(node.first).first != target) {
    return make_pair(string(), InvalidName);
  }
  return node;
}


unordered_map<string, GeomResult> parse_geometry(const string& s, const PropSpec& required_props, bool ordered) {
  unordered_map<string, GeomResult> ret;
  auto bounds = find_data_bounds(s);

  if (bounds.first == -1) {
    ret["*"] = SyntaxError;
    return ret;
  }

  auto prop_res = find_pairs(s.substr(bounds.first, bounds.second - bounds.first + 1));

  if (prop_res.second) {
    ret["*"] = SyntaxError;
    return ret;
  }

  unordered_map<string, size_t> required_idx;
  for (size_t i = 0; i < required_props.size(); i++) {
    required_idx[required_props[i].first] = i;
  }

  unordered_map<string, string> props;

  for (size_t i = 0; i < prop_res.first.size(); i++) {
    const auto& prop_name = prop_res.first[i].first;
    auto req = required_idx.find(prop_name);

    if (req == required_idx.end()) {
      // property is not required
      ret["*"] = ExtraProperty;
      return ret;
    }
    if (props.find(prop_name) != props.end()) {
      // we've already seen this property!
      ret["*"] = DuplicateProperty;
      return ret;
    }
    if (ordered && req->second != i) {
      ret["*"] = OutOfOrder;
      return ret;
    }

    props[prop_name] = prop_res.first[i].second;
  }

  for (auto prop = required_props.begin(); prop != required_props.end(); ++prop) {
    const string& prop_name = prop->first;

    if (props.find(prop_name) == props.end()) {
      cerr << "Missing property " << prop_name << endl;
      ret["*"] = MissingProperty;
      return ret;
    }

    const string& str = props[prop_name];

    ErrorType err;
    pair<int, double> res;

    Vec3 v;
    boost::optional<LineSegment> l;
    boost::optional<Plane> p;

    switch (prop->second) {
      case GeomTypes::Point3D:
        err = deserialize(str, v);
        if (err == NoError) {
          ret[prop_name] = v;
          break;
        } else {
          ret["*"] = err;
          return ret;
        }

      case GeomTypes::LineSegment:
        err = deserialize(str, l);
        if (err == NoError) {
          ret[prop_name] = *l;
          break;
        } else {
          ret["*"] = err;
          return ret;
        }

      case GeomTypes::Plane:
        err = deserialize(str, p);
        if (err == NoError) {
          ret[prop_name] = *p;
          break;
        } else {
          ret["*"] = err;
          return ret;
        }

      case GeomTypes::Scalar:
        res = parse_double(str, 0);
        if (res.first != -1 && static_cast<size_t>(res.first) + 1 == str.length()) {
          ret[prop_name] = res.second;
          break;
        } else {
          ret["*"] = SyntaxError;
          return ret;
        }

      default:
        ret["*"] = NoParser;
        return ret;
    }
  }

  return ret;
}


} } // end namespace Internal, Serialization
