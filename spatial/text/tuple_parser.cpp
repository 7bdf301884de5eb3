#include "tuple_parser.hpp"
#include "debug.hpp"

#include <algorithm>
#include <locale>
#include <set>
#include <sstream>
#include <boost/regex.hpp>
#include <boost/algorithm/string/trim.hpp>


namespace Text {


namespace Internal {


bool is_coordinate(const std::string& s) {
  static const boost::regex coordinate("[+-]?(?:\\d+(?:[.,]\\d+)?|[.,]\\d+)(?:[eE][+-]?\\d+)?");
  return boost::regex_match(s, coordinate);
}


bool is_separator(const std::string& s) {
  static const boost::regex separator(" *[,; ] *");
  return boost::regex_match(s, separator);
}


static void collect_splits(const std::string& s, size_t pos, size_t n,
                           std::vector<std::string>& current,
                           std::set<std::vector<std::string>>& found, size_t limit) {
  if (found.size() >= limit) return;

  for (size_t end = pos + 1; end <= s.length(); end++) {
    auto token = s.substr(pos, end - pos);
    if (!is_coordinate(token)) continue;

    current.push_back(token);
    if (n == 1) {
      if (end == s.length()) {
        found.insert(current);
      }
    } else {
      for (size_t next = end + 1; next < s.length(); next++) {
        if (is_separator(s.substr(end, next - end))) {
          collect_splits(s, next, n - 1, current, found, limit);
        }
      }
    }
    current.pop_back();

    if (found.size() >= limit) return;
  }
}


std::vector<std::vector<std::string>> find_splits(const std::string& s, size_t n, size_t limit) {
  std::set<std::vector<std::string>> found;
  std::vector<std::string> current;

  if (n > 0 && limit > 0) {
    collect_splits(s, 0, n, current, found, limit);
  }

  return std::vector<std::vector<std::string>>(found.begin(), found.end());
}


} // end namespace Internal


boost::optional<double> to_double(const std::string& coordinate) {
  std::string s = coordinate;
  std::replace(s.begin(), s.end(), ',', '.');

  std::istringstream ss(s);
  ss.imbue(std::locale::classic());

  double d;
  ss >> d;
  if (ss.fail()) {
    return boost::none;
  }
  ss >> std::ws;
  if (!ss.eof()) {
    return boost::none;
  }
  return d;
}


boost::optional<std::vector<double>> parse_tuple(const std::string& text, size_t n) {
  DEBUG_ENTER(__PRETTY_FUNCTION__);
  auto s = boost::algorithm::trim_copy(text);

  if (s.empty() || n == 0) {
    DEBUG_LEAVE;
    return boost::none;
  }

  bool open  = s.front() == '(',
       close = s.back() == ')';
  if (open != close) {
    DEBUG_COUT("Unbalanced parentheses in '" << text << "'");
    DEBUG_LEAVE;
    return boost::none;
  }
  if (open) {
    if (s.length() < 2) {
      DEBUG_LEAVE;
      return boost::none;
    }
    s = s.substr(1, s.length() - 2);
  }

  auto splits = Internal::find_splits(s, n);
  if (splits.size() != 1) {
    DEBUG_COUT("'" << text << "' has " << splits.size() << " readings as " << n << " coordinates");
    DEBUG_LEAVE;
    return boost::none;
  }

  std::vector<double> ret;
  for (const auto& coordinate : splits[0]) {
    auto d = to_double(coordinate);
    if (!d) {
      DEBUG_COUT("Cannot convert '" << coordinate << "'");
      DEBUG_LEAVE;
      return boost::none;
    }
    ret.push_back(*d);
  }

  DEBUG_LEAVE;
  return ret;
}


boost::optional<std::pair<double, double>> parse_pair(const std::string& text) {
  auto res = parse_tuple(text, 2);
  if (!res) {
    return boost::none;
  }
  return std::make_pair((*res)[0], (*res)[1]);
}


}
