#include "route_parser.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <set>

#include "internal/util/errors.hpp"

namespace fleetlink::mission {

using fleetlink::util::MissionError;

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

std::string LinePrefix(std::size_t line) {
  return "line " + std::to_string(line) + ": ";
}

double ParseNumber(std::string_view field, std::size_t line, std::string_view name) {
  std::string_view digits = field;
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  }
  double value   = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size() || !std::isfinite(value)) {
    throw MissionError(LinePrefix(line) + "invalid " + std::string(name) + " '" + std::string(field) + "'");
  }
  return value;
}

} // namespace

double NormalizeTheta(double theta) {
  constexpr double kPi = std::numbers::pi;
  while (theta > kPi) {
    theta -= 2 * kPi;
  }
  while (theta < -kPi) {
    theta += 2 * kPi;
  }
  return theta;
}

ParsedRoute ParseRoute(std::string_view text, const RouteParseOptions& options) {
  ParsedRoute           route;
  std::set<std::string> seen;

  std::size_t line_no = 0;
  std::size_t start   = 0;
  while (start <= text.size()) {
    const auto end  = text.find('\n', start);
    const auto line = Trim(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
    start           = end == std::string_view::npos ? text.size() + 1 : end + 1;
    ++line_no;

    if (line.empty()) {
      continue;
    }

    std::vector<std::string_view> fields;
    std::size_t                   field_start = 0;
    while (true) {
      const auto comma = line.find(',', field_start);
      fields.push_back(Trim(line.substr(field_start, comma == std::string_view::npos ? std::string_view::npos : comma - field_start)));
      if (comma == std::string_view::npos) {
        break;
      }
      field_start = comma + 1;
    }
    if (fields.size() != 4) {
      throw MissionError(LinePrefix(line_no) + "expected nodeId,x,y,theta, got " + std::to_string(fields.size()) + " values");
    }
    if (fields[0].empty()) {
      throw MissionError(LinePrefix(line_no) + "node id cannot be empty");
    }

    RouteNode node;
    node.node_id = std::string(fields[0]);
    node.x       = ParseNumber(fields[1], line_no, "x");
    node.y       = ParseNumber(fields[2], line_no, "y");
    node.theta   = NormalizeTheta(ParseNumber(fields[3], line_no, "theta"));
    node.line    = line_no;

    if (std::abs(node.x) > options.coordinate_limit || std::abs(node.y) > options.coordinate_limit) {
      throw MissionError(LinePrefix(line_no) + "coordinates exceed +/-" + std::to_string(static_cast<int>(options.coordinate_limit)) + "m");
    }
    if (!seen.insert(node.node_id).second) {
      throw MissionError("duplicate node id '" + node.node_id + "'");
    }

    route.nodes.push_back(std::move(node));
    if (route.nodes.size() > options.max_nodes) {
      throw MissionError("too many nodes (maximum " + std::to_string(options.max_nodes) + ")");
    }
  }

  if (route.nodes.empty()) {
    throw MissionError("route has no nodes");
  }

  for (std::size_t i = 0; i + 1 < route.nodes.size(); ++i) {
    const auto& a        = route.nodes[i];
    const auto& b        = route.nodes[i + 1];
    const auto  distance = std::hypot(b.x - a.x, b.y - a.y);
    if (distance < options.min_spacing) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.2f", distance);
      route.warnings.push_back("nodes '" + a.node_id + "' and '" + b.node_id + "' are very close (" + buf + "m)");
    }
  }
  return route;
}

} // namespace fleetlink::mission
