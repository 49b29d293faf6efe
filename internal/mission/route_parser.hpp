#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fleetlink::mission {

struct RouteNode {
  std::string node_id;
  double      x     = 0;
  double      y     = 0;
  double      theta = 0; // normalized to [-pi, pi]
  std::size_t line  = 0;
};

struct RouteParseOptions {
  std::size_t max_nodes        = 100;
  double      coordinate_limit = 1000.0; // metres, per axis
  double      min_spacing      = 0.1;    // closer consecutive nodes produce a warning
};

struct ParsedRoute {
  std::vector<RouteNode>   nodes;
  std::vector<std::string> warnings;
};

/*
  Parses one "nodeId,x,y,theta" node per line. Blank lines are skipped.

  Throws util::MissionError naming the offending line on a wrong field count,
  an empty id, a non-numeric value, a coordinate beyond coordinate_limit, a
  duplicate node id or more than max_nodes nodes.
*/
ParsedRoute ParseRoute(std::string_view text, const RouteParseOptions& options = {});

double NormalizeTheta(double theta);

} // namespace fleetlink::mission
