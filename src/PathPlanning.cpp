/*
 * PathPlanning.cpp - A* pathfinding and Bezier curve smoothing
 */

#include "PathPlanning.h"

#include <functional>
#include <queue>

static float NodeDistance(const RoadNode& a, const RoadNode& b) {
    return Distance2D(a.x, a.z, b.x, b.z);
}

/*
 * FindPath - A* pathfinding between two nodes
 *
 * Only fire truck routes are expanded, and one-way edges only from node1.
 * Edge cost is the planar edge length and the heuristic the straight-line
 * distance to the goal. On success path holds the node indices from start
 * to goal and pathCost (when given) the summed edge length.
 */
bool FindPath(const RoadNetwork& network, size_t startNode, size_t goalNode,
              std::vector<size_t>& path, float* pathCost) {
    path.clear();

    if (!network.isLoaded || startNode >= network.nodes.size() ||
        goalNode >= network.nodes.size()) {
        return false;
    }

    const size_t nodeCount = network.nodes.size();
    const RoadNode& goalNodeRef = network.nodes[goalNode];

    std::priority_queue<AStarNode, std::vector<AStarNode>, std::greater<AStarNode> > openSet;
    std::vector<float> gScores(nodeCount, std::numeric_limits<float>::max());
    std::vector<size_t> cameFrom(nodeCount, SIZE_MAX);
    std::vector<bool> closedSet(nodeCount, false);

    AStarNode startANode;
    startANode.nodeIndex = startNode;
    startANode.gScore = 0.0f;
    startANode.fScore = NodeDistance(network.nodes[startNode], goalNodeRef);
    openSet.push(startANode);
    gScores[startNode] = 0.0f;

    while (!openSet.empty()) {
        AStarNode current = openSet.top();
        openSet.pop();

        if (current.nodeIndex == goalNode) {
            /* Reconstruct path - walk from goal back to start */
            size_t node = goalNode;
            while (node != startNode && cameFrom[node] != SIZE_MAX) {
                path.push_back(node);
                node = cameFrom[node];
            }
            path.push_back(startNode);
            std::reverse(path.begin(), path.end());

            if (pathCost) {
                *pathCost = gScores[goalNode];
            }
            DebugLog("FindPath: Found path with %zu nodes (%.1f m)", path.size(), gScores[goalNode]);
            return true;
        }

        if (closedSet[current.nodeIndex]) {
            continue;
        }
        closedSet[current.nodeIndex] = true;

        const RoadNode& currentNode = network.nodes[current.nodeIndex];

        for (size_t i = 0; i < currentNode.connectedEdges.size(); ++i) {
            const RoadEdge& edge = network.edges[currentNode.connectedEdges[i]];

            if (!edge.isFireTruckRoute) continue;

            /* Determine neighbor node */
            size_t neighborIdx;
            if (edge.node1Idx == current.nodeIndex) {
                neighborIdx = edge.node2Idx;
            } else if (!edge.isOneWay && edge.node2Idx == current.nodeIndex) {
                neighborIdx = edge.node1Idx;
            } else {
                continue;
            }

            if (closedSet[neighborIdx]) continue;

            float tentativeG = gScores[current.nodeIndex] + edge.length;
            if (tentativeG >= gScores[neighborIdx]) continue;

            gScores[neighborIdx] = tentativeG;
            cameFrom[neighborIdx] = current.nodeIndex;

            AStarNode neighborANode;
            neighborANode.nodeIndex = neighborIdx;
            neighborANode.gScore = tentativeG;
            neighborANode.fScore = tentativeG + NodeDistance(network.nodes[neighborIdx], goalNodeRef);
            openSet.push(neighborANode);
        }
    }

    DebugLog("FindPath: No path found from node %zu to node %zu", startNode, goalNode);
    return false;
}

/*
 * ComputeWaypointHeadings - Point every waypoint except the last at its successor
 *
 * A waypoint sitting on top of its successor (a truck snapped onto the first
 * road node) takes the successor's heading instead.
 */
void ComputeWaypointHeadings(std::vector<PathWaypoint>& waypoints) {
    for (size_t i = waypoints.size(); i-- > 1; ) {
        PathWaypoint& wp = waypoints[i - 1];
        const PathWaypoint& next = waypoints[i];
        if (Distance2D(wp.x, wp.z, next.x, next.z) < MIN_WAYPOINT_SPACING) {
            wp.targetHeading = next.targetHeading;
        } else {
            wp.targetHeading = BearingDegrees(next.x - wp.x, next.z - wp.z);
        }
    }
}

static PathWaypoint MakeWaypoint(double x, double z, float heading, float speed, bool isSmoothed) {
    PathWaypoint wp;
    wp.x = x;
    wp.z = z;
    wp.targetHeading = heading;
    wp.speed = speed;
    wp.isSmoothed = isSmoothed;
    return wp;
}

/*
 * SmoothPath - Replace sharp interior waypoints with an approach/apex/exit triple
 *
 * A corner is only rounded when both adjacent segments are longer than twice
 * the minimum turn radius. The first and last waypoints are never touched;
 * the last keeps its heading.
 */
void SmoothPath(PlannedRoute& route, float cruiseSpeed) {
    if (route.waypoints.size() < 3) return;

    std::vector<PathWaypoint> smoothedWaypoints;
    smoothedWaypoints.reserve(route.waypoints.size() * 3);
    smoothedWaypoints.push_back(route.waypoints.front());

    for (size_t i = 1; i + 1 < route.waypoints.size(); ++i) {
        const PathWaypoint& prev = route.waypoints[i - 1];
        const PathWaypoint& current = route.waypoints[i];
        const PathWaypoint& next = route.waypoints[i + 1];

        float lenPrev = Distance2D(prev.x, prev.z, current.x, current.z);
        float lenNext = Distance2D(current.x, current.z, next.x, next.z);

        if (lenPrev <= MIN_TURN_RADIUS * 2.0f || lenNext <= MIN_TURN_RADIUS * 2.0f) {
            /* Segment too short, just keep the waypoint */
            smoothedWaypoints.push_back(current);
            continue;
        }

        float inHeading = BearingDegrees(current.x - prev.x, current.z - prev.z);
        float outHeading = BearingDegrees(next.x - current.x, next.z - current.z);

        /* Approach point before the turn */
        smoothedWaypoints.push_back(MakeWaypoint(
            current.x - (current.x - prev.x) * BEZIER_SMOOTHING_FACTOR,
            current.z - (current.z - prev.z) * BEZIER_SMOOTHING_FACTOR,
            inHeading, cruiseSpeed * CORNER_APPROACH_SPEED_FACTOR, true));

        /* Slowest at apex of turn */
        PathWaypoint apex = current;
        apex.speed = cruiseSpeed * CORNER_APEX_SPEED_FACTOR;
        smoothedWaypoints.push_back(apex);

        /* Exit point after the turn */
        smoothedWaypoints.push_back(MakeWaypoint(
            current.x + (next.x - current.x) * BEZIER_SMOOTHING_FACTOR,
            current.z + (next.z - current.z) * BEZIER_SMOOTHING_FACTOR,
            outHeading, cruiseSpeed * CORNER_APPROACH_SPEED_FACTOR, true));
    }

    smoothedWaypoints.push_back(route.waypoints.back());

    ComputeWaypointHeadings(smoothedWaypoints);

    route.waypoints.swap(smoothedWaypoints);
    DebugLog("SmoothPath: Created %zu smoothed waypoints", route.waypoints.size());
}

/*
 * PlanDirectRoute - Straight-line route used whenever the road network cannot help
 *
 * Waypoints are spaced about PATH_NODE_DISTANCE apart, all facing the target.
 * The final one carries the required heading and a full stop.
 */
PlannedRoute PlanDirectRoute(double startX, double startZ, double targetX, double targetZ,
                             float targetHeading, float cruiseSpeed) {
    PlannedRoute route;

    double dx = targetX - startX;
    double dz = targetZ - startZ;
    float dist = Distance2D(startX, startZ, targetX, targetZ);
    float heading = BearingDegrees(dx, dz);

    int numWaypoints = static_cast<int>(floorf(dist / PATH_NODE_DISTANCE)) + 2;
    numWaypoints = std::min(numWaypoints, MAX_PATH_NODES);

    route.waypoints.reserve(numWaypoints);
    for (int i = 0; i < numWaypoints; ++i) {
        double t = static_cast<double>(i) / static_cast<double>(numWaypoints - 1);
        route.waypoints.push_back(MakeWaypoint(startX + dx * t, startZ + dz * t,
                                               heading, cruiseSpeed, false));
    }

    route.waypoints.back().targetHeading = targetHeading;
    route.waypoints.back().speed = 0.0f;

    route.isValid = true;
    return route;
}

/*
 * PlanRouteToTarget - Plan a route from start position to target using road network
 *
 * Falls back to PlanDirectRoute when the network is not loaded, when no
 * start or goal node qualifies, or when A* cannot connect them.
 */
PlannedRoute PlanRouteToTarget(const RoadNetwork& network,
                               double startX, double startZ, double targetX, double targetZ,
                               float targetHeading, float cruiseSpeed) {
    DebugLog("PlanRouteToTarget: Planning from (%.2f, %.2f) to (%.2f, %.2f)",
             startX, startZ, targetX, targetZ);

    if (!network.isLoaded) {
        DebugLog("PlanRouteToTarget: No road network loaded, using direct approach");
        return PlanDirectRoute(startX, startZ, targetX, targetZ, targetHeading, cruiseSpeed);
    }

    size_t startNode = FindNearestNode(network, startX, startZ, true);
    size_t goalNode = FindNearestNode(network, targetX, targetZ, false);

    if (startNode == SIZE_MAX || goalNode == SIZE_MAX) {
        DebugLog("PlanRouteToTarget: Could not find start or goal node, using direct approach");
        return PlanDirectRoute(startX, startZ, targetX, targetZ, targetHeading, cruiseSpeed);
    }

    DebugLog("PlanRouteToTarget: Start node %zu, Goal node %zu", startNode, goalNode);

    std::vector<size_t> nodePath;
    if (!FindPath(network, startNode, goalNode, nodePath)) {
        DebugLog("PlanRouteToTarget: A* failed, using direct approach");
        return PlanDirectRoute(startX, startZ, targetX, targetZ, targetHeading, cruiseSpeed);
    }

    PlannedRoute route;
    route.waypoints.reserve(nodePath.size() + 2);

    /* Literal start, the road nodes, then the literal target */
    route.waypoints.push_back(MakeWaypoint(startX, startZ, 0.0f, cruiseSpeed, false));
    for (size_t i = 0; i < nodePath.size(); ++i) {
        const RoadNode& node = network.nodes[nodePath[i]];
        route.waypoints.push_back(MakeWaypoint(node.x, node.z, 0.0f, cruiseSpeed, false));
    }
    route.waypoints.push_back(MakeWaypoint(targetX, targetZ, targetHeading, 0.0f, false));

    ComputeWaypointHeadings(route.waypoints);

    SmoothPath(route, cruiseSpeed);

    route.isValid = true;
    DebugLog("PlanRouteToTarget: Created route with %zu waypoints", route.waypoints.size());

    return route;
}
