#include <catch2/catch.hpp>

#include "PathPlanning.h"

/*
 * Test network, 100 m grid (north is -Z):
 *
 *   3 --<-- 4 ----- 5
 *   |       |       |
 *   0 ----- 1 - x - 2      6 (isolated)
 *
 * 4->3 is one-way, 1-2 is closed to fire trucks.
 */
static void AddTestNode(RoadNetwork& network, double x, double z) {
    RoadNode node;
    node.name = std::to_string(network.nodes.size());
    node.lat = node.lon = 0.0;
    node.x = x;
    node.z = z;
    node.nodeType = "both";
    network.nodeNameToIndex[node.name] = network.nodes.size();
    network.nodes.push_back(node);
}

static void AddTestEdge(RoadNetwork& network, size_t a, size_t b, bool oneWay, bool fireTruck) {
    RoadEdge edge;
    edge.node1Idx = a;
    edge.node2Idx = b;
    edge.kind = fireTruck ? EDGE_TAXI : EDGE_SERVICE;
    edge.isOneWay = oneWay;
    edge.isFireTruckRoute = fireTruck;
    edge.length = Distance2D(network.nodes[a].x, network.nodes[a].z,
                             network.nodes[b].x, network.nodes[b].z);
    edge.surfaceType = fireTruck ? "taxiway" : "service_road";

    size_t index = network.edges.size();
    network.nodes[a].connectedEdges.push_back(index);
    if (!oneWay) {
        network.nodes[b].connectedEdges.push_back(index);
    }
    network.edges.push_back(edge);
}

static RoadNetwork MakeGridNetwork() {
    RoadNetwork network;
    network.airportId = "TEST";
    AddTestNode(network, 0.0, 0.0);        /* 0 */
    AddTestNode(network, 100.0, 0.0);      /* 1 */
    AddTestNode(network, 200.0, 0.0);      /* 2 */
    AddTestNode(network, 0.0, -100.0);     /* 3 */
    AddTestNode(network, 100.0, -100.0);   /* 4 */
    AddTestNode(network, 200.0, -100.0);   /* 5 */
    AddTestNode(network, 300.0, 0.0);      /* 6 */

    AddTestEdge(network, 0, 1, false, true);
    AddTestEdge(network, 1, 2, false, false);
    AddTestEdge(network, 2, 5, false, true);
    AddTestEdge(network, 0, 3, false, true);
    AddTestEdge(network, 4, 3, true, true);
    AddTestEdge(network, 4, 5, false, true);
    AddTestEdge(network, 1, 4, false, true);
    network.isLoaded = true;
    return network;
}

TEST_CASE("FindPath returns the cheapest fire truck path") {
    RoadNetwork network = MakeGridNetwork();
    std::vector<size_t> path;
    float cost = 0.0f;

    REQUIRE(FindPath(network, 0, 5, path, &cost));
    std::vector<size_t> expected;
    expected.push_back(0);
    expected.push_back(1);
    expected.push_back(4);
    expected.push_back(5);
    REQUIRE(path == expected);
    REQUIRE(cost == Approx(300.0f));
}

TEST_CASE("FindPath respects one-way edges") {
    RoadNetwork network = MakeGridNetwork();
    std::vector<size_t> path;
    float cost = 0.0f;

    REQUIRE(FindPath(network, 4, 3, path, &cost));
    REQUIRE(path.size() == 2);
    REQUIRE(cost == Approx(100.0f));

    /* Against the one-way edge the truck has to go around */
    REQUIRE(FindPath(network, 3, 4, path, &cost));
    std::vector<size_t> expected;
    expected.push_back(3);
    expected.push_back(0);
    expected.push_back(1);
    expected.push_back(4);
    REQUIRE(path == expected);
    REQUIRE(cost == Approx(300.0f));
}

TEST_CASE("FindPath fails for unreachable or invalid goals") {
    RoadNetwork network = MakeGridNetwork();
    std::vector<size_t> path;

    REQUIRE_FALSE(FindPath(network, 0, 6, path));
    REQUIRE(path.empty());

    REQUIRE_FALSE(FindPath(network, 0, 42, path));

    network.isLoaded = false;
    REQUIRE_FALSE(FindPath(network, 0, 5, path));
}

TEST_CASE("FindPath from a node to itself") {
    RoadNetwork network = MakeGridNetwork();
    std::vector<size_t> path;
    float cost = -1.0f;
    REQUIRE(FindPath(network, 1, 1, path, &cost));
    REQUIRE(path.size() == 1);
    REQUIRE(cost == Approx(0.0f));
}

TEST_CASE("PlanDirectRoute interpolates toward the target") {
    PlannedRoute route = PlanDirectRoute(0.0, 0.0, 0.0, -95.0, 90.0f, 15.0f);

    REQUIRE(route.isValid);
    REQUIRE_FALSE(route.isCompleted);
    REQUIRE(route.currentWaypointIndex == 0);
    /* floor(95 / 30) + 2 */
    REQUIRE(route.waypoints.size() == 5);

    REQUIRE(route.waypoints.front().x == Approx(0.0));
    REQUIRE(route.waypoints.front().z == Approx(0.0));
    REQUIRE(route.waypoints.back().z == Approx(-95.0));

    for (size_t i = 0; i + 1 < route.waypoints.size(); ++i) {
        REQUIRE(route.waypoints[i].targetHeading == Approx(0.0f).margin(1e-4));
        REQUIRE(route.waypoints[i].speed == Approx(15.0f));
    }
    REQUIRE(route.waypoints.back().targetHeading == Approx(90.0f));
    REQUIRE(route.waypoints.back().speed == 0.0f);
}

TEST_CASE("PlanDirectRoute with no distance still has two waypoints") {
    PlannedRoute route = PlanDirectRoute(10.0, 10.0, 10.0, 10.0, 45.0f, 15.0f);
    REQUIRE(route.waypoints.size() == 2);
    REQUIRE(route.waypoints.back().targetHeading == Approx(45.0f));
}

static PathWaypoint Waypoint(double x, double z, float heading, float speed) {
    PathWaypoint wp;
    wp.x = x;
    wp.z = z;
    wp.targetHeading = heading;
    wp.speed = speed;
    wp.isSmoothed = false;
    return wp;
}

TEST_CASE("SmoothPath rounds long corners and keeps the endpoints") {
    PlannedRoute route;
    route.waypoints.push_back(Waypoint(0.0, 0.0, 0.0f, 10.0f));
    route.waypoints.push_back(Waypoint(0.0, -100.0, 90.0f, 10.0f));
    route.waypoints.push_back(Waypoint(100.0, -100.0, 135.0f, 0.0f));
    route.isValid = true;

    SmoothPath(route, 10.0f);

    REQUIRE(route.waypoints.size() == 5);
    REQUIRE(route.waypoints.front().x == Approx(0.0).margin(1e-9));
    REQUIRE(route.waypoints.front().z == Approx(0.0).margin(1e-9));
    REQUIRE(route.waypoints.back().x == Approx(100.0));
    REQUIRE(route.waypoints.back().z == Approx(-100.0));
    REQUIRE(route.waypoints.back().targetHeading == Approx(135.0f));

    const PathWaypoint& approach = route.waypoints[1];
    REQUIRE(approach.isSmoothed);
    REQUIRE(approach.z == Approx(-75.0));
    REQUIRE(approach.speed == Approx(7.0f));

    const PathWaypoint& apex = route.waypoints[2];
    REQUIRE_FALSE(apex.isSmoothed);
    REQUIRE(apex.z == Approx(-100.0));
    REQUIRE(apex.speed == Approx(5.0f));

    const PathWaypoint& exit = route.waypoints[3];
    REQUIRE(exit.isSmoothed);
    REQUIRE(exit.x == Approx(25.0));
    REQUIRE(exit.targetHeading == Approx(90.0f));
}

TEST_CASE("SmoothPath leaves short segments alone") {
    PlannedRoute route;
    route.waypoints.push_back(Waypoint(0.0, 0.0, 0.0f, 10.0f));
    route.waypoints.push_back(Waypoint(0.0, -10.0, 90.0f, 10.0f));
    route.waypoints.push_back(Waypoint(100.0, -10.0, 90.0f, 0.0f));

    SmoothPath(route, 10.0f);
    REQUIRE(route.waypoints.size() == 3);
}

TEST_CASE("PlanRouteToTarget goes start, road nodes, target") {
    RoadNetwork network = MakeGridNetwork();

    PlannedRoute route = PlanRouteToTarget(network, -10.0, 5.0, 210.0, -110.0, 270.0f, 12.0f);
    REQUIRE(route.isValid);

    std::vector<PathWaypoint> corners;
    for (size_t i = 0; i < route.waypoints.size(); ++i) {
        if (!route.waypoints[i].isSmoothed) {
            corners.push_back(route.waypoints[i]);
        }
    }

    /* start, nodes 0, 1, 4, 5, target */
    REQUIRE(corners.size() == 6);
    REQUIRE(corners[0].x == Approx(-10.0));
    REQUIRE(corners[0].z == Approx(5.0));
    REQUIRE(corners[1].x == Approx(0.0).margin(1e-9));
    REQUIRE(corners[2].x == Approx(100.0));
    REQUIRE(corners[2].z == Approx(0.0).margin(1e-9));
    REQUIRE(corners[3].x == Approx(100.0));
    REQUIRE(corners[3].z == Approx(-100.0));
    REQUIRE(corners[4].x == Approx(200.0));
    REQUIRE(corners[5].x == Approx(210.0));
    REQUIRE(corners[5].z == Approx(-110.0));

    REQUIRE(route.waypoints.back().targetHeading == Approx(270.0f));
    REQUIRE(route.waypoints.back().speed == 0.0f);

    /* Corners 1 and 4 are rounded */
    REQUIRE(route.waypoints.size() == 10);
}

TEST_CASE("PlanRouteToTarget falls back to a direct route") {
    RoadNetwork network = MakeGridNetwork();

    SECTION("unreachable goal") {
        PlannedRoute route = PlanRouteToTarget(network, 0.0, 0.0, 300.0, 5.0, 0.0f, 12.0f);
        REQUIRE(route.isValid);
        REQUIRE(route.waypoints.size() ==
                static_cast<size_t>(floorf(Distance2D(0.0, 0.0, 300.0, 5.0) / PATH_NODE_DISTANCE)) + 2);
        REQUIRE(route.waypoints.back().x == Approx(300.0));
    }

    SECTION("no network") {
        network.isLoaded = false;
        PlannedRoute route = PlanRouteToTarget(network, 0.0, 0.0, 0.0, -60.0, 0.0f, 12.0f);
        REQUIRE(route.isValid);
        REQUIRE(route.waypoints.size() == 4);
    }
}
