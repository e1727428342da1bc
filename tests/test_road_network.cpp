#include <catch2/catch.hpp>

#include <sstream>

#include "FakeHost.h"
#include "RoadNetwork.h"

static const char* const kTwoAirports =
    "I\n"
    "1100 Generated apt.dat\n"
    "\n"
    "1 433 1 0 KAAA Alpha Field\n"
    "1200\n"
    "1201 47.0000 8.0000 both 0 north gate\n"
    "1201 47.0000 8.0010 both 1\n"
    "1201 47.0010 8.0010 junc 2\n"
    "1201 47.0x 8.0020 both 9\n"
    "1202 0 1 twoway taxiway_E A\n"
    "1202 1 2 oneway runway\n"
    "1206 0 2 twoway baggage_truck\n"
    "1202 1 9 twoway taxiway\n"
    "1 500 1 0 KBBB Bravo\n"
    "1200\n"
    "1201 47.1000 8.1000 both 0\n"
    "1201 47.1000 8.1010 both 1\n"
    "1202 0 1 twoway\n"
    "99\n";

static std::vector<std::string> Tokens(const std::string& line) {
    std::vector<std::string> tokens;
    ParseAptDatLine(line, tokens);
    return tokens;
}

TEST_CASE("ParseAptDatLine splits on any whitespace") {
    std::vector<std::string> tokens = Tokens("  1201\t47.5  8.25 both   12  ");
    REQUIRE(tokens.size() == 5);
    REQUIRE(tokens[0] == "1201");
    REQUIRE(tokens[4] == "12");
    REQUIRE(Tokens("").empty());
}

TEST_CASE("ParseNodeRecord reads routing nodes") {
    AptNodeRecord record;

    SECTION("single token name") {
        REQUIRE(ParseNodeRecord(Tokens("1201 47.25 -122.5 dest 42"), record));
        REQUIRE(record.lat == Approx(47.25));
        REQUIRE(record.lon == Approx(-122.5));
        REQUIRE(record.nodeType == "dest");
        REQUIRE(record.id == "42");
        REQUIRE(record.name == "42");
    }

    SECTION("multi-token names are joined with underscores") {
        REQUIRE(ParseNodeRecord(Tokens("1201 47.25 8.5 both 7 fire station exit"), record));
        REQUIRE(record.id == "7");
        REQUIRE(record.name == "7_fire_station_exit");
    }

    SECTION("short or malformed records are rejected") {
        REQUIRE_FALSE(ParseNodeRecord(Tokens("1201 47.25 8.5 both"), record));
        REQUIRE_FALSE(ParseNodeRecord(Tokens("1201 abc 8.5 both 1"), record));
        REQUIRE_FALSE(ParseNodeRecord(Tokens("1201 47.25 8.5e both 1"), record));
    }
}

TEST_CASE("ParseEdgeRecord reads taxi and truck edges") {
    AptEdgeRecord record;

    SECTION("taxi edge with surface") {
        REQUIRE(ParseEdgeRecord(Tokens("1202 3 4 oneway runway 16/34"), record));
        REQUIRE(record.kind == EDGE_TAXI);
        REQUIRE(record.fromName == "3");
        REQUIRE(record.toName == "4");
        REQUIRE(record.isOneWay);
        REQUIRE(record.hasSurfaceType);
        REQUIRE(record.surfaceType == "runway");
        REQUIRE(IsFireTruckUsable(record));
    }

    SECTION("taxi edge without surface") {
        REQUIRE(ParseEdgeRecord(Tokens("1202 3 4 twoway"), record));
        REQUIRE_FALSE(record.isOneWay);
        REQUIRE_FALSE(record.hasSurfaceType);
    }

    SECTION("truck edge vehicle permissions") {
        REQUIRE(ParseEdgeRecord(Tokens("1206 1 2 twoway"), record));
        REQUIRE(record.kind == EDGE_SERVICE);
        REQUIRE(record.vehicleTypes.empty());
        REQUIRE(IsFireTruckUsable(record));

        REQUIRE(ParseEdgeRecord(Tokens("1206 1 2 twoway baggage_truck,fire_truck"), record));
        REQUIRE(record.vehicleTypes.size() == 2);
        REQUIRE(IsFireTruckUsable(record));

        REQUIRE(ParseEdgeRecord(Tokens("1206 1 2 twoway baggage_truck,fuel_jet"), record));
        REQUIRE_FALSE(IsFireTruckUsable(record));
    }

    SECTION("other rows and short rows are rejected") {
        REQUIRE_FALSE(ParseEdgeRecord(Tokens("1204 departure 16L"), record));
        REQUIRE_FALSE(ParseEdgeRecord(Tokens("1202 3 4"), record));
    }
}

TEST_CASE("LatLonToLocal places north at -Z and east at +X") {
    double x, z;
    LatLonToLocal(47.001, 8.0, 47.0, 8.0, x, z);
    REQUIRE(x == Approx(0.0).margin(1e-9));
    REQUIRE(z == Approx(-111.19).epsilon(0.001));

    LatLonToLocal(47.0, 8.001, 47.0, 8.0, x, z);
    REQUIRE(x > 0.0);
    REQUIRE(z == Approx(0.0).margin(1e-9));

    double lat, lon;
    LocalToLatLon(x, z, 47.0, 8.0, lat, lon);
    REQUIRE(lat == Approx(47.0));
    REQUIRE(lon == Approx(8.001));
}

TEST_CASE("SelectNearestAirport keeps the closest airport with a ground network") {
    RoadNetwork network;

    SECTION("aircraft at the first airport") {
        std::istringstream in(kTwoAirports);
        REQUIRE(SelectNearestAirport(in, 47.0005, 8.0005, network));
        REQUIRE(network.airportId == "KAAA");
        REQUIRE(network.refLat == Approx(47.0));
        REQUIRE(network.refLon == Approx(8.0));
        /* The node with bad coordinates is dropped along with its edge */
        REQUIRE(network.nodes.size() == 3);
        REQUIRE(network.edges.size() == 3);
        REQUIRE(network.nodes[0].name == "0_north_gate");
        REQUIRE(network.nodeNameToIndex.count("0") == 1);
        REQUIRE(network.nodeNameToIndex.count("9") == 0);
    }

    SECTION("aircraft at the second airport") {
        std::istringstream in(kTwoAirports);
        REQUIRE(SelectNearestAirport(in, 47.1, 8.1005, network));
        REQUIRE(network.airportId == "KBBB");
        REQUIRE(network.nodes.size() == 2);
        REQUIRE(network.edges.size() == 1);
        REQUIRE(network.edges[0].surfaceType == "taxiway");
    }

    SECTION("nothing within the search radius") {
        std::istringstream in(kTwoAirports);
        REQUIRE_FALSE(SelectNearestAirport(in, 48.0, 9.0, network));
        REQUIRE(network.nodes.empty());
    }
}

TEST_CASE("Edges are wired by direction and permission") {
    std::istringstream in(kTwoAirports);
    RoadNetwork network;
    REQUIRE(SelectNearestAirport(in, 47.0, 8.0, network));

    const RoadEdge& oneWay = network.edges[1];
    REQUIRE(oneWay.isOneWay);
    REQUIRE(oneWay.surfaceType == "runway");

    const RoadEdge& service = network.edges[2];
    REQUIRE(service.kind == EDGE_SERVICE);
    REQUIRE(service.surfaceType == "service_road");
    REQUIRE_FALSE(service.isFireTruckRoute);

    /* One-way edges are only listed at their origin */
    REQUIRE(network.nodes[1].connectedEdges.size() == 2);
    REQUIRE(network.nodes[2].connectedEdges.size() == 1);
    REQUIRE(network.nodes[2].connectedEdges[0] == 2);
}

TEST_CASE("FinalizeRoadNetwork converts nodes and recomputes edge lengths") {
    std::istringstream in(kTwoAirports);
    RoadNetwork network;
    REQUIRE(SelectNearestAirport(in, 47.0, 8.0, network));

    FakeTransform transform;
    transform.originLat = 47.0;
    transform.originLon = 8.0;
    FinalizeRoadNetwork(network, transform);

    REQUIRE(network.isLoaded);
    REQUIRE(network.nodes[0].x == Approx(0.0).margin(1e-6));
    REQUIRE(network.nodes[0].z == Approx(0.0).margin(1e-6));
    REQUIRE(network.nodes[2].z == Approx(-111.19).epsilon(0.001));

    for (size_t i = 0; i < network.edges.size(); ++i) {
        const RoadEdge& edge = network.edges[i];
        const RoadNode& a = network.nodes[edge.node1Idx];
        const RoadNode& b = network.nodes[edge.node2Idx];
        REQUIRE(edge.length == Approx(Distance2D(a.x, a.z, b.x, b.z)));
        REQUIRE(edge.length > 0.0f);
    }
}

static RoadNetwork MakeLineNetwork() {
    RoadNetwork network;
    const double xs[] = {0.0, 100.0, 200.0};
    for (int i = 0; i < 3; ++i) {
        RoadNode node;
        node.name = std::to_string(i);
        node.lat = node.lon = 0.0;
        node.x = xs[i];
        node.z = 0.0;
        node.nodeType = "both";
        network.nodeNameToIndex[node.name] = network.nodes.size();
        network.nodes.push_back(node);
    }
    RoadEdge edge;
    edge.node1Idx = 1;
    edge.node2Idx = 2;
    edge.kind = EDGE_TAXI;
    edge.isOneWay = false;
    edge.isFireTruckRoute = true;
    edge.length = 100.0f;
    edge.surfaceType = "taxiway";
    network.edges.push_back(edge);
    network.nodes[1].connectedEdges.push_back(0);
    network.nodes[2].connectedEdges.push_back(0);
    network.isLoaded = true;
    return network;
}

TEST_CASE("FindNearestNode") {
    RoadNetwork network = MakeLineNetwork();

    SECTION("plain nearest") {
        REQUIRE(FindNearestNode(network, 10.0, 5.0, false) == 0);
        REQUIRE(FindNearestNode(network, 180.0, 0.0, false) == 2);
    }

    SECTION("restricted to nodes on a fire truck route") {
        /* Node 0 has no edges at all */
        REQUIRE(FindNearestNode(network, 10.0, 5.0, true) == 1);
    }

    SECTION("ties go to the lowest index") {
        REQUIRE(FindNearestNode(network, 50.0, 0.0, false) == 0);
        REQUIRE(FindNearestNode(network, 150.0, 0.0, true) == 1);
    }

    SECTION("empty or unloaded network") {
        RoadNetwork empty;
        REQUIRE(FindNearestNode(empty, 0.0, 0.0, false) == SIZE_MAX);
        network.isLoaded = false;
        REQUIRE(FindNearestNode(network, 0.0, 0.0, false) == SIZE_MAX);
    }
}

TEST_CASE("GetDefaultAptDatPaths lists the standard locations in order") {
    std::vector<std::string> paths = GetDefaultAptDatPaths("/xp/");
    REQUIRE(paths.size() == 3);
    REQUIRE(paths[0] == "/xp/Resources/default scenery/default apt data/Earth nav data/apt.dat");
    REQUIRE(paths[1] == "/xp/Custom Scenery/Global Airports/Earth nav data/apt.dat");
    REQUIRE(paths[2] == "/xp/Resources/default data/apt.dat");
}

TEST_CASE("LoadAptDat skips missing files and resets the network") {
    FakeTransform transform;
    RoadNetwork network = MakeLineNetwork();
    std::vector<std::string> paths;
    paths.push_back("/nonexistent/waterarch/apt.dat");

    REQUIRE_FALSE(LoadAptDat(paths, 47.0, 8.0, transform, network));
    REQUIRE_FALSE(network.isLoaded);
    REQUIRE(network.nodes.empty());
}
