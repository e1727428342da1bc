/*
 * RoadNetwork.cpp - Road network parsing and management
 */

#include "RoadNetwork.h"

#include <fstream>
#include <sstream>

/*
 * LatLonToLocal - Convert latitude/longitude to local planar coordinates
 * Uses simple equirectangular projection centered on reference point
 */
void LatLonToLocal(double lat, double lon, double refLat, double refLon, double& x, double& z) {
    double latRad = refLat * DEG_TO_RAD;
    /* X is East-West distance */
    x = (lon - refLon) * DEG_TO_RAD * EARTH_RADIUS_METERS * cos(latRad);
    /* Z in X-Plane is negative North, positive South */
    z = -(lat - refLat) * DEG_TO_RAD * EARTH_RADIUS_METERS;
}

/*
 * LocalToLatLon - Convert local planar coordinates to latitude/longitude
 */
void LocalToLatLon(double x, double z, double refLat, double refLon, double& lat, double& lon) {
    double latRad = refLat * DEG_TO_RAD;
    lon = refLon + x / (EARTH_RADIUS_METERS * cos(latRad)) * RAD_TO_DEG;
    lat = refLat - z / EARTH_RADIUS_METERS * RAD_TO_DEG;
}

/*
 * ParseAptDatLine - Split an apt.dat line into whitespace separated tokens
 */
void ParseAptDatLine(const std::string& line, std::vector<std::string>& tokens) {
    tokens.clear();
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
}

/* Parse a whole token as a number; false on any trailing garbage */
static bool ParseDouble(const std::string& token, double& value) {
    if (token.empty()) return false;
    char* end = nullptr;
    errno = 0;
    value = strtod(token.c_str(), &end);
    return errno == 0 && end != nullptr && *end == '\0';
}

static bool ParseInteger(const std::string& token, long& value) {
    if (token.empty()) return false;
    char* end = nullptr;
    errno = 0;
    value = strtol(token.c_str(), &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

/*
 * ParseNodeRecord - Parse a 1201 taxi routing node
 * Format: 1201 <lat> <lon> <usage> <id> [name tokens...]
 */
bool ParseNodeRecord(const std::vector<std::string>& tokens, AptNodeRecord& record) {
    if (tokens.size() < 5) {
        return false;
    }

    if (!ParseDouble(tokens[1], record.lat) || !ParseDouble(tokens[2], record.lon)) {
        DebugLogVerbose("ParseNodeRecord: Skipping node with bad coordinates '%s %s'",
                        tokens[1].c_str(), tokens[2].c_str());
        return false;
    }

    record.nodeType = tokens[3];
    record.id = tokens[4];
    record.name = tokens[4];
    /* For nodes with multi-word names, concatenate remaining tokens */
    for (size_t i = 5; i < tokens.size(); ++i) {
        record.name += "_" + tokens[i];
    }
    return true;
}

/*
 * ParseEdgeRecord - Parse a 1202 taxi edge or a 1206 ground truck edge
 * 1202 <from> <to> <oneway|twoway> [surface] [name]
 * 1206 <from> <to> <oneway|twoway> [truck types, comma separated]
 */
bool ParseEdgeRecord(const std::vector<std::string>& tokens, AptEdgeRecord& record) {
    if (tokens.size() < 4) {
        return false;
    }

    long rowCode = 0;
    if (!ParseInteger(tokens[0], rowCode)) {
        return false;
    }

    if (rowCode == APT_ROW_TAXI_EDGE) {
        record.kind = EDGE_TAXI;
    } else if (rowCode == APT_ROW_SERVICE_EDGE) {
        record.kind = EDGE_SERVICE;
    } else {
        return false;
    }

    record.fromName = tokens[1];
    record.toName = tokens[2];
    record.isOneWay = (tokens[3] == "oneway");
    record.hasSurfaceType = false;
    record.surfaceType.clear();
    record.vehicleTypes.clear();

    if (record.kind == EDGE_TAXI) {
        if (tokens.size() > 4) {
            record.hasSurfaceType = true;
            record.surfaceType = tokens[4];
        }
    } else if (tokens.size() > 4) {
        std::stringstream typeList(tokens[4]);
        std::string vehicleType;
        while (std::getline(typeList, vehicleType, ',')) {
            if (!vehicleType.empty()) {
                record.vehicleTypes.push_back(vehicleType);
            }
        }
    }
    return true;
}

/*
 * IsFireTruckUsable - Taxi routes are open to fire trucks; truck routes only
 * when they list fire_truck or list nothing (all trucks allowed)
 */
bool IsFireTruckUsable(const AptEdgeRecord& record) {
    if (record.kind == EDGE_TAXI) {
        return true;
    }
    if (record.vehicleTypes.empty()) {
        return true;
    }
    return std::find(record.vehicleTypes.begin(), record.vehicleTypes.end(),
                     std::string("fire_truck")) != record.vehicleTypes.end();
}

void ResetRoadNetwork(RoadNetwork& network) {
    network.airportId.clear();
    network.refLat = 0.0;
    network.refLon = 0.0;
    network.nodes.clear();
    network.edges.clear();
    network.nodeNameToIndex.clear();
    network.isLoaded = false;
}

/* Ground network of the airport currently being read */
struct AirportScratch {
    std::string airportId;
    double refLat, refLon;
    bool inAirport;
    bool inGroundNetwork;
    std::vector<RoadNode> nodes;
    std::vector<RoadEdge> edges;
    std::unordered_map<std::string, size_t> nodeNameToIndex;
};

static void ClearScratch(AirportScratch& scratch) {
    scratch.airportId.clear();
    scratch.refLat = 0.0;
    scratch.refLon = 0.0;
    scratch.inAirport = false;
    scratch.inGroundNetwork = false;
    scratch.nodes.clear();
    scratch.edges.clear();
    scratch.nodeNameToIndex.clear();
}

static void AddNode(AirportScratch& scratch, const AptNodeRecord& record) {
    /* First node is the airport reference point */
    if (scratch.nodes.empty()) {
        scratch.refLat = record.lat;
        scratch.refLon = record.lon;
    }

    RoadNode node;
    node.name = record.name;
    node.lat = record.lat;
    node.lon = record.lon;
    node.x = 0.0;
    node.z = 0.0;
    node.nodeType = record.nodeType;

    size_t index = scratch.nodes.size();
    scratch.nodeNameToIndex[node.name] = index;
    /* Edges reference nodes by their id column */
    if (record.id != record.name && scratch.nodeNameToIndex.find(record.id) == scratch.nodeNameToIndex.end()) {
        scratch.nodeNameToIndex[record.id] = index;
    }
    scratch.nodes.push_back(node);
}

static void AddEdge(AirportScratch& scratch, const AptEdgeRecord& record) {
    std::unordered_map<std::string, size_t>::const_iterator it1 = scratch.nodeNameToIndex.find(record.fromName);
    std::unordered_map<std::string, size_t>::const_iterator it2 = scratch.nodeNameToIndex.find(record.toName);
    if (it1 == scratch.nodeNameToIndex.end() || it2 == scratch.nodeNameToIndex.end()) {
        DebugLogVerbose("AddEdge: Unknown node in edge %s -> %s",
                        record.fromName.c_str(), record.toName.c_str());
        return;
    }

    RoadEdge edge;
    edge.node1Idx = it1->second;
    edge.node2Idx = it2->second;
    edge.kind = record.kind;
    edge.isOneWay = record.isOneWay;
    edge.isFireTruckRoute = IsFireTruckUsable(record);
    edge.length = 0.0f;  /* Calculated after coordinate conversion */
    if (record.kind == EDGE_SERVICE) {
        edge.surfaceType = "service_road";
    } else {
        edge.surfaceType = record.hasSurfaceType ? record.surfaceType : "taxiway";
    }

    size_t edgeIndex = scratch.edges.size();
    scratch.nodes[edge.node1Idx].connectedEdges.push_back(edgeIndex);
    if (!edge.isOneWay) {
        scratch.nodes[edge.node2Idx].connectedEdges.push_back(edgeIndex);
    }
    scratch.edges.push_back(edge);
}

/* Keep the airport just read if it is the closest one with a ground network so far */
static bool ConsiderAirport(AirportScratch& scratch, double acLat, double acLon,
                            double& bestDistance, RoadNetwork& network) {
    if (!scratch.inAirport || !scratch.inGroundNetwork || scratch.nodes.empty()) {
        return false;
    }

    double dx, dz;
    LatLonToLocal(acLat, acLon, scratch.refLat, scratch.refLon, dx, dz);
    double dist = sqrt(dx * dx + dz * dz);
    if (dist >= bestDistance) {
        return false;
    }

    bestDistance = dist;
    network.airportId = scratch.airportId;
    network.refLat = scratch.refLat;
    network.refLon = scratch.refLon;
    network.nodes.swap(scratch.nodes);
    network.edges.swap(scratch.edges);
    network.nodeNameToIndex.swap(scratch.nodeNameToIndex);

    DebugLogVerbose("ConsiderAirport: %s is the best candidate so far (%.0f m)",
                    network.airportId.c_str(), dist);
    return true;
}

/*
 * SelectNearestAirport - Stream an apt.dat file and keep the ground network
 * of the nearest airport within ROAD_SEARCH_RADIUS
 *
 * Only one airport's graph is buffered at a time: the candidate is judged
 * when the next airport header (or the end of the stream) is reached.
 * Node coordinates are left unconverted; see FinalizeRoadNetwork.
 */
bool SelectNearestAirport(std::istream& in, double acLat, double acLon, RoadNetwork& network) {
    AirportScratch scratch;
    ClearScratch(scratch);

    double bestDistance = ROAD_SEARCH_RADIUS;
    bool foundNearbyAirport = false;

    std::string line;
    std::vector<std::string> tokens;
    AptNodeRecord nodeRecord;
    AptEdgeRecord edgeRecord;

    while (std::getline(in, line)) {
        ParseAptDatLine(line, tokens);
        if (tokens.empty()) continue;

        long rowCode = 0;
        if (!ParseInteger(tokens[0], rowCode)) continue;

        if (rowCode == APT_ROW_LAND_AIRPORT || rowCode == APT_ROW_SEAPLANE_BASE ||
            rowCode == APT_ROW_HELIPORT) {
            if (ConsiderAirport(scratch, acLat, acLon, bestDistance, network)) {
                foundNearbyAirport = true;
            }

            /* Reset for new airport */
            ClearScratch(scratch);
            scratch.inAirport = true;
            if (tokens.size() >= 5) {
                scratch.airportId = tokens[4];
            }
            continue;
        }

        if (!scratch.inAirport) continue;

        if (rowCode == APT_ROW_ROUTING_NETWORK) {
            scratch.inGroundNetwork = true;
            continue;
        }

        if (!scratch.inGroundNetwork) continue;

        if (rowCode == APT_ROW_ROUTING_NODE) {
            if (ParseNodeRecord(tokens, nodeRecord)) {
                AddNode(scratch, nodeRecord);
            }
        } else if (rowCode == APT_ROW_TAXI_EDGE || rowCode == APT_ROW_SERVICE_EDGE) {
            if (ParseEdgeRecord(tokens, edgeRecord)) {
                AddEdge(scratch, edgeRecord);
            }
        }
    }

    /* Check final airport if any */
    if (ConsiderAirport(scratch, acLat, acLon, bestDistance, network)) {
        foundNearbyAirport = true;
    }

    return foundNearbyAirport;
}

/*
 * FinalizeRoadNetwork - Convert node positions with the host transform and
 * recompute every edge length from the resulting planar coordinates
 */
void FinalizeRoadNetwork(RoadNetwork& network, CoordinateTransform& transform) {
    for (size_t i = 0; i < network.nodes.size(); ++i) {
        RoadNode& node = network.nodes[i];
        double outY;
        transform.WorldToLocal(node.lat, node.lon, 0.0, node.x, outY, node.z);
    }

    for (size_t i = 0; i < network.edges.size(); ++i) {
        RoadEdge& edge = network.edges[i];
        const RoadNode& n1 = network.nodes[edge.node1Idx];
        const RoadNode& n2 = network.nodes[edge.node2Idx];
        edge.length = Distance2D(n1.x, n1.z, n2.x, n2.z);
    }

    network.isLoaded = true;
}

/* Standard apt.dat locations for X-Plane 11/12, in search order */
std::vector<std::string> GetDefaultAptDatPaths(const std::string& systemPath) {
    std::vector<std::string> paths;
    paths.push_back(systemPath + "Resources/default scenery/default apt data/Earth nav data/apt.dat");
    paths.push_back(systemPath + "Custom Scenery/Global Airports/Earth nav data/apt.dat");
    paths.push_back(systemPath + "Resources/default data/apt.dat");
    return paths;
}

/*
 * LoadAptDat - Load the ground routes of the airport nearest the aircraft
 *
 * The network is reset first. Candidate files are scanned in order and the
 * first one holding a qualifying airport is used. Returns false when no
 * airport with a ground network lies within ROAD_SEARCH_RADIUS.
 */
bool LoadAptDat(const std::vector<std::string>& aptDatPaths, double acLat, double acLon,
                CoordinateTransform& transform, RoadNetwork& network) {
    DebugLog("LoadAptDat: Searching for airport near (%.6f, %.6f)", acLat, acLon);

    ResetRoadNetwork(network);

    for (size_t i = 0; i < aptDatPaths.size(); ++i) {
        const std::string& path = aptDatPaths[i];
        std::ifstream aptFile(path.c_str());
        if (!aptFile.is_open()) {
            DebugLogVerbose("LoadAptDat: Cannot open %s", path.c_str());
            continue;
        }

        DebugLog("LoadAptDat: Scanning %s", path.c_str());
        if (!SelectNearestAirport(aptFile, acLat, acLon, network)) {
            continue;
        }

        FinalizeRoadNetwork(network, transform);
        DebugLog("LoadAptDat: Loaded airport %s with %zu nodes and %zu edges",
                 network.airportId.c_str(), network.nodes.size(), network.edges.size());
        return true;
    }

    DebugLog("LoadAptDat: No nearby airport with ground routes found");
    return false;
}

/*
 * FindNearestNode - Find the nearest road network node to a given position
 * Returns SIZE_MAX when the network is empty or no node qualifies.
 */
size_t FindNearestNode(const RoadNetwork& network, double x, double z, bool firetruckRoutesOnly) {
    if (!network.isLoaded || network.nodes.empty()) {
        return SIZE_MAX;
    }

    size_t bestIndex = SIZE_MAX;
    float bestDist = std::numeric_limits<float>::max();

    for (size_t i = 0; i < network.nodes.size(); ++i) {
        const RoadNode& node = network.nodes[i];

        /* Node must touch at least one fire truck route */
        if (firetruckRoutesOnly) {
            bool hasFiretruckRoute = false;
            for (size_t j = 0; j < node.connectedEdges.size(); ++j) {
                if (network.edges[node.connectedEdges[j]].isFireTruckRoute) {
                    hasFiretruckRoute = true;
                    break;
                }
            }
            if (!hasFiretruckRoute) continue;
        }

        float dist = Distance2D(x, z, node.x, node.z);
        if (dist < bestDist) {
            bestDist = dist;
            bestIndex = i;
        }
    }

    return bestIndex;
}
