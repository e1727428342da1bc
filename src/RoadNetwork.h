/*
 * RoadNetwork.h - Road network data structures and apt.dat parsing
 *
 * This module parses X-Plane apt.dat files to extract the ground route
 * network of the airport nearest the aircraft, for fire truck navigation.
 */

#ifndef WATERARCH_ROADNETWORK_H
#define WATERARCH_ROADNETWORK_H

#include <istream>
#include <unordered_map>

#include "Common.h"
#include "HostServices.h"

/* apt.dat row codes used by the parser */
static const int APT_ROW_LAND_AIRPORT = 1;
static const int APT_ROW_SEAPLANE_BASE = 16;
static const int APT_ROW_HELIPORT = 17;
static const int APT_ROW_ROUTING_NETWORK = 1200;
static const int APT_ROW_ROUTING_NODE = 1201;
static const int APT_ROW_TAXI_EDGE = 1202;
static const int APT_ROW_SERVICE_EDGE = 1206;

/* Road network node (from apt.dat 1201 records) */
struct RoadNode {
    std::string name;        /* Node identifier (multi-word names joined with '_') */
    double lat;              /* Latitude in degrees */
    double lon;              /* Longitude in degrees */
    double x, z;             /* Local OpenGL coordinates (calculated) */
    std::string nodeType;    /* "both", "dest", "init", "junc" */
    std::vector<size_t> connectedEdges; /* Indices into edge array */
};

enum RoadEdgeKind {
    EDGE_TAXI,               /* 1202 taxi route */
    EDGE_SERVICE             /* 1206 ground truck route */
};

/* Road network edge (from apt.dat 1202/1206 records) */
struct RoadEdge {
    size_t node1Idx;         /* Index into nodes array */
    size_t node2Idx;         /* Index into nodes array */
    RoadEdgeKind kind;
    bool isOneWay;           /* Traversable only from node1 to node2 */
    bool isFireTruckRoute;   /* True if fire trucks may use this edge */
    float length;            /* Edge length in meters (calculated) */
    std::string surfaceType; /* "taxiway", "runway", "service_road", ... */
};

/* Road network for one airport */
struct RoadNetwork {
    std::string airportId;   /* ICAO code */
    double refLat, refLon;   /* Reference point for coordinate conversion */
    std::vector<RoadNode> nodes;
    std::vector<RoadEdge> edges;
    std::unordered_map<std::string, size_t> nodeNameToIndex; /* Fast lookup */
    bool isLoaded;

    RoadNetwork() : refLat(0.0), refLon(0.0), isLoaded(false) {}
};

/* Parsed 1201 record */
struct AptNodeRecord {
    double lat;
    double lon;
    std::string nodeType;
    std::string id;          /* First name token, referenced by edge records */
    std::string name;        /* id plus any trailing name tokens */
};

/* Parsed 1202 or 1206 record */
struct AptEdgeRecord {
    RoadEdgeKind kind;
    std::string fromName;
    std::string toName;
    bool isOneWay;
    bool hasSurfaceType;     /* 1202 only: optional surface column present */
    std::string surfaceType;
    std::vector<std::string> vehicleTypes; /* 1206 only: empty means any vehicle */
};

/* Coordinate conversion functions */
void LatLonToLocal(double lat, double lon, double refLat, double refLon, double& x, double& z);
void LocalToLatLon(double x, double z, double refLat, double refLon, double& lat, double& lon);

/* apt.dat parsing functions */
void ParseAptDatLine(const std::string& line, std::vector<std::string>& tokens);
bool ParseNodeRecord(const std::vector<std::string>& tokens, AptNodeRecord& record);
bool ParseEdgeRecord(const std::vector<std::string>& tokens, AptEdgeRecord& record);
bool IsFireTruckUsable(const AptEdgeRecord& record);

/* Network loading */
void ResetRoadNetwork(RoadNetwork& network);
bool SelectNearestAirport(std::istream& in, double acLat, double acLon, RoadNetwork& network);
void FinalizeRoadNetwork(RoadNetwork& network, CoordinateTransform& transform);
std::vector<std::string> GetDefaultAptDatPaths(const std::string& systemPath);
bool LoadAptDat(const std::vector<std::string>& aptDatPaths, double acLat, double acLon,
                CoordinateTransform& transform, RoadNetwork& network);

/* Queries */
size_t FindNearestNode(const RoadNetwork& network, double x, double z, bool firetruckRoutesOnly);

#endif /* WATERARCH_ROADNETWORK_H */
