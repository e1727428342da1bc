/*
 * PathPlanning.h - Path planning with A* algorithm and Bezier smoothing
 *
 * This module handles pathfinding through the road network and
 * smooth path generation for natural truck movement.
 */

#ifndef WATERARCH_PATHPLANNING_H
#define WATERARCH_PATHPLANNING_H

#include "Common.h"
#include "RoadNetwork.h"

/* Path waypoint for truck navigation */
struct PathWaypoint {
    double x, z;             /* Local OpenGL coordinates */
    float targetHeading;     /* Desired heading when reaching this point */
    float speed;             /* Target speed at this waypoint */
    bool isSmoothed;         /* Whether this waypoint was added by corner smoothing */
};

/* Planned route for a truck */
struct PlannedRoute {
    std::vector<PathWaypoint> waypoints;
    size_t currentWaypointIndex;
    bool isValid;
    bool isCompleted;

    PlannedRoute() : currentWaypointIndex(0), isValid(false), isCompleted(false) {}
};

/* A* pathfinding node */
struct AStarNode {
    size_t nodeIndex;
    float gScore;            /* Cost from start to this node */
    float fScore;            /* gScore + heuristic estimate to goal */
    bool operator>(const AStarNode& other) const {
        return fScore > other.fScore;
    }
};

/* Path planning functions */
bool FindPath(const RoadNetwork& network, size_t startNode, size_t goalNode,
              std::vector<size_t>& path, float* pathCost = nullptr);
void ComputeWaypointHeadings(std::vector<PathWaypoint>& waypoints);
void SmoothPath(PlannedRoute& route, float cruiseSpeed);
PlannedRoute PlanDirectRoute(double startX, double startZ, double targetX, double targetZ,
                             float targetHeading, float cruiseSpeed);
PlannedRoute PlanRouteToTarget(const RoadNetwork& network,
                               double startX, double startZ, double targetX, double targetZ,
                               float targetHeading, float cruiseSpeed);

#endif /* WATERARCH_PATHPLANNING_H */
