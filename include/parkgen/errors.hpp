#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace parkgen {

enum class ErrorKind {
    kInfeasibleGeometry = 0,
    kNoValidFrontage = 1,
    kPlacementInfeasible = 2,
    kCyclicDependency = 3,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kInfeasibleGeometry:
        return "InfeasibleGeometry";
    case ErrorKind::kNoValidFrontage:
        return "NoValidFrontage";
    case ErrorKind::kPlacementInfeasible:
        return "PlacementInfeasible";
    case ErrorKind::kCyclicDependency:
        return "CyclicDependency";
    }
    return "Unknown";
}

// Base error for planning failures; callers can catch by kind or by subclass.
class PlanningError : public std::runtime_error {
public:
    PlanningError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Buildable region is empty or degenerate.
class InfeasibleGeometry : public PlanningError {
public:
    explicit InfeasibleGeometry(const std::string& msg) : PlanningError(ErrorKind::kInfeasibleGeometry, msg) {}
};

// No boundary edge can host an entrance.
class NoValidFrontage : public PlanningError {
public:
    explicit NoValidFrontage(const std::string& msg) : PlanningError(ErrorKind::kNoValidFrontage, msg) {}
};

// The work-package graph has a cycle (internal fault).
class CyclicDependency : public PlanningError {
public:
    explicit CyclicDependency(const std::string& msg) : PlanningError(ErrorKind::kCyclicDependency, msg) {}
};

}  // namespace parkgen
