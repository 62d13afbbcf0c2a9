#include "project_record.hpp"
#include <sstream>

std::string toString(VcsStatus status) {
    return status == VcsStatus::Clean ? "clean" : "dirty";
}

std::string toString(RemoteSyncStatus status) {
    switch (status) {
        case RemoteSyncStatus::Clean:
            return "clean";
        case RemoteSyncStatus::Dirty:
            return "dirty";
        case RemoteSyncStatus::Unknown:
            break;
    }
    return "unknown";
}

std::string toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Warning:
            return "warning";
        case HealthStatus::Unhealthy:
            break;
    }
    return "unhealthy";
}

int DependencyInfo::totalCount() const {
    int total = 0;
    for (const auto& [ecosystem, count] : counts) {
        total += count;
    }
    return total;
}

std::string DependencyInfo::summary() const {
    if (!hasDependencies) {
        return "No dependencies found";
    }

    std::stringstream ss;
    for (size_t i = 0; i < details.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << details[i];
    }
    return ss.str();
}
