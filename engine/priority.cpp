#include "priority.hpp"

double PriorityModel::weight(Priority p) const {
    switch (p) {
        case Priority::HIGH:   return cfg.high_priority_weight;
        case Priority::MEDIUM: return cfg.medium_priority_weight;
        case Priority::LOW:    return cfg.low_priority_weight;
    }
    return cfg.low_priority_weight;
}

double PriorityModel::penalty(Priority p) const {
    switch (p) {
        case Priority::HIGH:   return cfg.penalty_missing_high_priority;
        case Priority::MEDIUM: return cfg.penalty_missing_medium_priority;
        case Priority::LOW:    return cfg.penalty_missing_low_priority;
    }
    return cfg.penalty_missing_low_priority;
}
