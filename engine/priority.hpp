#pragma once
#include "models.hpp"
#include "config.hpp"

// Inclusion weight and skip penalty per priority tier, straight from config.
class PriorityModel {
public:
    explicit PriorityModel(const PriorityConfig& cfg) : cfg(cfg) {}

    double weight(Priority p) const;
    double penalty(Priority p) const;

private:
    PriorityConfig cfg;
};
