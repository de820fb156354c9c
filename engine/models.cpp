#include "models.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>

using namespace std;

bool parse_time_of_day(const string& text, int& minutes) {
    size_t colon = text.find(':');
    if (colon == string::npos || colon == 0 || colon > 2) return false;
    if (text.size() - colon - 1 != 2) return false;

    for (size_t i = 0; i < text.size(); i++) {
        if (i != colon && !isdigit(static_cast<unsigned char>(text[i]))) return false;
    }

    int h = stoi(text.substr(0, colon));
    int m = stoi(text.substr(colon + 1));
    if (h > 23 || m > 59) return false;

    minutes = h * 60 + m;
    return true;
}

string format_time_of_day(double minutes) {
    int total = static_cast<int>(floor(minutes));
    if (total < 0) total = 0;
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d", total / 60, total % 60);
    return buf;
}

string to_string(OptimizeBy mode) {
    switch (mode) {
        case OptimizeBy::DISTANCE: return "distance";
        case OptimizeBy::TIME:     return "time";
        case OptimizeBy::PRIORITY: return "priority";
    }
    return "priority";
}

bool parse_optimize_by(const string& text, OptimizeBy& mode) {
    if (text == "distance") mode = OptimizeBy::DISTANCE;
    else if (text == "time") mode = OptimizeBy::TIME;
    else if (text == "priority") mode = OptimizeBy::PRIORITY;
    else return false;
    return true;
}

string to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::NONE:                  return "none";
        case SkipReason::TIME_WINDOW_VIOLATED:  return "time_window_violated";
        case SkipReason::MAX_DISTANCE_EXCEEDED: return "max_distance_exceeded";
        case SkipReason::MAX_TIME_EXCEEDED:     return "max_time_exceeded";
        case SkipReason::RETURN_INFEASIBLE:     return "return_infeasible";
        case SkipReason::NOT_BENEFICIAL:        return "not_beneficial";
    }
    return "none";
}

bool priority_from_int(int value, Priority& priority) {
    if (value < 1 || value > 3) return false;
    priority = static_cast<Priority>(value);
    return true;
}
