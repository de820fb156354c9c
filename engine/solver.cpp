#include "solver.hpp"
#include "feasibility.hpp"
#include "scoring.hpp"
#include <algorithm>
#include <chrono>
#include <vector>
using namespace std;

namespace {

const double EPS = 1e-9;

struct SearchContext {
    const RouteRequest& req;
    const FeasibilityChecker& checker;
    const PriorityModel& priorities;
    OptimizeBy mode;
};

int count_high(const SearchContext& ctx, const vector<int>& order) {
    int n = 0;
    for (int idx : order)
        if (ctx.req.deliveries[idx].priority == Priority::HIGH) n++;
    return n;
}

vector<bool> routed_mask(const SearchContext& ctx, const vector<int>& order) {
    vector<bool> routed(ctx.req.deliveries.size(), false);
    for (int idx : order) routed[idx] = true;
    return routed;
}

// Unrouted deliveries, most urgent tier first.
vector<int> unrouted(const SearchContext& ctx, const vector<int>& order) {
    vector<bool> routed = routed_mask(ctx, order);
    vector<int> out;
    for (int i = 0; i < (int)routed.size(); i++)
        if (!routed[i]) out.push_back(i);

    const auto& ds = ctx.req.deliveries;
    stable_sort(out.begin(), out.end(), [&](int a, int b) {
        if (ds[a].priority != ds[b].priority) return ds[a].priority < ds[b].priority;
        return ds[a].window.end < ds[b].window.end;
    });
    return out;
}

double skip_penalty(const SearchContext& ctx, const vector<int>& order) {
    vector<bool> routed = routed_mask(ctx, order);
    double penalty = 0.0;
    for (size_t i = 0; i < routed.size(); i++)
        if (!routed[i]) penalty += ctx.priorities.penalty(ctx.req.deliveries[i].priority);
    return penalty;
}

bool try_order(const SearchContext& ctx, const vector<int>& order, Objective& obj) {
    RouteEvaluation ev = ctx.checker.evaluate_route(order);
    if (!ev.feasible) return false;
    obj.penalty = skip_penalty(ctx, order);
    obj.cost = route_cost(ctx.mode, ctx.priorities, ctx.req, order, ev);
    return true;
}

vector<int> construct_route(const SearchContext& ctx) {
    size_t n = ctx.req.deliveries.size();
    vector<bool> routed(n, false);
    vector<int> order;
    RouteState state = ctx.checker.start_state();

    while (order.size() < n) {
        bool found = false;
        Candidate best{};
        RouteState best_next{};

        for (int i = 0; i < (int)n; i++) {
            if (routed[i]) continue;
            Admission a = ctx.checker.check(state, i);
            if (!a.admitted) continue;  // deferred, the improvement phase retries it

            const Delivery& d = ctx.req.deliveries[i];
            Candidate c{i, construction_score(ctx.mode, ctx.priorities, d.priority, a),
                        a.leg_distance_km, d.window.end};
            if (!found || better_candidate(ctx.mode, c, best)) {
                best = c;
                best_next = a.next;
                found = true;
            }
        }

        if (!found) break;
        order.push_back(best.delivery_index);
        routed[best.delivery_index] = true;
        state = best_next;
    }
    return order;
}

// Best feasible position for `idx` in `order`; -1 if there is none.
int best_insertion(const SearchContext& ctx, const vector<int>& order, int idx,
                   const RouteEvaluation& ev, Objective& best_obj) {
    const Delivery& d = ctx.req.deliveries[idx];
    int best_pos = -1;

    for (size_t pos = 0; pos <= order.size(); pos++) {
        // lower bound on arrival; by the triangle inequality later positions cannot beat it
        double depart = pos == 0 ? ctx.req.pickup.window.start : ev.stops[pos - 1].departure;
        int from = pos == 0 ? 0 : node_of(order[pos - 1]);
        if (depart + ctx.checker.leg_minutes(from, node_of(idx)) > d.window.end + EPS) break;

        vector<int> cand = order;
        cand.insert(cand.begin() + pos, idx);
        Objective obj{};
        if (!try_order(ctx, cand, obj)) continue;
        if (best_pos == -1 || improves(obj, best_obj)) {
            best_obj = obj;
            best_pos = (int)pos;
        }
    }
    return best_pos;
}

bool insert_move(const SearchContext& ctx, vector<int>& order, Objective& current) {
    RouteEvaluation ev = ctx.checker.evaluate_route(order);
    for (int idx : unrouted(ctx, order)) {
        Objective obj{};
        int pos = best_insertion(ctx, order, idx, ev, obj);
        if (pos >= 0 && improves(obj, current)) {
            order.insert(order.begin() + pos, idx);
            current = obj;
            return true;
        }
    }
    return false;
}

bool exchange_move(const SearchContext& ctx, vector<int>& order, Objective& current) {
    int high_before = count_high(ctx, order);

    for (int idx : unrouted(ctx, order)) {
        double gain = ctx.priorities.penalty(ctx.req.deliveries[idx].priority);
        for (size_t r = 0; r < order.size(); r++) {
            if (ctx.priorities.penalty(ctx.req.deliveries[order[r]].priority) >= gain - EPS)
                continue;

            vector<int> reduced = order;
            reduced.erase(reduced.begin() + r);
            RouteEvaluation ev = ctx.checker.evaluate_route(reduced);
            if (!ev.feasible) continue;

            Objective obj{};
            int pos = best_insertion(ctx, reduced, idx, ev, obj);
            if (pos < 0 || !improves(obj, current)) continue;

            reduced.insert(reduced.begin() + pos, idx);
            if (count_high(ctx, reduced) < high_before) continue;

            order = reduced;
            current = obj;
            return true;
        }
    }
    return false;
}

bool accept_if_better(const SearchContext& ctx, vector<int>& order, const vector<int>& cand,
                      Objective& current) {
    Objective obj{};
    if (!try_order(ctx, cand, obj) || !improves(obj, current)) return false;
    order = cand;
    current = obj;
    return true;
}

bool relocate_move(const SearchContext& ctx, vector<int>& order, Objective& current) {
    int n = order.size();
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            if (i == j) continue;
            vector<int> cand = order;
            int idx = cand[i];
            cand.erase(cand.begin() + i);
            cand.insert(cand.begin() + j, idx);
            if (accept_if_better(ctx, order, cand, current)) return true;
        }
    }
    return false;
}

bool swap_move(const SearchContext& ctx, vector<int>& order, Objective& current) {
    int n = order.size();
    for (int i = 0; i < n - 1; i++) {
        for (int j = i + 1; j < n; j++) {
            vector<int> cand = order;
            swap(cand[i], cand[j]);
            if (accept_if_better(ctx, order, cand, current)) return true;
        }
    }
    return false;
}

bool two_opt_move(const SearchContext& ctx, vector<int>& order, Objective& current) {
    int n = order.size();
    if (n < 3) return false;
    for (int i = 0; i < n - 2; i++) {
        for (int j = i + 2; j < n; j++) {
            vector<int> cand = order;
            reverse(cand.begin() + i, cand.begin() + j + 1);
            if (accept_if_better(ctx, order, cand, current)) return true;
        }
    }
    return false;
}

int improve_route(const SearchContext& ctx, vector<int>& order, int max_iterations) {
    Objective current{};
    if (!try_order(ctx, order, current)) return 0;

    int iterations = 0;
    while (iterations < max_iterations) {
        bool improved = insert_move(ctx, order, current) ||
                        exchange_move(ctx, order, current) ||
                        relocate_move(ctx, order, current) ||
                        swap_move(ctx, order, current) ||
                        two_opt_move(ctx, order, current);
        if (!improved) break;
        iterations++;
    }
    return iterations;
}

// Constraints are checked in this order, so a later one means the attempt got further.
int stage_of(SkipReason reason) {
    switch (reason) {
        case SkipReason::TIME_WINDOW_VIOLATED:  return 1;
        case SkipReason::MAX_DISTANCE_EXCEEDED: return 2;
        case SkipReason::MAX_TIME_EXCEEDED:     return 3;
        case SkipReason::RETURN_INFEASIBLE:     return 4;
        case SkipReason::NONE:                  return 5;
        case SkipReason::NOT_BENEFICIAL:        return 5;
    }
    return 0;
}

SkipReason diagnose_skip(const SearchContext& ctx, const vector<int>& order, int idx) {
    SkipReason best = SkipReason::NONE;
    int best_stage = 0;
    for (size_t pos = 0; pos <= order.size(); pos++) {
        vector<int> cand = order;
        cand.insert(cand.begin() + pos, idx);
        RouteEvaluation ev = ctx.checker.evaluate_route(cand);
        int stage = stage_of(ev.reason);
        if (stage > best_stage) {
            best_stage = stage;
            best = ev.reason;
        }
    }
    return best;
}

}  // namespace

HeuristicSolver::HeuristicSolver(const EngineConfig& cfg) : cfg(cfg), priorities(cfg.priority) {}

SolvedRoute HeuristicSolver::search(const RouteRequest& request) const {
    FeasibilityChecker checker(request, cfg.routing);
    SearchContext ctx{request, checker, priorities, request.settings.optimize_by};

    SolvedRoute solved{};
    solved.method = ctx.mode;
    solved.order = construct_route(ctx);
    solved.iterations = improve_route(ctx, solved.order, cfg.max_improvement_iterations);

    // last admission pass in case the budget ran out first; adds at most one stop per round
    Objective current{};
    if (try_order(ctx, solved.order, current)) {
        while (insert_move(ctx, solved.order, current)) {}
    }

    for (int idx : unrouted(ctx, solved.order)) {
        SkipReason reason = diagnose_skip(ctx, solved.order, idx);
        // fits somewhere, but its penalty does not pay for the detour
        if (reason == SkipReason::NONE) reason = SkipReason::NOT_BENEFICIAL;
        solved.skipped.push_back(SkippedDelivery{idx, reason});
    }
    sort(solved.skipped.begin(), solved.skipped.end(),
         [](const SkippedDelivery& a, const SkippedDelivery& b) {
             return a.delivery_index < b.delivery_index;
         });

    solved.evaluation = checker.evaluate_route(solved.order);

    bool all_high = true;
    for (const auto& s : solved.skipped)
        if (request.deliveries[s.delivery_index].priority == Priority::HIGH) all_high = false;

    bool return_on_time = true;
    if (solved.evaluation.has_return &&
        solved.evaluation.return_arrival > request.pickup.window.end + EPS)
        return_on_time = false;

    solved.is_feasible = all_high && return_on_time && solved.evaluation.feasible;
    return solved;
}

OptimizationResult HeuristicSolver::solve(const RouteRequest& request) const {
    auto start_time = chrono::steady_clock::now();
    SolvedRoute solved = search(request);
    auto end_time = chrono::steady_clock::now();

    double seconds = chrono::duration<double>(end_time - start_time).count();
    return assemble_result(request, solved, seconds);
}
