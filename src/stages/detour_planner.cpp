#include "stages/detour_planner.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

#include "common/geometry.hpp"

namespace agro {
namespace detour {

using geo::Dot;
using geo::Cross;
using geo::Length;
using geo::Normalize;

// Caps the vertex offset at sharp corners (miter limit).
static constexpr double kMaxMiter = 4.0;

static inline Vec2 rightNormal(const Vec2& v) { return {v.y, -v.x}; }

// ======================= Graph nodes =======================
// Each NFZ vertex pushed outward along the bisector of its two edge normals.
static std::vector<Vec2> buildOffsetNodes(const std::vector<Polygon>& nfz, double clearance)
{
    std::vector<Vec2> nodes;
    for (const auto& poly : nfz) {
        const auto& r = poly.ring;
        const size_t n = r.size();
        if (n < 3) continue;
        // Outward normal is the right normal for CCW rings.
        const double orient = (geo::SignedArea(r) >= 0.0) ? 1.0 : -1.0;

        for (size_t i = 0; i < n; ++i) {
            const Vec2& prev = r[(i + n - 1) % n];
            const Vec2& cur  = r[i];
            const Vec2& next = r[(i + 1) % n];

            Vec2 n1 = Normalize(rightNormal(cur - prev)) * orient;
            Vec2 n2 = Normalize(rightNormal(next - cur)) * orient;
            Vec2 bis = Normalize(n1 + n2);
            if (Length(bis) < 1e-12) continue;

            double c = Dot(bis, n1);
            double d = clearance / std::max(c, 1.0 / kMaxMiter);
            nodes.push_back(cur + bis * d);
        }
    }

    // Nodes swallowed by a neighbouring NFZ are useless.
    std::vector<Vec2> kept;
    kept.reserve(nodes.size());
    for (const auto& p : nodes) {
        bool inside = false;
        for (const auto& poly : nfz) {
            if (geo::PointInPolygon(p, poly)) { inside = true; break; }
        }
        if (!inside) kept.push_back(p);
    }
    return kept;
}

// ======================= Visibility graph + Dijkstra =======================
static std::vector<Vec2> shortestPathViaVisibilityGraph(
        const Vec2& start,
        const Vec2& goal,
        const std::vector<Polygon>& nfz,
        double clearance)
{
    std::vector<Vec2> nodes;
    nodes.push_back(start); // 0
    nodes.push_back(goal);  // 1
    for (const auto& p : buildOffsetNodes(nfz, clearance)) nodes.push_back(p);

    int N = (int)nodes.size();
    std::vector<std::vector<std::pair<int,double>>> adj(N);

    for (int i = 0; i < N; ++i) {
        for (int j = i + 1; j < N; ++j) {
            if (!geo::SegmentCrossesAny(nodes[i], nodes[j], nfz)) {
                double w = geo::Dist(nodes[i], nodes[j]);
                adj[i].push_back({j, w});
                adj[j].push_back({i, w});
            }
        }
    }

    const double INF = std::numeric_limits<double>::infinity();
    std::vector<double> dist(N, INF);
    std::vector<int> prev(N, -1);

    using QN = std::pair<double,int>;
    std::priority_queue<QN, std::vector<QN>, std::greater<QN>> pq;
    dist[0] = 0.0;
    pq.push({0.0, 0});

    while (!pq.empty()) {
        auto [d,u] = pq.top(); pq.pop();
        if (d != dist[u]) continue;
        if (u == 1) break;
        for (auto [v,w] : adj[u]) {
            double nd = d + w;
            if (nd < dist[v]) {
                dist[v] = nd;
                prev[v] = u;
                pq.push({nd, v});
            }
        }
    }

    if (!std::isfinite(dist[1])) return {};

    std::vector<int> idx;
    for (int cur = 1; cur != -1; cur = prev[cur]) idx.push_back(cur);
    std::reverse(idx.begin(), idx.end());

    std::vector<Vec2> poly;
    poly.reserve(idx.size());
    for (int id : idx) {
        if (poly.empty() || geo::Dist(poly.back(), nodes[id]) > 1e-6) poly.push_back(nodes[id]);
    }
    return poly;
}

// ======================= Polyline simplification =======================
static void simplifyPolylineShortcut(std::vector<Vec2>& pts, const std::vector<Polygon>& nfz)
{
    if (pts.size() <= 2) return;

    bool changed = true;
    while (changed && pts.size() > 2) {
        changed = false;
        for (size_t i = 1; i + 1 < pts.size(); ++i) {
            if (!geo::SegmentCrossesAny(pts[i-1], pts[i+1], nfz)) {
                pts.erase(pts.begin() + i);
                changed = true;
                break;
            }
        }
    }

    auto almostCollinear = [&](const Vec2& a, const Vec2& b, const Vec2& c)->bool {
        Vec2 ab = b - a;
        Vec2 bc = c - b;
        if (Length(ab) < 1e-9 || Length(bc) < 1e-9) return true;
        return Dot(Normalize(ab), Normalize(bc)) > 0.9999 && std::fabs(Cross(ab, bc)) < 1e-6;
    };

    for (;;) {
        bool removed = false;
        for (size_t i = 1; i + 1 < pts.size(); ++i) {
            if (almostCollinear(pts[i-1], pts[i], pts[i+1]) &&
                !geo::SegmentCrossesAny(pts[i-1], pts[i+1], nfz)) {
                pts.erase(pts.begin() + i);
                removed = true;
                break;
            }
        }
        if (!removed) break;
    }
}

const char* statusName(PlanStatus s)
{
    switch (s) {
        case PlanStatus::Straight:        return "straight";
        case PlanStatus::Detour:          return "detour";
        case PlanStatus::EndpointBlocked: return "endpoint_blocked";
        case PlanStatus::NoPath:          return "no_path";
    }
    return "no_path";
}

PlanResult PlanDetour(
    const Vec2& start,
    const Vec2& goal,
    const std::vector<Polygon>& nfz,
    const PlannerConfig& cfg)
{
    PlanResult res;

    for (const auto& poly : nfz) {
        if (geo::PointInPolygon(start, poly) || geo::PointInPolygon(goal, poly)) {
            res.status = PlanStatus::EndpointBlocked;
            return res;
        }
    }

    if (!geo::SegmentCrossesAny(start, goal, nfz)) {
        res.status = PlanStatus::Straight;
        res.path = {start, goal};
        return res;
    }

    for (double scale : cfg.clearanceScales) {
        const double clearance = std::max(0.0, cfg.clearance * scale);
        std::vector<Vec2> path = shortestPathViaVisibilityGraph(start, goal, nfz, clearance);
        if (path.size() < 2) continue;

        if (cfg.shortcut) simplifyPolylineShortcut(path, nfz);
        res.status = PlanStatus::Detour;
        res.path = std::move(path);
        res.clearanceUsed = clearance;
        return res;
    }

    res.status = PlanStatus::NoPath;
    return res;
}

} // namespace detour
} // namespace agro
