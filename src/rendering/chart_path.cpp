// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_path.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace chartkit {

namespace {

constexpr float DEG_TO_RAD = 3.14159265358979323846f / 180.0f;

// Max arc step, degrees. Keeps 300px radius arcs visually round.
constexpr float ARC_STEP_DEG = 3.0f;

// Upper bound on cubic subdivision
constexpr int MAX_CUBIC_SEGMENTS = 64;

float distance(Point a, Point b) {
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

Point cubic_point(Point p0, Point c1, Point c2, Point p1, float t) {
    float u = 1.0f - t;
    float b0 = u * u * u;
    float b1 = 3.0f * u * u * t;
    float b2 = 3.0f * u * t * t;
    float b3 = t * t * t;
    return {b0 * p0.x + b1 * c1.x + b2 * c2.x + b3 * p1.x,
            b0 * p0.y + b1 * c1.y + b2 * c2.y + b3 * p1.y};
}

Point point_on_circle(Point center, float radius, float deg) {
    float rad = deg * DEG_TO_RAD;
    return {center.x + radius * std::cos(rad), center.y + radius * std::sin(rad)};
}

} // namespace

void Path::move_to(Point p) {
    PathCommand cmd;
    cmd.verb = PathVerb::MOVE;
    cmd.pts[0] = p;
    commands_.push_back(cmd);
}

void Path::line_to(Point p) {
    if (commands_.empty()) {
        move_to(p);
        return;
    }
    PathCommand cmd;
    cmd.verb = PathVerb::LINE;
    cmd.pts[0] = p;
    commands_.push_back(cmd);
}

void Path::cubic_to(Point c1, Point c2, Point end) {
    if (commands_.empty()) {
        move_to(c1);
    }
    PathCommand cmd;
    cmd.verb = PathVerb::CUBIC;
    cmd.pts[0] = c1;
    cmd.pts[1] = c2;
    cmd.pts[2] = end;
    commands_.push_back(cmd);
}

void Path::close() {
    if (commands_.empty() || commands_.back().verb == PathVerb::CLOSE) {
        return;
    }
    PathCommand cmd;
    cmd.verb = PathVerb::CLOSE;
    commands_.push_back(cmd);
}

void Path::arc_to(Point center, float radius, float start_deg, float sweep_deg, bool connect) {
    if (!std::isfinite(sweep_deg) || !std::isfinite(start_deg)) {
        spdlog::warn("[Path] Ignoring arc with non-finite angles");
        return;
    }
    int steps = std::max(1, static_cast<int>(std::ceil(std::fabs(sweep_deg) / ARC_STEP_DEG)));
    Point first = point_on_circle(center, radius, start_deg);
    if (connect && !commands_.empty() && commands_.back().verb != PathVerb::CLOSE) {
        line_to(first);
    } else {
        move_to(first);
    }
    for (int i = 1; i <= steps; i++) {
        float deg = start_deg + sweep_deg * static_cast<float>(i) / static_cast<float>(steps);
        line_to(point_on_circle(center, radius, deg));
    }
}

size_t Path::count(PathVerb verb) const {
    return static_cast<size_t>(std::count_if(commands_.begin(), commands_.end(),
                                             [verb](const PathCommand& c) { return c.verb == verb; }));
}

Point Path::current_point() const {
    // CLOSE returns the pen to the start of its contour
    Point contour_start;
    Point pen;
    for (const auto& cmd : commands_) {
        switch (cmd.verb) {
        case PathVerb::MOVE:
            contour_start = cmd.pts[0];
            pen = cmd.pts[0];
            break;
        case PathVerb::LINE:
            pen = cmd.pts[0];
            break;
        case PathVerb::CUBIC:
            pen = cmd.pts[2];
            break;
        case PathVerb::CLOSE:
            pen = contour_start;
            break;
        }
    }
    return pen;
}

Rect Path::bounds() const {
    bool any = false;
    float min_x = 0, min_y = 0, max_x = 0, max_y = 0;
    auto add = [&](Point p) {
        if (!any) {
            min_x = max_x = p.x;
            min_y = max_y = p.y;
            any = true;
            return;
        }
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    };
    for (const auto& cmd : commands_) {
        switch (cmd.verb) {
        case PathVerb::MOVE:
        case PathVerb::LINE:
            add(cmd.pts[0]);
            break;
        case PathVerb::CUBIC:
            add(cmd.pts[0]);
            add(cmd.pts[1]);
            add(cmd.pts[2]);
            break;
        case PathVerb::CLOSE:
            break;
        }
    }
    return Rect(min_x, min_y, max_x - min_x, max_y - min_y);
}

std::vector<Polyline> Path::flatten(float tolerance) const {
    std::vector<Polyline> result;
    if (!(tolerance > 0.0f)) {
        tolerance = 0.5f;
    }
    float max_segment = tolerance * 8.0f;

    Polyline current;
    auto flush = [&]() {
        if (current.points.size() > 1) {
            result.push_back(std::move(current));
        }
        current = Polyline();
    };

    for (const auto& cmd : commands_) {
        switch (cmd.verb) {
        case PathVerb::MOVE:
            flush();
            current.points.push_back(cmd.pts[0]);
            break;
        case PathVerb::LINE:
            current.points.push_back(cmd.pts[0]);
            break;
        case PathVerb::CUBIC: {
            Point p0 = current.points.empty() ? cmd.pts[0] : current.points.back();
            float hull = distance(p0, cmd.pts[0]) + distance(cmd.pts[0], cmd.pts[1]) +
                         distance(cmd.pts[1], cmd.pts[2]);
            int segments = static_cast<int>(std::ceil(hull / max_segment));
            segments = std::min(MAX_CUBIC_SEGMENTS, std::max(1, segments));
            for (int i = 1; i <= segments; i++) {
                float t = static_cast<float>(i) / static_cast<float>(segments);
                current.points.push_back(cubic_point(p0, cmd.pts[0], cmd.pts[1], cmd.pts[2], t));
            }
            break;
        }
        case PathVerb::CLOSE:
            current.closed = true;
            {
                Point start = current.points.empty() ? Point() : current.points.front();
                flush();
                // A verb after CLOSE continues from the contour start
                current.points.push_back(start);
            }
            break;
        }
    }
    flush();
    return result;
}

Path make_sector_path(Point center, float outer_radius, float inner_radius, float start_deg,
                      float sweep_deg) {
    Path path;
    if (inner_radius <= 0.0f) {
        path.move_to(center);
        path.arc_to(center, outer_radius, start_deg, sweep_deg, true);
    } else {
        path.arc_to(center, outer_radius, start_deg, sweep_deg, false);
        path.arc_to(center, inner_radius, start_deg + sweep_deg, -sweep_deg, true);
    }
    path.close();
    return path;
}

} // namespace chartkit
