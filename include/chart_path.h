// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include <cstddef>
#include <vector>

/**
 * @file chart_path.h
 * @brief Vector path built by the chart renderers and consumed by a ChartCanvas
 *
 * A path is a list of verbs (move, line, cubic, close). Canvases that cannot
 * rasterize curves natively call flatten() to get polylines.
 */

namespace chartkit {

enum class PathVerb { MOVE, LINE, CUBIC, CLOSE };

/**
 * @brief One path command
 *
 * MOVE/LINE use pts[0]. CUBIC uses pts[0] and pts[1] as control points and
 * pts[2] as the end point. CLOSE uses none.
 */
struct PathCommand {
    PathVerb verb = PathVerb::MOVE;
    Point pts[3];
};

/// One flattened sub-path
struct Polyline {
    std::vector<Point> points;
    bool closed = false;
};

class Path {
  public:
    void move_to(Point p);
    void move_to(float x, float y) {
        move_to(Point(x, y));
    }
    void line_to(Point p);
    void line_to(float x, float y) {
        line_to(Point(x, y));
    }
    void cubic_to(Point c1, Point c2, Point end);
    void close();

    /**
     * @brief Append a circular arc as line segments
     *
     * Angles are in degrees, 0 = 3 o'clock, positive sweep = clockwise on
     * screen (Y down). Starts a new contour unless @p connect is true and the
     * path already has a current point, in which case a line joins them.
     */
    void arc_to(Point center, float radius, float start_deg, float sweep_deg, bool connect);

    bool empty() const {
        return commands_.empty();
    }
    const std::vector<PathCommand>& commands() const {
        return commands_;
    }
    size_t count(PathVerb verb) const;

    /// Current pen position (last end point), {0,0} for an empty path
    Point current_point() const;

    /// Axis-aligned bounds of all points, control points included
    Rect bounds() const;

    /**
     * @brief Flatten to polylines
     *
     * Cubics are subdivided uniformly; the segment count grows with the length
     * of the control polygon so that no segment is longer than @p tolerance
     * times 8 pixels.
     *
     * @param tolerance Approximate max segment length / 8, in pixels (> 0)
     */
    std::vector<Polyline> flatten(float tolerance = 0.5f) const;

  private:
    std::vector<PathCommand> commands_;
};

/**
 * @brief Build a ring sector (or pie slice when inner_radius is 0)
 *
 * Angles in degrees as for Path::arc_to().
 */
Path make_sector_path(Point center, float outer_radius, float inner_radius, float start_deg,
                      float sweep_deg);

} // namespace chartkit
