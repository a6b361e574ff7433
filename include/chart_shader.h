// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chart_types.h"

#include <memory>
#include <vector>

/**
 * @file chart_shader.h
 * @brief Shader and paint descriptions issued by the chart renderers
 *
 * Shaders are immutable values. A canvas either maps them onto native
 * gradients or samples them with color_at().
 */

namespace chartkit {

/// Porter-Duff modes supported by Shader::compose()
enum class BlendMode {
    SRC_OVER, ///< src + dst * (1 - src.a)
    SRC_IN,   ///< src * dst.a
    SRC_OUT,  ///< src * (1 - dst.a)
    DST_IN,   ///< dst * src.a
    DST_OUT   ///< dst * (1 - src.a)
};

class Shader {
  public:
    enum class Kind { NONE, LINEAR_GRADIENT, COMPOSE };

    /// Empty shader: the paint color is used as-is
    Shader() = default;

    /**
     * @brief Linear gradient between two points, clamped outside the segment
     *
     * @param positions Stop offsets in [0,1], one per color; empty = evenly spaced
     */
    static Shader linear_gradient(Point start, Point end, std::vector<Color> colors,
                                  std::vector<float> positions = {});

    /**
     * @brief Blend two shaders per pixel with a Porter-Duff mode
     *
     * @param dst Destination shader (the "bottom" input)
     * @param src Source shader (the "top" input)
     */
    static Shader compose(Shader dst, Shader src, BlendMode mode);

    Kind kind() const {
        return kind_;
    }
    bool is_none() const {
        return kind_ == Kind::NONE;
    }

    // LINEAR_GRADIENT accessors
    Point start() const {
        return start_;
    }
    Point end() const {
        return end_;
    }
    const std::vector<Color>& colors() const {
        return colors_;
    }
    /// Resolved stop offsets (always one per color)
    const std::vector<float>& positions() const {
        return positions_;
    }

    // COMPOSE accessors (default-constructed shader if not COMPOSE)
    const Shader& dst() const;
    const Shader& src() const;
    BlendMode blend_mode() const {
        return mode_;
    }

    /**
     * @brief Evaluate the shader at a chart-local pixel position
     *
     * NONE evaluates to transparent.
     */
    Color color_at(float x, float y) const;

    /// true if color_at() can only vary with Y (vertical gradient axis)
    bool is_vertical() const;
    /// true if color_at() can only vary with X (horizontal gradient axis)
    bool is_horizontal() const;

  private:
    Kind kind_ = Kind::NONE;

    Point start_;
    Point end_;
    std::vector<Color> colors_;
    std::vector<float> positions_;

    std::shared_ptr<const Shader> dst_;
    std::shared_ptr<const Shader> src_;
    BlendMode mode_ = BlendMode::SRC_OVER;
};

/// Blend two colors with a Porter-Duff mode (non-premultiplied in and out)
Color blend_colors(const Color& dst, const Color& src, BlendMode mode);

enum class PaintStyle { FILL, STROKE };

/**
 * @brief How a primitive is painted
 *
 * If shader is not NONE it supplies the color and @ref color is ignored.
 */
struct Paint {
    PaintStyle style = PaintStyle::FILL;
    Color color = colors::BLACK;
    float stroke_width = 1.0f;
    bool antialias = true;
    Shader shader;
};

} // namespace chartkit
