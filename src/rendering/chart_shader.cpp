// SPDX-License-Identifier: GPL-3.0-or-later

#include "chart_shader.h"

#include "color_utils.h"

#include <algorithm>
#include <cmath>

namespace chartkit {

namespace {

const Shader& empty_shader() {
    static const Shader empty;
    return empty;
}

uint8_t to_channel(float v) {
    return static_cast<uint8_t>(std::lround(std::min(255.0f, std::max(0.0f, v * 255.0f))));
}

} // namespace

Shader Shader::linear_gradient(Point start, Point end, std::vector<Color> colors,
                               std::vector<float> positions) {
    Shader s;
    s.kind_ = Kind::LINEAR_GRADIENT;
    s.start_ = start;
    s.end_ = end;
    s.colors_ = std::move(colors);

    const size_t n = s.colors_.size();
    if (positions.size() == n) {
        s.positions_ = std::move(positions);
        for (auto& p : s.positions_) {
            p = std::min(1.0f, std::max(0.0f, p));
        }
    } else {
        s.positions_.resize(n);
        for (size_t i = 0; i < n; i++) {
            s.positions_[i] = n > 1 ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
        }
    }
    return s;
}

Shader Shader::compose(Shader dst, Shader src, BlendMode mode) {
    Shader s;
    s.kind_ = Kind::COMPOSE;
    s.dst_ = std::make_shared<const Shader>(std::move(dst));
    s.src_ = std::make_shared<const Shader>(std::move(src));
    s.mode_ = mode;
    return s;
}

const Shader& Shader::dst() const {
    return dst_ ? *dst_ : empty_shader();
}

const Shader& Shader::src() const {
    return src_ ? *src_ : empty_shader();
}

Color Shader::color_at(float x, float y) const {
    switch (kind_) {
    case Kind::NONE:
        return colors::TRANSPARENT;

    case Kind::LINEAR_GRADIENT: {
        if (colors_.empty()) {
            return colors::TRANSPARENT;
        }
        if (colors_.size() == 1) {
            return colors_.front();
        }
        float dx = end_.x - start_.x;
        float dy = end_.y - start_.y;
        float len_sq = dx * dx + dy * dy;
        if (len_sq <= 0.0f) {
            return colors_.back();
        }
        float t = ((x - start_.x) * dx + (y - start_.y) * dy) / len_sq;
        t = std::min(1.0f, std::max(0.0f, t));

        if (t <= positions_.front()) {
            return colors_.front();
        }
        for (size_t i = 1; i < colors_.size(); i++) {
            if (t <= positions_[i]) {
                float span = positions_[i] - positions_[i - 1];
                float local = span > 0.0f ? (t - positions_[i - 1]) / span : 1.0f;
                return lerp_color(colors_[i - 1], colors_[i], local);
            }
        }
        return colors_.back();
    }

    case Kind::COMPOSE:
        return blend_colors(dst().color_at(x, y), src().color_at(x, y), mode_);
    }
    return colors::TRANSPARENT;
}

bool Shader::is_vertical() const {
    switch (kind_) {
    case Kind::NONE:
        return true;
    case Kind::LINEAR_GRADIENT:
        return colors_.size() < 2 || start_.x == end_.x;
    case Kind::COMPOSE:
        return dst().is_vertical() && src().is_vertical();
    }
    return false;
}

bool Shader::is_horizontal() const {
    switch (kind_) {
    case Kind::NONE:
        return true;
    case Kind::LINEAR_GRADIENT:
        return colors_.size() < 2 || start_.y == end_.y;
    case Kind::COMPOSE:
        return dst().is_horizontal() && src().is_horizontal();
    }
    return false;
}

Color blend_colors(const Color& dst, const Color& src, BlendMode mode) {
    // Premultiplied, normalized
    float sa = src.a / 255.0f;
    float da = dst.a / 255.0f;
    float sr = src.r / 255.0f * sa, sg = src.g / 255.0f * sa, sb = src.b / 255.0f * sa;
    float dr = dst.r / 255.0f * da, dg = dst.g / 255.0f * da, db = dst.b / 255.0f * da;

    float r = 0, g = 0, b = 0, a = 0;
    switch (mode) {
    case BlendMode::SRC_OVER:
        r = sr + dr * (1 - sa);
        g = sg + dg * (1 - sa);
        b = sb + db * (1 - sa);
        a = sa + da * (1 - sa);
        break;
    case BlendMode::SRC_IN:
        r = sr * da;
        g = sg * da;
        b = sb * da;
        a = sa * da;
        break;
    case BlendMode::SRC_OUT:
        r = sr * (1 - da);
        g = sg * (1 - da);
        b = sb * (1 - da);
        a = sa * (1 - da);
        break;
    case BlendMode::DST_IN:
        r = dr * sa;
        g = dg * sa;
        b = db * sa;
        a = da * sa;
        break;
    case BlendMode::DST_OUT:
        r = dr * (1 - sa);
        g = dg * (1 - sa);
        b = db * (1 - sa);
        a = da * (1 - sa);
        break;
    }

    if (a <= 0.0f) {
        return colors::TRANSPARENT;
    }
    return Color(to_channel(r / a), to_channel(g / a), to_channel(b / a), to_channel(a));
}

} // namespace chartkit
