/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "host/anim_curve.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace ssw::host {

    std::vector<CurveKey>::iterator AnimCurve::findKey(const double time) {
        return std::find_if(keys_.begin(), keys_.end(), [time](const CurveKey& k) {
            return std::abs(k.time - time) < KEY_TIME_EPSILON;
        });
    }

    std::vector<CurveKey>::const_iterator AnimCurve::findKey(const double time) const {
        return std::find_if(keys_.begin(), keys_.end(), [time](const CurveKey& k) {
            return std::abs(k.time - time) < KEY_TIME_EPSILON;
        });
    }

    void AnimCurve::setKey(const double time, const double value) {
        if (auto it = findKey(time); it != keys_.end()) {
            it->value = value;
            return;
        }
        const CurveKey key{time, value};
        keys_.insert(std::upper_bound(keys_.begin(), keys_.end(), key), key);
    }

    bool AnimCurve::removeKey(const double time) {
        const auto it = findKey(time);
        if (it == keys_.end())
            return false;
        keys_.erase(it);
        return true;
    }

    bool AnimCurve::hasKeyAt(const double time) const {
        return findKey(time) != keys_.end();
    }

    double AnimCurve::evaluate(const double time) const {
        assert(!keys_.empty());
        if (time <= keys_.front().time)
            return keys_.front().value;
        if (time >= keys_.back().time)
            return keys_.back().value;

        const auto next = std::upper_bound(keys_.begin(), keys_.end(), CurveKey{time, 0.0});
        const auto prev = next - 1;
        if (interpolation_ == CurveInterpolation::Step)
            return prev->value;

        const double span = next->time - prev->time;
        const double t = span > 0.0 ? (time - prev->time) / span : 0.0;
        return prev->value + (next->value - prev->value) * t;
    }

    std::vector<double> AnimCurve::times() const {
        std::vector<double> out;
        out.reserve(keys_.size());
        for (const auto& k : keys_)
            out.push_back(k.time);
        return out;
    }

    std::vector<double> AnimCurve::values() const {
        std::vector<double> out;
        out.reserve(keys_.size());
        for (const auto& k : keys_)
            out.push_back(k.value);
        return out;
    }

    void AnimCurve::setKeyValue(const size_t index, const double value) {
        if (index >= keys_.size())
            return;
        keys_[index].value = value;
    }

} // namespace ssw::host
