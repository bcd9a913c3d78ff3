/* SPDX-FileCopyrightText: 2025 SpaceSwitch Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ssw::host {

    enum class CurveInterpolation : uint8_t {
        Linear, // Scalar channels
        Step    // Enum and boolean channels hold the previous key's value
    };

    struct CurveKey {
        double time = 0.0;
        double value = 0.0;

        bool operator<(const CurveKey& other) const { return time < other.time; }
    };

    // Keys closer than this are the same key
    inline constexpr double KEY_TIME_EPSILON = 1e-6;

    class AnimCurve {
    public:
        explicit AnimCurve(CurveInterpolation interpolation = CurveInterpolation::Linear)
            : interpolation_(interpolation) {}

        // Replaces the value of an existing key at time, otherwise inserts
        void setKey(double time, double value);
        bool removeKey(double time);
        [[nodiscard]] bool hasKeyAt(double time) const;

        // Clamps outside the key range. Must not be called on an empty curve.
        [[nodiscard]] double evaluate(double time) const;

        [[nodiscard]] std::vector<double> times() const;
        [[nodiscard]] std::vector<double> values() const;
        [[nodiscard]] const std::vector<CurveKey>& keys() const { return keys_; }
        void setKeyValue(size_t index, double value);

        [[nodiscard]] bool empty() const { return keys_.empty(); }
        [[nodiscard]] size_t size() const { return keys_.size(); }
        [[nodiscard]] CurveInterpolation interpolation() const { return interpolation_; }

    private:
        std::vector<CurveKey>::iterator findKey(double time);
        [[nodiscard]] std::vector<CurveKey>::const_iterator findKey(double time) const;

        std::vector<CurveKey> keys_;
        CurveInterpolation interpolation_;
    };

} // namespace ssw::host
