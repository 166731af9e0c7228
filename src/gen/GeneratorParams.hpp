//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/GeneratorParams.hpp
// Purpose: Learned weights of the template search and their binary form.
// Key invariants: Every weight satisfies |w| <= kMaxWeightMagnitude; the
//                 content hash is a pure function of the serialized bytes.
// Ownership/Lifetime: Value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "field/Fixed.hpp"
#include "gen/StackScheduler.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace talus::gen
{

/// @brief Integer-valued block summary features fed to each knob.
constexpr size_t kSummaryFeatures = 22;

/// @brief Weights per knob: one per feature plus a bias.
constexpr size_t kWeightsPerKnob = kSummaryFeatures + 1;

/// @brief Total parameter count.
constexpr size_t kParamCount = kNumKnobs * kWeightsPerKnob;

/// @brief Serialization version of the parameter blob.
constexpr uint32_t kParamsFormatVersion = 1;

using Summary = std::array<field::Fixed, kSummaryFeatures>;

/// @brief Flat weight vector of the template search.
class GeneratorParams
{
  public:
    using Weights = std::array<field::Fixed, kParamCount>;

    /// @brief All weights zero: the untrained state.
    static GeneratorParams zeros();

    /// @brief Zero feature weights with positive biases, enabling every knob.
    static GeneratorParams defaults();

    /// @brief Adopt @p weights, clamping each to the weight bound.
    static GeneratorParams fromWeights(const Weights &weights);

    const Weights &weights() const
    {
        return weights_;
    }

    field::Fixed weight(size_t index) const
    {
        return weights_[index];
    }

    /// @brief Store @p w at @p index after clamping.
    void set(size_t index, field::Fixed w);

    /// @brief Index of the weight for @p feature of @p knob.
    static constexpr size_t index(Knob knob, size_t feature)
    {
        return static_cast<size_t>(knob) * kWeightsPerKnob + feature;
    }

    /// @brief Index of the bias of @p knob.
    static constexpr size_t biasIndex(Knob knob)
    {
        return index(knob, kSummaryFeatures);
    }

    /// @brief Knob score dot(w_knob, summary) + bias with one rescale.
    field::Fixed score(Knob knob, const Summary &summary) const;

    /// @brief Binary blob: "TLGP", version, count, little-endian u64 words.
    std::string serialize() const;

    /// @brief Parse a blob produced by serialize().
    /// @return "checkpoint-corrupt" when the blob is malformed.
    static support::Expected<GeneratorParams> deserialize(std::string_view bytes);

    /// @brief 32-hex-character content hash of serialize().
    std::string hash() const;

    friend bool operator==(const GeneratorParams &a, const GeneratorParams &b)
    {
        return a.weights_ == b.weights_;
    }

  private:
    Weights weights_{};
};

} // namespace talus::gen
