//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: gen/GeneratorParams.cpp
// Purpose: Parameter construction, scoring and the TLGP blob format.
//
//===----------------------------------------------------------------------===//

#include "gen/GeneratorParams.hpp"

#include "support/byte_io.hpp"
#include "support/hash.hpp"

#include <string>

namespace talus::gen
{
using field::Fixed;
using field::Goldilocks;
using support::Expected;
using support::getLE;
using support::putU32;
using support::putU64;
using support::makeError;

namespace
{
constexpr char kMagic[4] = {'T', 'L', 'G', 'P'};
constexpr size_t kHeaderBytes = 12;
} // namespace

GeneratorParams GeneratorParams::zeros()
{
    return GeneratorParams();
}

GeneratorParams GeneratorParams::defaults()
{
    GeneratorParams p;
    for (size_t k = 0; k < kNumKnobs; ++k)
        p.weights_[biasIndex(static_cast<Knob>(k))] = Fixed::one();
    return p;
}

GeneratorParams GeneratorParams::fromWeights(const Weights &weights)
{
    GeneratorParams p;
    for (size_t i = 0; i < kParamCount; ++i)
        p.set(i, weights[i]);
    return p;
}

void GeneratorParams::set(size_t index, Fixed w)
{
    weights_[index] = w.clamp(field::kMaxWeightMagnitude);
}

Fixed GeneratorParams::score(Knob knob, const Summary &summary) const
{
    Summary w{};
    for (size_t f = 0; f < kSummaryFeatures; ++f)
        w[f] = weights_[index(knob, f)];
    return field::affine(w, summary, weights_[biasIndex(knob)]);
}

std::string GeneratorParams::serialize() const
{
    std::string out(kMagic, sizeof(kMagic));
    putU32(out, kParamsFormatVersion);
    putU32(out, static_cast<uint32_t>(kParamCount));
    for (const auto &w : weights_)
        putU64(out, w.raw().value());
    return out;
}

Expected<GeneratorParams> GeneratorParams::deserialize(std::string_view bytes)
{
    if (bytes.size() < kHeaderBytes || bytes.substr(0, 4) != std::string_view(kMagic, 4))
        return makeError("checkpoint-corrupt", "parameter blob has no TLGP header");
    const uint64_t version = getLE(bytes, 4, 4);
    const uint64_t count = getLE(bytes, 8, 4);
    if (version != kParamsFormatVersion)
        return makeError("checkpoint-corrupt",
                         "unsupported parameter blob version " + std::to_string(version));
    if (count != kParamCount || bytes.size() != kHeaderBytes + count * 8)
        return makeError("checkpoint-corrupt", "parameter blob has the wrong length");

    GeneratorParams p;
    for (size_t i = 0; i < kParamCount; ++i)
    {
        const uint64_t raw = getLE(bytes, kHeaderBytes + i * 8, 8);
        if (raw >= field::kModulus)
            return makeError("checkpoint-corrupt", "weight " + std::to_string(i) +
                                                       " is not a canonical field element");
        const Fixed w = Fixed::fromRaw(Goldilocks::fromU64(raw));
        if (w.clamp(field::kMaxWeightMagnitude) != w)
            return makeError("checkpoint-corrupt",
                             "weight " + std::to_string(i) + " exceeds the weight bound");
        p.weights_[i] = w;
    }
    return p;
}

std::string GeneratorParams::hash() const
{
    return support::contentHash(serialize());
}

} // namespace talus::gen
