//===----------------------------------------------------------------------===//
//
// Part of the Talus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: field/Goldilocks.cpp
// Purpose: Out-of-line multiplication, exponentiation and inversion.
//
//===----------------------------------------------------------------------===//

#include "field/Goldilocks.hpp"

namespace talus::field
{

Goldilocks Goldilocks::mul(Goldilocks rhs) const
{
    __extension__ using u128 = unsigned __int128;
    const u128 product = static_cast<u128>(v_) * static_cast<u128>(rhs.v_);
    return Goldilocks(static_cast<uint64_t>(product % kModulus));
}

Goldilocks Goldilocks::pow(uint64_t exp) const
{
    Goldilocks base = *this;
    Goldilocks acc = fromU64(1);
    while (exp > 0)
    {
        if (exp & 1)
            acc = acc.mul(base);
        base = base.mul(base);
        exp >>= 1;
    }
    return acc;
}

std::optional<Goldilocks> Goldilocks::inverse() const
{
    if (isZero())
        return std::nullopt;
    return pow(kModulus - 2);
}

} // namespace talus::field
