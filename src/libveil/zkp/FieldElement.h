#pragma once

#include <libveil/zkp/Types.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace veil {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/** Initialise the alt_bn128 parameters once per process. */
void
initCurveParams();

/** Interpret the 32 bytes as a big-endian integer reduced into the field. */
FieldT
toFieldElement(uint256 const& value);

FieldT
toFieldElement(std::uint64_t value);

/** Decimal string of the canonical representative. */
std::string
toDecimal(FieldT const& element);

/** Parse a non-negative decimal; nullopt if the text is not one. */
std::optional<FieldT>
parseFieldElement(std::string const& decimal);

} // namespace zkp
} // namespace veil
