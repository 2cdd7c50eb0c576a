#pragma once

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>

#include <cstdint>

namespace veil {

using ripple::Blob;
using ripple::Slice;
using ripple::uint256;

namespace zkp {

/** 32-byte ledger address: pools, trees, relayers and recipients. */
using AccountId = uint256;

} // namespace zkp
} // namespace veil
