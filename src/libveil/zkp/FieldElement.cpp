#include <libveil/zkp/FieldElement.h>

#include <libff/common/profiling.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <sstream>

namespace veil {
namespace zkp {

namespace {

using BigInt = libff::bigint<FieldT::num_limbs>;

// 10^77 - 1 is the largest all-nines value below 2^256
std::size_t constexpr maxDecimalDigits = 77;

} // namespace

void
initCurveParams()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

FieldT
toFieldElement(uint256 const& value)
{
    initCurveParams();

    FieldT const radix(256l);
    FieldT acc = FieldT::zero();
    for (auto const byte : value)
        acc = acc * radix + FieldT(static_cast<long>(byte));
    return acc;
}

FieldT
toFieldElement(std::uint64_t value)
{
    initCurveParams();
    return FieldT(BigInt(static_cast<unsigned long>(value)));
}

std::string
toDecimal(FieldT const& element)
{
    std::ostringstream oss;
    oss << element.as_bigint();
    return oss.str();
}

std::optional<FieldT>
parseFieldElement(std::string const& decimal)
{
    if (decimal.empty() || decimal.size() > maxDecimalDigits)
        return std::nullopt;

    if (!std::all_of(decimal.begin(), decimal.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        }))
        return std::nullopt;

    initCurveParams();

    BigInt const value(decimal.c_str());
    if (mpn_cmp(value.data, FieldT::mod.data, FieldT::num_limbs) >= 0)
        return std::nullopt;
    return FieldT(value);
}

} // namespace zkp
} // namespace veil
