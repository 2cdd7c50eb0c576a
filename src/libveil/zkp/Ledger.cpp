#include <libveil/zkp/Ledger.h>

namespace veil {
namespace zkp {

std::string
to_string(SubmitCode code)
{
    switch (code)
    {
        case SubmitCode::Success:
            return "Success";
        case SubmitCode::NullifierSpent:
            return "NullifierSpent";
        case SubmitCode::StaleRoot:
            return "StaleRoot";
        case SubmitCode::InvalidProof:
            return "InvalidProof";
        case SubmitCode::Rejected:
            return "Rejected";
    }
    return "Unknown";
}

} // namespace zkp
} // namespace veil
