#include <libveil/zkp/MixerError.h>

namespace veil {
namespace zkp {

std::string
to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::InvalidNoteFormat:
            return "InvalidNoteFormat";
        case ErrorKind::AlreadySpent:
            return "AlreadySpent";
        case ErrorKind::NoAvailableTree:
            return "NoAvailableTree";
        case ErrorKind::InvalidCircuitInput:
            return "InvalidCircuitInput";
        case ErrorKind::ProofGenerationFailed:
            return "ProofGenerationFailed";
        case ErrorKind::StaleRoot:
            return "StaleRoot";
        case ErrorKind::StaleProof:
            return "StaleProof";
        case ErrorKind::RelayerUnavailable:
            return "RelayerUnavailable";
        case ErrorKind::NetworkError:
            return "NetworkError";
        case ErrorKind::PoolNotFound:
            return "PoolNotFound";
        case ErrorKind::CommitmentNotFound:
            return "CommitmentNotFound";
        case ErrorKind::InvalidFee:
            return "InvalidFee";
        case ErrorKind::WithdrawalInFlight:
            return "WithdrawalInFlight";
        case ErrorKind::SubmissionRejected:
            return "SubmissionRejected";
    }
    return "Unknown";
}

bool
isTransient(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::ProofGenerationFailed:
        case ErrorKind::StaleRoot:
        case ErrorKind::NetworkError:
        case ErrorKind::RelayerUnavailable:
        case ErrorKind::WithdrawalInFlight:
            return true;
        default:
            return false;
    }
}

bool
isFatal(ErrorKind kind)
{
    return !isTransient(kind);
}

MixerError::MixerError(ErrorKind kind, std::string const& message)
    : MixerError(kind, message, uint256{})
{
}

MixerError::MixerError(
    ErrorKind kind,
    std::string const& message,
    uint256 const& context)
    : std::runtime_error(to_string(kind) + ": " + message)
    , kind_(kind)
    , context_(context)
{
}

} // namespace zkp
} // namespace veil
