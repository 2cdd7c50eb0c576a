#pragma once

#include <libveil/zkp/Types.h>

#include <stdexcept>
#include <string>

namespace veil {
namespace zkp {

enum class ErrorKind {
    InvalidNoteFormat,
    AlreadySpent,
    NoAvailableTree,
    InvalidCircuitInput,
    ProofGenerationFailed,
    StaleRoot,
    StaleProof,
    RelayerUnavailable,
    NetworkError,
    PoolNotFound,
    CommitmentNotFound,
    InvalidFee,
    WithdrawalInFlight,
    SubmissionRejected
};

std::string
to_string(ErrorKind kind);

/** True when retrying the same request may succeed. */
bool
isTransient(ErrorKind kind);

/** True when the note (or the request built from it) can never succeed
    as given. AlreadySpent and InvalidNoteFormat are always fatal.
*/
bool
isFatal(ErrorKind kind);

/**
 * Error raised by every mixer component.
 *
 * The context is the commitment or nullifier hash of the note involved,
 * or zero when the failure is not tied to a note.
 */
class MixerError : public std::runtime_error
{
public:
    MixerError(ErrorKind kind, std::string const& message);

    MixerError(
        ErrorKind kind,
        std::string const& message,
        uint256 const& context);

    ErrorKind
    kind() const
    {
        return kind_;
    }

    uint256 const&
    context() const
    {
        return context_;
    }

    bool
    transient() const
    {
        return isTransient(kind_);
    }

private:
    ErrorKind kind_;
    uint256 context_;
};

} // namespace zkp
} // namespace veil
