#include <libveil/zkp/LittleEndian.h>
#include <libveil/zkp/Operation.h>

#include <openssl/sha.h>

namespace veil {
namespace zkp {

namespace {

void
appendHash(Blob& out, uint256 const& value)
{
    out.insert(out.end(), value.begin(), value.end());
}

Blob
encode(DepositOperation const& op)
{
    Blob out;
    out.reserve(DepositOperation::size);
    out.push_back(static_cast<std::uint8_t>(OpCode::deposit));
    appendHash(out, op.pool);
    appendHash(out, op.tree);
    appendHash(out, op.commitment);
    appendLE(out, op.amount);
    return out;
}

Blob
encode(WithdrawOperation const& op)
{
    Blob out;
    out.reserve(WithdrawOperation::fixedSize + op.proof.size());
    out.push_back(static_cast<std::uint8_t>(OpCode::withdraw));
    appendHash(out, op.pool);
    appendHash(out, op.tree);
    appendLE(out, static_cast<std::uint32_t>(op.proof.size()));
    out.insert(out.end(), op.proof.begin(), op.proof.end());
    appendHash(out, op.root);
    appendHash(out, op.nullifierHash);
    appendHash(out, op.recipient);
    appendHash(out, op.relayer);
    appendLE(out, op.fee);
    return out;
}

std::optional<OperationBody>
decodeDeposit(Blob const& data)
{
    if (data.size() != DepositOperation::size)
        return std::nullopt;

    auto const* p = data.data() + 1;
    DepositOperation op;
    op.pool = getHash(p);
    op.tree = getHash(p + 32);
    op.commitment = getHash(p + 64);
    op.amount = getLE<std::uint64_t>(p + 96);
    return op;
}

std::optional<OperationBody>
decodeWithdraw(Blob const& data)
{
    if (data.size() < WithdrawOperation::fixedSize)
        return std::nullopt;

    auto const* p = data.data() + 1;
    WithdrawOperation op;
    op.pool = getHash(p);
    op.tree = getHash(p + 32);

    auto const proofSize = getLE<std::uint32_t>(p + 64);
    if (data.size() != WithdrawOperation::fixedSize + proofSize)
        return std::nullopt;
    p += 68;
    op.proof.assign(p, p + proofSize);
    p += proofSize;

    op.root = getHash(p);
    op.nullifierHash = getHash(p + 32);
    op.recipient = getHash(p + 64);
    op.relayer = getHash(p + 96);
    op.fee = getLE<std::uint64_t>(p + 128);
    return op;
}

} // namespace

std::optional<OpCode>
Operation::opcode() const
{
    if (payload.empty())
        return std::nullopt;
    switch (payload[0])
    {
        case static_cast<std::uint8_t>(OpCode::deposit):
            return OpCode::deposit;
        case static_cast<std::uint8_t>(OpCode::withdraw):
            return OpCode::withdraw;
        default:
            return std::nullopt;
    }
}

std::string
Operation::id() const
{
    uint256 digest;
    SHA256(payload.data(), payload.size(), digest.data());
    return to_string(digest);
}

Operation
makeOperation(OperationBody const& body)
{
    return Operation{std::visit([](auto const& op) { return encode(op); }, body)};
}

std::optional<OperationBody>
parseOperation(Operation const& op)
{
    auto const code = op.opcode();
    if (!code)
        return std::nullopt;

    switch (*code)
    {
        case OpCode::deposit:
            return decodeDeposit(op.payload);
        case OpCode::withdraw:
            return decodeWithdraw(op.payload);
    }
    return std::nullopt;
}

} // namespace zkp
} // namespace veil
