#include <libveil/zkp/CircuitInputs.h>
#include <libveil/zkp/Keylet.h>
#include <libveil/zkp/LocalLedger.h>

#include <xrpl/basics/Log.h>

#include <chrono>
#include <stdexcept>

namespace veil {
namespace zkp {

namespace {

SubmitResult
reject(SubmitCode code, std::string message)
{
    SubmitResult result;
    result.code = code;
    result.message = std::move(message);
    return result;
}

} // namespace

LocalLedger::LocalLedger(beast::Journal journal, Verifier const* verifier)
    : j_(journal), verifier_(verifier)
{
}

AccountId
LocalLedger::createPool(
    std::uint64_t denomination,
    TokenType token,
    std::size_t treeDepth,
    std::uint16_t maxFeeBasisPoints)
{
    if (!isStandardDenomination(token, denomination))
        throw std::invalid_argument(
            "Non-standard denomination " + std::to_string(denomination) +
            " for " + to_string(token));

    std::lock_guard lock(mutex_);

    auto const id = keylet::pool(denomination, token);
    if (pools_.count(id) != 0)
        throw std::invalid_argument("Pool already exists");

    PoolState pool;
    pool.id = id;
    pool.denomination = denomination;
    pool.tokenType = token;
    pool.maxFeeBasisPoints = maxFeeBasisPoints;
    pool.minWithdrawal = denomination / 10;
    pools_.emplace(id, pool);

    pools_[id].treeId = addTreeLocked(id, treeDepth);

    JLOG(j_.info()) << "Created pool " << id << " for " << denomination << " "
                    << to_string(token);
    return id;
}

AccountId
LocalLedger::addTree(AccountId const& pool, std::size_t depth)
{
    std::lock_guard lock(mutex_);
    if (pools_.count(pool) == 0)
        throw std::invalid_argument("Unknown pool");
    return addTreeLocked(pool, depth);
}

AccountId
LocalLedger::addTreeLocked(AccountId const& pool, std::size_t depth)
{
    auto const id = keylet::tree(pool, treeSequence_[pool]++);
    trees_.emplace(id, Tree{pool, IncrementalMerkleTree(depth)});
    JLOG(j_.debug()) << "Added tree " << id << " of depth " << depth;
    return id;
}

void
LocalLedger::putRelayer(RelayerState const& relayer)
{
    std::lock_guard lock(mutex_);
    relayers_[relayer.address] = relayer;
}

std::optional<PoolState>
LocalLedger::pool(AccountId const& id) const
{
    std::lock_guard lock(mutex_);
    auto const it = pools_.find(id);
    if (it == pools_.end())
        return std::nullopt;
    return it->second;
}

TreeState
LocalLedger::treeState(AccountId const& id, Tree const& tree) const
{
    TreeState state;
    state.id = id;
    state.pool = tree.pool;
    state.root = tree.tree.root();
    state.depth = static_cast<std::uint32_t>(tree.tree.depth());
    state.leafCount = tree.tree.size();
    return state;
}

std::optional<TreeState>
LocalLedger::tree(AccountId const& id) const
{
    std::lock_guard lock(mutex_);
    auto const it = trees_.find(id);
    if (it == trees_.end())
        return std::nullopt;
    return treeState(id, it->second);
}

std::size_t
LocalLedger::nullifierCount() const
{
    std::lock_guard lock(mutex_);
    return nullifiers_.size();
}

//------------------------------------------------------------------------------

template <class Op>
SubmitResult
LocalLedger::process(Op const& op)
{
    if (auto failed = preflight(op))
        return *failed;
    if (auto failed = preclaim(op))
        return *failed;
    return doApply(op);
}

SubmitResult
LocalLedger::submitAndConfirm(Operation const& op)
{
    auto const body = parseOperation(op);
    if (!body)
    {
        JLOG(j_.debug()) << "Malformed operation payload";
        return reject(SubmitCode::Rejected, "malformed operation");
    }

    SubmitResult result;
    {
        std::lock_guard lock(mutex_);
        result =
            std::visit([this](auto const& o) { return process(o); }, *body);
    }
    result.signature = op.id();
    return result;
}

std::optional<SubmitResult>
LocalLedger::preflight(DepositOperation const& op) const
{
    if (op.amount == 0)
        return reject(SubmitCode::Rejected, "zero deposit");
    if (op.commitment.isZero())
        return reject(SubmitCode::Rejected, "empty commitment");
    return std::nullopt;
}

std::optional<SubmitResult>
LocalLedger::preclaim(DepositOperation const& op) const
{
    auto const pool = pools_.find(op.pool);
    if (pool == pools_.end() || !pool->second.active)
        return reject(SubmitCode::Rejected, "unknown pool");

    if (op.amount != pool->second.denomination)
    {
        JLOG(j_.debug()) << "Deposit of " << op.amount << " into pool of "
                         << pool->second.denomination;
        return reject(SubmitCode::Rejected, "amount does not match pool");
    }

    auto const tree = trees_.find(op.tree);
    if (tree == trees_.end() || tree->second.pool != op.pool)
        return reject(SubmitCode::Rejected, "unknown tree");

    if (tree->second.tree.full())
        return reject(SubmitCode::Rejected, "tree is full");

    if (leaves_.count(op.commitment) != 0)
    {
        JLOG(j_.warn()) << "Duplicate commitment " << op.commitment;
        return reject(SubmitCode::Rejected, "duplicate commitment");
    }

    return std::nullopt;
}

SubmitResult
LocalLedger::doApply(DepositOperation const& op)
{
    auto& tree = trees_.at(op.tree);
    auto const index = tree.tree.append(op.commitment);
    leaves_.emplace(op.commitment, Leaf{op.tree, index});

    auto& pool = pools_.at(op.pool);
    ++pool.totalDeposits;

    JLOG(j_.debug()) << "Deposit " << op.commitment << " at leaf " << index
                     << " of " << op.tree;

    SubmitResult result;
    result.code = SubmitCode::Success;
    result.leafIndex = index;
    return result;
}

std::optional<SubmitResult>
LocalLedger::preflight(WithdrawOperation const& op) const
{
    if (op.proof.empty() || op.proof.size() > WithdrawOperation::maxProofSize)
        return reject(SubmitCode::Rejected, "bad proof size");
    if (op.nullifierHash.isZero() || op.recipient.isZero())
        return reject(SubmitCode::Rejected, "missing field");
    return std::nullopt;
}

std::optional<SubmitResult>
LocalLedger::preclaim(WithdrawOperation const& op) const
{
    auto const pool = pools_.find(op.pool);
    if (pool == pools_.end() || !pool->second.active)
        return reject(SubmitCode::Rejected, "unknown pool");

    auto const tree = trees_.find(op.tree);
    if (tree == trees_.end() || tree->second.pool != op.pool)
        return reject(SubmitCode::Rejected, "unknown tree");

    if (nullifiers_.count(keylet::nullifier(op.nullifierHash)) != 0)
    {
        JLOG(j_.warn()) << "Nullifier already used: " << op.nullifierHash;
        return reject(SubmitCode::NullifierSpent, "nullifier already used");
    }

    if (op.root != tree->second.tree.root())
    {
        JLOG(j_.debug()) << "Stale root " << op.root;
        return reject(SubmitCode::StaleRoot, "root is not current");
    }

    auto const& p = pool->second;
    if (op.fee > p.maxFee() || op.fee > p.denomination ||
        p.denomination - op.fee < p.minWithdrawal)
        return reject(SubmitCode::Rejected, "fee out of range");

    if (verifier_)
    {
        PublicSignals const signals{
            op.root, op.nullifierHash, op.recipient, op.relayer, op.fee};
        if (!verifier_->verify(op.proof, signals.toStrings()))
        {
            JLOG(j_.warn()) << "Proof verification failed for "
                            << op.nullifierHash;
            return reject(SubmitCode::InvalidProof, "proof does not verify");
        }
    }

    return std::nullopt;
}

SubmitResult
LocalLedger::doApply(WithdrawOperation const& op)
{
    auto const now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());

    NullifierState record;
    record.pool = op.pool;
    record.hash = op.nullifierHash;
    record.spent = true;
    record.timestamp = now.count();
    nullifiers_.emplace(keylet::nullifier(op.nullifierHash), record);

    auto& pool = pools_.at(op.pool);
    ++pool.totalWithdrawals;

    JLOG(j_.debug()) << "Recorded nullifier: " << op.nullifierHash;

    SubmitResult result;
    result.code = SubmitCode::Success;
    return result;
}

//------------------------------------------------------------------------------

std::optional<Blob>
LocalLedger::readAccount(AccountId const& id)
{
    std::lock_guard lock(mutex_);

    if (auto const it = pools_.find(id); it != pools_.end())
        return serialize(it->second);
    if (auto const it = trees_.find(id); it != trees_.end())
        return serialize(treeState(id, it->second));
    if (auto const it = relayers_.find(id); it != relayers_.end())
        return serialize(it->second);
    if (auto const it = nullifiers_.find(id); it != nullifiers_.end())
        return serialize(it->second);
    return std::nullopt;
}

std::vector<AccountRecord>
LocalLedger::readProgramAccounts(AccountFilter const& filter)
{
    std::lock_guard lock(mutex_);

    std::vector<AccountRecord> result;
    auto add = [&](AccountId const& id, Blob data) {
        if (filter.matches(data))
            result.push_back(AccountRecord{id, std::move(data)});
    };

    for (auto const& [id, pool] : pools_)
        add(id, serialize(pool));
    for (auto const& [id, relayer] : relayers_)
        add(id, serialize(relayer));
    for (auto const& [id, tree] : trees_)
        add(id, serialize(treeState(id, tree)));
    for (auto const& [id, nullifier] : nullifiers_)
        add(id, serialize(nullifier));

    return result;
}

std::optional<MerkleProof>
LocalLedger::fetchMerkleProof(uint256 const& commitment)
{
    std::lock_guard lock(mutex_);

    auto const leaf = leaves_.find(commitment);
    if (leaf == leaves_.end())
        return std::nullopt;

    auto const& tree = trees_.at(leaf->second.tree).tree;

    MerkleProof proof;
    proof.treeId = leaf->second.tree;
    proof.root = tree.root();
    proof.siblings = tree.authPath(leaf->second.index);
    proof.leafIndex = leaf->second.index;
    return proof;
}

} // namespace zkp
} // namespace veil
