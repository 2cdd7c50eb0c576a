#include <test/zkp/MixerFixtures.h>

#include <libveil/zkp/CircuitInputs.h>
#include <libveil/zkp/FieldElement.h>
#include <libveil/zkp/Groth16Verifier.h>

#include <xrpl/beast/unit_test.h>

#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <filesystem>
#include <fstream>

namespace veil {
namespace zkp {

using namespace libsnark;

class Groth16Verifier_test : public beast::unit_test::suite
{
    using Keypair = r1cs_gg_ppzksnark_keypair<DefaultCurve>;

    struct Fixture
    {
        Keypair keypair;
        Groth16Verifier::Proof proof;
        std::vector<std::string> signals;
    };

    // Five public inputs in withdrawal order, with one private sum
    // constrained over the first two.
    static Fixture
    makeFixture()
    {
        initCurveParams();

        PublicSignals const publicSignals{
            test::account("root"),
            test::account("nullifier"),
            test::account("recipient"),
            test::account("relayer"),
            5'000'000};

        protoboard<FieldT> pb;
        pb_variable_array<FieldT> inputs;
        inputs.allocate(pb, 5, "inputs");
        pb_variable<FieldT> sum;
        sum.allocate(pb, "sum");
        pb.set_input_sizes(5);

        pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(inputs[0] + inputs[1], 1, sum), "sum");
        pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(inputs[4], 1, inputs[4]), "fee");

        Fixture f;
        f.signals = publicSignals.toStrings();
        for (std::size_t i = 0; i < 5; ++i)
            pb.val(inputs[i]) = *parseFieldElement(f.signals[i]);
        pb.val(sum) = pb.val(inputs[0]) + pb.val(inputs[1]);

        f.keypair =
            r1cs_gg_ppzksnark_generator<DefaultCurve>(pb.get_constraint_system());
        f.proof = r1cs_gg_ppzksnark_prover<DefaultCurve>(
            f.keypair.pk, pb.primary_input(), pb.auxiliary_input());
        return f;
    }

public:
    void
    run() override
    {
        auto const f = makeFixture();
        testVerify(f);
        testRejects(f);
        testKeyFile(f);
    }

    void
    testVerify(Fixture const& f)
    {
        testcase("Groth16 Verify");

        Groth16Verifier const verifier(f.keypair.vk);
        auto const bytes = Groth16Verifier::serializeProof(f.proof);
        BEAST_EXPECT(!bytes.empty());

        auto const parsed = Groth16Verifier::deserializeProof(bytes);
        BEAST_EXPECT(parsed && *parsed == f.proof);

        BEAST_EXPECT(verifier.verify(bytes, f.signals));
    }

    void
    testRejects(Fixture const& f)
    {
        testcase("Groth16 Rejects");

        Groth16Verifier const verifier(f.keypair.vk);
        auto const bytes = Groth16Verifier::serializeProof(f.proof);

        auto tampered = f.signals;
        tampered[4] = "5000001";
        BEAST_EXPECT(!verifier.verify(bytes, tampered));

        auto swapped = f.signals;
        std::swap(swapped[2], swapped[3]);
        BEAST_EXPECT(!verifier.verify(bytes, swapped));

        auto shorter = f.signals;
        shorter.pop_back();
        BEAST_EXPECT(!verifier.verify(bytes, shorter));

        auto notANumber = f.signals;
        notANumber[0] = "root";
        BEAST_EXPECT(!verifier.verify(bytes, notANumber));

        BEAST_EXPECT(!verifier.verify({}, f.signals));
        BEAST_EXPECT(!Groth16Verifier::deserializeProof(Blob{}));
    }

    void
    testKeyFile(Fixture const& f)
    {
        testcase("Verification Key File");

        auto const path = std::filesystem::temp_directory_path() /
            ("veil_vk_" + to_string(test::account("vk-file")).substr(0, 16));
        {
            std::ofstream out(path, std::ios::binary);
            out << f.keypair.vk;
        }

        auto const verifier = Groth16Verifier::fromFile(path.string());
        BEAST_EXPECT(verifier != nullptr);
        if (verifier)
            BEAST_EXPECT(verifier->verify(
                Groth16Verifier::serializeProof(f.proof), f.signals));

        std::filesystem::remove(path);
        BEAST_EXPECT(Groth16Verifier::fromFile(path.string()) == nullptr);
    }
};

BEAST_DEFINE_TESTSUITE(Groth16Verifier, zkp, veil);

} // namespace zkp
} // namespace veil
