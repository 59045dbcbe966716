#include <gtest/gtest.h>
#include "test_fixtures.hpp"
#include "common/errors.hpp"
#include "verifier.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace zkverify;

class VerifierTest : public ::testing::Test {
protected:
    Process process = Process::load();
    ChaCha12Rng rng{ChaCha12Rng::seed_from_u64(42)};
    fixtures::Ledger ledger;

    std::pair<ProvingKey, VerifyingKey> keys(const std::string& function) {
        return process.synthesize_key(fixtures::credits_id(), Identifier::parse(function), rng);
    }

    static Program counter_program() {
        return Program::parse("program counter.aleo;\n"
                              "\n"
                              "mapping counts:\n"
                              "    key as address.public;\n"
                              "    value as u64.public;\n"
                              "\n"
                              "function bump:\n"
                              "    input r0 as u64.public;\n"
                              "    input r1 as u64.private;\n"
                              "    add r0 r1 into r2;\n"
                              "    async bump self.caller r2 into r3;\n"
                              "    output r2 as u64.private;\n"
                              "    output r3 as counter.aleo/bump.future;\n"
                              "\n"
                              "finalize bump:\n"
                              "    input r0 as address.public;\n"
                              "    input r1 as u64.public;\n"
                              "    set r1 into counts[r0];\n");
    }
};

TEST_F(VerifierTest, CreditsTransferPublic) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_TRUE(verify_function_execution(execution, vk, Program::credits(), "transfer_public"));
}

// Artifacts survive their text forms, as when read from files
TEST_F(VerifierTest, CreditsTransferPublicFromText) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_TRUE(verify_function_execution(Execution::from_string(execution.to_string()),
                                          VerifyingKey::from_string(vk.to_string()),
                                          Program::parse(Program::credits().to_string()), "transfer_public"));
}

TEST_F(VerifierTest, KeyOfOtherFunctionFails) {
    auto [pk, vk] = keys("transfer_public");
    auto other = keys("transfer_private");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_FALSE(verify_function_execution(execution, other.second, Program::credits(), "transfer_public"));
}

TEST_F(VerifierTest, OtherFunctionNameFails) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_FALSE(verify_function_execution(execution, vk, Program::credits(), "transfer_private"));
}

TEST_F(VerifierTest, CorruptedProofFails) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    Proof proof = execution.proof();
    proof.signatures[0][10] ^= 0x01;
    Execution corrupted(execution.transitions(), execution.global_state_root(), proof);
    EXPECT_FALSE(verify_function_execution(corrupted, vk, Program::credits(), "transfer_public"));
}

TEST_F(VerifierTest, MultipleTransitionsFail) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    Transition transition = execution.transitions()[0];
    Execution doubled({transition, transition}, execution.global_state_root(), execution.proof());
    EXPECT_FALSE(verify_function_execution(doubled, vk, Program::credits(), "transfer_public"));
}

TEST_F(VerifierTest, TransitionsOfTwoFunctionsFail) {
    auto [transfer_pk, transfer_vk] = keys("transfer_public");
    auto [join_pk, join_vk] = keys("join");
    Execution execution = fixtures::transfer_public_and_join(process, transfer_pk, join_pk, rng, ledger,
                                                             fixtures::make_address(1), fixtures::make_address(2));
    EXPECT_FALSE(verify_function_execution(execution, transfer_vk, Program::credits(), "transfer_public",
                                           &ledger.query));
    EXPECT_FALSE(verify_function_execution(execution, join_vk, Program::credits(), "join", &ledger.query));
}

// A future promising more than the transition's public amount
TEST_F(VerifierTest, InflatedFutureAmountFails) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 10);
    Transition transition = execution.transitions()[0];
    Future future = Future::parse(*transition.outputs[0].value);
    future.arguments[2] = "1000000000u64";
    transition.outputs[0].value = future.to_string();
    Execution inflated({transition}, execution.global_state_root(), execution.proof());
    EXPECT_FALSE(verify_function_execution(inflated, vk, Program::credits(), "transfer_public"));
}

TEST_F(VerifierTest, MalformedFunctionNameThrows) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_THROW(verify_function_execution(execution, vk, Program::credits(), "transfer-public"), InvalidIdentifier);
    EXPECT_THROW(verify_function_execution(execution, vk, Program::credits(), ""), InvalidIdentifier);
}

TEST_F(VerifierTest, UnknownFunctionThrows) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_THROW(verify_function_execution(execution, vk, Program::credits(), "burn"), ProcessError);
}

TEST_F(VerifierTest, PrivateTransferWithQuery) {
    auto [pk, vk] = keys("transfer_private");
    Execution execution = fixtures::transfer_private(process, pk, rng, ledger.root(), ledger.commitment(3),
                                                     fixtures::make_address(1), fixtures::make_address(2), 1, 2);
    EXPECT_TRUE(verify_function_execution(execution, vk, Program::credits(), "transfer_private", &ledger.query));
    EXPECT_FALSE(verify_function_execution(execution, vk, Program::credits(), "transfer_private"));

    OfflineQuery restored = OfflineQuery::from_string(ledger.query.to_string());
    EXPECT_TRUE(verify_function_execution(execution, vk, Program::credits(), "transfer_private", &restored));
}

TEST_F(VerifierTest, CustomProgram) {
    Program program = counter_program();
    process.add_program(program);
    auto [pk, vk] = process.synthesize_key(program.id(), Identifier::parse("bump"), rng);

    Future future{program.id(), Identifier::parse("bump"), {fixtures::make_address(5), "12u64"}};
    ExecutionBuilder builder(process, rng);
    builder.add_transition(program.id(), Identifier::parse("bump"), pk, {"5u64", "7u64"},
                           {"12u64", future.to_string()});
    Execution execution = builder.build(ledger.root());

    EXPECT_TRUE(verify_function_execution(execution, vk, program, "bump"));
    EXPECT_FALSE(verify_function_execution(execution, vk, Program::credits(), "transfer_public"));
}

TEST_F(VerifierTest, CustomProgramWithMissingImportThrows) {
    Program program = Program::parse("import counter.aleo;\n"
                                     "program relay.aleo;\n"
                                     "function ping:\n"
                                     "    input r0 as u8.public;\n");
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    EXPECT_THROW(verify_function_execution(execution, vk, program, "ping"), ProcessError);
}

TEST_F(VerifierTest, BatchReportsEachRequest) {
    auto [pk, vk] = keys("transfer_public");
    std::vector<VerificationRequest> requests;
    for (uint64_t amount = 1; amount <= 6; ++amount) {
        Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                        fixtures::make_address(1), fixtures::make_address(2), amount);
        requests.push_back({execution, vk, Program::credits(), "transfer_public"});
    }
    requests[2].function_name = "transfer_private";
    requests[4].function_name = "not a name";

    auto results = verify_batch(requests, &ledger.query);
    ASSERT_EQ(results.size(), requests.size());
    for (size_t i = 0; i < results.size(); ++i) {
        if (i == 2) {
            EXPECT_FALSE(results[i].valid);
            EXPECT_FALSE(results[i].has_error());
        } else if (i == 4) {
            EXPECT_FALSE(results[i].valid);
            EXPECT_TRUE(results[i].has_error());
        } else {
            EXPECT_TRUE(results[i].valid) << "request " << i;
            EXPECT_FALSE(results[i].has_error());
        }
    }
}

TEST_F(VerifierTest, EmptyBatch) {
    EXPECT_TRUE(verify_batch({}).empty());
}

class ManifestTest : public VerifierTest {
protected:
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "zkverify_manifest_test";

    void SetUp() override {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir / "artifacts");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    static void write(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

// A manifest moved together with its artifacts still loads from any working directory
TEST_F(ManifestTest, PathsResolveAgainstManifestDirectory) {
    auto [pk, vk] = keys("transfer_public");
    Execution execution = fixtures::transfer_public(process, pk, rng, ledger.root(),
                                                    fixtures::make_address(1), fixtures::make_address(2), 100);
    write(dir / "artifacts" / "transfer.json", execution.to_string());
    write(dir / "artifacts" / "transfer_public.vk", vk.to_string());

    nlohmann::json manifest;
    manifest["requests"] = nlohmann::json::array({
        {{"execution", "artifacts/transfer.json"}, {"verifying_key", "artifacts/transfer_public.vk"},
         {"credits", true}, {"function", "transfer_public"}},
        {{"execution", "artifacts/transfer.json"},
         {"verifying_key", (dir / "artifacts" / "transfer_public.vk").string()},
         {"credits", true}, {"function", "transfer_public"}},
    });
    write(dir / "manifest.json", manifest.dump());

    auto requests = load_manifest((dir / "manifest.json").string());
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].verifying_key, vk);
    EXPECT_EQ(requests[1].verifying_key, vk);
    EXPECT_EQ(requests[0].function_name, "transfer_public");

    for (const auto& result : verify_batch(requests)) {
        EXPECT_TRUE(result.valid);
        EXPECT_FALSE(result.has_error());
    }
}

TEST_F(ManifestTest, MalformedManifestThrows) {
    write(dir / "no_requests.json", "{\"jobs\":[]}");
    EXPECT_THROW(load_manifest((dir / "no_requests.json").string()), ParseError);

    write(dir / "not_json.json", "{requests");
    EXPECT_THROW(load_manifest((dir / "not_json.json").string()), ParseError);

    write(dir / "no_function.json", "{\"requests\":[{\"execution\":\"e.json\",\"verifying_key\":\"k.vk\",\"credits\":true}]}");
    EXPECT_THROW(load_manifest((dir / "no_function.json").string()), ParseError);

    EXPECT_THROW(load_manifest((dir / "missing.json").string()), std::runtime_error);
}
