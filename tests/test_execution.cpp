#include <gtest/gtest.h>
#include "test_fixtures.hpp"
#include "common/errors.hpp"
#include "execution/ciphertext.hpp"

using namespace zkverify;

class FutureTest : public ::testing::Test {
};

TEST_F(FutureTest, PrintsAndParses) {
    Future future{fixtures::credits_id(), Identifier::parse("transfer_public"),
                  {fixtures::make_address(1), "5u64"}};
    std::string text = future.to_string();
    EXPECT_EQ(text, "{ program_id: credits.aleo, function_name: transfer_public, arguments: [ " +
                        fixtures::make_address(1) + ", 5u64 ] }");
    EXPECT_EQ(Future::parse(text), future);
}

TEST_F(FutureTest, EmptyArguments) {
    Future future{fixtures::credits_id(), Identifier::parse("join"), {}};
    EXPECT_EQ(future.to_string(), "{ program_id: credits.aleo, function_name: join, arguments: [ ] }");
    EXPECT_EQ(Future::parse(future.to_string()), future);
}

TEST_F(FutureTest, ToleratesWhitespace) {
    Future future = Future::parse("{  program_id: credits.aleo,\n  function_name: join,\n  arguments: [\n 1u8,\n 2u8\n ]\n}");
    EXPECT_EQ(future.arguments, (std::vector<std::string>{"1u8", "2u8"}));
}

TEST_F(FutureTest, RejectsMalformed) {
    EXPECT_THROW(Future::parse(""), ParseError);
    EXPECT_THROW(Future::parse("{ program_id: credits.aleo function_name: join, arguments: [ ] }"), ParseError);
    EXPECT_THROW(Future::parse("{ program_id: credits.aleo, function_name: join, arguments: [ 1u8 2u8 ] }"),
                 ParseError);
    EXPECT_THROW(Future::parse("{ program_id: credits.aleo, function_name: join, arguments: [ 300u8 ] }"),
                 ParseError);
    EXPECT_THROW(Future::parse("{ program_id: credits, function_name: join, arguments: [ ] }"), ParseError);
}

class CiphertextTest : public ::testing::Test {
protected:
    BFieldElement view_key{123456789};
};

TEST_F(CiphertextTest, DecryptsWithViewKey) {
    std::string ciphertext = encrypt_value(CIPHERTEXT_HRP, "42u64", view_key, 1);
    EXPECT_EQ(ciphertext.substr(0, 11), "ciphertext1");
    EXPECT_EQ(decrypt_value(CIPHERTEXT_HRP, ciphertext, view_key, 1), "42u64");
    EXPECT_NO_THROW(check_ciphertext(CIPHERTEXT_HRP, ciphertext));
}

TEST_F(CiphertextTest, SlotSeparatesEqualPlaintexts) {
    EXPECT_NE(encrypt_value(CIPHERTEXT_HRP, "42u64", view_key, 1),
              encrypt_value(CIPHERTEXT_HRP, "42u64", view_key, 2));
}

TEST_F(CiphertextTest, WrongKeyFails) {
    std::string ciphertext = encrypt_value(CIPHERTEXT_HRP, "42u64", view_key, 1);
    EXPECT_THROW(decrypt_value(CIPHERTEXT_HRP, ciphertext, BFieldElement(987654321), 1), ParseError);
}

TEST_F(CiphertextTest, RecordCiphertext) {
    std::string record = fixtures::credits_record(fixtures::make_address(2), 50);
    std::string ciphertext = encrypt_value(RECORD_CIPHERTEXT_HRP, record, view_key, 4);
    EXPECT_EQ(ciphertext.substr(0, 7), "record1");
    EXPECT_EQ(decrypt_value(RECORD_CIPHERTEXT_HRP, ciphertext, view_key, 4), record);
    EXPECT_THROW(check_ciphertext(CIPHERTEXT_HRP, ciphertext), ParseError);
}

class ExecutionTest : public ::testing::Test {
protected:
    Process process = Process::load();
    ChaCha12Rng rng{ChaCha12Rng::seed_from_u64(42)};
    fixtures::Ledger ledger;

    Execution public_transfer() {
        auto keys = process.synthesize_key(fixtures::credits_id(), Identifier::parse("transfer_public"), rng);
        return fixtures::transfer_public(process, keys.first, rng, ledger.root(),
                                         fixtures::make_address(1), fixtures::make_address(2), 10);
    }

    Execution private_transfer() {
        auto keys = process.synthesize_key(fixtures::credits_id(), Identifier::parse("transfer_private"), rng);
        return fixtures::transfer_private(process, keys.first, rng, ledger.root(), ledger.commitment(0),
                                          fixtures::make_address(1), fixtures::make_address(2), 30, 70);
    }
};

TEST_F(ExecutionTest, TransitionShape) {
    Execution execution = public_transfer();
    ASSERT_EQ(execution.transitions().size(), 1u);
    const Transition& transition = execution.transitions()[0];
    EXPECT_EQ(transition.program_id, fixtures::credits_id());
    EXPECT_EQ(transition.function_name.to_string(), "transfer_public");
    ASSERT_EQ(transition.inputs.size(), 2u);
    EXPECT_EQ(transition.inputs[0].kind, ValueKind::Public);
    EXPECT_EQ(*transition.inputs[1].value, "10u64");
    ASSERT_EQ(transition.outputs.size(), 1u);
    EXPECT_EQ(transition.outputs[0].kind, ValueKind::Future);
    EXPECT_EQ(transition.id, transition.compute_id());
    EXPECT_FALSE(transition.has_record_inputs());
    EXPECT_EQ(execution.proof().signatures.size(), 1u);
}

TEST_F(ExecutionTest, TransitionIdBindsFields) {
    Transition transition = public_transfer().transitions()[0];
    Digest id = transition.compute_id();

    Transition changed = transition;
    changed.inputs[1].id = BFieldElement(1);
    EXPECT_NE(changed.compute_id(), id);

    changed = transition;
    changed.scm = changed.scm + BFieldElement::one();
    EXPECT_NE(changed.compute_id(), id);
}

TEST_F(ExecutionTest, PublicInputsIncludeRootOnlyForRecords) {
    Transition pub = public_transfer().transitions()[0];
    // id, tpk/tcm/scm, two input ids, one output id
    EXPECT_EQ(pub.public_inputs(ledger.root()).size(), Digest::LEN + 3 + 2 + 1);

    Transition priv = private_transfer().transitions()[0];
    EXPECT_TRUE(priv.has_record_inputs());
    // one record input adds its commitment; the root adds a digest
    EXPECT_EQ(priv.public_inputs(ledger.root()).size(), Digest::LEN + 3 + 3 + 1 + 2 + Digest::LEN);
}

TEST_F(ExecutionTest, PrivateValuesAreEncrypted) {
    ExecutionBuilder builder(process, rng);
    auto keys = process.synthesize_key(fixtures::credits_id(), Identifier::parse("transfer_private"), rng);
    builder.add_transition(fixtures::credits_id(), Identifier::parse("transfer_private"), keys.first,
                           {ledger.commitment(1), fixtures::make_address(3), "5u64"},
                           {fixtures::credits_record(fixtures::make_address(3), 5),
                            fixtures::credits_record(fixtures::make_address(4), 95)});
    Execution execution = builder.build(ledger.root());
    const Transition& transition = execution.transitions()[0];

    EXPECT_EQ(transition.inputs[0].kind, ValueKind::Record);
    EXPECT_EQ(*transition.inputs[0].commitment, ledger.commitments[1]);
    EXPECT_FALSE(transition.inputs[0].value.has_value());
    EXPECT_EQ(decrypt_value(CIPHERTEXT_HRP, *transition.inputs[2].value, builder.view_key(0), 2), "5u64");
    EXPECT_EQ(decrypt_value(RECORD_CIPHERTEXT_HRP, *transition.outputs[1].value, builder.view_key(0), 4),
              fixtures::credits_record(fixtures::make_address(4), 95));
}

TEST_F(ExecutionTest, BuilderRejectsBadArguments) {
    ExecutionBuilder builder(process, rng);
    auto keys = process.synthesize_key(fixtures::credits_id(), Identifier::parse("transfer_public"), rng);
    auto id = fixtures::credits_id();
    auto name = Identifier::parse("transfer_public");
    EXPECT_THROW(builder.add_transition(id, name, keys.first, {"10u64"}, {}), std::invalid_argument);
    EXPECT_THROW(builder.add_transition(id, name, keys.first, {fixtures::make_address(1), "10u32"},
                                        {Future{id, name, {}}.to_string()}),
                 std::invalid_argument);
    EXPECT_THROW(builder.add_transition(id, name, keys.first, {fixtures::make_address(1), "10u64"},
                                        {Future{id, Identifier::parse("join"), {}}.to_string()}),
                 std::invalid_argument);
    EXPECT_THROW(builder.add_transition(id, Identifier::parse("burn"), keys.first, {}, {}), ProcessError);
}

TEST_F(ExecutionTest, JsonKeyOrder) {
    std::string json = public_transfer().to_string();
    size_t transitions = json.find("\"transitions\"");
    size_t root = json.find("\"global_state_root\"");
    size_t proof = json.find("\"proof\"");
    ASSERT_NE(transitions, std::string::npos);
    EXPECT_LT(transitions, root);
    EXPECT_LT(root, proof);

    auto transition = nlohmann::ordered_json::parse(json)["transitions"][0];
    std::vector<std::string> keys;
    for (const auto& item : transition.items()) keys.push_back(item.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"id", "program", "function", "inputs", "outputs", "tpk", "tcm", "scm"}));
    EXPECT_EQ(transition["id"].get<std::string>().substr(0, 3), "au1");
}

TEST_F(ExecutionTest, JsonRoundTrip) {
    for (const Execution& execution : {public_transfer(), private_transfer()}) {
        Execution restored = Execution::from_string(execution.to_string());
        EXPECT_EQ(restored, execution);
        EXPECT_EQ(restored.to_string(), execution.to_string());
    }
}

TEST_F(ExecutionTest, RejectsMalformedJson) {
    EXPECT_THROW(Execution::from_string("not json"), ParseError);
    EXPECT_THROW(Execution::from_string("{\"transitions\":[]}"), ParseError);

    auto j = nlohmann::json::parse(public_transfer().to_string());
    auto missing_value = j;
    missing_value["transitions"][0]["inputs"][0].erase("value");
    EXPECT_THROW(Execution::from_string(missing_value.dump()), ParseError);

    auto bad_kind = j;
    bad_kind["transitions"][0]["outputs"][0]["type"] = "promise";
    EXPECT_THROW(Execution::from_string(bad_kind.dump()), ParseError);

    auto bad_function = j;
    bad_function["transitions"][0]["function"] = "1bad";
    EXPECT_THROW(Execution::from_string(bad_function.dump()), InvalidIdentifier);

    auto bad_proof = j;
    bad_proof["proof"] = "proof1qqqq";
    EXPECT_THROW(Execution::from_string(bad_proof.dump()), ParseError);
}
