#include <gtest/gtest.h>
#include "program/program.hpp"
#include "common/errors.hpp"

using namespace zkverify;

class IdentifierTest : public ::testing::Test {
};

TEST_F(IdentifierTest, AcceptsValidNames) {
    EXPECT_EQ(Identifier::parse("transfer_public").to_string(), "transfer_public");
    EXPECT_TRUE(Identifier::is_valid("a"));
    EXPECT_TRUE(Identifier::is_valid("Token2_x"));
    EXPECT_TRUE(Identifier::is_valid(std::string(Identifier::MAX_LENGTH, 'x')));
}

TEST_F(IdentifierTest, RejectsInvalidNames) {
    EXPECT_FALSE(Identifier::is_valid(""));
    EXPECT_FALSE(Identifier::is_valid("1abc"));
    EXPECT_FALSE(Identifier::is_valid("_abc"));
    EXPECT_FALSE(Identifier::is_valid("ab-c"));
    EXPECT_FALSE(Identifier::is_valid(std::string(Identifier::MAX_LENGTH + 1, 'x')));
    EXPECT_THROW(Identifier::parse("transfer public"), InvalidIdentifier);
}

TEST_F(IdentifierTest, RejectsReservedWords) {
    EXPECT_THROW(Identifier::parse("function"), InvalidIdentifier);
    EXPECT_THROW(Identifier::parse("record"), InvalidIdentifier);
    EXPECT_THROW(Identifier::parse("u64"), InvalidIdentifier);
    EXPECT_THROW(Identifier::parse("address"), InvalidIdentifier);
}

TEST_F(IdentifierTest, ProgramId) {
    auto id = ProgramID::parse("token.aleo");
    EXPECT_EQ(id.name().to_string(), "token");
    EXPECT_EQ(id.to_string(), "token.aleo");
    EXPECT_EQ(ProgramID::parse(CREDITS_PROGRAM_ID).to_string(), "credits.aleo");

    EXPECT_THROW(ProgramID::parse("token"), InvalidIdentifier);
    EXPECT_THROW(ProgramID::parse(".aleo"), InvalidIdentifier);
    EXPECT_THROW(ProgramID::parse("token.eth"), InvalidIdentifier);
    EXPECT_THROW(ProgramID::parse("myaleo.aleo"), InvalidIdentifier);
    EXPECT_THROW(ProgramID::parse("9token.aleo"), InvalidIdentifier);
}

class LiteralTest : public ::testing::Test {
};

TEST_F(LiteralTest, ParsesEveryKind) {
    EXPECT_EQ(Literal::parse("10u64").type(), LiteralType::U64);
    EXPECT_EQ(Literal::parse("-3i8").type(), LiteralType::I8);
    EXPECT_EQ(Literal::parse("42field").type(), LiteralType::Field);
    EXPECT_EQ(Literal::parse("5scalar").type(), LiteralType::Scalar);
    EXPECT_EQ(Literal::parse("9group").type(), LiteralType::Group);
    EXPECT_EQ(Literal::parse("true").type(), LiteralType::Boolean);
    EXPECT_EQ(Literal::parse("0u8").to_string(), "0u8");
}

TEST_F(LiteralTest, IntegerRanges) {
    EXPECT_NO_THROW(Literal::parse("255u8"));
    EXPECT_THROW(Literal::parse("256u8"), ParseError);
    EXPECT_NO_THROW(Literal::parse("-128i8"));
    EXPECT_THROW(Literal::parse("128i8"), ParseError);
    EXPECT_THROW(Literal::parse("-129i8"), ParseError);
    EXPECT_NO_THROW(Literal::parse("18446744073709551615u64"));
    EXPECT_THROW(Literal::parse("18446744073709551616u64"), ParseError);
    EXPECT_NO_THROW(Literal::parse("340282366920938463463374607431768211455u128"));
    EXPECT_THROW(Literal::parse("340282366920938463463374607431768211456u128"), ParseError);
}

TEST_F(LiteralTest, RejectsMalformed) {
    EXPECT_THROW(Literal::parse("u64"), ParseError);
    EXPECT_THROW(Literal::parse("-1u64"), ParseError);
    EXPECT_THROW(Literal::parse("-0i32"), ParseError);
    EXPECT_THROW(Literal::parse("01u32"), ParseError);
    EXPECT_THROW(Literal::parse("1.5u32"), ParseError);
    EXPECT_THROW(Literal::parse("0group"), ParseError);
    EXPECT_THROW(Literal::parse("18446744069414584321field"), ParseError);
    EXPECT_THROW(Literal::parse("TRUE"), ParseError);
    EXPECT_THROW(Literal::parse("aleo1qqqq"), ParseError);
}

TEST_F(LiteralTest, FieldElementConversion) {
    EXPECT_EQ(element_from_literal("1234field", LiteralType::Field), BFieldElement(1234));
    EXPECT_EQ(element_to_literal(BFieldElement(1234), LiteralType::Field), "1234field");
    EXPECT_THROW(element_from_literal("1234u64", LiteralType::Field), ParseError);
}

class ValueTypeTest : public ::testing::Test {
};

TEST_F(ValueTypeTest, ParseEveryKind) {
    auto pub = ValueType::parse("u64.public");
    EXPECT_EQ(pub.kind, ValueKind::Public);
    EXPECT_EQ(pub.literal, LiteralType::U64);
    EXPECT_TRUE(pub.is_literal());

    auto record = ValueType::parse("credits.record");
    EXPECT_EQ(record.kind, ValueKind::Record);
    EXPECT_EQ(record.name->to_string(), "credits");

    auto external = ValueType::parse("credits.aleo/credits.record");
    EXPECT_EQ(external.kind, ValueKind::ExternalRecord);
    EXPECT_EQ(external.program->to_string(), "credits.aleo");

    auto future = ValueType::parse("credits.aleo/transfer_public.future");
    EXPECT_EQ(future.kind, ValueKind::Future);
    EXPECT_EQ(future.name->to_string(), "transfer_public");
}

TEST_F(ValueTypeTest, PrintsCanonicalText) {
    for (const char* text : {"field.constant", "address.private", "u64.public", "credits.record",
                             "credits.aleo/credits.record", "credits.aleo/join.future"}) {
        EXPECT_EQ(ValueType::parse(text).to_string(), text);
    }
}

TEST_F(ValueTypeTest, RejectsMalformed) {
    EXPECT_THROW(ValueType::parse("u64"), ParseError);
    EXPECT_THROW(ValueType::parse("u64.secret"), ParseError);
    EXPECT_THROW(ValueType::parse("u64.record.public"), ParseError);
    EXPECT_THROW(ValueType::parse("transfer_public.future"), ParseError);
    EXPECT_THROW(ValueType::parse("x.aleo/1bad.record"), InvalidIdentifier);
}

class ProgramTest : public ::testing::Test {
protected:
    static std::string token_source() {
        return "import credits.aleo;\n"
               "program token.aleo;\n"
               "\n"
               "mapping balances:\n"
               "    key as address.public;\n"
               "    value as u64.public;\n"
               "\n"
               "struct pair:\n"
               "    left as u64;\n"
               "    right as u64;\n"
               "\n"
               "record token:\n"
               "    owner as address.private;\n"
               "    amount as u64.private;\n"
               "\n"
               "closure double:\n"
               "    input r0 as u64;\n"
               "    add r0 r0 into r1;\n"
               "    output r1 as u64;\n"
               "\n"
               "function mint:   // public mint\n"
               "    input r0 as address.public;\n"
               "    input r1 as u64.public;\n"
               "    async mint r0 r1 into r2;\n"
               "    output r2 as token.aleo/mint.future;\n"
               "\n"
               "finalize mint:\n"
               "    input r0 as address.public;\n"
               "    input r1 as u64.public;\n"
               "    set r1 into balances[r0];\n"
               "\n"
               "function wrap:\n"
               "    input r0 as credits.aleo/credits.record;\n"
               "    input r1 as u64.private;\n"
               "    cast r0.owner r1 into r2 as token.record;\n"
               "    output r2 as token.record;\n";
    }

    static std::string single_function(const std::string& body) {
        return "program demo.aleo;\n\nfunction main:\n" + body;
    }
};

TEST_F(ProgramTest, ParsesEveryBlock) {
    Program program = Program::parse(token_source());
    EXPECT_EQ(program.id().to_string(), "token.aleo");
    ASSERT_EQ(program.imports().size(), 1u);
    EXPECT_EQ(program.imports()[0].to_string(), "credits.aleo");
    EXPECT_EQ(program.mappings().size(), 1u);
    EXPECT_EQ(program.structs().size(), 1u);
    EXPECT_EQ(program.records().size(), 1u);
    EXPECT_EQ(program.closures().size(), 1u);
    ASSERT_EQ(program.functions().size(), 2u);

    const Function* mint = program.find_function(Identifier::parse("mint"));
    ASSERT_NE(mint, nullptr);
    EXPECT_EQ(mint->inputs.size(), 2u);
    EXPECT_EQ(mint->instructions.size(), 1u);
    EXPECT_TRUE(mint->has_future_output());
    ASSERT_TRUE(mint->finalize.has_value());
    EXPECT_EQ(mint->finalize->statements.size(), 3u);

    EXPECT_TRUE(program.contains_record(Identifier::parse("token")));
    EXPECT_FALSE(program.contains_function(Identifier::parse("burn")));
}

TEST_F(ProgramTest, CanonicalTextParsesBack) {
    Program program = Program::parse(token_source());
    Program reparsed = Program::parse(program.to_string());
    EXPECT_EQ(reparsed, program);
    EXPECT_EQ(reparsed.to_string(), program.to_string());
}

TEST_F(ProgramTest, CreditsProgram) {
    Program credits = Program::credits();
    EXPECT_EQ(credits.id().to_string(), CREDITS_PROGRAM_ID);
    for (const char* name : {"transfer_public", "transfer_private", "transfer_private_to_public",
                             "transfer_public_to_private", "join", "split"}) {
        EXPECT_TRUE(credits.contains_function(Identifier::parse(name))) << name;
    }
    EXPECT_TRUE(credits.contains_record(Identifier::parse("credits")));
    EXPECT_EQ(Program::parse(credits.to_string()), credits);
}

TEST_F(ProgramTest, RejectsMalformedSource) {
    EXPECT_THROW(Program::parse(""), ParseError);
    EXPECT_THROW(Program::parse("program demo.aleo;\n"), ParseError);
    EXPECT_THROW(Program::parse("program demo.aleo\nfunction main:\n"), ParseError);
    EXPECT_THROW(Program::parse(single_function("    input r1 as u64.public;\n")), ParseError);
    EXPECT_THROW(Program::parse(single_function("    input r0 as u64.public;\n    input r0 as u64.public;\n")),
                 ParseError);
    EXPECT_THROW(Program::parse(single_function("    output r0 as u64.public;\n    add r0 r0 into r1;\n")),
                 ParseError);
    EXPECT_THROW(Program::parse(single_function("    input r0 as ghost.record;\n")), ParseError);
    EXPECT_THROW(Program::parse(single_function("    input r0 as u64.public;\n") + "\nwidget main:\n    x;\n"),
                 ParseError);
}

TEST_F(ProgramTest, RejectsDuplicateNames) {
    std::string source = single_function("    input r0 as u64.public;\n") +
                         "\nfunction main:\n    input r0 as u64.public;\n";
    EXPECT_THROW(Program::parse(source), ParseError);
}

TEST_F(ProgramTest, RejectsBadRecords) {
    EXPECT_THROW(Program::parse("program demo.aleo;\nrecord r:\n    amount as u64.private;\n"
                                "function main:\n    input r0 as u64.public;\n"),
                 ParseError);
}

TEST_F(ProgramTest, FutureAndFinalizeMustMatch) {
    // future without finalize
    EXPECT_THROW(Program::parse(single_function("    async main into r0;\n"
                                                "    output r0 as demo.aleo/main.future;\n")),
                 ParseError);
    // finalize without future
    EXPECT_THROW(Program::parse(single_function("    input r0 as u64.public;\n"
                                                "finalize main:\n    input r0 as u64.public;\n")),
                 ParseError);
    // future named after another function
    EXPECT_THROW(Program::parse(single_function("    async main into r0;\n"
                                                "    output r0 as demo.aleo/other.future;\n"
                                                "finalize main:\n    input r0 as u64.public;\n")),
                 ParseError);
}

TEST_F(ProgramTest, ExternalRecordNeedsImport) {
    EXPECT_THROW(Program::parse(single_function("    input r0 as credits.aleo/credits.record;\n")), ParseError);
}

TEST_F(ProgramTest, CircuitIdsAreDistinct) {
    Program credits = Program::credits();
    auto id = credits.id();
    const Function* pub = credits.find_function(Identifier::parse("transfer_public"));
    const Function* priv = credits.find_function(Identifier::parse("transfer_private"));
    ASSERT_NE(pub, nullptr);
    ASSERT_NE(priv, nullptr);

    EXPECT_NE(compute_circuit_id(id, *pub), compute_circuit_id(id, *priv));
    EXPECT_EQ(compute_circuit_id(id, *pub), compute_circuit_id(id, *pub));
    EXPECT_NE(compute_function_id(id, pub->name), compute_circuit_id(id, *pub));
    EXPECT_NE(compute_function_id(id, pub->name), compute_function_id(ProgramID::parse("other.aleo"), pub->name));
}
