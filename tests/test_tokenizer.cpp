#include <gtest/gtest.h>
#include <clocale>
#include "ifc-core/step/Decoder.hpp"
#include "ifc-core/step/Tokenizer.hpp"

using namespace ifccore;
using namespace ifccore::step;

TEST(Tokenizer, RecognizesEveryTokenKind) {
    auto tokens = tokenizeArguments("(#12,'Wall',42,-1.5E-2,.ELEMENT.,(1,2),IFCLABEL('x'),$,*)");
    ASSERT_TRUE(tokens.success) << tokens.errorMessage;
    ASSERT_EQ(tokens.value.size(), 9u);

    const auto& t = tokens.value;
    EXPECT_EQ(t[0].kind, TokenKind::EntityRef);
    EXPECT_EQ(t[0].ref, 12u);
    EXPECT_EQ(t[1].kind, TokenKind::String);
    EXPECT_EQ(t[1].text, "Wall");
    EXPECT_EQ(t[2].kind, TokenKind::Integer);
    EXPECT_EQ(t[2].integer, 42);
    EXPECT_EQ(t[3].kind, TokenKind::Float);
    EXPECT_DOUBLE_EQ(t[3].real, -0.015);
    EXPECT_EQ(t[4].kind, TokenKind::Enum);
    EXPECT_EQ(t[4].text, "ELEMENT");
    EXPECT_EQ(t[5].kind, TokenKind::List);
    EXPECT_EQ(t[5].children.size(), 2u);
    EXPECT_EQ(t[6].kind, TokenKind::TypedValue);
    EXPECT_EQ(t[6].text, "IFCLABEL");
    ASSERT_EQ(t[6].children.size(), 1u);
    EXPECT_EQ(t[6].children[0].text, "x");
    EXPECT_EQ(t[7].kind, TokenKind::Null);
    EXPECT_EQ(t[8].kind, TokenKind::Derived);
}

TEST(Tokenizer, NumbersWithDotOrExponentAreFloats) {
    auto tokens = tokenizeArguments("(1.,2,3E2,+4,-0.)");
    ASSERT_TRUE(tokens.success);
    EXPECT_EQ(tokens.value[0].kind, TokenKind::Float);
    EXPECT_DOUBLE_EQ(tokens.value[0].real, 1.0);
    EXPECT_EQ(tokens.value[1].kind, TokenKind::Integer);
    EXPECT_EQ(tokens.value[2].kind, TokenKind::Float);
    EXPECT_DOUBLE_EQ(tokens.value[2].real, 300.0);
    EXPECT_EQ(tokens.value[3].kind, TokenKind::Integer);
    EXPECT_EQ(tokens.value[3].integer, 4);
    EXPECT_EQ(tokens.value[4].kind, TokenKind::Float);
}

TEST(Tokenizer, RealsIgnoreProcessLocale) {
    const char* applied = std::setlocale(LC_NUMERIC, "de_DE.UTF-8");
    if (applied == nullptr) {
        applied = std::setlocale(LC_NUMERIC, "fr_FR.UTF-8");
    }
    if (applied == nullptr) {
        GTEST_SKIP() << "No comma-decimal locale installed";
    }

    auto tokens = tokenizeArguments("(1.5,2.E-1)");
    std::setlocale(LC_NUMERIC, "C");

    ASSERT_TRUE(tokens.success) << tokens.errorMessage;
    EXPECT_DOUBLE_EQ(tokens.value[0].real, 1.5);
    EXPECT_DOUBLE_EQ(tokens.value[1].real, 0.2);
}

TEST(Tokenizer, AllowsWhitespaceAndEmptyLists) {
    auto tokens = tokenizeArguments("( #1 , ( ) ,\n 'a' )");
    ASSERT_TRUE(tokens.success) << tokens.errorMessage;
    ASSERT_EQ(tokens.value.size(), 3u);
    EXPECT_EQ(tokens.value[1].kind, TokenKind::List);
    EXPECT_TRUE(tokens.value[1].children.empty());
}

TEST(Tokenizer, ErrorCarriesFileOffset) {
    // '@' is byte 3 of the argument text
    auto tokens = tokenizeArguments("(1,@)", 100);
    ASSERT_FALSE(tokens.success);
    EXPECT_EQ(tokens.errorCode, ErrorCode::ParseError);
    ASSERT_TRUE(tokens.byteOffset.has_value());
    EXPECT_EQ(*tokens.byteOffset, 103u);
}

TEST(Tokenizer, RejectsMalformedInput) {
    EXPECT_FALSE(tokenizeArguments("(1,2").success);
    EXPECT_FALSE(tokenizeArguments("('open)").success);
    EXPECT_FALSE(tokenizeArguments("(.ENUM)").success);
    EXPECT_FALSE(tokenizeArguments("(BARE)").success);
    EXPECT_FALSE(tokenizeArguments("(1) trailing").success);
    EXPECT_FALSE(tokenizeArguments("(#)").success);
}

TEST(Decoder, UnescapesQuotes) {
    EXPECT_EQ(unescapeString("it''s"), "it's");
    EXPECT_EQ(unescapeString("''''"), "''");
    EXPECT_EQ(unescapeString("plain"), "plain");
}

TEST(Decoder, DecodesRawRecord) {
    std::string text = "#9=IFCWALL('guid',$,'O''Brien',(#1,#2),.T.,IFCLENGTHMEASURE(2.5));";
    RawEntity raw;
    raw.id = 9;
    raw.typeName = std::string_view(text).substr(3, 7);
    raw.offset = 0;
    raw.argumentsOffset = 10;
    raw.arguments = std::string_view(text).substr(10, text.size() - 11);

    auto decoded = decodeEntity(raw);
    ASSERT_TRUE(decoded.success) << decoded.errorMessage;
    const DecodedEntity& entity = decoded.value;
    EXPECT_EQ(entity.id, 9u);
    EXPECT_EQ(entity.typeName, "IFCWALL");
    ASSERT_EQ(entity.size(), 6u);
    EXPECT_EQ(entity.getString(0), std::optional<std::string>("guid"));
    EXPECT_TRUE(entity.isNull(1));
    EXPECT_EQ(*entity.getString(2), "O'Brien");
    EXPECT_EQ(entity.getRefs(3), (std::vector<EntityId>{1, 2}));
    EXPECT_EQ(entity.getBool(4), std::optional<bool>(true));
    EXPECT_DOUBLE_EQ(*entity.getFloat(5), 2.5);
    EXPECT_TRUE(entity.isNull(6));
    EXPECT_EQ(entity.get(6), nullptr);
}

TEST(Decoder, ErrorNamesEntity) {
    std::string text = "#4=IFCFOO((1,2);";
    RawEntity raw;
    raw.id = 4;
    raw.typeName = std::string_view(text).substr(3, 6);
    raw.argumentsOffset = 9;
    raw.arguments = std::string_view(text).substr(9, 6);

    auto decoded = decodeEntity(raw);
    ASSERT_FALSE(decoded.success);
    EXPECT_EQ(decoded.errorCode, ErrorCode::ParseError);
    EXPECT_EQ(decoded.entityId, 4u);
    EXPECT_NE(decoded.errorMessage.find("#4"), std::string::npos);
}

TEST(AttributeValue, AccessorsUnwrapTypedValues) {
    auto label = AttributeValue::typed("IFCLABEL", {AttributeValue::string("Door")});
    ASSERT_NE(label.asString(), nullptr);
    EXPECT_EQ(*label.asString(), "Door");

    auto length = AttributeValue::typed("IFCLENGTHMEASURE", {AttributeValue::integer(3)});
    EXPECT_EQ(length.asFloat(), std::optional<double>(3.0));

    auto flag = AttributeValue::typed("IFCBOOLEAN", {AttributeValue::enumeration("F")});
    EXPECT_EQ(flag.asBool(), std::optional<bool>(false));

    EXPECT_FALSE(AttributeValue::enumeration("UNKNOWN").asBool().has_value());
    EXPECT_FALSE(AttributeValue::string("x").asRef().has_value());
}

TEST(AttributeValue, ToStringRendersStepText) {
    auto value = AttributeValue::list({
        AttributeValue::ref(3),
        AttributeValue::string("it's"),
        AttributeValue::null(),
        AttributeValue::enumeration("T")
    });
    EXPECT_EQ(value.toString(), "(#3,'it''s',$,.T.)");
}
