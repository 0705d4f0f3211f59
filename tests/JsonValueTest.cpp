#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

import shape.common.message_output;
import shape.json.reading_ahead_buffer;
import shape.json.json_token_manager;
import shape.json.json_tokenizer;
import shape.json.json_parser;
import shape.json.json_value;
import shape.json.json_io;

using namespace shape::json;
using shape::common::CollectingMessageOutput;

namespace {

JsonValue parseQuiet(std::string_view text) {
    shape::common::NullMessageOutput output;
    return parseJsonValue(text, output);
}

// 例外メッセージに指定文字列が含まれることを確認する
void expectParseError(std::string_view text, const std::string& fragment) {
    try {
        parseQuiet(text);
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos)
            << "message: " << e.what();
        return;
    }
    ADD_FAILURE() << "no exception for: " << text;
}

} // namespace

// ********************************************************************************
// プリミティブ値
// ********************************************************************************

TEST(JsonValueTest, Primitives) {
    EXPECT_TRUE(parseQuiet("null").isNull());
    EXPECT_EQ(parseQuiet("true").asBool(), true);
    EXPECT_EQ(parseQuiet("false").asBool(), false);
    EXPECT_EQ(parseQuiet("42").asInteger(), std::int64_t{42});
    EXPECT_EQ(parseQuiet("-7").asInteger(), std::int64_t{-7});
    EXPECT_DOUBLE_EQ(*parseQuiet("1.5").asNumber(), 1.5);
    EXPECT_DOUBLE_EQ(*parseQuiet("2e3").asNumber(), 2000.0);
    EXPECT_DOUBLE_EQ(*parseQuiet(".5").asNumber(), 0.5);
    ASSERT_NE(parseQuiet("\"text\"").asString(), nullptr);
    EXPECT_EQ(*parseQuiet("\"text\"").asString(), "text");
}

// 整数は asNumber でも取得できるが、浮動小数点数は asInteger で取得できない
TEST(JsonValueTest, IntegerAndNumberAccessors) {
    const JsonValue integer = parseQuiet("3");
    EXPECT_EQ(integer.kind(), JsonKind::Integer);
    EXPECT_DOUBLE_EQ(*integer.asNumber(), 3.0);

    const JsonValue number = parseQuiet("3.25");
    EXPECT_EQ(number.kind(), JsonKind::Number);
    EXPECT_FALSE(number.asInteger().has_value());
}

TEST(JsonValueTest, KindNames) {
    EXPECT_STREQ(parseQuiet("{}").kindName(), "object");
    EXPECT_STREQ(parseQuiet("[]").kindName(), "array");
    EXPECT_STREQ(parseQuiet("'s'").kindName(), "string");
    EXPECT_STREQ(parseQuiet("1").kindName(), "integer");
    EXPECT_STREQ(parseQuiet("1.0").kindName(), "number");
    EXPECT_STREQ(parseQuiet("true").kindName(), "bool");
    EXPECT_STREQ(parseQuiet("null").kindName(), "null");
}

// ********************************************************************************
// オブジェクトと配列
// ********************************************************************************

// キーの出現順を保持する
TEST(JsonValueTest, ObjectKeepsInsertionOrder) {
    const JsonValue value = parseQuiet(R"({"z": 1, "a": 2, "m": 3})");
    const JsonObject* object = value.asObject();
    ASSERT_NE(object, nullptr);
    ASSERT_EQ(object->size(), 3u);

    std::string order;
    for (const auto& [key, member] : *object) {
        order += key;
    }
    EXPECT_EQ(order, "zam");
    EXPECT_TRUE(object->contains("a"));
    EXPECT_FALSE(object->contains("b"));
    ASSERT_NE(object->find("m"), nullptr);
    EXPECT_EQ(object->find("m")->asInteger(), std::int64_t{3});
}

TEST(JsonValueTest, NestedStructureEquality) {
    const JsonValue parsed = parseQuiet(R"({"list": [1, "x", null, true], "inner": {"k": 1.5}})");
    const JsonValue expected{JsonObject{
        {"list", JsonArray{JsonValue(1), JsonValue("x"), JsonValue(nullptr), JsonValue(true)}},
        {"inner", JsonObject{{"k", 1.5}}},
    }};
    EXPECT_TRUE(parsed == expected);
}

// 重複キーは最後の値が有効になり、警告が出る
TEST(JsonValueTest, DuplicateKeyKeepsLastValueAndWarns) {
    CollectingMessageOutput output;
    const JsonValue value = parseJsonValue(R"({"a": 1, "b": 2, "a": 3})", output);

    const JsonObject* object = value.asObject();
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(object->size(), 2u);
    EXPECT_EQ(object->find("a")->asInteger(), std::int64_t{3});

    const auto warnings = output.warnings();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("Duplicate key 'a'"), std::string::npos);
}

// 出力先を指定しなければ標準出力に警告する
TEST(JsonValueTest, DefaultOutputPrintsWarnings) {
    testing::internal::CaptureStdout();
    const JsonValue value = parseJsonValue(R"({"a": 1, "a": 2})");
    const std::string printed = testing::internal::GetCapturedStdout();

    EXPECT_EQ(value.asObject()->find("a")->asInteger(), std::int64_t{2});
    EXPECT_NE(printed.find("Warning: Duplicate key 'a'"), std::string::npos) << printed;
}

TEST(JsonValueTest, ObjectInsertOrAssign) {
    JsonObject object;
    EXPECT_FALSE(object.insertOrAssign("k", JsonValue(1)));
    EXPECT_TRUE(object.insertOrAssign("k", JsonValue(2)));
    EXPECT_EQ(object.size(), 1u);
    EXPECT_EQ(object.find("k")->asInteger(), std::int64_t{2});
}

// ********************************************************************************
// JSON5の構文
// ********************************************************************************

TEST(JsonValueTest, Json5Syntax) {
    const JsonValue value = parseQuiet(R"(
        // 単一行コメント
        {
            unquoted: 'single',   /* 複数行
                                     コメント */
            $dollar_1: 0x1F,
            negativeHex: -0x10,
            trailing: [1, 2,],
            "plus": +5,
        }
    )");
    const JsonObject* object = value.asObject();
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(*object->find("unquoted")->asString(), "single");
    EXPECT_EQ(object->find("$dollar_1")->asInteger(), std::int64_t{31});
    EXPECT_EQ(object->find("negativeHex")->asInteger(), std::int64_t{-16});
    EXPECT_EQ(object->find("trailing")->asArray()->size(), 2u);
    EXPECT_EQ(object->find("plus")->asInteger(), std::int64_t{5});
}

TEST(JsonValueTest, SpecialNumbers) {
    const JsonValue value = parseQuiet("{a: Infinity, b: -Infinity, c: NaN}");
    const JsonObject* object = value.asObject();
    ASSERT_NE(object, nullptr);
    EXPECT_TRUE(std::isinf(*object->find("a")->asNumber()));
    EXPECT_LT(*object->find("b")->asNumber(), 0.0);
    EXPECT_TRUE(std::isnan(*object->find("c")->asNumber()));
}

// 予約語もコロンが続けばキーになる
TEST(JsonValueTest, ReservedWordsAsKeys) {
    const JsonValue value = parseQuiet("{null: 1, true: 2, Infinity: 3}");
    const JsonObject* object = value.asObject();
    ASSERT_NE(object, nullptr);
    EXPECT_TRUE(object->contains("null"));
    EXPECT_TRUE(object->contains("true"));
    EXPECT_TRUE(object->contains("Infinity"));
}

// int64 に収まらない整数は浮動小数点数になる
TEST(JsonValueTest, IntegerOverflowBecomesNumber) {
    const JsonValue value = parseQuiet("9223372036854775808");
    EXPECT_EQ(value.kind(), JsonKind::Number);
    EXPECT_DOUBLE_EQ(*value.asNumber(), 9223372036854775808.0);
}

TEST(JsonValueTest, StringEscapes) {
    EXPECT_EQ(*parseQuiet(R"("a\nb\t\"q\"")").asString(), "a\nb\t\"q\"");
    EXPECT_EQ(*parseQuiet(R"('it\'s')").asString(), "it's");
    EXPECT_EQ(*parseQuiet(R"("\x41é")").asString(), "A\xC3\xA9");
    // サロゲートペアは1つのコードポイントに結合する
    EXPECT_EQ(*parseQuiet(R"("\uD83D\uDE00")").asString(), "\xF0\x9F\x98\x80");
    // 行継続
    EXPECT_EQ(*parseQuiet("\"ab\\\ncd\"").asString(), "abcd");
}

// 文字列中のエスケープされていない行区切り文字は警告になる
TEST(JsonValueTest, UnescapedLineSeparatorWarns) {
    CollectingMessageOutput output;
    const JsonValue value = parseJsonValue("\"x" "\xE2\x80\xA8" "y\"", output);
    EXPECT_EQ(*value.asString(), "x\xE2\x80\xA8y");
    EXPECT_EQ(output.warnings().size(), 1u);
}

// ********************************************************************************
// エラー
// ********************************************************************************

TEST(JsonValueTest, SyntaxErrorsReportPosition) {
    expectParseError(R"({"a": @})", "position 6");
    expectParseError(R"({"a": "unterminated})", "unterminated string");
    expectParseError("{a: 1 b: 2}", "after value");
    expectParseError("/* open", "unterminated comment");
    expectParseError("[1, bare]", "unexpected identifier 'bare'");
}

TEST(JsonValueTest, StructuralErrors) {
    expectParseError("", "expected value but got end-of-stream");
    expectParseError("[1, 2", "expected value but got end-of-stream");
    expectParseError("{\"a\" 1}", "after value");
    expectParseError("1, 2", "unexpected ','");
}

// 区切り文字の位置の誤り
TEST(JsonValueTest, MisplacedSeparators) {
    expectParseError("[1,,2]", "unexpected ','");
    expectParseError(R"({,"p":1})", "unexpected ','");
    expectParseError(R"({"p"::1})", "unexpected ':'");
    expectParseError("1,", "unexpected ','");
    expectParseError("[,]", "unexpected ','");
    expectParseError("[1 2]", "after value");
    expectParseError(R"({"p":})", "after key");
    // 末尾のカンマは1つだけ許す
    EXPECT_EQ(parseQuiet("[1,]").asArray()->size(), 1u);
    EXPECT_EQ(parseQuiet("{p: 1,}").asObject()->size(), 1u);
}

// 16進整数は int64 の範囲だけ受け付け、範囲外で値が変わることはない
TEST(JsonValueTest, HexIntegerRange) {
    EXPECT_EQ(parseQuiet("0x7FFFFFFFFFFFFFFF").asInteger(), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(parseQuiet("-0x8000000000000000").asInteger(), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(parseQuiet("-0x7FFFFFFFFFFFFFFF").asInteger(), -std::numeric_limits<std::int64_t>::max());
    expectParseError("0x8000000000000000", "hexadecimal number out of range");
    expectParseError("0xFFFFFFFFFFFFFFFF", "hexadecimal number out of range");
    expectParseError("-0x8000000000000001", "hexadecimal number out of range");
    expectParseError("0x10000000000000000", "hexadecimal number out of range");
}

// 数値の変換はロケールの小数点記号に左右されない
TEST(JsonValueTest, DecimalConversion) {
    EXPECT_DOUBLE_EQ(*parseQuiet("1.5").asNumber(), 1.5);
    EXPECT_DOUBLE_EQ(*parseQuiet("-.25").asNumber(), -0.25);
    EXPECT_DOUBLE_EQ(*parseQuiet("5.").asNumber(), 5.0);
    EXPECT_DOUBLE_EQ(*parseQuiet("2e3").asNumber(), 2000.0);
    EXPECT_EQ(parseQuiet("-9223372036854775808").asInteger(), std::numeric_limits<std::int64_t>::min());
    expectParseError("1e400", "number out of range");
}

// 入れ子の深さには上限がある
TEST(JsonValueTest, NestingDepthLimit) {
    const std::string accepted = std::string(maxNestingDepth, '[') + std::string(maxNestingDepth, ']');
    EXPECT_TRUE(parseQuiet(accepted).isArray());

    const std::size_t tooDeep = maxNestingDepth + 1;
    expectParseError(std::string(tooDeep, '[') + std::string(tooDeep, ']'), "nesting deeper than");

    std::string objects;
    for (std::size_t i = 0; i < 100000; ++i) {
        objects += "{a:";
    }
    expectParseError(objects, "nesting deeper than");
}

TEST(JsonValueTest, SkipValueDepthLimit) {
    const std::size_t tooDeep = maxNestingDepth + 1;
    const std::string text = std::string(tooDeep, '[') + std::string(tooDeep, ']');
    ReadingAheadBuffer input{std::string_view(text)};
    JsonTokenManager tokens;
    shape::common::NullMessageOutput output;
    JsonTokenizer<ReadingAheadBuffer, JsonTokenManager> tokenizer(input, tokens, output);
    tokenizer.tokenize();

    JsonParser parser(tokens);
    EXPECT_THROW(parser.skipValue(), std::runtime_error);
}

// ********************************************************************************
// パーサーの直接利用
// ********************************************************************************

TEST(JsonValueTest, PullParserSkipsValues) {
    ReadingAheadBuffer input(std::string_view(R"({"skip": {"x": [1, {"y": 2}]}, "keep": "v"})"));
    JsonTokenManager tokens;
    shape::common::NullMessageOutput output;
    JsonTokenizer<ReadingAheadBuffer, JsonTokenManager> tokenizer(input, tokens, output);
    tokenizer.tokenize();

    JsonParser parser(tokens);
    parser.startObject();
    EXPECT_EQ(parser.nextKey(), "skip");
    parser.skipValue();
    EXPECT_EQ(parser.nextKey(), "keep");
    EXPECT_EQ(parser.nextTokenType(), JsonTokenType::String);
    std::string keep;
    parser.readTo(keep);
    EXPECT_EQ(keep, "v");
    parser.endObject();
    EXPECT_TRUE(parser.nextIsEndOfStream());
    // 終端トークンは何度読んでも終端のまま
    EXPECT_TRUE(parser.nextIsEndOfStream());
}

TEST(JsonValueTest, InputBufferBounds) {
    ReadingAheadBuffer input(std::string_view("ab"));
    EXPECT_EQ(input.peekAhead(1), 'b');
    EXPECT_EQ(input.peekAhead(5), '\0');
    input.consume(2);
    EXPECT_TRUE(input.atEnd());
    EXPECT_EQ(input.position(), 2u);
    EXPECT_THROW(input.consume(), std::out_of_range);
}

TEST(JsonValueTest, ParserTypeMismatch) {
    ReadingAheadBuffer input(std::string_view("\"text\""));
    JsonTokenManager tokens;
    shape::common::NullMessageOutput output;
    JsonTokenizer<ReadingAheadBuffer, JsonTokenManager> tokenizer(input, tokens, output);
    tokenizer.tokenize();

    JsonParser parser(tokens);
    bool flag = false;
    EXPECT_THROW(parser.readTo(flag), std::runtime_error);
}

// ********************************************************************************
// ファイル読み込み
// ********************************************************************************

TEST(JsonValueTest, ReadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "shape_dispatch_json_value_test.json5";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "{type: 'Circle', radius: 2}";
    }
    CollectingMessageOutput output;
    const JsonValue value = readJsonValueFile(path, output);
    std::filesystem::remove(path);

    ASSERT_TRUE(value.isObject());
    EXPECT_EQ(*value.asObject()->find("type")->asString(), "Circle");
    EXPECT_TRUE(output.warnings().empty());
}

TEST(JsonValueTest, ReadMissingFileThrows) {
    CollectingMessageOutput output;
    EXPECT_THROW(readJsonValueFile("/nonexistent/shape_dispatch/none.json5", output),
                 std::runtime_error);
}
