// @file JsonParser.cppm
// @brief JSON5パーサーの定義。トークン列を先頭から順に読み取るプル型インターフェース。

module;
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

export module shape.json.json_parser;

import shape.json.json_token_manager;

export namespace shape::json {

// @brief パーサーが読み取り元として要求するインターフェース
template <typename T>
concept TokenManager = requires(T& t, const T& ct) {
    { t.take() } -> std::same_as<JsonToken>;
    { ct.peek() } -> std::same_as<const JsonToken&>;
};

// @brief 配列・オブジェクトの入れ子の上限
inline constexpr std::size_t maxNestingDepth = 512;

// @brief 入れ子が上限を超えていれば送出する
// @param depth 開いたばかりの配列・オブジェクトを含めた深さ
// @param position その開始トークンの位置
inline void checkNestingDepth(std::size_t depth, std::size_t position) {
    if (depth > maxNestingDepth) {
        throw std::runtime_error("JsonParser: nesting deeper than " +
                                 std::to_string(maxNestingDepth) + " levels at position " +
                                 std::to_string(position));
    }
}

// ******************************************************************************** JsonParserBase
// @brief JSON5パーサー（トークン列からの読み取り）
// @note トークナイザーが終端トークンを必ず追加するため、読み取り元が空になることはない。
template <TokenManager TokMgr>
class JsonParserBase {
public:
    explicit JsonParserBase(TokMgr& tokenManager) : tokenManager_(tokenManager) {}

    // ******************************************************************************** 先読み
    // @brief 次のトークンの開始位置
    std::size_t nextPosition() const { return tokenManager_.peek().position; }

    // @brief 次のトークンの種類（消費しない）
    JsonTokenType nextTokenType() const { return tokenManager_.peek().type; }

    bool nextIsEndArray() const { return nextTokenType() == JsonTokenType::EndArray; }
    bool nextIsEndObject() const { return nextTokenType() == JsonTokenType::EndObject; }
    bool nextIsEndOfStream() const { return nextTokenType() == JsonTokenType::EndOfStream; }
    bool nextIsNull() const { return nextTokenType() == JsonTokenType::Null; }

    // ******************************************************************************** 構造
    // 戻り値は消費したトークンの位置
    std::size_t startObject() { return expect(JsonTokenType::StartObject, "object start '{'").position; }
    std::size_t endObject() { return expect(JsonTokenType::EndObject, "object end '}'").position; }
    std::size_t startArray() { return expect(JsonTokenType::StartArray, "array start '['").position; }
    std::size_t endArray() { return expect(JsonTokenType::EndArray, "array end ']'").position; }

    std::string nextKey() {
        return std::get<std::string>(expect(JsonTokenType::Key, "object key").payload);
    }

    // ******************************************************************************** 値
    void readTo(bool& out) {
        out = std::get<bool>(expect(JsonTokenType::Bool, "bool").payload);
    }

    void readTo(std::int64_t& out) {
        out = std::get<std::int64_t>(expect(JsonTokenType::Integer, "integer").payload);
    }

    // 整数トークンも受け付ける
    void readTo(double& out) {
        JsonToken token = tokenManager_.take();
        if (token.type == JsonTokenType::Number) {
            out = std::get<double>(token.payload);
        } else if (token.type == JsonTokenType::Integer) {
            out = static_cast<double>(std::get<std::int64_t>(token.payload));
        } else {
            typeError("number", token);
        }
    }

    void readTo(std::string& out) {
        out = std::get<std::string>(expect(JsonTokenType::String, "string").payload);
    }

    void readNull() { expect(JsonTokenType::Null, "null"); }

    // @brief 値を1つ読み飛ばす。配列・オブジェクトは対応する終端まで消費する。
    void skipValue() { skipValue(0); }

private:
    void skipValue(std::size_t depth) {
        const JsonToken token = tokenManager_.take();
        switch (token.type) {
        case JsonTokenType::Null:
        case JsonTokenType::Bool:
        case JsonTokenType::Integer:
        case JsonTokenType::Number:
        case JsonTokenType::String:
            return;
        case JsonTokenType::StartObject:
            checkNestingDepth(depth + 1, token.position);
            while (!nextIsEndObject()) {
                nextKey();
                skipValue(depth + 1);
            }
            endObject();
            return;
        case JsonTokenType::StartArray:
            checkNestingDepth(depth + 1, token.position);
            while (!nextIsEndArray()) {
                skipValue(depth + 1);
            }
            endArray();
            return;
        default:
            typeError("value", token);
        }
    }

    JsonToken expect(JsonTokenType type, const char* description) {
        JsonToken token = tokenManager_.take();
        if (token.type != type) {
            typeError(description, token);
        }
        return token;
    }

    [[noreturn]] static void typeError(const char* expected, const JsonToken& actual) {
        throw std::runtime_error(std::string("JsonParser: expected ") + expected + " but got " +
                                 tokenTypeName(actual.type) + " at position " +
                                 std::to_string(actual.position));
    }

    TokMgr& tokenManager_;
};

// @brief 既定のトークン管理クラスを使うパーサー
using JsonParser = JsonParserBase<JsonTokenManager>;

}  // namespace shape::json
