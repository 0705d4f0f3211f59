// @file JsonTokenManager.cppm
// @brief トークナイザーとパーサーの間で受け渡すトークン列。

module;
#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

export module shape.json.json_token_manager;

export namespace shape::json {

// @brief トークンの種類
enum class JsonTokenType {
    EndOfStream,
    Null,
    Bool,
    Integer,
    Number,
    String,
    Key,        ///< オブジェクトのキー（文字列値とは区別する）
    StartObject,
    EndObject,
    StartArray,
    EndArray
};

// @brief トークン種別の表示名（エラーメッセージ用）
constexpr const char* tokenTypeName(JsonTokenType type) {
    switch (type) {
    case JsonTokenType::EndOfStream: return "end-of-stream";
    case JsonTokenType::Null: return "null";
    case JsonTokenType::Bool: return "bool";
    case JsonTokenType::Integer: return "integer";
    case JsonTokenType::Number: return "number";
    case JsonTokenType::String: return "string";
    case JsonTokenType::Key: return "key";
    case JsonTokenType::StartObject: return "'{'";
    case JsonTokenType::EndObject: return "'}'";
    case JsonTokenType::StartArray: return "'['";
    case JsonTokenType::EndArray: return "']'";
    }
    return "unknown";
}

// @brief トークンが運ぶ値。構造トークンと null は monostate。
// @note String と Key はどちらも std::string を運ぶ。
using JsonTokenPayload = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// @brief 1つのトークン（種類・値・入力上の開始位置）
struct JsonToken {
    JsonTokenType type = JsonTokenType::EndOfStream;
    JsonTokenPayload payload{};
    std::size_t position = 0;

    JsonToken() = default;
    JsonToken(JsonTokenType t, std::size_t pos, JsonTokenPayload p = {})
        : type(t), payload(std::move(p)), position(pos) {}
};

// ******************************************************************************** JsonTokenManager
// @brief トークン列を先頭から順に取り出すキュー
// @note トークン化を終えてから読み取る単一スレッド用。
class JsonTokenManager {
public:
    void pushToken(JsonToken&& token) {
        tokens_.push_back(std::move(token));
    }

    // @brief 先頭のトークンを取り出す
    // @note 最後の EndOfStream は取り除かず、何度でも同じものを返す
    JsonToken take() {
        ensureNotEmpty();
        if (tokens_.size() == 1 && tokens_.front().type == JsonTokenType::EndOfStream) {
            return tokens_.front();
        }
        JsonToken front = std::move(tokens_.front());
        tokens_.pop_front();
        return front;
    }

    // @brief 先頭のトークンを参照する（取り出さない）
    const JsonToken& peek() const {
        ensureNotEmpty();
        return tokens_.front();
    }

    // @brief 未読のトークン数
    std::size_t size() const { return tokens_.size(); }

private:
    void ensureNotEmpty() const {
        if (tokens_.empty()) {
            throw std::logic_error("JsonTokenManager: token stream is not terminated");
        }
    }

    std::deque<JsonToken> tokens_;
};

}  // namespace shape::json
