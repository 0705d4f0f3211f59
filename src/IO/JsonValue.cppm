/// @file JsonValue.cppm
/// @brief 型の決まっていないJSON値（動的な値ツリー）と、その読み取り。

module;
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

export module shape.json.json_value;

import shape.common.message_output;
import shape.json.json_token_manager;
import shape.json.json_parser;

export namespace shape::json {

class JsonValue;

/// @brief JSON配列。
using JsonArray = std::vector<JsonValue>;

/// @brief JSONオブジェクト。キーの出現順を保持する。
/// @note キーは一意。同じキーを追加すると値を上書きする（位置は最初の出現のまま）。
class JsonObject {
public:
    using Member = std::pair<std::string, JsonValue>;
    using iterator = std::vector<Member>::const_iterator;

    JsonObject() = default;
    JsonObject(std::initializer_list<Member> members);

    /// @brief キーが存在するかどうか。
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// @brief キーに対応する値を返す。なければ nullptr。
    const JsonValue* find(std::string_view key) const;

    /// @brief メンバーを追加する。
    /// @return 既存のキーを上書きした場合はtrue。
    bool insertOrAssign(std::string key, JsonValue value);

    std::size_t size() const;
    bool empty() const;
    iterator begin() const;
    iterator end() const;

    bool operator==(const JsonObject& other) const;

private:
    std::vector<Member> members_{}; ///< 出現順のメンバー
};

/// @brief JSON値の種類。
enum class JsonKind {
    Null,
    Bool,
    Integer,
    Number,
    String,
    Array,
    Object
};

/// @brief 種類の表示名（"object" など）
constexpr const char* kindName(JsonKind kind) {
    switch (kind) {
    case JsonKind::Null: return "null";
    case JsonKind::Bool: return "bool";
    case JsonKind::Integer: return "integer";
    case JsonKind::Number: return "number";
    case JsonKind::String: return "string";
    case JsonKind::Array: return "array";
    case JsonKind::Object: return "object";
    }
    return "unknown";
}

/// @brief 動的なJSON値。
/// @note variant の alternative は JsonKind と同じ並び。
class JsonValue {
public:
    using Storage = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string,
                                 JsonArray, JsonObject>;

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) : storage_(v) {}
    JsonValue(int v) : storage_(static_cast<std::int64_t>(v)) {}
    JsonValue(std::int64_t v) : storage_(v) {}
    JsonValue(double v) : storage_(v) {}
    JsonValue(const char* v) : storage_(std::string(v)) {}
    JsonValue(std::string v) : storage_(std::move(v)) {}
    JsonValue(JsonArray v) : storage_(std::move(v)) {}
    JsonValue(JsonObject v) : storage_(std::move(v)) {}

    JsonKind kind() const { return static_cast<JsonKind>(storage_.index()); }
    const char* kindName() const { return json::kindName(kind()); }

    bool isNull() const { return kind() == JsonKind::Null; }
    bool isObject() const { return kind() == JsonKind::Object; }
    bool isArray() const { return kind() == JsonKind::Array; }
    bool isString() const { return kind() == JsonKind::String; }

    /// @brief オブジェクトなら参照を返す。それ以外は nullptr。
    const JsonObject* asObject() const { return std::get_if<JsonObject>(&storage_); }
    const JsonArray* asArray() const { return std::get_if<JsonArray>(&storage_); }
    const std::string* asString() const { return std::get_if<std::string>(&storage_); }
    std::optional<bool> asBool() const;
    std::optional<std::int64_t> asInteger() const;
    /// @brief 数値（整数も含む）を double で返す。
    std::optional<double> asNumber() const;

    const Storage& storage() const { return storage_; }

    bool operator==(const JsonValue& other) const { return storage_ == other.storage_; }

private:
    Storage storage_{nullptr};
};

// ******************************************************************************** JsonObject 実装

inline JsonObject::JsonObject(std::initializer_list<Member> members) {
    for (const auto& member : members) {
        insertOrAssign(member.first, member.second);
    }
}

inline const JsonValue* JsonObject::find(std::string_view key) const {
    for (const auto& member : members_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

inline bool JsonObject::insertOrAssign(std::string key, JsonValue value) {
    for (auto& member : members_) {
        if (member.first == key) {
            member.second = std::move(value);
            return true;
        }
    }
    members_.emplace_back(std::move(key), std::move(value));
    return false;
}

inline std::size_t JsonObject::size() const { return members_.size(); }
inline bool JsonObject::empty() const { return members_.empty(); }
inline JsonObject::iterator JsonObject::begin() const { return members_.begin(); }
inline JsonObject::iterator JsonObject::end() const { return members_.end(); }

inline bool JsonObject::operator==(const JsonObject& other) const {
    return members_ == other.members_;
}

// ******************************************************************************** JsonValue 実装

inline std::optional<bool> JsonValue::asBool() const {
    if (const auto* v = std::get_if<bool>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

inline std::optional<std::int64_t> JsonValue::asInteger() const {
    if (const auto* v = std::get_if<std::int64_t>(&storage_)) {
        return *v;
    }
    return std::nullopt;
}

inline std::optional<double> JsonValue::asNumber() const {
    if (const auto* v = std::get_if<double>(&storage_)) {
        return *v;
    }
    if (const auto* v = std::get_if<std::int64_t>(&storage_)) {
        return static_cast<double>(*v);
    }
    return std::nullopt;
}

// ******************************************************************************** 読み取り

/// @brief パーサーの現在位置から値を1つ読み取り、JsonValue を構築する。
/// @param parser 読み取り元のパーサー。
/// @param warningOutput 重複キーなどの警告出力先。
/// @param depth 呼び出し元の入れ子の深さ（トップレベルは0）。
/// @throws std::runtime_error 入れ子が maxNestingDepth を超えた場合。
template <typename Parser>
JsonValue readJsonValue(Parser& parser, common::MessageOutput& warningOutput,
                        std::size_t depth = 0) {
    switch (parser.nextTokenType()) {
    case JsonTokenType::Null:
        parser.readNull();
        return JsonValue{nullptr};
    case JsonTokenType::Bool: {
        bool v{};
        parser.readTo(v);
        return JsonValue{v};
    }
    case JsonTokenType::Integer: {
        std::int64_t v{};
        parser.readTo(v);
        return JsonValue{v};
    }
    case JsonTokenType::Number: {
        double v{};
        parser.readTo(v);
        return JsonValue{v};
    }
    case JsonTokenType::String: {
        std::string v;
        parser.readTo(v);
        return JsonValue{std::move(v)};
    }
    case JsonTokenType::StartArray: {
        JsonArray array;
        checkNestingDepth(depth + 1, parser.startArray());
        while (!parser.nextIsEndArray()) {
            array.push_back(readJsonValue(parser, warningOutput, depth + 1));
        }
        parser.endArray();
        return JsonValue{std::move(array)};
    }
    case JsonTokenType::StartObject: {
        JsonObject object;
        checkNestingDepth(depth + 1, parser.startObject());
        while (!parser.nextIsEndObject()) {
            const std::size_t keyPosition = parser.nextPosition();
            std::string key = parser.nextKey();
            JsonValue value = readJsonValue(parser, warningOutput, depth + 1);
            if (object.insertOrAssign(key, std::move(value))) {
                warningOutput.warning("Duplicate key '" + key + "' at position " +
                                      std::to_string(keyPosition) + "; the last value wins");
            }
        }
        parser.endObject();
        return JsonValue{std::move(object)};
    }
    default:
        throw std::runtime_error(std::string("JsonParser: expected value but got ") +
                                 tokenTypeName(parser.nextTokenType()) + " at position " +
                                 std::to_string(parser.nextPosition()));
    }
}

}  // namespace shape::json
