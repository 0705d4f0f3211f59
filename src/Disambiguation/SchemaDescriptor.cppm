/// @file SchemaDescriptor.cppm
/// @brief 候補となるレコード型の記述子と、メンバーポインタからの登録ヘルパー。

module;
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>
#include <utility>
#include <vector>

export module shape.disambiguation.schema_descriptor;

export namespace shape::disambiguation {

// ******************************************************************************** SchemaId

/// @brief レコード型の識別子。型から生成し、コピー・比較・ハッシュが可能。
class SchemaId {
public:
    /// @brief 型Tの識別子を返す。
    template <typename T>
    static SchemaId of() {
        return SchemaId(typeid(T));
    }

    /// @brief 実装の型名（処理系依存の文字列）。診断用。
    const char* typeName() const noexcept { return type_.name(); }

    std::size_t hash() const noexcept { return type_.hash_code(); }

    bool operator==(const SchemaId& other) const noexcept { return type_ == other.type_; }

private:
    explicit SchemaId(const std::type_info& info) : type_(info) {}

    std::type_index type_;
};

// ******************************************************************************** FieldDescriptor

/// @brief 1フィールドの記述。
struct FieldDescriptor {
    std::string name;        ///< マッピング上のキー名
    bool hasDefault = false; ///< 入力になくても構築できるか

    bool operator==(const FieldDescriptor&) const = default;
};

// ******************************************************************************** SchemaDescriptor

/// @brief 1つの候補レコード型の記述子。
/// @note 構築後は変更しない。フィールド名の重複は構築時に拒否する。
class SchemaDescriptor {
public:
    SchemaDescriptor(SchemaId identity, std::string name, std::vector<FieldDescriptor> fields)
        : identity_(identity), name_(std::move(name)), fields_(std::move(fields)) {
        validateFields();
    }

    const SchemaId& identity() const noexcept { return identity_; }
    const std::string& name() const noexcept { return name_; }
    const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    /// @brief 指定の名前のフィールドを持つかどうか。
    bool hasField(std::string_view fieldName) const {
        for (const auto& field : fields_) {
            if (field.name == fieldName) {
                return true;
            }
        }
        return false;
    }

private:
    void validateFields() const {
        std::unordered_set<std::string_view> seen;
        for (const auto& field : fields_) {
            if (!seen.insert(field.name).second) {
                throw std::invalid_argument("SchemaDescriptor: duplicate field '" + field.name +
                                            "' in schema '" + name_ + "'");
            }
        }
    }

    SchemaId identity_;
    std::string name_;
    std::vector<FieldDescriptor> fields_;
};

// ******************************************************************************** 登録ヘルパー

/// @brief メンバーポインタ型から所有者型と値型を取り出すメタ関数。
template <typename T>
struct MemberPointerTraits;

template <typename Owner, typename Value>
struct MemberPointerTraits<Value Owner::*> {
    using OwnerType = Owner;
    using ValueType = Value;
};

/// @brief メンバーポインタとキー名の対応。
/// @tparam MemberPtrType メンバーポインタ型。
template <typename MemberPtrType>
struct SchemaField {
    using Traits = MemberPointerTraits<MemberPtrType>;
    using OwnerType = typename Traits::OwnerType;
    using ValueType = typename Traits::ValueType;

    constexpr SchemaField(MemberPtrType memberPtr, const char* keyName, bool withDefault = false)
        : member(memberPtr), key(keyName), hasDefault(withDefault) {}

    FieldDescriptor descriptor() const { return FieldDescriptor{key, hasDefault}; }

    MemberPtrType member{};
    const char* key{};
    bool hasDefault{false};
};

/// @brief 2つの所有者型のうち、派生側を選ぶ。継承関係がなければ void。
template <typename Left, typename Right>
struct PromoteOwnerType {
    using type = std::conditional_t<std::is_same_v<Left, Right>, Left,
        std::conditional_t<std::is_base_of_v<Left, Right>, Right,
            std::conditional_t<std::is_base_of_v<Right, Left>, Left, void>>>;
};

/// @brief 複数の所有者型から最も派生した所有者型を推論する。
template <typename... Owners>
struct DeduceOwnerType;

template <typename Owner>
struct DeduceOwnerType<Owner> {
    using type = Owner;
};

template <typename Owner, typename Next, typename... Rest>
struct DeduceOwnerType<Owner, Next, Rest...> {
    using Promoted = typename PromoteOwnerType<Owner, Next>::type;
    static_assert(!std::is_same_v<Promoted, void>, "SchemaField owner types are not compatible");
    using type = typename DeduceOwnerType<Promoted, Rest...>::type;
};

/// @brief 所有者型を明示して記述子を生成する。
/// @tparam Owner 識別子の元になるレコード型。
/// @param name 表示名（タグ方式で照合される）。
/// @param fields フィールド定義群。宣言順がそのままフィールド順になる。
template <typename Owner, typename... Fields>
SchemaDescriptor makeSchemaDescriptor(std::string name, Fields... fields) {
    static_assert((std::is_base_of_v<typename Fields::OwnerType, Owner> && ...),
        "SchemaField members must be accessible from Owner type");
    return SchemaDescriptor(SchemaId::of<Owner>(), std::move(name),
        std::vector<FieldDescriptor>{fields.descriptor()...});
}

/// @brief フィールドから所有者型を推論して記述子を生成する。
/// @note フィールドが1つもない場合は所有者型を明示すること。
template <typename Field, typename... Fields>
SchemaDescriptor makeSchemaDescriptor(std::string name, Field first, Fields... rest) {
    using Owner = typename DeduceOwnerType<typename Field::OwnerType,
                                           typename Fields::OwnerType...>::type;
    return makeSchemaDescriptor<Owner>(std::move(name), std::move(first), std::move(rest)...);
}

}  // namespace shape::disambiguation

// SchemaId を unordered コンテナのキーにするためのハッシュ
template <>
struct std::hash<shape::disambiguation::SchemaId> {
    std::size_t operator()(const shape::disambiguation::SchemaId& id) const noexcept {
        return id.hash();
    }
};
