/// @file TagFieldDisambiguator.cppm
/// @brief 判別キー（型名タグ）による判別器。

module;
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

export module shape.disambiguation.tag_field;

import shape.common.message_output;
import shape.collection.sorted_hash_vector_map;
import shape.json.json_value;
import shape.disambiguation.error;
import shape.disambiguation.schema_descriptor;
import shape.disambiguation.resolver;

export namespace shape::disambiguation {

/// @brief 未知の型名を受け取ったときの扱い。
enum class UnknownTagPolicy {
    Fallback, ///< 先頭の候補を選ぶ（警告を出す）
    Reject    ///< UnknownTag を送出する
};

/// @brief タグ方式の判別器の設定。
/// @note messageOutput は所有しない。判別器より長く生存する出力先を渡すこと。
///       複数スレッドから resolve する場合はスレッド安全な出力先（StdoutMessageOutput など）を使う。
struct TagResolverOptions {
    std::string discriminatorKey = "type";                   ///< 型名を保持するキー
    UnknownTagPolicy unknownTagPolicy = UnknownTagPolicy::Fallback;
    common::MessageOutput* messageOutput = nullptr;          ///< 警告の出力先（nullptrなら出力しない）
};

/// @brief 表示名 → スキーマの表。
using NameTable = collection::SortedHashVectorMap<std::string, SchemaId>;

/// @brief 判別キーの値（型名）による判別器。
class TagFieldResolver : public ResolverBase {
public:
    TagFieldResolver(NameTable names, SchemaId fallback, TagResolverOptions options)
        : names_(std::move(names)), fallback_(fallback), options_(std::move(options)) {}

    std::optional<SchemaId> resolve(const json::JsonValue& value) const override {
        const auto& object = requireMapping(value);
        const json::JsonValue* tag = object.find(options_.discriminatorKey);
        if (tag == nullptr) {
            throw DisambiguationError(DisambiguationErrorKind::MissingDiscriminator,
                "key '" + options_.discriminatorKey + "' is not in the mapping");
        }

        if (const std::string* name = tag->asString()) {
            if (const SchemaId* identity = names_.findValue(*name)) {
                return *identity;
            }
            return unknownTag("'" + *name + "'");
        }
        return unknownTag(std::string("a ") + tag->kindName() + " value");
    }

    DisambiguationStrategy strategy() const override { return DisambiguationStrategy::TagField; }

    const std::string& discriminatorKey() const noexcept { return options_.discriminatorKey; }

    /// @brief 未知の型名に対して選ぶスキーマ（先頭の候補）。
    const SchemaId& fallback() const noexcept { return fallback_; }

    /// @brief 登録された表示名の一覧。
    const NameTable& names() const noexcept { return names_; }

private:
    SchemaId unknownTag(const std::string& what) const {
        if (options_.unknownTagPolicy == UnknownTagPolicy::Reject) {
            throw DisambiguationError(DisambiguationErrorKind::UnknownTag,
                "'" + options_.discriminatorKey + "' holds " + what +
                ", which names no registered schema");
        }
        if (options_.messageOutput != nullptr) {
            options_.messageOutput->warning("Unknown type name " + what + " in '" +
                                            options_.discriminatorKey +
                                            "'; falling back to the first schema");
        }
        return fallback_;
    }

    NameTable names_;
    SchemaId fallback_;
    TagResolverOptions options_;
};

/// @brief 候補スキーマ群から判別キー方式の判別器を構築する。
/// @param schemas 候補スキーマ（1つ以上）。先頭がフォールバックになる。
/// @param options 判別キー名など。
/// @throws DisambiguationError 候補が空の場合。
/// @note 表示名が重複した場合は後の候補が有効になる。
TagFieldResolver buildTagResolver(std::span<const SchemaDescriptor> schemas,
    TagResolverOptions options = {}) {
    if (schemas.empty()) {
        throw DisambiguationError(DisambiguationErrorKind::InsufficientCandidates,
            "at least one schema is required");
    }

    std::vector<std::pair<std::string, SchemaId>> pairs;
    pairs.reserve(schemas.size());
    for (const auto& schema : schemas) {
        pairs.emplace_back(schema.name(), schema.identity());
    }

    return TagFieldResolver(NameTable(pairs), schemas.front().identity(), std::move(options));
}

}  // namespace shape::disambiguation
