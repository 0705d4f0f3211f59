/// @file Disambiguator.cppm
/// @brief 判別器の統合インターフェース。方式を指定して判別器を生成する。

module;
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

export module shape.disambiguation;

export import shape.disambiguation.error;
export import shape.disambiguation.schema_descriptor;
export import shape.disambiguation.resolver;
export import shape.disambiguation.structural;
export import shape.disambiguation.tag_field;

import shape.common.message_output;
import shape.json.json_value;
import shape.json.json_io;

export namespace shape::disambiguation {

/// @brief 方式を指定して判別器を構築する。
/// @param strategy 判別方式。
/// @param schemas 候補スキーマ。
/// @param options タグ方式の設定（Structural では使わない）。
/// @throws DisambiguationError 構築できない候補の組み合わせの場合。
std::unique_ptr<IResolver> buildResolver(DisambiguationStrategy strategy,
    std::span<const SchemaDescriptor> schemas, TagResolverOptions options = {}) {
    switch (strategy) {
    case DisambiguationStrategy::Structural:
        return std::make_unique<StructuralResolver>(buildStructuralResolver(schemas));
    case DisambiguationStrategy::TagField:
        return std::make_unique<TagFieldResolver>(buildTagResolver(schemas, std::move(options)));
    }
    throw std::logic_error("buildResolver: unknown strategy");
}

/// @brief JSON5テキストを読み込んで判定する。
/// @param resolver 使用する判別器。
/// @param jsonText 判定対象のJSON5テキスト。
/// @param warningOutput 読み取り時の警告の出力先。
/// @throws std::runtime_error 構文エラーの場合。
/// @throws DisambiguationError 判定できない場合。
std::optional<SchemaId> resolveJsonText(const IResolver& resolver, std::string_view jsonText,
    common::MessageOutput& warningOutput) {
    const json::JsonValue value = json::parseJsonValue(jsonText, warningOutput);
    return resolver.resolve(value);
}

std::optional<SchemaId> resolveJsonText(const IResolver& resolver, std::string_view jsonText) {
    common::StdoutMessageOutput warningOutput;
    return resolveJsonText(resolver, jsonText, warningOutput);
}

}  // namespace shape::disambiguation
