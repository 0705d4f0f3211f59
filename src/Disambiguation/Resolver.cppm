/// @file Resolver.cppm
/// @brief 判別器の共通インターフェース。

module;
#include <optional>
#include <string>

export module shape.disambiguation.resolver;

import shape.json.json_value;
import shape.disambiguation.error;
import shape.disambiguation.schema_descriptor;

export namespace shape::disambiguation {

/// @brief 判別方式。
enum class DisambiguationStrategy {
    Structural, ///< フィールド構成で判別する
    TagField    ///< 判別キーの値（型名）で判別する
};

constexpr const char* toString(DisambiguationStrategy strategy) {
    switch (strategy) {
    case DisambiguationStrategy::Structural: return "Structural";
    case DisambiguationStrategy::TagField: return "TagField";
    }
    return "Unknown";
}

/// @brief 判別器の抽象インターフェース。
/// @note resolve は const で、構築後の状態を変更しない。複数スレッドから同時に呼び出せる。
class ResolverBase {
public:
    virtual ~ResolverBase() = default;

    /// @brief マッピングが表すスキーマを判定する。
    /// @param value 判定対象の値（オブジェクトであること）。
    /// @return 選ばれたスキーマ。どれにも当てはまらず、フォールバックもない場合は nullopt。
    /// @throws DisambiguationError 入力がオブジェクトでない場合など。
    virtual std::optional<SchemaId> resolve(const json::JsonValue& value) const = 0;

    /// @brief この判別器の方式。
    virtual DisambiguationStrategy strategy() const = 0;
};

using IResolver = ResolverBase;

/// @brief 入力がオブジェクトであることを確認して返す。
/// @throws DisambiguationError オブジェクトでない場合（NotAMapping）。
inline const json::JsonObject& requireMapping(const json::JsonValue& value) {
    const auto* object = value.asObject();
    if (object == nullptr) {
        throw DisambiguationError(DisambiguationErrorKind::NotAMapping,
            std::string("expected object but got ") + value.kindName());
    }
    return *object;
}

}  // namespace shape::disambiguation
