/// @file DisambiguationError.cppm
/// @brief 判別器の構築時・判定時に送出する例外。

module;
#include <stdexcept>
#include <string>
#include <utility>

export module shape.disambiguation.error;

export namespace shape::disambiguation {

/// @brief 判別エラーの種類。
enum class DisambiguationErrorKind {
    InsufficientCandidates,  ///< 候補スキーマが足りない（構築時）
    MultipleEmptySchemas,    ///< フィールドを持たないスキーマが複数ある（構築時）
    NoUniqueField,           ///< 後続スキーマと区別できるフィールドがない（構築時）
    NoUniqueRequiredField,   ///< 区別できるフィールドがすべて既定値付き（構築時）
    MissingDiscriminator,    ///< 判別キーが入力にない（判定時）
    NotAMapping,             ///< 入力がオブジェクトではない（判定時）
    UnknownTag               ///< 未知の型名を拒否した（判定時、Rejectポリシーのみ）
};

/// @brief 種類の名前を返す。
constexpr const char* toString(DisambiguationErrorKind kind) {
    switch (kind) {
    case DisambiguationErrorKind::InsufficientCandidates: return "InsufficientCandidates";
    case DisambiguationErrorKind::MultipleEmptySchemas: return "MultipleEmptySchemas";
    case DisambiguationErrorKind::NoUniqueField: return "NoUniqueField";
    case DisambiguationErrorKind::NoUniqueRequiredField: return "NoUniqueRequiredField";
    case DisambiguationErrorKind::MissingDiscriminator: return "MissingDiscriminator";
    case DisambiguationErrorKind::NotAMapping: return "NotAMapping";
    case DisambiguationErrorKind::UnknownTag: return "UnknownTag";
    }
    return "Unknown";
}

/// @brief 構築時・判定時のエラー。
/// @note what() は "Disambiguation: <Kind>: <詳細>" の形式。
class DisambiguationError : public std::runtime_error {
public:
    DisambiguationError(DisambiguationErrorKind kind, const std::string& detail,
        std::string schemaName = {})
        : std::runtime_error(std::string("Disambiguation: ") + toString(kind) + ": " + detail),
          kind_(kind), schemaName_(std::move(schemaName)) {}

    /// @brief エラーの種類。
    DisambiguationErrorKind kind() const noexcept { return kind_; }

    /// @brief 原因となったスキーマの表示名。特定のスキーマに起因しない場合は空。
    const std::string& schemaName() const noexcept { return schemaName_; }

private:
    DisambiguationErrorKind kind_;
    std::string schemaName_;
};

}  // namespace shape::disambiguation
