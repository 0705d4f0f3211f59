/// @file StructuralDisambiguator.cppm
/// @brief フィールド構成による判別器。
/// @details 構築時に候補スキーマのフィールド集合を比較し、「そのスキーマにしかないフィールド名」
///          からスキーマへの対応表を作る。判定時は表の順にフィールドの有無を調べるだけ。

module;
#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

export module shape.disambiguation.structural;

import shape.json.json_value;
import shape.disambiguation.error;
import shape.disambiguation.schema_descriptor;
import shape.disambiguation.resolver;

export namespace shape::disambiguation {

/// @brief 判別表の1行（判別フィールド名 → スキーマ）。
struct StructuralEntry {
    std::string fieldName;
    SchemaId identity;
    std::string schemaName; ///< 診断用の表示名
};

/// @brief フィールド構成による判別器。
/// @note 判別表は構築後に変更しない。
class StructuralResolver : public ResolverBase {
public:
    StructuralResolver(std::vector<StructuralEntry> entries, std::optional<SchemaId> fallback)
        : entries_(std::move(entries)), fallback_(fallback) {}

    std::optional<SchemaId> resolve(const json::JsonValue& value) const override {
        const auto& object = requireMapping(value);
        for (const auto& entry : entries_) {
            if (object.contains(entry.fieldName)) {
                return entry.identity;
            }
        }
        return fallback_;
    }

    DisambiguationStrategy strategy() const override { return DisambiguationStrategy::Structural; }

    /// @brief 判別表（挿入順）。
    const std::vector<StructuralEntry>& entries() const noexcept { return entries_; }

    /// @brief どの判別フィールドもない場合に選ぶスキーマ。
    const std::optional<SchemaId>& fallback() const noexcept { return fallback_; }

private:
    std::vector<StructuralEntry> entries_;
    std::optional<SchemaId> fallback_;
};

/// @brief 候補スキーマ群からフィールド構成による判別器を構築する。
/// @param schemas 候補スキーマ（2つ以上）。
/// @return 構築した判別器。
/// @throws DisambiguationError 判別できない組み合わせの場合。
/// @note フィールド数の多い順に並べ、各スキーマについて「後ろに並ぶスキーマのどれも持たない
///       フィールド」を判別フィールドとする。最後のスキーマはフォールバックになる。
StructuralResolver buildStructuralResolver(std::span<const SchemaDescriptor> schemas) {
    if (schemas.size() < 2) {
        throw DisambiguationError(DisambiguationErrorKind::InsufficientCandidates,
            "at least two schemas are required, got " + std::to_string(schemas.size()));
    }

    const auto emptyCount = std::count_if(schemas.begin(), schemas.end(),
        [](const SchemaDescriptor& schema) { return schema.fields().empty(); });
    if (emptyCount > 1) {
        throw DisambiguationError(DisambiguationErrorKind::MultipleEmptySchemas,
            std::to_string(emptyCount) + " schemas have no fields");
    }

    std::vector<const SchemaDescriptor*> ordered;
    ordered.reserve(schemas.size());
    for (const auto& schema : schemas) {
        ordered.push_back(&schema);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const SchemaDescriptor* a, const SchemaDescriptor* b) {
            return a->fields().size() > b->fields().size();
        });

    std::vector<StructuralEntry> entries;
    std::optional<SchemaId> fallback;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const SchemaDescriptor& schema = *ordered[i];
        if (i + 1 == ordered.size()) {
            fallback = schema.identity();
            break;
        }

        std::unordered_set<std::string> laterFields;
        for (std::size_t j = i + 1; j < ordered.size(); ++j) {
            for (const auto& field : ordered[j]->fields()) {
                laterFields.insert(field.name);
            }
        }

        bool hasUnique = false;
        const FieldDescriptor* chosen = nullptr;
        for (const auto& field : schema.fields()) {
            if (laterFields.contains(field.name)) {
                continue;
            }
            hasUnique = true;
            if (!field.hasDefault) {
                chosen = &field;
                break;
            }
        }
        if (!hasUnique) {
            throw DisambiguationError(DisambiguationErrorKind::NoUniqueField,
                "schema '" + schema.name() + "' has no usable unique fields", schema.name());
        }
        if (chosen == nullptr) {
            throw DisambiguationError(DisambiguationErrorKind::NoUniqueRequiredField,
                "schema '" + schema.name() + "' has no usable unique fields without a default",
                schema.name());
        }

        // 判別フィールドは後続のどのスキーマにもないため、表内で重複しない
        for (const auto& entry : entries) {
            if (entry.fieldName == chosen->name) {
                throw std::logic_error("buildStructuralResolver: field '" + chosen->name +
                                       "' is already in the table");
            }
        }
        entries.push_back(StructuralEntry{chosen->name, schema.identity(), schema.name()});
    }

    return StructuralResolver(std::move(entries), fallback);
}

}  // namespace shape::disambiguation
