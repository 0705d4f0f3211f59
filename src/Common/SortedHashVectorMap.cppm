// @file SortedHashVectorMap.cppm
// @brief 実行時に要素数が決まるハッシュベースのソート済みマップの定義。

module;
#include <vector>
#include <string>
#include <string_view>
#include <concepts>
#include <optional>
#include <algorithm>
#include <ranges>
#include <functional>
#include <type_traits>
#include <utility>
#include <cstdint>

export module shape.collection.sorted_hash_vector_map;

export namespace shape::collection {

// Key/value descriptor concept shared by the constructors below.
template <typename KeyT, typename ValueT, typename FieldT>
concept IsKeyValuePair = requires(const FieldT& f) {
    { f.first } -> std::convertible_to<KeyT>;
    { f.second } -> std::convertible_to<ValueT>;
};

// Traits you can specialize if you want custom hash/equality/compare behavior
template <typename K>
struct SortedHashVectorMapTraits {
    using Hash = std::hash<K>;
    using KeyEqual = std::equal_to<>;
    using KeyCompare = std::less<>;
};

// std::hash<std::string> does not accept std::string_view lookups.
template <>
struct SortedHashVectorMapTraits<std::string> {
    struct Hash {
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };
    using KeyEqual = std::equal_to<>;
    using KeyCompare = std::less<>;
};

/// @brief SortedHashVectorMapで保持するエントリ情報。
/// @tparam KeyType キーの型。
/// @tparam ValueType 値の型。
template <typename KeyType, typename ValueType>
struct MapEntry {
    KeyType key;                ///< エントリのキー。
    ValueType value;            ///< エントリの値。
    std::size_t hash;           ///< キーから計算したハッシュ値（Hash の結果）。
    std::size_t originalIndex;  ///< 元の登録順序。
};

/// @brief ハッシュベースのソート済みマップ（要素数は実行時に決まる）。
/// @tparam KeyType キーの型。
/// @tparam ValueType 値の型。
/// @tparam Traits ハッシュ／比較の振る舞い。
/// @note 構築時にキーのハッシュ値でソートし、以後は変更しない。
///       同じキーが複数回現れた場合は後から登録した値が有効になる。
template <
    typename KeyType,
    typename ValueType,
    typename Traits = SortedHashVectorMapTraits<KeyType>
>
class SortedHashVectorMap {
    using Hash = typename Traits::Hash;
    using KeyEqual = typename Traits::KeyEqual;
    using KeyCompare = typename Traits::KeyCompare;

public:
    using Entry = MapEntry<KeyType, ValueType>;
    using iterator = typename std::vector<Entry>::const_iterator;
    using value_type = Entry;

    /// @brief デフォルトコンストラクタ。空のマップを構築する。
    SortedHashVectorMap() = default;

    /// @brief キーと値の組の範囲から構築する。
    /// @tparam Range pair<KeyType, ValueType> 互換の要素を持つ範囲。
    /// @param pairs 登録するキーと値の組。
    template <typename Range>
        requires IsKeyValuePair<KeyType, ValueType, std::ranges::range_value_t<Range>>
    explicit SortedHashVectorMap(const Range& pairs) {
        std::size_t i = 0;
        for (const auto& p : pairs) {
            entries_.push_back(Entry{
                static_cast<KeyType>(p.first),
                static_cast<ValueType>(p.second),
                Hash{}(p.first),
                i++
            });
        }
        sortEntries();
        removeShadowedEntries();
    }

    /// @brief 指定キーに対応するエントリの元インデックスを検索する。
    /// @param key 検索キー。
    /// @return 見つかった場合は元インデックス、未検出時はstd::nullopt。
    template <typename Lookup>
    std::optional<std::size_t> findIndex(const Lookup& key) const {
        const Entry* entry = findEntry(key);
        if (!entry) {
            return std::nullopt;
        }
        return entry->originalIndex;
    }

    /// @brief 指定キーに対応する値を取得する。見つからなければ nullptr を返す。
    template <typename Lookup>
    const ValueType* findValue(const Lookup& key) const {
        const Entry* entry = findEntry(key);
        return entry ? &entry->value : nullptr;
    }

    /// @brief 有効なエントリ数を返す。
    std::size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    iterator begin() const { return entries_.begin(); }
    iterator end() const { return entries_.end(); }

private:
    /// @brief ハッシュ値で二分探索を行い、同じハッシュ値の範囲内で線形探索する。
    template <typename Lookup>
    const Entry* findEntry(const Lookup& key) const {
        const auto hash = Hash{}(key);
        auto lower = std::lower_bound(
            entries_.begin(), entries_.end(), hash,
            [](const Entry& entry, std::size_t hashValue) {
                return entry.hash < hashValue;
            });
        for (auto it = lower; it != entries_.end() && it->hash == hash; ++it) {
            if (KeyEqual{}(it->key, key)) {
                return &*it;
            }
        }
        return nullptr;
    }

    /// @brief entries_を (hash, key, 登録順) でソートする。
    void sortEntries() {
        std::sort(entries_.begin(), entries_.end(),
            [](const Entry& a, const Entry& b) {
                if (a.hash != b.hash) {
                    return a.hash < b.hash;
                }
                if (KeyCompare{}(a.key, b.key)) {
                    return true;
                }
                if (KeyCompare{}(b.key, a.key)) {
                    return false;
                }
                return a.originalIndex < b.originalIndex;
            });
    }

    /// @brief 同一キーのエントリのうち最後に登録されたもの以外を取り除く。
    void removeShadowedEntries() {
        std::vector<Entry> kept;
        kept.reserve(entries_.size());
        for (auto& entry : entries_) {
            if (!kept.empty() && kept.back().hash == entry.hash &&
                KeyEqual{}(kept.back().key, entry.key)) {
                kept.back() = std::move(entry);
                continue;
            }
            kept.push_back(std::move(entry));
        }
        entries_ = std::move(kept);
    }

    std::vector<Entry> entries_{}; ///< ハッシュ順に整列したエントリ。
};

}  // namespace shape::collection
