// @file ReadingAheadBuffer.cppm
// @brief メモリ上のテキストを先頭から読み進める入力元。トークナイザーが使う。

module;
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

export module shape.json.reading_ahead_buffer;

export namespace shape::json {

/// @brief 読み取り位置を持つ入力バッファ。
/// @note 入力末尾より先を先読みすると'\0'を返す。'\0'を含む入力では atEnd() で終端を判定すること。
class ReadingAheadBuffer {
public:
    explicit ReadingAheadBuffer(std::string text) : text_(std::move(text)) {}
    explicit ReadingAheadBuffer(std::string_view text) : text_(text) {}

    ReadingAheadBuffer(const ReadingAheadBuffer&) = delete;
    ReadingAheadBuffer& operator=(const ReadingAheadBuffer&) = delete;

    /// @brief 現在位置から offset 文字先の文字。範囲外は'\0'。
    char peekAhead(std::size_t offset) const {
        const std::size_t index = pos_ + offset;
        return index < text_.size() ? text_[index] : '\0';
    }

    /// @brief count 文字読み進める。
    /// @throws std::out_of_range 入力末尾を越える場合。
    void consume(std::size_t count = 1) {
        if (count > text_.size() - pos_) {
            throw std::out_of_range("ReadingAheadBuffer: consume past end of input");
        }
        pos_ += count;
    }

    /// @brief 先頭からのバイト位置。
    std::size_t position() const { return pos_; }

    bool atEnd() const { return pos_ >= text_.size(); }

private:
    std::string text_;
    std::size_t pos_ = 0;
};

}  // namespace shape::json
