// @file JsonTokenizer.cppm
// @brief JSON5トークナイザーの定義。入力文字列からトークン列を生成する。

module;
#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

export module shape.json.json_tokenizer;

import shape.common.message_output;
import shape.json.json_token_manager;

export namespace shape::json {

// 入力文字列取得元のconcept
template <typename T>
concept InputSource = requires(T& t, const T& ct, std::size_t offset, std::size_t count) {
    { ct.peekAhead(offset) } -> std::same_as<char>;
    { t.consume(count) } -> std::same_as<void>;
    { ct.position() } -> std::same_as<std::size_t>;
    { ct.atEnd() } -> std::same_as<bool>;
};

// トークンの受け取り先のconcept
template <typename T>
concept IsTokenManager = requires(T& t, JsonToken&& token) {
    { t.pushToken(std::move(token)) } -> std::same_as<void>;
};

// ******************************************************************************** 文字の分類

namespace json_char {

constexpr bool isDecimalDigit(char c) { return c >= '0' && c <= '9'; }

constexpr bool isAsciiLetter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// 識別子の先頭（ASCIIのみ。非ASCIIは呼び出し側でUTF-8として扱う）
constexpr bool isIdentifierStart(char c) { return isAsciiLetter(c) || c == '$' || c == '_'; }

constexpr bool isIdentifierPart(char c) { return isIdentifierStart(c) || isDecimalDigit(c); }

// 16進数字の値。16進数字でなければ -1
constexpr int hexValue(char c) {
    if (isDecimalDigit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// 1文字エスケープ（\n など）の置き換え先
constexpr std::optional<char> singleCharEscape(char c) {
    switch (c) {
    case 'b': return '\b';
    case 'f': return '\f';
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case 'v': return '\v';
    default: return std::nullopt;
    }
}

// UTF-8の先頭バイトからバイト数を求める。継続バイトなど不正な先頭なら0
constexpr std::size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

// コードポイントをUTF-8で追加する
inline void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp > 0x10FFFF) {
        throw std::runtime_error("JSON5: code point out of Unicode range");
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace json_char

// ******************************************************************************** JsonTokenizer
// @brief JSON5トークナイザー（入力文字列からトークン列を生成）
// @note カンマとコロンはトークン化しない。その代わり直前のトークンとの並びをここで検証し、
//       [1,,2] や {"a"::1} のような区切りの誤りを送出する。値の並びそのものの検証はJsonParser側で行う。
template <InputSource Input, IsTokenManager TokMgr>
class JsonTokenizer {
public:
    // @param inputSource 入力文字列取得元
    // @param tokenManager トークンの追加先
    // @param warnOut 警告メッセージの出力先
    JsonTokenizer(Input& inputSource, TokMgr& tokenManager, common::MessageOutput& warnOut)
        : input_(inputSource), tokens_(tokenManager), warningOutput_(warnOut) {}

    // @brief 入力全体をトークン化し、最後に終端トークンを追加する。
    // @note 失敗時は入力位置を付けた std::runtime_error を送出する。
    void tokenize() {
        try {
            while (scanToken()) {
            }
            emit(JsonTokenType::EndOfStream, input_.position());
        } catch (const std::exception& e) {
            throw std::runtime_error("JSON5 parse error at position " +
                                     std::to_string(input_.position()) + ": " + e.what());
        }
    }

private:
    // ******************************************************************************** 入力アクセス
    char peek(std::size_t offset = 0) const { return input_.peekAhead(offset); }
    unsigned char peekByte(std::size_t offset = 0) const {
        return static_cast<unsigned char>(input_.peekAhead(offset));
    }
    void consume(std::size_t count = 1) { input_.consume(count); }

    void emit(JsonTokenType type, std::size_t position, JsonTokenPayload payload = {}) {
        trackSeparator(type);
        tokens_.pushToken(JsonToken{type, position, std::move(payload)});
    }

    // ******************************************************************************** 区切り文字

    // 直前に出したもの（区切り文字の検証用）
    enum class Previous { Nothing, Open, Value, Key, Comma, Colon };

    // トークンを出す前に、直前との並びを検証する
    void trackSeparator(JsonTokenType type) {
        switch (type) {
        case JsonTokenType::EndOfStream:
            return;
        case JsonTokenType::EndObject:
        case JsonTokenType::EndArray:
            if (previous_ == Previous::Key || previous_ == Previous::Colon) {
                throw std::runtime_error(std::string("JSON5: unexpected ") + tokenTypeName(type) +
                                         " after key");
            }
            if (!containers_.empty()) {
                containers_.pop_back();
            }
            previous_ = Previous::Value;
            return;
        default:
            break;
        }
        if (previous_ == Previous::Value) {
            throw std::runtime_error("JSON5: missing ',' between values");
        }
        if (previous_ == Previous::Key) {
            throw std::runtime_error("JSON5: missing ':' after key");
        }
        switch (type) {
        case JsonTokenType::StartObject:
        case JsonTokenType::StartArray:
            containers_.push_back(type);
            previous_ = Previous::Open;
            return;
        case JsonTokenType::Key:
            if (previous_ == Previous::Colon) {
                throw std::runtime_error("JSON5: key where a value is expected");
            }
            previous_ = Previous::Key;
            return;
        default:
            previous_ = Previous::Value;
            return;
        }
    }

    // カンマは値の直後、かつ配列・オブジェクトの中だけ
    void readComma() {
        if (previous_ != Previous::Value || containers_.empty()) {
            throw std::runtime_error("JSON5: unexpected ','");
        }
        consume();
        previous_ = Previous::Comma;
    }

    // コロンはキーの直後だけ
    void readColon() {
        if (previous_ != Previous::Key) {
            throw std::runtime_error("JSON5: unexpected ':'");
        }
        consume();
        previous_ = Previous::Colon;
    }

    // ******************************************************************************** 空白とコメント

    // U+2028 / U+2029（E2 80 A8 / E2 80 A9）
    bool atLineSeparator() const {
        return peekByte(0) == 0xE2 && peekByte(1) == 0x80 &&
               (peekByte(2) == 0xA8 || peekByte(2) == 0xA9);
    }

    // 現在位置の空白のバイト数。空白でなければ0
    // ASCII空白に加え、U+00A0、U+2028/U+2029、U+FEFF を空白とみなす
    std::size_t whitespaceLength() const {
        switch (peek()) {
        case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
            return 1;
        default:
            break;
        }
        if (peekByte(0) == 0xC2 && peekByte(1) == 0xA0) {
            return 2;
        }
        if (atLineSeparator()) {
            return 3;
        }
        if (peekByte(0) == 0xEF && peekByte(1) == 0xBB && peekByte(2) == 0xBF) {
            return 3;
        }
        return 0;
    }

    // コメントを1つ読み飛ばす。コメントでなければfalse
    bool skipComment() {
        if (peek() != '/') {
            return false;
        }
        if (peek(1) == '/') {
            consume(2);
            while (!input_.atEnd() && peek() != '\n' && peek() != '\r' && !atLineSeparator()) {
                consume();
            }
            return true;
        }
        if (peek(1) == '*') {
            consume(2);
            while (!(peek() == '*' && peek(1) == '/')) {
                if (input_.atEnd()) {
                    throw std::runtime_error("JSON5: unterminated comment");
                }
                consume();
            }
            consume(2);
            return true;
        }
        return false;
    }

    void skipTrivia() {
        for (;;) {
            if (const std::size_t length = whitespaceLength(); length > 0) {
                consume(length);
            } else if (!skipComment()) {
                return;
            }
        }
    }

    // ******************************************************************************** トークンの振り分け

    // 次のトークンを1つ追加する。入力が尽きていればfalse
    bool scanToken() {
        skipTrivia();
        if (input_.atEnd()) {
            return false;
        }
        const std::size_t start = input_.position();
        const char c = peek();
        switch (c) {
        case '{':
            consume();
            emit(JsonTokenType::StartObject, start);
            return true;
        case '[':
            consume();
            emit(JsonTokenType::StartArray, start);
            return true;
        case '}':
            consume();
            emit(JsonTokenType::EndObject, start);
            requireValueTerminator();
            return true;
        case ']':
            consume();
            emit(JsonTokenType::EndArray, start);
            requireValueTerminator();
            return true;
        case ':':
            readColon();
            return true;
        case ',':
            readComma();
            return true;
        case '"':
        case '\'':
            emitStringOrKey(readQuoted(c), start);
            return true;
        default:
            break;
        }

        if (json_char::isDecimalDigit(c) || c == '+' || c == '-' || c == '.') {
            readNumber(start);
            requireValueTerminator();
            return true;
        }
        if (tryReservedWord("null", JsonTokenType::Null, {}, start) ||
            tryReservedWord("true", JsonTokenType::Bool, true, start) ||
            tryReservedWord("false", JsonTokenType::Bool, false, start) ||
            tryReservedWord("Infinity", JsonTokenType::Number,
                            std::numeric_limits<double>::infinity(), start) ||
            tryReservedWord("NaN", JsonTokenType::Number,
                            std::numeric_limits<double>::quiet_NaN(), start)) {
            return true;
        }
        emitIdentifierKey(readIdentifier(), start);
        return true;
    }

    // 値の直後は , } ] または終端のみ
    void requireValueTerminator() {
        skipTrivia();
        if (input_.atEnd()) {
            return;
        }
        const char c = peek();
        if (c != ',' && c != '}' && c != ']') {
            throw std::runtime_error(std::string("JSON5: unexpected character '") + c +
                                     "' after value");
        }
    }

    // 次の非空白文字がコロンか
    bool followedByColon() {
        skipTrivia();
        return peek() == ':';
    }

    // ******************************************************************************** キーワード・識別子

    // 現在位置が単語wordそのもの（後ろに識別子文字が続かない）ならtrue
    bool atWord(std::string_view word) const {
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (peek(i) != word[i]) {
                return false;
            }
        }
        return !json_char::isIdentifierPart(peek(word.size()));
    }

    // 予約語を読み取る。コロンが続けばキーとして扱う
    bool tryReservedWord(std::string_view word, JsonTokenType type, JsonTokenPayload value,
                         std::size_t start) {
        if (!atWord(word)) {
            return false;
        }
        consume(word.size());
        if (followedByColon()) {
            emit(JsonTokenType::Key, start, std::string(word));
            return true;
        }
        emit(type, start, std::move(value));
        requireValueTerminator();
        return true;
    }

    // 非ASCII文字を1文字ぶん読み取ってoutに追加する。ASCIIならfalse
    bool readNonAscii(std::string& out) {
        if (peekByte() < 0x80) {
            return false;
        }
        const std::size_t length = json_char::utf8SequenceLength(peekByte());
        if (length == 0) {
            throw std::runtime_error("JSON5: invalid UTF-8 sequence");
        }
        for (std::size_t i = 0; i < length; ++i) {
            out += peek(i);
        }
        consume(length);
        return true;
    }

    // 引用符なしのキー名。非ASCII文字はそのまま受け付ける
    std::string readIdentifier() {
        std::string name;
        if (json_char::isIdentifierStart(peek())) {
            name += peek();
            consume();
        } else if (!readNonAscii(name)) {
            throw std::runtime_error(std::string("JSON5: unexpected character '") + peek() + "'");
        }
        for (;;) {
            if (json_char::isIdentifierPart(peek())) {
                name += peek();
                consume();
            } else if (!readNonAscii(name)) {
                return name;
            }
        }
    }

    void emitIdentifierKey(std::string name, std::size_t start) {
        if (!followedByColon()) {
            throw std::runtime_error("JSON5: unexpected identifier '" + name + "'");
        }
        emit(JsonTokenType::Key, start, std::move(name));
    }

    // ******************************************************************************** 文字列

    void emitStringOrKey(std::string text, std::size_t start) {
        if (followedByColon()) {
            emit(JsonTokenType::Key, start, std::move(text));
            return;
        }
        emit(JsonTokenType::String, start, std::move(text));
        requireValueTerminator();
    }

    // 引用符で囲まれた文字列を読み取る
    std::string readQuoted(char quote) {
        std::string text;
        consume();
        for (;;) {
            if (input_.atEnd()) {
                throw std::runtime_error("JSON5: unterminated string");
            }
            const char c = peek();
            if (c == quote) {
                consume();
                return text;
            }
            if (c == '\n' || c == '\r') {
                throw std::runtime_error("JSON5: line terminator in string");
            }
            if (c == '\\') {
                consume();
                readEscape(text);
                continue;
            }
            if (atLineSeparator()) {
                warningOutput_.warning("Unescaped line separator in string at position " +
                                       std::to_string(input_.position()));
            }
            text += c;
            consume();
        }
    }

    // '\'の直後から1つのエスケープを読み取る
    void readEscape(std::string& text) {
        if (input_.atEnd()) {
            throw std::runtime_error("JSON5: unterminated escape sequence");
        }
        const char c = peek();
        consume();
        if (const auto replaced = json_char::singleCharEscape(c)) {
            text += *replaced;
            return;
        }
        switch (c) {
        case '0':
            if (json_char::isDecimalDigit(peek())) {
                throw std::runtime_error("JSON5: decimal digit must not follow \\0 escape sequence");
            }
            text += '\0';
            return;
        case 'x':
            json_char::appendUtf8(text, readHexDigits(2, "\\x"));
            return;
        case 'u':
            json_char::appendUtf8(text, readUnicodeEscape());
            return;
        case '\r':
            // 行継続（CRLF は1つの改行として扱う）
            if (peek() == '\n') {
                consume();
            }
            return;
        case '\n':
            return;
        default:
            // \" \' \\ \/ を含め、その他は文字そのもの
            text += c;
            return;
        }
    }

    std::uint32_t readHexDigits(int count, const char* escapeName) {
        std::uint32_t value = 0;
        for (int i = 0; i < count; ++i) {
            const int digit = json_char::hexValue(peek());
            if (digit < 0) {
                throw std::runtime_error(std::string("JSON5: invalid escape sequence '") +
                                         escapeName + "', expected hex digit");
            }
            consume();
            value = (value << 4) | static_cast<std::uint32_t>(digit);
        }
        return value;
    }

    // \uXXXX。上位サロゲートの直後に \u で下位サロゲートが続けば結合する
    std::uint32_t readUnicodeEscape() {
        const std::uint32_t high = readHexDigits(4, "\\u");
        if (high < 0xD800 || high > 0xDBFF || peek() != '\\' || peek(1) != 'u') {
            return high;
        }
        consume(2);
        const std::uint32_t low = readHexDigits(4, "\\u");
        if (low < 0xDC00 || low > 0xDFFF) {
            throw std::runtime_error("JSON5: invalid low surrogate in \\u escape");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    // ******************************************************************************** 数値

    // 符号付きの Infinity / NaN、16進整数、10進数
    void readNumber(std::size_t start) {
        bool negative = false;
        if (peek() == '+' || peek() == '-') {
            negative = peek() == '-';
            consume();
        }

        if (atWord("Infinity")) {
            consume(8);
            const double inf = std::numeric_limits<double>::infinity();
            emit(JsonTokenType::Number, start, negative ? -inf : inf);
            return;
        }
        if (atWord("NaN")) {
            consume(3);
            emit(JsonTokenType::Number, start, std::numeric_limits<double>::quiet_NaN());
            return;
        }

        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
            consume(2);
            if (json_char::hexValue(peek()) < 0) {
                throw std::runtime_error("JSON5: invalid hexadecimal number");
            }
            std::uint64_t magnitude = 0;
            for (int digit = json_char::hexValue(peek()); digit >= 0;
                 digit = json_char::hexValue(peek())) {
                if (magnitude > (std::numeric_limits<std::uint64_t>::max() >> 4)) {
                    throw std::runtime_error("JSON5: hexadecimal number out of range");
                }
                magnitude = (magnitude << 4) | static_cast<std::uint64_t>(digit);
                consume();
            }
            // int64 の範囲: 正は 2^63-1、負は 2^63 まで
            constexpr auto maxPositive =
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (magnitude > (negative ? maxPositive + 1 : maxPositive)) {
                throw std::runtime_error("JSON5: hexadecimal number out of range");
            }
            const std::int64_t value = negative
                ? -static_cast<std::int64_t>(magnitude - 1) - 1
                : static_cast<std::int64_t>(magnitude);
            emit(JsonTokenType::Integer, start, value);
            return;
        }

        readDecimal(negative, start);
    }

    // 数字列を切り出してから std::from_chars で変換する（ロケールに依存しない）
    void readDecimal(bool negative, std::size_t start) {
        std::string literal = negative ? "-" : "";
        bool hasDigits = false;
        bool isFloat = false;

        const auto takeDigits = [&] {
            while (json_char::isDecimalDigit(peek())) {
                hasDigits = true;
                literal += peek();
                consume();
            }
        };

        takeDigits();
        if (peek() == '.') {
            isFloat = true;
            literal += '.';
            consume();
            takeDigits();
        }
        if (!hasDigits) {
            throw std::runtime_error("JSON5: invalid number format");
        }
        if (peek() == 'e' || peek() == 'E') {
            isFloat = true;
            literal += 'e';
            consume();
            if (peek() == '+' || peek() == '-') {
                literal += peek();
                consume();
            }
            if (!json_char::isDecimalDigit(peek())) {
                throw std::runtime_error("JSON5: invalid exponent");
            }
            takeDigits();
        }

        const char* const first = literal.data();
        const char* const last = literal.data() + literal.size();
        if (!isFloat) {
            std::int64_t integer = 0;
            const auto [ptr, ec] = std::from_chars(first, last, integer);
            if (ec == std::errc{} && ptr == last) {
                emit(JsonTokenType::Integer, start, integer);
                return;
            }
            if (ec != std::errc::result_out_of_range) {
                throw std::runtime_error("JSON5: invalid number format");
            }
            // int64に収まらない整数は浮動小数点数として扱う
        }

        double number = 0.0;
        const auto [ptr, ec] = std::from_chars(first, last, number);
        if (ec == std::errc::result_out_of_range) {
            throw std::runtime_error("JSON5: number out of range '" + literal + "'");
        }
        if (ec != std::errc{} || ptr != last) {
            throw std::runtime_error("JSON5: invalid number format");
        }
        emit(JsonTokenType::Number, start, number);
    }

    Input& input_;
    TokMgr& tokens_;
    common::MessageOutput& warningOutput_;
    std::vector<JsonTokenType> containers_;  ///< 開いている '{' / '['
    Previous previous_ = Previous::Nothing;
};

}  // namespace shape::json
