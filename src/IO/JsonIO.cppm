// @file JsonIO.cppm
// @brief JSON5テキストから JsonValue を読み込む統合インターフェース。

module;
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

export module shape.json.json_io;

import shape.common.message_output;
import shape.json.reading_ahead_buffer;
import shape.json.json_token_manager;
import shape.json.json_tokenizer;
import shape.json.json_parser;
import shape.json.json_value;

namespace shape::json {

/// @brief JSON5文字列を JsonValue に変換する。
/// @param jsonText JSON5形式の文字列。
/// @param warningOutput 警告の出力先。
/// @return ルートの値。
/// @note ルートの値の後ろに余分なトークンがある場合は例外を送出する。
export JsonValue parseJsonValue(std::string_view jsonText, common::MessageOutput& warningOutput) {
    ReadingAheadBuffer inputSource(jsonText);
    JsonTokenManager tokenManager;
    JsonTokenizer<ReadingAheadBuffer, JsonTokenManager> tokenizer(
        inputSource, tokenManager, warningOutput);
    tokenizer.tokenize();

    JsonParser parser(tokenManager);
    JsonValue root = readJsonValue(parser, warningOutput);
    if (!parser.nextIsEndOfStream()) {
        throw std::runtime_error("JsonParser: unexpected trailing " +
                                 std::string(tokenTypeName(parser.nextTokenType())) +
                                 " at position " + std::to_string(parser.nextPosition()));
    }
    return root;
}

/// @brief JSON5文字列を JsonValue に変換する（警告は標準出力へ）。
/// @param jsonText JSON5形式の文字列。
export JsonValue parseJsonValue(std::string_view jsonText) {
    common::StdoutMessageOutput warningOutput;
    return parseJsonValue(jsonText, warningOutput);
}

/// @brief JSON5ファイルを読み込んで JsonValue に変換する。
/// @param filename 入力元のファイル名。
/// @param warningOutput 警告の出力先。
export JsonValue readJsonValueFile(const std::filesystem::path& filename,
    common::MessageOutput& warningOutput) {
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("readJsonValueFile: Cannot open file " + filename.string());
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) {
        throw std::runtime_error("readJsonValueFile: Error reading from file " + filename.string());
    }
    return parseJsonValue(oss.str(), warningOutput);
}

}  // namespace shape::json
