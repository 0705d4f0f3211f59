// @file MessageOutput.cppm
// @brief 警告メッセージの出力先を抽象化する。

module;
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

export module shape.common.message_output;

export namespace shape::common {

// @brief メッセージ出力用の基底クラス。
class MessageOutput {
public:
    virtual ~MessageOutput() = default;

    /// @brief 警告メッセージを出力する。
    /// @param msg 出力するメッセージ。
    /// @note 複数スレッドから同時に呼ばれることがある。
    virtual void warning(const std::string& msg) = 0;
};

// @brief 標準出力への警告出力
class StdoutMessageOutput : public MessageOutput {
public:
    /// @brief 警告メッセージを標準出力に出力する。
    /// @param msg 出力するメッセージ。
    void warning(const std::string& msg) override {
        // 単純なロギングのみを行う。フォーマットは呼び出し元に依存させる。
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "Warning: " << msg << std::endl;
    }

private:
    std::mutex mutex_;  ///< 行単位の出力を保つためのミューテックス
};

// @brief 警告を捨てる出力
class NullMessageOutput : public MessageOutput {
public:
    void warning(const std::string&) override {}
};

// @brief 警告を保持する出力（診断やテスト用）
class CollectingMessageOutput : public MessageOutput {
public:
    void warning(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(msg);
    }

    // @brief 記録した警告の一覧を取得（コピー）
    std::vector<std::string> warnings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return warnings_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> warnings_{};
};

}  // namespace shape::common
