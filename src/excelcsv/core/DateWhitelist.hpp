#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace excelcsv {
namespace core {

/**
 * @brief 日期白名单
 *
 * 由逗号分隔的配置串解析而来，决定哪些列中的数值按日期序列号解码。
 * 模式在读取任何行之前确定，之后不再改变。
 */
class DateWhitelist {
public:
    enum class Mode {
        All,         // 所有列
        None,        // 不做日期转换
        IndexSet,    // 列序号集合（字符串形式，已排序）
        PatternSet   // 表头子串模式（小写，保持原序）
    };

    static constexpr const char* kDefaultSpec = "date,time,due,opened,closed";

    DateWhitelist() = default;

    /**
     * @brief 解析白名单配置
     *
     * 整串（小写、去空白后）为 "all" / "none" 时分别得到 All / None；
     * 每个片段都是 0-65535 的十进制数字时得到 IndexSet；否则为 PatternSet。
     */
    static DateWhitelist parse(const std::string& raw);

    /**
     * @brief 根据表头生成逐列的日期标志，长度等于表头列数
     */
    std::vector<bool> classify(const std::vector<std::string>& header) const;

    Mode getMode() const { return mode_; }

    static const char* modeName(Mode mode) noexcept;

    /**
     * @brief 片段是否为列序号（纯数字且不超过 65535）
     */
    static bool isColumnIndexToken(const std::string& token) noexcept;

private:
    DateWhitelist(Mode mode, std::vector<std::string> tokens)
        : mode_(mode), tokens_(std::move(tokens)) {}

    Mode mode_ = Mode::None;
    std::vector<std::string> tokens_;
};

}} // namespace excelcsv::core
