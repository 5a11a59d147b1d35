#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace fastword {
namespace reader {

/**
 * @brief 内容类型解析器（[Content_Types].xml）
 *
 * 扩展名和部件名按OPC规则大小写不敏感，索引里统一存小写。
 */
class ContentTypesParser : public BaseSAXParser {
public:
    struct DefaultType {
        std::string extension;     // 文件扩展名
        std::string content_type;  // 内容类型
    };

    struct OverrideType {
        std::string part_name;     // 部件路径，如 "/word/document.xml"
        std::string content_type;  // 内容类型
    };

    ContentTypesParser() = default;
    ~ContentTypesParser() override = default;

    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<DefaultType>& getDefaults() const { return defaults_; }
    const std::vector<OverrideType>& getOverrides() const { return overrides_; }

    /**
     * @brief 根据扩展名查找默认类型
     * @return 内容类型，未找到返回空字符串
     */
    std::string findDefaultType(const std::string& extension) const;

    /**
     * @brief 根据部件名查找覆盖类型（有无前导 '/' 均可）
     * @return 内容类型，未找到返回空字符串
     */
    std::string findOverrideType(const std::string& part_name) const;

    /**
     * @brief 获取部件的内容类型（优先检查覆盖，再检查默认）
     * @return 内容类型，都没有时为 application/octet-stream
     */
    std::string getContentType(const std::string& part_name) const;

    size_t getDefaultCount() const { return defaults_.size(); }
    size_t getOverrideCount() const { return overrides_.size(); }

    void clear();

private:
    std::vector<DefaultType> defaults_;
    std::vector<OverrideType> overrides_;

    std::unordered_map<std::string, std::string> default_index_;
    std::unordered_map<std::string, std::string> override_index_;

    static std::string toLower(std::string value);
    static std::string toPartKey(const std::string& part_name);

    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
};

}} // namespace fastword::reader
