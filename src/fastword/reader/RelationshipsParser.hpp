#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace fastword {
namespace reader {

/**
 * @brief 关系文件解析器（*.rels）
 *
 * 关系按声明顺序保存，同时建立 ID 索引。
 * Id 或 Type 缺失的条目被跳过；Target 为空的条目会保留，
 * 由后续的目标解析把它报告为逐项失败。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles"
        std::string target;      // 如 "styles.xml"
        std::string target_mode; // 默认 "Internal"

        Relationship() : target_mode("Internal") {}
    };

    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    /**
     * @brief 解析关系XML内容
     * @return 是否解析成功
     */
    bool parse(const std::string& xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    /**
     * @brief 根据ID查找关系
     * @return 关系指针，未找到返回nullptr
     */
    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 根据类型查找关系（保持声明顺序）
     */
    std::vector<const Relationship*> findByType(const std::string& type) const;

    size_t getRelationshipCount() const { return relationships_.size(); }

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;

    void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) override;
};

}} // namespace fastword::reader
