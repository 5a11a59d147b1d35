#pragma once

#include "fastword/core/Constants.hpp"
#include "fastword/core/Expected.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace fastword {

namespace archive {
    class ZipReader;
}

namespace opc {

/**
 * @brief OPC部件关系图 - 管理部件与部件之间的类型化关系
 *
 * 部件路径不带前导 '/'（与ZIP条目名一致），如 "word/document.xml"。
 * 包级关系（_rels/.rels）的源部件记为空字符串。
 * 部件一经加入地址稳定，返回的 Part 指针在图的生命周期内有效。
 */
class PartGraph {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles"
        std::string target;      // 如 "styles.xml"、"../media/image1.png" 或外部URL
        std::string target_mode; // 默认 "Internal"

        Relationship() : target_mode(core::Constants::kTargetModeInternal) {}
        Relationship(std::string rel_id, std::string rel_type, std::string rel_target,
                     std::string mode = core::Constants::kTargetModeInternal)
            : id(std::move(rel_id)), type(std::move(rel_type)),
              target(std::move(rel_target)), target_mode(std::move(mode)) {}

        bool isExternal() const { return target_mode == core::Constants::kTargetModeExternal; }
    };

    struct Part {
        std::string path;                              // 部件路径
        std::string content_type;                      // 内容类型
        std::string data;                              // 部件字节
        std::vector<Relationship> relationships;       // 该部件的关系（声明顺序）
        std::unordered_map<std::string, size_t> relationship_index;  // ID -> 下标
    };

    static constexpr const char* kPackageSource = "";

    PartGraph();
    ~PartGraph();

    PartGraph(const PartGraph&) = delete;
    PartGraph& operator=(const PartGraph&) = delete;
    PartGraph(PartGraph&&) = default;
    PartGraph& operator=(PartGraph&&) = default;

    /**
     * @brief 从ZIP构建关系图
     *
     * 读取 [Content_Types].xml 确定内容类型，加载所有部件字节，
     * 再解析每个 *.rels 把关系挂到对应的源部件上。
     * @param max_part_size 单个部件解压后的大小上限
     */
    core::VoidResult buildFromZipReader(archive::ZipReader& reader,
                                        size_t max_part_size = core::Constants::kDefaultMaxPartSize);

    /**
     * @brief 添加部件（同名部件被替换，已有关系保留）
     */
    Part& addPart(const std::string& path, const std::string& content_type, std::string data = std::string());

    /**
     * @brief 添加关系
     * @param source 源部件路径，包级关系用 kPackageSource
     * @return 源部件不存在时为 PartNotFound，ID 重复时为 DuplicateId
     */
    core::VoidResult addRelationship(const std::string& source, const Relationship& rel);

    const Part* getPart(const std::string& path) const;
    bool hasPart(const std::string& path) const { return getPart(path) != nullptr; }

    /**
     * @brief 所有部件路径（加入顺序）
     */
    const std::vector<std::string>& getAllParts() const { return part_order_; }
    size_t getPartCount() const { return part_order_.size(); }

    /**
     * @brief 源部件的全部关系（声明顺序）
     */
    const std::vector<Relationship>& getRelationships(const std::string& source) const;

    /**
     * @brief 按类型筛选源部件的关系（保持声明顺序）
     */
    std::vector<const Relationship*> getRelationshipsByType(const std::string& source, const std::string& type) const;

    /**
     * @brief 按ID查找源部件的关系
     * @return 未找到返回nullptr
     */
    const Relationship* getRelationship(const std::string& source, const std::string& id) const;

    /**
     * @brief 把关系解析到目标部件
     * @return 外部目标或目标部件缺失时为 PartNotFound，目标为空时为 InvalidTargetUri
     */
    core::Result<const Part*> resolveTargetPart(const std::string& source, const Relationship& rel) const;

    /**
     * @brief 把关系解析为绝对URI
     *
     * 外部目标原样返回；内部目标返回以 '/' 开头的包内绝对路径。
     * @return 目标为空或含有URI非法字符时为 InvalidTargetUri
     */
    core::Result<std::string> resolveTargetUri(const std::string& source, const Relationship& rel) const;

    /**
     * @brief 通过包级 officeDocument 关系定位主文档部件
     */
    core::Result<const Part*> getMainDocumentPart() const;

    /**
     * @brief 部件对应的关系文件路径，如 "word/_rels/document.xml.rels"
     */
    static std::string getRelsPath(const std::string& part_path);

    /**
     * @brief 关系文件路径反推源部件，"_rels/.rels" 得到 kPackageSource
     */
    static std::string getSourcePartFromRelsPath(const std::string& rels_path);

    /**
     * @brief 相对源部件解析目标路径，处理 "." 和 ".."，保留百分号编码
     */
    static std::string normalizePath(const std::string& source, const std::string& target);

    static bool isRelsPath(const std::string& path);

private:
    std::unordered_map<std::string, Part> parts_;
    std::vector<std::string> part_order_;
    Part package_;  // 包级关系的宿主

    Part* findPart(const std::string& source);
    const Part* findSource(const std::string& source) const;

    core::VoidResult parseRels(const std::string& rels_path, const std::string& rels_content);
};

}} // namespace fastword::opc
