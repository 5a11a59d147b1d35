#pragma once

#include <cstddef>

namespace fastword {
namespace core {

/**
 * @brief WordprocessingML / OPC 格式常量
 *
 * 这些字符串与包内元数据逐字节比较，不能改动。
 */
namespace Constants {
    // 内容类型
    constexpr const char* kMainContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml";
    constexpr const char* kMacroMainContentType =
        "application/vnd.ms-word.document.macroEnabled.main+xml";
    constexpr const char* kTemplateMainContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.template.main+xml";
    constexpr const char* kHeaderContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml";
    constexpr const char* kFooterContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml";
    constexpr const char* kStylesContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml";
    constexpr const char* kCommentsContentType =
        "application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml";
    constexpr const char* kRelationshipsContentType =
        "application/vnd.openxmlformats-package.relationships+xml";
    constexpr const char* kOctetStreamContentType = "application/octet-stream";

    // 关系类型
    constexpr const char* kOfficeDocumentRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
    constexpr const char* kHeaderRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/header";
    constexpr const char* kFooterRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer";
    constexpr const char* kStylesRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles";
    constexpr const char* kHyperlinkRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink";
    constexpr const char* kCommentsRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments";
    constexpr const char* kOleObjectRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/oleObject";
    constexpr const char* kPackageRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/package";

    // 命名空间
    constexpr const char* kWordprocessingNS =
        "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
    constexpr const char* kRelationshipsNS =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
    constexpr const char* kPackageRelationshipsNS =
        "http://schemas.openxmlformats.org/package/2006/relationships";
    constexpr const char* kContentTypesNS =
        "http://schemas.openxmlformats.org/package/2006/content-types";
    constexpr const char* kXmlNS = "http://www.w3.org/XML/1998/namespace";

    // 包内固定路径
    constexpr const char* kContentTypesPath = "[Content_Types].xml";
    constexpr const char* kPackageRelsPath = "_rels/.rels";

    // 关系目标模式
    constexpr const char* kTargetModeInternal = "Internal";
    constexpr const char* kTargetModeExternal = "External";

    // 读取限制
    constexpr size_t kDefaultMaxPartSize = 256 * 1024 * 1024;  // 256MB
    constexpr size_t kIOBufferSize = 64 * 1024;                // 64KB
}

}} // namespace fastword::core
