/**
 * @file dump_document.cpp
 * @brief FastWord读取功能示例
 *
 * 打开一个 .docx，输出正文、超链接、批注、嵌入对象、样式、页眉页脚和装配诊断。
 * 用法: fastword_dump <file.docx> [--strict]
 */

#include "fastword/FastWord.hpp"
#include <iostream>
#include <string>

namespace {

void printBody(const fastword::Document& document) {
    std::cout << "\n=== 正文 (" << document.getBodyElements().size() << " 个块级元素) ===" << std::endl;
    size_t index = 0;
    for (const auto& element : document.getBodyElements()) {
        ++index;
        if (element->getElementType() == fastword::core::BodyElementType::Table) {
            const auto* table = static_cast<const fastword::core::Table*>(element.get());
            std::cout << "[" << index << "] 表格 " << table->getRowCount() << " 行" << std::endl;
            std::cout << table->getText() << std::endl;
        } else {
            const auto* paragraph = static_cast<const fastword::core::Paragraph*>(element.get());
            std::string style = paragraph->getStyleId();
            std::cout << "[" << index << "] 段落";
            if (!style.empty()) {
                std::cout << " (" << style << ")";
            }
            std::cout << ": " << paragraph->getText() << std::endl;
        }
    }
}

void printHyperlinks(const fastword::Document& document) {
    const auto& hyperlinks = document.getHyperlinks();
    if (hyperlinks.empty()) {
        return;
    }
    std::cout << "\n=== 超链接 ===" << std::endl;
    for (const auto& link : hyperlinks) {
        std::cout << "  " << link.getId() << " -> ";
        if (link.isResolved()) {
            std::cout << link.getURL() << std::endl;
        } else {
            std::cout << "(无法解析: " << link.getError()->message << ")" << std::endl;
        }
    }
}

void printComments(const fastword::Document& document) {
    auto comments = document.getComments();
    if (comments.empty()) {
        return;
    }
    std::cout << "\n=== 批注 ===" << std::endl;
    for (const auto* comment : comments) {
        std::cout << "  #" << comment->getId() << " " << comment->getAuthor();
        if (!comment->getDate().empty()) {
            std::cout << " @ " << comment->getDate();
        }
        std::cout << ": " << comment->getText() << std::endl;
    }
}

void printEmbeds(const fastword::Document& document) {
    const auto& embeds = document.getAllEmbeds();
    if (embeds.empty()) {
        return;
    }
    std::cout << "\n=== 嵌入对象 ===" << std::endl;
    for (const auto* part : embeds) {
        std::cout << "  " << part->path << " [" << part->content_type << "] "
                  << part->data.size() << " 字节" << std::endl;
    }
}

void printStyles(const fastword::Document& document) {
    std::cout << "\n=== 样式 ===" << std::endl;
    auto styles = document.tryGetStyles();
    if (!styles) {
        std::cout << "  不可用: " << styles.error().fullMessage() << std::endl;
        return;
    }
    std::cout << "  共 " << styles.value()->getStyleCount() << " 个样式，默认段落样式: "
              << styles.value()->getDefaultStyleId("paragraph") << std::endl;
    for (const auto& style : styles.value()->getStyles()) {
        std::cout << "  " << style.id << " (" << style.type << ")";
        if (!style.name.empty()) {
            std::cout << " \"" << style.name << "\"";
        }
        if (!style.based_on.empty()) {
            std::cout << " <- " << style.based_on;
        }
        std::cout << std::endl;
    }
}

void printHeaderFooter(const fastword::Document& document) {
    const auto* policy = document.getHeaderFooterPolicy();
    if (!policy) {
        return;
    }
    std::cout << "\n=== 页眉页脚 ===" << std::endl;
    for (int page = 1; page <= 2; ++page) {
        const auto* header = policy->getHeader(page);
        const auto* footer = policy->getFooter(page);
        std::cout << "  第 " << page << " 页 页眉: " << (header ? header->getText() : "(无)") << std::endl;
        std::cout << "  第 " << page << " 页 页脚: " << (footer ? footer->getText() : "(无)") << std::endl;
    }
}

void printDiagnostics(const fastword::Document& document) {
    const auto& diagnostics = document.getDiagnostics();
    if (diagnostics.empty()) {
        return;
    }
    std::cout << "\n=== 诊断 ===" << std::endl;
    for (const auto& diagnostic : diagnostics) {
        std::cout << "  " << diagnostic.toString() << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "用法: " << argv[0] << " <file.docx> [--strict]" << std::endl;
        return 1;
    }

    fastword::DocumentOptions options;
    if (argc > 2 && std::string(argv[2]) == "--strict") {
        options.policy = fastword::AssemblyPolicy::Strict;
    }

    fastword::initialize("", false);

    try {
        auto document = fastword::openDocument(argv[1], options);

        std::cout << "=== FastWord " << fastword::getVersion() << " ===" << std::endl;
        std::cout << "主文档: " << document->getCorePartPath() << std::endl;

        printBody(*document);
        printHyperlinks(*document);
        printComments(*document);
        printEmbeds(*document);
        printStyles(*document);
        printHeaderFooter(*document);
        printDiagnostics(*document);
    } catch (const fastword::core::FastWordException& e) {
        std::cerr << "错误: " << e.what() << std::endl;
        fastword::cleanup();
        return 2;
    }

    fastword::cleanup();
    return 0;
}
