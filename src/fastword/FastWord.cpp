#include "fastword/FastWord.hpp"
#include "fastword/utils/Logger.hpp"
#include <iostream>

namespace fastword {

FASTWORD_API bool initialize(const std::string& log_file_path, bool enable_console) {
    try {
        Logger::getInstance().initialize(log_file_path, Logger::Level::INFO, enable_console);
        FASTWORD_LOG_INFO("FastWord library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统本身不可用，只能写标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize FastWord: " << e.what() << std::endl;
        }
        return false;
    }
}

FASTWORD_API void cleanup() {
    FASTWORD_LOG_INFO("FastWord library cleanup completed");
    Logger::getInstance().shutdown();
}

FASTWORD_API std::unique_ptr<core::Document> openDocument(const std::string& filename,
                                                          const core::DocumentOptions& options) {
    return core::Document::open(filename, options);
}

} // namespace fastword
