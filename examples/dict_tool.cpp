#include <cstring>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "yomikae_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项] <命令> [参数]\n"
        << "\n"
        << "选项:\n"
        << "  -d <path>      词典文件路径 (默认: 平台默认路径或 $YOMIKAE_DICT_PATH)\n"
        << "  -f <format>    文件格式: auto, binary, text (默认: auto, 按后缀推断)\n"
        << "  -v             输出详细日志\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "命令:\n"
        << "  add <表记> <读音> [-p 优先级] [-a 声调类型] [--pos 词性] [--lang 语言]\n"
        << "  remove <键> [--lang 语言]   删除条目 (二进制格式的键为读音)\n"
        << "  find <键>                   查找条目\n"
        << "  list                        列出全部条目\n"
        << "  clear                       清空词典\n"
        << "  path                        显示词典路径\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " add MCP エムシーピー\n"
        << "  " << program << " -d /tmp/user.dic add MCP エムシーピー -p 10\n"
        << "  " << program << " remove MCP\n"
        << "  " << program << " find MCP\n"
        << std::endl;
}

bool parseFormat(const std::string& name, Yomikae::DictFormat& format) {
    if (name == "auto") {
        format = Yomikae::DictFormat::AUTO;
    } else if (name == "binary" || name == "dic") {
        format = Yomikae::DictFormat::BINARY;
    } else if (name == "text" || name == "json") {
        format = Yomikae::DictFormat::TEXT;
    } else {
        return false;
    }
    return true;
}

bool parseInt(const char* value, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(value, &pos);
        return pos == std::strlen(value);
    } catch (const std::exception&) {
        return false;
    }
}

void printEntries(const std::vector<Yomikae::DictionaryEntry>& entries) {
    for (const auto& e : entries) {
        std::cout << e.surface_form << "\t" << e.pronunciation
            << "\tpos=" << e.part_of_speech
            << "\tpriority=" << e.priority
            << "\taccent=" << e.accent_type
            << "\tlang=" << e.language << std::endl;
    }
}

int reportFailure(const Yomikae::PronunciationDictionary& dict, const std::string& what) {
    std::cerr << what << "失败: " << dict.GetLastError() << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    Yomikae::DictConfig config;
    std::vector<std::string> args;

    // 解析全局选项, 其余参数交给命令处理
    int i = 1;
    for (; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            config.dictionary_path = argv[++i];
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            if (!parseFormat(argv[++i], config.format)) {
                std::cerr << "错误: 未知格式 '" << argv[i] << "'\n"
                    << "可用格式: auto, binary, text\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        } else {
            break;
        }
    }
    for (; i < argc; i++) {
        args.emplace_back(argv[i]);
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    Yomikae::PronunciationDictionary dict(config);
    if (!dict.IsInitialized()) {
        std::cerr << "词典初始化失败: " << dict.GetLastError() << std::endl;
        return 1;
    }

    const std::string& command = args[0];

    if (command == "path") {
        std::cout << dict.GetPath() << std::endl;
        std::cout << "格式: " << (dict.IsBinaryFormat() ? "binary" : "text") << std::endl;
        return 0;
    }

    if (command == "add") {
        if (args.size() < 3) {
            std::cerr << "错误: add 需要 <表记> <读音>" << std::endl;
            return 1;
        }

        Yomikae::DictionaryEntry entry;
        entry.surface_form = args[1];
        entry.pronunciation = args[2];

        for (size_t k = 3; k < args.size(); k++) {
            bool has_value = k + 1 < args.size();
            if (args[k] == "-p" && has_value) {
                if (!parseInt(args[++k].c_str(), entry.priority)) {
                    std::cerr << "错误: 无效的优先级 '" << args[k] << "'" << std::endl;
                    return 1;
                }
            } else if (args[k] == "-a" && has_value) {
                if (!parseInt(args[++k].c_str(), entry.accent_type)) {
                    std::cerr << "错误: 无效的声调类型 '" << args[k] << "'" << std::endl;
                    return 1;
                }
            } else if (args[k] == "--pos" && has_value) {
                entry.part_of_speech = args[++k];
            } else if (args[k] == "--lang" && has_value) {
                entry.language = args[++k];
            } else {
                std::cerr << "错误: 未知参数 '" << args[k] << "'" << std::endl;
                return 1;
            }
        }

        if (!dict.AddEntry(entry)) {
            return reportFailure(dict, "添加");
        }
        std::cout << "已添加: " << entry.surface_form << " -> " << entry.pronunciation << std::endl;
        if (dict.IsBinaryFormat()) {
            std::cout << "注意: 二进制词典不保存表记, 请用读音删除或查找该条目" << std::endl;
        }
        return 0;
    }

    if (command == "remove") {
        if (args.size() < 2) {
            std::cerr << "错误: remove 需要 <键>" << std::endl;
            return 1;
        }
        std::string language = "ja";
        if (args.size() >= 4 && args[2] == "--lang") {
            language = args[3];
        }

        bool removed = dict.RemoveEntry(args[1], language);
        if (dict.HasError()) {
            return reportFailure(dict, "删除");
        }
        if (!removed) {
            std::cout << "未找到条目: " << args[1] << std::endl;
            return 0;
        }
        std::cout << "已删除: " << args[1] << std::endl;
        return 0;
    }

    if (command == "find") {
        if (args.size() < 2) {
            std::cerr << "错误: find 需要 <键>" << std::endl;
            return 1;
        }
        auto entries = dict.FindEntry(args[1]);
        if (dict.HasError()) {
            return reportFailure(dict, "查找");
        }
        if (entries.empty()) {
            std::cout << "未找到条目: " << args[1] << std::endl;
            return 0;
        }
        printEntries(entries);
        return 0;
    }

    if (command == "list") {
        auto entries = dict.ListEntries();
        if (dict.HasError()) {
            return reportFailure(dict, "读取");
        }
        std::cout << "共 " << entries.size() << " 个条目 (" << dict.GetPath() << ")" << std::endl;
        printEntries(entries);
        return 0;
    }

    if (command == "clear") {
        if (!dict.Clear()) {
            return reportFailure(dict, "清空");
        }
        return 0;
    }

    std::cerr << "错误: 未知命令 '" << command << "'" << std::endl;
    printUsage(argv[0]);
    return 1;
}
