#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "yomikae_api.hpp"

namespace py = pybind11;

// 调用失败时转换为 Python RuntimeError
static void raiseIfError(const Yomikae::PronunciationDictionary& dict) {
    if (dict.HasError()) {
        throw std::runtime_error(dict.GetLastError());
    }
}

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_yomikae, m) {
    m.doc() = "Yomikae - VOICEPEAK pronunciation dictionary Python bindings";

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<Yomikae::DictFormat>(m, "DictFormat", "Dictionary file formats")
        .value("AUTO", Yomikae::DictFormat::AUTO, "Infer from the file suffix")
        .value("BINARY", Yomikae::DictFormat::BINARY, "user.dic binary format")
        .value("TEXT", Yomikae::DictFormat::TEXT, "user.json text format")
        .export_values();

    // =========================================================================
    // DictionaryEntry - 词典条目
    // =========================================================================

    py::class_<Yomikae::DictionaryEntry>(m, "DictionaryEntry", "Pronunciation override")
        .def(py::init<>(), "Create an entry with default values")
        .def(py::init([](const std::string& surface, const std::string& pronunciation,
                         int priority, const std::string& language) {
                Yomikae::DictionaryEntry entry;
                entry.surface_form = surface;
                entry.pronunciation = pronunciation;
                entry.priority = priority;
                entry.language = language;
                return entry;
            }),
            py::arg("surface_form"),
            py::arg("pronunciation"),
            py::arg("priority") = 5,
            py::arg("language") = "ja",
            "Create an entry")
        .def_readwrite("surface_form", &Yomikae::DictionaryEntry::surface_form, "Text to replace")
        .def_readwrite("pronunciation", &Yomikae::DictionaryEntry::pronunciation, "Reading in katakana")
        .def_readwrite("part_of_speech", &Yomikae::DictionaryEntry::part_of_speech, "Part of speech")
        .def_readwrite("priority", &Yomikae::DictionaryEntry::priority, "Priority")
        .def_readwrite("accent_type", &Yomikae::DictionaryEntry::accent_type, "Accent type")
        .def_readwrite("language", &Yomikae::DictionaryEntry::language, "Language code")
        .def("__repr__", [](const Yomikae::DictionaryEntry& e) {
            return "<DictionaryEntry '" + e.surface_form + "' -> '" + e.pronunciation + "'" +
                " priority=" + std::to_string(e.priority) +
                " lang=" + e.language + ">";
        });

    // =========================================================================
    // DictConfig - 配置结构
    // =========================================================================

    py::class_<Yomikae::DictConfig>(m, "DictConfig", "Dictionary configuration")
        .def(py::init<>(), "Create default configuration")
        .def_readwrite("dictionary_path", &Yomikae::DictConfig::dictionary_path,
            "Dictionary file path (empty = platform default)")
        .def_readwrite("format", &Yomikae::DictConfig::format, "File format")
        .def_readwrite("verbose", &Yomikae::DictConfig::verbose, "Verbose logging")
        .def_static("Default", &Yomikae::DictConfig::Default,
                    "Create default configuration")
        .def_static("AtPath", &Yomikae::DictConfig::AtPath,
                    py::arg("path"),
                    "Create configuration for a dictionary file")
        .def("withFormat", &Yomikae::DictConfig::withFormat,
            py::arg("format"),
            "Set file format (chainable)")
        .def("withVerbose", &Yomikae::DictConfig::withVerbose,
            py::arg("verbose"),
            "Set verbose logging (chainable)");

    // =========================================================================
    // PronunciationDictionary - 读音词典
    // =========================================================================

    py::class_<Yomikae::PronunciationDictionary>(m, "PronunciationDictionary",
        "VOICEPEAK user dictionary")
        .def(py::init<const Yomikae::DictConfig&>(),
            py::arg("config") = Yomikae::DictConfig(),
            "Open a dictionary")
        .def("add", [](Yomikae::PronunciationDictionary& self, const Yomikae::DictionaryEntry& entry) {
            self.AddEntry(entry);
            raiseIfError(self);
        }, py::arg("entry"), "Add or replace an entry")
        .def("remove", [](Yomikae::PronunciationDictionary& self, const std::string& key,
                          const std::string& language) {
            bool removed = self.RemoveEntry(key, language);
            raiseIfError(self);
            return removed;
        }, py::arg("key"), py::arg("language") = "ja",
            "Remove entries by key; returns whether anything was removed")
        .def("find", [](Yomikae::PronunciationDictionary& self, const std::string& key) {
            auto entries = self.FindEntry(key);
            raiseIfError(self);
            return entries;
        }, py::arg("key"), "Find entries by key")
        .def("list", [](Yomikae::PronunciationDictionary& self) {
            auto entries = self.ListEntries();
            raiseIfError(self);
            return entries;
        }, "List all entries")
        .def("clear", [](Yomikae::PronunciationDictionary& self) {
            self.Clear();
            raiseIfError(self);
        }, "Remove all entries")
        .def_property_readonly("path", &Yomikae::PronunciationDictionary::GetPath,
            "Dictionary file path")
        .def_property_readonly("is_binary", &Yomikae::PronunciationDictionary::IsBinaryFormat,
            "Whether the dictionary uses the binary format")
        .def("is_initialized", &Yomikae::PronunciationDictionary::IsInitialized,
            "Check if the dictionary was opened")
        .def("__repr__", [](const Yomikae::PronunciationDictionary& d) {
            return "<PronunciationDictionary path='" + d.GetPath() + "' format=" +
                std::string(d.IsBinaryFormat() ? "binary" : "text") + ">";
        });
}
