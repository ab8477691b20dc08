#include "language.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/assign.hpp>
#include <algorithm>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<string, language> language_names = boost::assign::map_list_of
    ("python", language::PYTHON)
    ("c", language::C)
    ("cpp", language::CPP)
    ("java", language::JAVA)
    ("javascript", language::JAVASCRIPT);
// clang-format on

static const char *BINARY_NAME = "program";
static const char *JAVA_MAIN_CLASS = "Solution";

const char *get_language_name(language lang) {
    switch (lang) {
        case language::PYTHON: return "python";
        case language::C: return "c";
        case language::CPP: return "cpp";
        case language::JAVA: return "java";
        case language::JAVASCRIPT: return "javascript";
    }
    throw internal_error("unknown language");
}

language_registry::language_registry(const toolchain &tools) {
    // clang-format off
    descriptors[language::PYTHON] = {language::PYTHON, "code.py",
        nullopt,
        {tools.python, "{source}"}};
    descriptors[language::JAVASCRIPT] = {language::JAVASCRIPT, "code.js",
        nullopt,
        {tools.node, "{source}"}};
    descriptors[language::C] = {language::C, "code.c",
        vector<string>{tools.cc, "-o", "{binary}", "{source}"},
        {"{binary}"}};
    descriptors[language::CPP] = {language::CPP, "code.cpp",
        vector<string>{tools.cxx, "-o", "{binary}", "{source}"},
        {"{binary}"}};
    descriptors[language::JAVA] = {language::JAVA, fmt::format("{}.java", JAVA_MAIN_CLASS),
        vector<string>{tools.javac, "{source}"},
        {tools.java, "-cp", "{workdir}", "{main_class}"}};
    // clang-format on
}

const language_descriptor *language_registry::find(const string &name) const {
    auto it = language_names.find(name);
    if (it == language_names.end()) return nullptr;
    return &descriptors.at(it->second);
}

const language_descriptor &language_registry::get(language lang) const {
    return descriptors.at(lang);
}

vector<string> language_registry::names() const {
    vector<string> result;
    for (auto &[lang, desc] : descriptors)
        result.push_back(get_language_name(lang));
    sort(result.begin(), result.end());
    return result;
}

vector<string> expand_command(const vector<string> &command, const language_descriptor &desc, const filesystem::path &workdir) {
    string source = (workdir / desc.source_file_name).string();
    string binary = (workdir / BINARY_NAME).string();
    vector<string> result;
    for (string arg : command) {
        boost::algorithm::replace_all(arg, "{source}", source);
        boost::algorithm::replace_all(arg, "{binary}", binary);
        boost::algorithm::replace_all(arg, "{workdir}", workdir.string());
        boost::algorithm::replace_all(arg, "{main_class}", JAVA_MAIN_CLASS);
        result.push_back(move(arg));
    }
    return result;
}

}  // namespace runner
