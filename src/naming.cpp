#include "naming.hpp"

#include <regex>

std::string trim_copy(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::string sanitize_filename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') c = '_';
    }
    s = trim_copy(s);
    if (s.size() > kMaxFileNameLength) s = trim_copy(s.substr(0, kMaxFileNameLength));
    return s;
}

std::string pad_chapter(const std::string& label) {
    std::string l = trim_copy(label);
    auto dot = l.find('.');
    std::string whole = dot == std::string::npos ? l : l.substr(0, dot);
    std::string rest = dot == std::string::npos ? std::string() : l.substr(dot);
    if (whole.size() < 4) whole.insert(0, 4 - whole.size(), '0');
    return whole + rest;
}

std::string chapter_dir_name(const ChapterRef& chapter) {
    std::string name = "Ch." + pad_chapter(chapter.chapterLabel);
    if (chapter.title && !chapter.title->empty()) name += " - " + *chapter.title;
    if (name.size() > 150) name.resize(150);
    return sanitize_filename(name);
}

std::string page_file_name(int ordinal, const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = last.find_last_of('.');
    std::string ext = dot == std::string::npos ? std::string() : last.substr(dot + 1);
    if (ext.empty()) ext = "jpg";

    std::string num = std::to_string(ordinal);
    if (num.size() < 3) num.insert(0, 3 - num.size(), '0');
    return num + "." + ext;
}

std::string extract_uuid(const std::string& input) {
    static const std::regex re(R"(([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}))");
    std::smatch m;
    if (std::regex_search(input, m, re)) return m[1].str();
    return trim_copy(input);
}
