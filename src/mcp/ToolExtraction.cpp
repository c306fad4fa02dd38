#include "mcp/ToolExtraction.h"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <sstream>
#include <unordered_set>

namespace ToolExtraction {

namespace {
const size_t npos = std::string::npos;

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isWordChar(char c) {
    return isAsciiAlpha(c) || (c >= '0' && c <= '9') || c == '_';
}

bool isQuote(char c) {
    return c == '"' || c == '\'';
}

size_t skipSpaces(const std::string& text, size_t i) {
    while (i < text.size() && isSpace(text[i])) ++i;
    return i;
}

// 大小写不敏感地查找 word
size_t findKeyword(const std::string& text, const std::string& word, size_t from) {
    if (word.empty() || text.size() < word.size()) return npos;
    for (size_t i = from; i + word.size() <= text.size(); ++i) {
        size_t k = 0;
        while (k < word.size() &&
               std::tolower(static_cast<unsigned char>(text[i + k])) == static_cast<unsigned char>(word[k])) {
            ++k;
        }
        if (k == word.size()) return i;
    }
    return npos;
}

// key 之后的 ["']? \s* : \s*，返回值的起点；形状不符时返回 npos
size_t declarationValueStart(const std::string& text, size_t afterKey) {
    size_t i = afterKey;
    if (i < text.size() && isQuote(text[i])) ++i;
    i = skipSpaces(text, i);
    if (i >= text.size() || text[i] != ':') return npos;
    return skipSpaces(text, i + 1);
}

// "jsonrpc" \s* : \s* "2.0"
bool hasJsonRpcMarker(const std::string& text) {
    static const std::string key = "\"jsonrpc\"";
    static const std::string version = "\"2.0\"";
    for (size_t pos = text.find(key); pos != npos; pos = text.find(key, pos + 1)) {
        size_t i = skipSpaces(text, pos + key.size());
        if (i >= text.size() || text[i] != ':') continue;
        i = skipSpaces(text, i + 1);
        if (text.compare(i, version.size(), version) == 0) return true;
    }
    return false;
}

// ["']name["'] \s* : \s* ["']value["']，取行内第一个完整匹配
bool quotedNameValue(const std::string& line, std::string& value) {
    for (size_t q = 0; q + 6 <= line.size(); ++q) {
        if (!isQuote(line[q]) || !isQuote(line[q + 5])) continue;
        if (findKeyword(line.substr(q + 1, 4), "name", 0) != 0) continue;

        size_t i = skipSpaces(line, q + 6);
        if (i >= line.size() || line[i] != ':') continue;
        i = skipSpaces(line, i + 1);
        if (i >= line.size() || !isQuote(line[i])) continue;

        size_t start = i + 1;
        size_t end = start;
        while (end < line.size() && !isQuote(line[end])) ++end;
        if (end >= line.size() || end == start) continue;
        value = line.substr(start, end - start);
        return true;
    }
    return false;
}

// word_word 形状：字母开头，第二个字符之后出现 '_' 且紧跟字母
bool isSnakeIdentifier(const std::string& token) {
    if (token.size() < 4 || !isAsciiAlpha(token[0])) return false;
    for (size_t k = 2; k + 1 < token.size(); ++k) {
        if (token[k] == '_' && isAsciiAlpha(token[k + 1])) return true;
    }
    return false;
}

enum class ScanState { OUT, IN_STRING, ESCAPE };

struct ScanLane {
    ScanState state;
    std::vector<size_t> open;   // 尚未闭合的 '{' 的下标（并查集中的任一成员）
};

size_t findRoot(std::vector<size_t>& parent, size_t x) {
    while (parent[x] != x) {
        parent[x] = parent[parent[x]];
        x = parent[x];
    }
    return x;
}

struct BracePair {
    size_t open;
    size_t close;   // npos when never closed
};

/**
 * 为每个 '{' 求出配对的 '}'，语义等同于从该 '{' 单独做一次考虑字符串字面量的
 * 括号配平扫描。
 *
 * 单独扫描的走向只取决于 (位置, 字符串状态)，状态相同的两次扫描此后完全一致。
 * 因此同时推进至多三条扫描线（串外 / 串内 / 转义），状态重合时合并栈，
 * 同一层的 '{' 用并查集归为一组，整体线性。
 */
std::vector<BracePair> matchBraces(const std::string& text) {
    std::vector<BracePair> braces;
    std::vector<size_t> parent;     // 按 braces 下标
    std::vector<size_t> closeOf;
    std::vector<ScanLane> lanes;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '{') {
            braces.push_back({i, npos});
            parent.push_back(parent.size());
            closeOf.push_back(npos);
            bool outside = std::any_of(lanes.begin(), lanes.end(),
                                       [](const ScanLane& l) { return l.state == ScanState::OUT; });
            if (!outside) lanes.push_back({ScanState::OUT, {}});
        }

        for (auto& lane : lanes) {
            switch (lane.state) {
                case ScanState::OUT:
                    if (c == '"') {
                        lane.state = ScanState::IN_STRING;
                    } else if (c == '{') {
                        lane.open.push_back(braces.size() - 1);
                    } else if (c == '}' && !lane.open.empty()) {
                        closeOf[findRoot(parent, lane.open.back())] = i;
                        lane.open.pop_back();
                    }
                    break;
                case ScanState::IN_STRING:
                    if (c == '\\') {
                        lane.state = ScanState::ESCAPE;
                    } else if (c == '"') {
                        lane.state = ScanState::OUT;
                    }
                    break;
                case ScanState::ESCAPE:
                    lane.state = ScanState::IN_STRING;
                    break;
            }
        }

        // 状态相同的扫描线合并：自栈顶起逐层归并
        for (size_t a = 0; a < lanes.size(); ++a) {
            for (size_t b = a + 1; b < lanes.size();) {
                if (lanes[b].state != lanes[a].state) {
                    ++b;
                    continue;
                }
                auto& keep = lanes[a].open;
                auto& drop = lanes[b].open;
                if (keep.size() < drop.size()) keep.swap(drop);
                for (size_t t = 1; t <= drop.size(); ++t) {
                    size_t& slot = keep[keep.size() - t];
                    size_t root = findRoot(parent, slot);
                    parent[findRoot(parent, drop[drop.size() - t])] = root;
                    slot = root;
                }
                lanes.erase(lanes.begin() + static_cast<std::ptrdiff_t>(b));
            }
        }
        lanes.erase(std::remove_if(lanes.begin(), lanes.end(),
                                   [](const ScanLane& l) { return l.open.empty(); }),
                    lanes.end());
    }

    for (size_t k = 0; k < braces.size(); ++k) {
        braces[k].close = closeOf[findRoot(parent, k)];
    }
    return braces;
}

bool tryParse(const std::string& candidate, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(candidate);
        return true;
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
}

bool hasList(const nlohmann::json& obj, const char* key) {
    return obj.is_object() && obj.contains(key) && obj[key].is_array();
}
} // namespace

std::vector<std::string> findJsonObjects(const std::string& text) {
    std::vector<std::string> objects;
    size_t resumeAt = 0;
    for (const auto& brace : matchBraces(text)) {
        if (brace.open < resumeAt) continue;
        // 未闭合（常见于超时截断）的直接跳过，从下一个 '{' 继续
        if (brace.close == npos) continue;
        objects.push_back(text.substr(brace.open, brace.close - brace.open + 1));
        resumeAt = brace.close + 1;
    }
    return objects;
}

std::vector<std::string> collectNames(const nlohmann::json& list) {
    std::vector<std::string> names;
    if (!list.is_array()) return names;
    for (const auto& item : list) {
        if (item.is_object() && item.contains("name") && item["name"].is_string()) {
            std::string name = item["name"].get<std::string>();
            if (!name.empty()) names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> fromJsonRpc(const std::string& text) {
    for (const auto& candidate : findJsonObjects(text)) {
        if (!hasJsonRpcMarker(candidate)) continue;
        nlohmann::json response;
        if (!tryParse(candidate, response) || !response.is_object()) continue;
        if (!response.contains("result") || !hasList(response["result"], "tools")) continue;

        auto names = collectNames(response["result"]["tools"]);
        if (!names.empty()) return names;
    }
    return {};
}

std::vector<std::string> fromFunctionManifest(const std::string& text) {
    // 单个 name 对象与列表共用一份结果；列表命中即返回，之前累积的名字保留
    std::vector<std::string> names;
    for (const auto& candidate : findJsonObjects(text)) {
        nlohmann::json parsed;
        if (!tryParse(candidate, parsed) || !parsed.is_object()) continue;

        // OpenAI 风格 functions 列表
        if (hasList(parsed, "functions")) {
            auto listed = collectNames(parsed["functions"]);
            names.insert(names.end(), listed.begin(), listed.end());
            if (!names.empty()) return names;
        }
        if (hasList(parsed, "tools")) {
            auto listed = collectNames(parsed["tools"]);
            names.insert(names.end(), listed.begin(), listed.end());
            if (!names.empty()) return names;
        }
        if (parsed.contains("name") && parsed["name"].is_string()) {
            std::string name = parsed["name"].get<std::string>();
            if (!name.empty()) names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> fromNameLines(const std::string& text) {
    std::vector<std::string> names;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find("\"name\"") == npos && line.find("'name'") == npos) {
            continue;
        }

        nlohmann::json lineData;
        if (tryParse(line, lineData)) {
            if (lineData.is_object() && lineData.contains("name") && lineData["name"].is_string()) {
                std::string name = lineData["name"].get<std::string>();
                if (!name.empty()) names.push_back(name);
            }
            continue;
        }

        std::string value;
        if (quotedNameValue(line, value)) names.push_back(value);
    }
    return names;
}

std::vector<std::string> fromKeyDeclarations(const std::string& text) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& raw) {
        std::string value = trim(raw);
        if (!value.empty() && seen.insert(value).second) names.push_back(value);
    };

    // function: value，值为 [A-Za-z0-9_]+
    for (size_t pos = findKeyword(text, "function", 0); pos != npos;) {
        size_t i = declarationValueStart(text, pos + 8);
        if (i != npos && i < text.size() && isQuote(text[i])) ++i;
        size_t end = i;
        while (end != npos && end < text.size() && isWordChar(text[end])) ++end;
        if (i == npos || end == i) {
            pos = findKeyword(text, "function", pos + 1);
            continue;
        }
        add(text.substr(i, end - i));
        pos = findKeyword(text, "function", end);
    }

    // name: value，值到引号、逗号或换行为止
    for (size_t pos = findKeyword(text, "name", 0); pos != npos;) {
        size_t i = declarationValueStart(text, pos + 4);
        if (i != npos && i < text.size() && isQuote(text[i])) ++i;
        size_t end = i;
        while (end != npos && end < text.size() && !isQuote(text[end]) && text[end] != ',' && text[end] != '\n') {
            ++end;
        }
        if (i == npos || end == i) {
            pos = findKeyword(text, "name", pos + 1);
            continue;
        }
        add(text.substr(i, end - i));
        pos = findKeyword(text, "name", end);
    }
    return names;
}

std::string hintPrefix(const std::string& serverHint) {
    std::string segment = serverHint;
    while (!segment.empty() && segment.back() == '/') segment.pop_back();
    auto slash = segment.find_last_of('/');
    if (slash != npos) segment = segment.substr(slash + 1);
    segment = toLower(segment);

    for (const char* prefix : {"mcp-", "mcp_"}) {
        if (segment.rfind(prefix, 0) == 0) segment = segment.substr(4);
    }
    for (const char* suffix : {"-mcp", "_mcp"}) {
        if (segment.size() > 4 && segment.compare(segment.size() - 4, 4, suffix) == 0) {
            segment = segment.substr(0, segment.size() - 4);
        }
    }
    auto sep = segment.find_first_of("-_.");
    if (sep != npos) segment = segment.substr(0, sep);
    if (segment.empty() || !std::isalpha(static_cast<unsigned char>(segment[0]))) return "";
    return segment;
}

std::vector<std::string> fromIdentifiers(const std::string& text, const std::string& serverHint) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    // 整段 [A-Za-z0-9_] 作为一个候选，两端即单词边界
    size_t i = 0;
    while (i < text.size()) {
        if (!isWordChar(text[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && isWordChar(text[i])) ++i;
        std::string token = text.substr(start, i - start);
        if (isSnakeIdentifier(token) && seen.insert(token).second) names.push_back(token);
    }

    // 服务器标识只作为提示：命中前缀的候选存在时才收窄
    const std::string prefix = hintPrefix(serverHint);
    if (!prefix.empty()) {
        std::vector<std::string> hinted;
        for (const auto& name : names) {
            if (toLower(name).rfind(prefix + "_", 0) == 0) hinted.push_back(name);
        }
        if (!hinted.empty()) return hinted;
    }
    return names;
}

std::vector<std::string> unique(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) result.push_back(name);
    }
    return result;
}

ExtractionChain::ExtractionChain(DiagnosticSink sink, std::string serverHint)
    : sink(std::move(sink)) {
    strategies = {
        {"json-rpc", "in JSON-RPC response", fromJsonRpc},
        {"function-manifest", "using functions/tools manifest format", fromFunctionManifest},
        {"line-scan", "using line-by-line search", fromNameLines},
        {"key-declaration", "using function/name declaration pattern", fromKeyDeclarations},
        {"identifier", "using identifier heuristic",
         [hint = std::move(serverHint)](const std::string& text) { return fromIdentifiers(text, hint); }}
    };
}

void ExtractionChain::emit(LogLevel level, const std::string& message) const {
    if (sink) sink(level, message);
}

ExtractionResult ExtractionChain::extract(const std::string& text) const {
    ExtractionResult result;
    if (trim(text).empty()) {
        emit(LogLevel::WARNING, "Server output is empty");
        return result;
    }

    for (const auto& strategy : strategies) {
        auto names = unique(strategy.run(text));
        if (names.empty()) continue;
        emit(LogLevel::DEBUG, "Found " + std::to_string(names.size()) + " tools " + strategy.foundMessage);
        result.names = std::move(names);
        result.strategy = strategy.name;
        return result;
    }

    emit(LogLevel::DEBUG, "No tools found. Raw output (first 500 chars): " + text.substr(0, 500));
    return result;
}

ExtractionResult ExtractionChain::extractFromStreams(const std::string& stdoutText,
                                                     const std::string& stderrText) const {
    ExtractionResult result = extract(stdoutText);
    if (!result.names.empty() || trim(stderrText).empty()) return result;

    // 部分服务器把函数信息写到 stderr
    ExtractionResult fallback = extract(stderrText);
    if (!fallback.names.empty()) {
        emit(LogLevel::DEBUG, "Found " + std::to_string(fallback.names.size()) + " tools in stderr output");
        fallback.fromStderr = true;
        return fallback;
    }
    return result;
}

} // namespace ToolExtraction
