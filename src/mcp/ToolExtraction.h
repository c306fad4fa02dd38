#pragma once
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include "utils/Logger.h"

/**
 * @brief 从服务器原始输出中提取工具名的策略集合
 *
 * 每个策略都是纯函数 (text) -> names，按精度从高到低排列：
 *   1. fromJsonRpc           JSON-RPC 2.0 响应中的 result.tools[].name
 *   2. fromFunctionManifest  functions / tools 列表或单个带 name 的对象
 *   3. fromNameLines         逐行查找 "name" 键
 *   4. fromKeyDeclarations   function: x / name: x 形式的声明
 *   5. fromIdentifiers       snake_case 形式的裸标识符（最后手段）
 */
namespace ToolExtraction {

using Strategy = std::function<std::vector<std::string>(const std::string&)>;

// 完整（括号配平）的 JSON 对象子串，按出现顺序
std::vector<std::string> findJsonObjects(const std::string& text);

// Names of every object element of `list` that carries a non-empty string "name"
std::vector<std::string> collectNames(const nlohmann::json& list);

std::vector<std::string> fromJsonRpc(const std::string& text);
std::vector<std::string> fromFunctionManifest(const std::string& text);
std::vector<std::string> fromNameLines(const std::string& text);
std::vector<std::string> fromKeyDeclarations(const std::string& text);
std::vector<std::string> fromIdentifiers(const std::string& text, const std::string& serverHint = "");

// "github.com/foo/mcp-playwright" -> "playwright"; empty when nothing usable remains
std::string hintPrefix(const std::string& serverHint);

std::vector<std::string> unique(const std::vector<std::string>& names);

struct ExtractionResult {
    std::vector<std::string> names;
    std::string strategy;     // empty when nothing matched
    bool fromStderr = false;
};

/**
 * @brief 按优先级串联各策略：第一个产出非空结果的策略即为最终结果。
 * stdout 无结果时对 stderr 完整重跑一遍。
 */
class ExtractionChain {
public:
    explicit ExtractionChain(DiagnosticSink sink = nullptr, std::string serverHint = "");

    ExtractionResult extract(const std::string& text) const;
    ExtractionResult extractFromStreams(const std::string& stdoutText, const std::string& stderrText) const;

    size_t strategyCount() const { return strategies.size(); }

private:
    struct NamedStrategy {
        std::string name;
        std::string foundMessage;
        Strategy run;
    };

    DiagnosticSink sink;
    std::vector<NamedStrategy> strategies;

    void emit(LogLevel level, const std::string& message) const;
};

} // namespace ToolExtraction
