#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace fs = std::filesystem;

namespace toolbridge::tools {

namespace {

constexpr size_t kLogTailLines = 20;

std::string default_output_dir(const std::string& apk_path, const char* suffix) {
    fs::path apk(apk_path);
    return (apk.parent_path() / (apk.stem().string() + suffix)).string();
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string tail_lines(const std::string& text, size_t count) {
    std::vector<std::string> lines;
    std::stringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    size_t start = lines.size() > count ? lines.size() - count : 0;
    std::string tail;
    for (size_t i = start; i < lines.size(); ++i) {
        tail += lines[i];
        tail += '\n';
    }
    return tail;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

ToolOutcome run_decompiler(ToolCall& call, const std::string& label, const std::vector<std::string>& argv,
                           const std::string& apk_path, const std::string& output_dir) {
    LOG4CPLUS_INFO(tool_logger(), label << ": " << apk_path << " -> " << output_dir);

    ProcessResult result = call.context.runner.run(argv, call.cancel);
    if (result.cancelled) {
        return cancelled(label + " was cancelled");
    }
    if (result.exit_code != 0) {
        std::string detail = trim(result.stderr_text.empty() ? result.stdout_text : result.stderr_text);
        LOG4CPLUS_ERROR(tool_logger(), label << " failed with exit code " << result.exit_code << ": " << detail);
        return execution_failed(label + " failed with exit code " + std::to_string(result.exit_code) + ": " + detail,
                                {{"exitCode", result.exit_code}, {"stderr", result.stderr_text}});
    }

    return ok({
        {"success", true},
        {"tool", label},
        {"apk_path", apk_path},
        {"output_dir", output_dir},
        {"log", tail_lines(result.stdout_text, kLogTailLines)},
    });
}

struct DecompileApkArgs {
    std::string apk_path;
    std::string output_dir;
    bool force = true;

    static DecompileApkArgs from(const ToolArguments& args, const ToolContext&) {
        DecompileApkArgs parsed;
        parsed.apk_path = args.get_string("apk_path");
        parsed.output_dir = args.find_string("output_dir").value_or(default_output_dir(parsed.apk_path, "_apktool"));
        parsed.force = args.get_bool("force");
        return parsed;
    }
};

class DecompileApkTool final : public TypedToolHandler<DecompileApkArgs> {
public:
    DecompileApkTool()
        : TypedToolHandler(ToolDescriptor{
              "decompile_apk",
              "Decode an APK with apktool: resources, AndroidManifest.xml and smali sources",
              {
                  required_string("apk_path", "Path to the APK file"),
                  optional_string("output_dir", "Output directory (default: <apk name>_apktool next to the APK)"),
                  optional_bool("force", "Overwrite the output directory if it exists", true),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const DecompileApkArgs& args, ToolCall& call) override {
        if (!is_regular_file(args.apk_path)) {
            LOG4CPLUS_WARN(tool_logger(), "decompile_apk: APK file not found: " << args.apk_path);
            return not_found("APK file not found: " + args.apk_path);
        }

        std::vector<std::string> argv{call.context.config.apktool_path, "d"};
        if (args.force) {
            argv.push_back("-f");
        }
        argv.insert(argv.end(), {"-o", args.output_dir, args.apk_path});
        return run_decompiler(call, "apktool", argv, args.apk_path, args.output_dir);
    }
};

struct JadxDecompileArgs {
    std::string apk_path;
    std::string output_dir;
    std::string content;

    static JadxDecompileArgs from(const ToolArguments& args, const ToolContext&) {
        JadxDecompileArgs parsed;
        parsed.apk_path = args.get_string("apk_path");
        parsed.output_dir = args.find_string("output_dir").value_or(default_output_dir(parsed.apk_path, "_jadx"));
        parsed.content = args.get_string("content");
        return parsed;
    }
};

class JadxDecompileTool final : public TypedToolHandler<JadxDecompileArgs> {
public:
    JadxDecompileTool()
        : TypedToolHandler(ToolDescriptor{
              "jadx_decompile",
              "Decompile an APK to Java sources with jadx",
              {
                  required_string("apk_path", "Path to the APK file"),
                  optional_string("output_dir", "Output directory (default: <apk name>_jadx next to the APK)"),
                  enum_param("content", "What to produce: sources and resources, sources only, or resources only",
                             {"all", "sources", "resources"}, "all"),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const JadxDecompileArgs& args, ToolCall& call) override {
        if (!is_regular_file(args.apk_path)) {
            LOG4CPLUS_WARN(tool_logger(), "jadx_decompile: APK file not found: " << args.apk_path);
            return not_found("APK file not found: " + args.apk_path);
        }

        std::vector<std::string> argv{call.context.config.jadx_path, "-d", args.output_dir};
        if (args.content == "sources") {
            argv.push_back("--no-res");
        } else if (args.content == "resources") {
            argv.push_back("--no-src");
        }
        argv.push_back(args.apk_path);
        return run_decompiler(call, "jadx", argv, args.apk_path, args.output_dir);
    }
};

struct AnalyzeManifestArgs {
    std::string apktool_dir;

    static AnalyzeManifestArgs from(const ToolArguments& args, const ToolContext&) {
        return AnalyzeManifestArgs{args.get_string("apktool_dir")};
    }
};

std::vector<std::string> collect_names(const std::string& xml, const char* element) {
    std::regex pattern(std::string("<") + element + R"(\b[^>]*?\bandroid:name=\"([^\"]+)\")");
    std::vector<std::string> names;
    for (std::sregex_iterator it(xml.begin(), xml.end(), pattern), end; it != end; ++it) {
        std::string name = (*it)[1].str();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

nlohmann::json manifest_attribute(const std::string& xml, const char* attribute) {
    std::regex pattern(std::string(R"(<manifest\b[^>]*?\b)") + attribute + R"(=\"([^\"]*)\")");
    std::smatch match;
    if (std::regex_search(xml, match, pattern)) {
        return match[1].str();
    }
    return nullptr;
}

class AnalyzeManifestTool final : public TypedToolHandler<AnalyzeManifestArgs> {
public:
    AnalyzeManifestTool()
        : TypedToolHandler(ToolDescriptor{
              "analyze_manifest",
              "Summarize AndroidManifest.xml of an apktool output directory",
              {
                  required_string("apktool_dir", "Directory produced by decompile_apk"),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const AnalyzeManifestArgs& args, ToolCall&) override {
        if (!is_directory(args.apktool_dir)) {
            return not_found("Directory not found: " + args.apktool_dir);
        }
        fs::path manifest_path = fs::path(args.apktool_dir) / "AndroidManifest.xml";
        std::ifstream input(manifest_path, std::ios::binary);
        if (!input) {
            return not_found("AndroidManifest.xml not found in: " + args.apktool_dir);
        }
        std::stringstream buffer;
        buffer << input.rdbuf();
        const std::string xml = buffer.str();

        if (xml.find("<manifest") == std::string::npos) {
            // binary AXML: the APK was copied, not decoded
            return fail("AndroidManifest.xml is not decoded text XML: " + manifest_path.string());
        }

        nlohmann::json summary = {
            {"success", true},
            {"manifest", manifest_path.string()},
            {"package", manifest_attribute(xml, "package")},
            {"versionCode", manifest_attribute(xml, "android:versionCode")},
            {"versionName", manifest_attribute(xml, "android:versionName")},
            {"permissions", collect_names(xml, "uses-permission")},
            {"activities", collect_names(xml, "activity")},
            {"services", collect_names(xml, "service")},
            {"receivers", collect_names(xml, "receiver")},
            {"providers", collect_names(xml, "provider")},
        };
        LOG4CPLUS_INFO(tool_logger(), "analyze_manifest: " << summary["package"].dump() << " with "
                       << summary["permissions"].size() << " permission(s)");
        return ok(std::move(summary));
    }
};

struct FindClassesArgs {
    std::string decompiled_dir;
    std::string pattern;
    size_t limit = 0;

    static FindClassesArgs from(const ToolArguments& args, const ToolContext& context) {
        FindClassesArgs parsed;
        parsed.decompiled_dir = args.get_string("decompiled_dir");
        parsed.pattern = args.get_string("pattern");
        if (parsed.pattern.empty()) {
            throw ValidationError("pattern", "Parameter 'pattern' cannot be empty");
        }
        auto limit = args.find_int("limit");
        if (limit && *limit <= 0) {
            throw ValidationError("limit", "Parameter 'limit' must be positive");
        }
        parsed.limit = limit ? static_cast<size_t>(*limit) : context.config.max_items;
        return parsed;
    }
};

struct ClassSearch {
    const fs::path& root;
    std::string needle;
    size_t limit;
    const CancellationToken& cancel;
    std::vector<nlohmann::json> matches;
    size_t total = 0;
};

// jadx writes under sources/, apktool under smali/, smali_classes2/, ...
fs::path package_path(const fs::path& relative) {
    fs::path package = relative.parent_path();
    auto first = package.begin();
    if (first == package.end()) {
        return package;
    }
    const std::string top = first->string();
    if (top != "sources" && top.rfind("smali", 0) != 0) {
        return package;
    }
    fs::path stripped;
    for (auto it = std::next(first); it != package.end(); ++it) {
        stripped /= *it;
    }
    return stripped;
}

// Depth-first, entries in name order so results are stable across runs.
bool search_classes(const fs::path& dir, ClassSearch& search) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        LOG4CPLUS_WARN(tool_logger(), "find_classes: cannot read " << dir.string() << ": " << ec.message());
        return true;
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    for (const auto& entry : entries) {
        if (search.cancel.is_cancelled()) {
            return false;
        }
        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_directory(ec)) {
            if (!search_classes(entry.path(), search)) {
                return false;
            }
            continue;
        }

        const std::string ext = entry.path().extension().string();
        if (ext != ".java" && ext != ".smali") {
            continue;
        }
        fs::path relative = entry.path().lexically_relative(search.root);
        std::string class_name = package_path(relative).generic_string();
        std::replace(class_name.begin(), class_name.end(), '/', '.');
        if (!class_name.empty()) {
            class_name += '.';
        }
        class_name += entry.path().stem().string();

        if (to_lower(class_name).find(search.needle) == std::string::npos) {
            continue;
        }
        ++search.total;
        if (search.matches.size() < search.limit) {
            search.matches.push_back({
                {"class", class_name},
                {"path", relative.generic_string()},
                {"kind", ext.substr(1)},
            });
        }
    }
    return true;
}

class FindClassesTool final : public TypedToolHandler<FindClassesArgs> {
public:
    FindClassesTool()
        : TypedToolHandler(ToolDescriptor{
              "find_classes",
              "Find decompiled classes (.java or .smali) whose qualified name contains a pattern",
              {
                  required_string("decompiled_dir", "Directory produced by jadx_decompile or decompile_apk"),
                  required_string("pattern", "Case-insensitive substring of the qualified class name"),
                  optional_integer("limit", "Maximum number of classes returned"),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const FindClassesArgs& args, ToolCall& call) override {
        if (!is_directory(args.decompiled_dir)) {
            return not_found("Directory not found: " + args.decompiled_dir);
        }

        fs::path root(args.decompiled_dir);
        ClassSearch search{root, to_lower(args.pattern), args.limit, call.cancel, {}, 0};
        if (!search_classes(root, search)) {
            return cancelled("find_classes was cancelled");
        }

        Payload items;
        items.push_back({
            {"decompiled_dir", args.decompiled_dir},
            {"pattern", args.pattern},
            {"totalMatches", search.total},
            {"returned", search.matches.size()},
            {"truncated", search.total > search.matches.size()},
        });
        for (auto& match : search.matches) {
            items.push_back(std::move(match));
        }
        return ok_items(std::move(items));
    }
};

} // namespace

void register_apk_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<DecompileApkTool>());
    registry.add(std::make_unique<JadxDecompileTool>());
    registry.add(std::make_unique<AnalyzeManifestTool>());
    registry.add(std::make_unique<FindClassesTool>());
}

} // namespace toolbridge::tools
