#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../logger.hpp"

#include <mutex>
#include <string>

#include <log4cplus/loggingmacros.h>

namespace toolbridge::tools {

namespace {

using project::ProjectFile;
using project::ProjectFolder;

nlohmann::json folder_entry(const ProjectFolder& folder, const std::string& path) {
    return {
        {"name", folder.name()},
        {"path", path},
        {"type", "folder"},
        {"childCount", folder.child_count()},
    };
}

nlohmann::json file_entry(const ProjectFile& file, const std::string& path) {
    return {
        {"name", file.name()},
        {"path", path},
        {"type", "file"},
        {"contentType", file.content_type()},
        {"sizeBytes", file.size_bytes()},
        {"lastModified", file.last_modified()},
        {"readOnly", file.is_read_only()},
        {"versioned", file.is_versioned()},
        {"checkedOut", file.is_checked_out()},
        {"version", file.version()},
    };
}

nlohmann::json program_info(const ProjectFile& file) {
    return {
        {"name", file.name()},
        {"path", file.pathname()},
        {"contentType", file.content_type()},
        {"sizeBytes", file.size_bytes()},
        {"modificationDate", file.last_modified()},
        {"isReadOnly", file.is_read_only()},
        {"isVersioned", file.is_versioned()},
        {"isCheckedOut", file.is_checked_out()},
        {"version", file.version()},
    };
}

struct Listing {
    size_t limit;
    Payload items;
    size_t total = 0;

    void add(nlohmann::json item) {
        ++total;
        if (items.size() < limit) {
            items.push_back(std::move(item));
        }
    }
};

void list_children(const ProjectFolder& folder, const std::string& prefix, bool recursive, Listing& listing) {
    for (auto* sub : folder.folders()) {
        std::string path = prefix + sub->name();
        listing.add(folder_entry(*sub, path));
        if (recursive) {
            list_children(*sub, path + "/", true, listing);
        }
    }
    for (auto* file : folder.files()) {
        listing.add(file_entry(*file, prefix + file->name()));
    }
}

struct ListProjectFilesArgs {
    std::string folder_path;
    bool recursive = false;

    static ListProjectFilesArgs from(const ToolArguments& args, const ToolContext&) {
        return ListProjectFilesArgs{args.get_string("folderPath"), args.get_bool("recursive")};
    }
};

class ListProjectFilesTool final : public TypedToolHandler<ListProjectFilesArgs> {
public:
    ListProjectFilesTool()
        : TypedToolHandler(ToolDescriptor{
              "list-project-files",
              "List files and folders in the project",
              {
                  required_string("folderPath", "Path to the folder to list contents of. Use '/' for the root folder."),
                  optional_bool("recursive", "Whether to list files recursively", false),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const ListProjectFilesArgs& args, ToolCall& call) override {
        auto& session = call.context.project;
        std::lock_guard<std::mutex> lock(session.mutex());

        ProjectFolder* folder = session.store().find_folder(args.folder_path);
        if (!folder) {
            return not_found("Folder not found: " + args.folder_path);
        }

        Listing listing{call.context.config.max_items, {}, 0};
        list_children(*folder, "", args.recursive, listing);

        Payload items;
        items.push_back({
            {"folderPath", args.folder_path},
            {"folderName", folder->name()},
            {"isRecursive", args.recursive},
            {"itemCount", listing.items.size()},
            {"totalCount", listing.total},
            {"truncated", listing.total > listing.items.size()},
        });
        for (auto& item : listing.items) {
            items.push_back(std::move(item));
        }
        return ok_items(std::move(items));
    }
};

struct ProgramPathArgs {
    std::string program_path;

    static ProgramPathArgs from(const ToolArguments& args, const ToolContext&) {
        return ProgramPathArgs{args.get_string("programPath")};
    }
};

class OpenProgramTool final : public TypedToolHandler<ProgramPathArgs> {
public:
    OpenProgramTool()
        : TypedToolHandler(ToolDescriptor{
              "open-program",
              "Open a program of the project and make it the current program",
              {
                  required_string("programPath", "Path in the project to the program to open"),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const ProgramPathArgs& args, ToolCall& call) override {
        auto& session = call.context.project;
        std::lock_guard<std::mutex> lock(session.mutex());

        ProjectFile* file = session.store().find_file(args.program_path);
        if (!file) {
            return not_found("Program not found: " + args.program_path);
        }
        session.open_program(*file);
        LOG4CPLUS_INFO(tool_logger(), "open-program: " << file->pathname());
        return ok(program_info(*file));
    }
};

class GetCurrentProgramTool final : public ToolHandler {
public:
    const ToolDescriptor& descriptor() const override {
        static const ToolDescriptor descriptor{
            "get-current-program", "Get the currently active program", {}, std::nullopt};
        return descriptor;
    }

    ToolOutcome handle(ToolCall& call) override {
        auto& session = call.context.project;
        std::lock_guard<std::mutex> lock(session.mutex());

        ProjectFile* current = session.current_program();
        if (!current) {
            return not_found("No programs are currently open");
        }
        return ok(program_info(*current));
    }
};

class ListOpenProgramsTool final : public ToolHandler {
public:
    const ToolDescriptor& descriptor() const override {
        static const ToolDescriptor descriptor{
            "list-open-programs", "List all programs currently open", {}, std::nullopt};
        return descriptor;
    }

    ToolOutcome handle(ToolCall& call) override {
        auto& session = call.context.project;
        std::lock_guard<std::mutex> lock(session.mutex());

        const auto& programs = session.open_programs();
        if (programs.empty()) {
            return not_found("No programs are currently open");
        }

        Payload items;
        items.push_back({{"count", programs.size()}});
        for (auto* program : programs) {
            items.push_back(program_info(*program));
        }
        return ok_items(std::move(items));
    }
};

struct CheckinProgramArgs {
    std::string program_path;
    std::string message;
    bool keep_checked_out = true;

    static CheckinProgramArgs from(const ToolArguments& args, const ToolContext&) {
        CheckinProgramArgs parsed;
        parsed.program_path = args.get_string("programPath");
        parsed.message = args.get_string("message");
        parsed.keep_checked_out = args.get_bool("keepCheckedOut");
        if (parsed.message.empty()) {
            throw ValidationError("message", "Parameter 'message' cannot be empty");
        }
        return parsed;
    }
};

class CheckinProgramTool final : public TypedToolHandler<CheckinProgramArgs> {
public:
    CheckinProgramTool()
        : TypedToolHandler(ToolDescriptor{
              "checkin-program",
              "Check in (commit) a program to version control with a message",
              {
                  required_string("programPath", "Path in the project to the program to check in"),
                  required_string("message", "Commit message describing the changes being checked in"),
                  optional_bool("keepCheckedOut", "Whether to keep the program checked out after commit", true),
              },
              std::nullopt}) {}

protected:
    ToolOutcome run(const CheckinProgramArgs& args, ToolCall& call) override {
        auto& session = call.context.project;
        std::lock_guard<std::mutex> lock(session.mutex());

        ProjectFile* file = session.store().find_file(args.program_path);
        if (!file) {
            return not_found("Program not found: " + args.program_path);
        }

        std::string action;
        try {
            if (file->can_add_to_repository()) {
                file->add_to_version_control(args.message, args.keep_checked_out);
                action = "added_to_version_control";
            } else if (file->can_checkin()) {
                file->checkin(args.message, args.keep_checked_out);
                action = "checked_in";
            } else if (!file->is_versioned()) {
                return fail("Program is not under version control: " + args.program_path);
            } else if (!file->is_checked_out()) {
                return fail("Program is not checked out and cannot be modified: " + args.program_path);
            } else if (!file->modified_since_checkout()) {
                return fail("Program has no changes since checkout: " + args.program_path);
            } else {
                return fail("Program cannot be checked in: " + args.program_path);
            }
        } catch (const project::VersionControlError& e) {
            return execution_failed(std::string("Version control error: ") + e.what());
        }

        LOG4CPLUS_INFO(tool_logger(), "checkin-program: " << action << " " << file->pathname()
                       << " (version " << file->version() << ")");
        return ok({
            {"success", true},
            {"action", action},
            {"programPath", args.program_path},
            {"message", args.message},
            {"keepCheckedOut", args.keep_checked_out},
            {"isVersioned", file->is_versioned()},
            {"isCheckedOut", file->is_checked_out()},
            {"version", file->version()},
        });
    }
};

} // namespace

void register_project_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<GetCurrentProgramTool>());
    registry.add(std::make_unique<ListProjectFilesTool>());
    registry.add(std::make_unique<ListOpenProgramsTool>());
    registry.add(std::make_unique<OpenProgramTool>());
    registry.add(std::make_unique<CheckinProgramTool>());
}

} // namespace toolbridge::tools
