#include "project_store.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <sstream>

#include <log4cplus/loggingmacros.h>

namespace toolbridge::project {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
    }
    return parts;
}

int64_t to_epoch_ms(std::filesystem::file_time_type time) {
    auto system_time = std::chrono::time_point_cast<std::chrono::milliseconds>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return system_time.time_since_epoch().count();
}

void mirror_directory(const std::filesystem::path& dir, ProjectFolder& folder) {
    std::vector<std::filesystem::directory_entry> entries;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    for (const auto& entry : entries) {
        std::error_code ec;
        const std::string name = entry.path().filename().string();
        if (entry.is_symlink(ec)) {
            continue;
        }
        if (entry.is_directory(ec)) {
            mirror_directory(entry.path(), folder.add_folder(name));
        } else if (entry.is_regular_file(ec)) {
            ProjectFile& file = folder.add_file(name, content_type_for(entry.path()));
            file.set_size_bytes(entry.file_size(ec));
            auto mtime = entry.last_write_time(ec);
            if (!ec) {
                file.set_last_modified(to_epoch_ms(mtime));
            }
            auto perms = entry.status(ec).permissions();
            file.set_read_only(!ec && (perms & std::filesystem::perms::owner_write) == std::filesystem::perms::none);
        }
    }
}

} // namespace

ProjectFile::ProjectFile(std::string name, std::string content_type, ProjectFolder* parent)
    : name_(std::move(name)), content_type_(std::move(content_type)), parent_(parent) {}

std::string ProjectFile::pathname() const {
    std::string parent_path = parent_ ? parent_->pathname() : "/";
    if (parent_path.back() != '/') {
        parent_path += '/';
    }
    return parent_path + name_;
}

bool ProjectFile::can_add_to_repository() const {
    return !versioned_ && !read_only_;
}

bool ProjectFile::can_checkin() const {
    return versioned_ && checked_out_ && modified_ && !read_only_;
}

void ProjectFile::add_to_version_control(const std::string& comment, bool keep_checked_out) {
    if (!can_add_to_repository()) {
        throw VersionControlError("cannot add to version control: " + pathname());
    }
    versioned_ = true;
    version_ = 1;
    checked_out_ = keep_checked_out;
    modified_ = false;
    history_.push_back(comment);
}

void ProjectFile::checkin(const std::string& comment, bool keep_checked_out) {
    if (!can_checkin()) {
        throw VersionControlError("cannot check in: " + pathname());
    }
    ++version_;
    checked_out_ = keep_checked_out;
    modified_ = false;
    history_.push_back(comment);
}

void ProjectFile::mark_modified() {
    modified_ = true;
    last_modified_ms_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
}

ProjectFolder::ProjectFolder(std::string name, ProjectFolder* parent)
    : name_(std::move(name)), parent_(parent) {}

std::string ProjectFolder::pathname() const {
    if (!parent_) {
        return "/";
    }
    std::string parent_path = parent_->pathname();
    if (parent_path.back() != '/') {
        parent_path += '/';
    }
    return parent_path + name_;
}

ProjectFolder& ProjectFolder::add_folder(const std::string& name) {
    if (auto* existing = folder(name)) {
        return *existing;
    }
    folders_.push_back(std::make_unique<ProjectFolder>(name, this));
    return *folders_.back();
}

ProjectFile& ProjectFolder::add_file(const std::string& name, const std::string& content_type) {
    if (file(name)) {
        throw std::invalid_argument("file already exists: " + name);
    }
    files_.push_back(std::make_unique<ProjectFile>(name, content_type, this));
    return *files_.back();
}

std::vector<ProjectFolder*> ProjectFolder::folders() const {
    std::vector<ProjectFolder*> result;
    for (const auto& f : folders_) {
        result.push_back(f.get());
    }
    std::sort(result.begin(), result.end(), [](auto* a, auto* b) { return a->name() < b->name(); });
    return result;
}

std::vector<ProjectFile*> ProjectFolder::files() const {
    std::vector<ProjectFile*> result;
    for (const auto& f : files_) {
        result.push_back(f.get());
    }
    std::sort(result.begin(), result.end(), [](auto* a, auto* b) { return a->name() < b->name(); });
    return result;
}

ProjectFolder* ProjectFolder::folder(const std::string& name) const {
    for (const auto& f : folders_) {
        if (f->name() == name) {
            return f.get();
        }
    }
    return nullptr;
}

ProjectFile* ProjectFolder::file(const std::string& name) const {
    for (const auto& f : files_) {
        if (f->name() == name) {
            return f.get();
        }
    }
    return nullptr;
}

ProjectStore::ProjectStore(std::string name) : name_(std::move(name)), root_(name_, nullptr) {}

ProjectFolder* ProjectStore::find_folder(const std::string& path) {
    ProjectFolder* current = &root_;
    for (const auto& part : split_path(path)) {
        current = current->folder(part);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

ProjectFile* ProjectStore::find_file(const std::string& path) {
    auto parts = split_path(path);
    if (parts.empty()) {
        return nullptr;
    }
    ProjectFolder* folder = &root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        folder = folder->folder(parts[i]);
        if (!folder) {
            return nullptr;
        }
    }
    return folder->file(parts.back());
}

ProjectSession::ProjectSession(std::unique_ptr<ProjectStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("project session requires a store");
    }
}

void ProjectSession::open_program(ProjectFile& file) {
    if (std::find(open_programs_.begin(), open_programs_.end(), &file) == open_programs_.end()) {
        open_programs_.push_back(&file);
    }
    current_ = &file;
}

std::string content_type_for(const std::filesystem::path& path) {
    static const std::set<std::string> program_extensions = {
        ".apk", ".dex", ".so", ".elf", ".bin", ".exe", ".dll", ".o",
    };
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return program_extensions.count(ext) ? "Program" : "File";
}

std::unique_ptr<ProjectStore> load_project_directory(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        throw std::filesystem::filesystem_error("project directory not found", root,
                                                std::make_error_code(std::errc::no_such_file_or_directory));
    }
    auto name = std::filesystem::absolute(root).lexically_normal().filename().string();
    if (name.empty()) {
        name = std::filesystem::absolute(root).lexically_normal().parent_path().filename().string();
    }
    auto store = std::make_unique<ProjectStore>(name.empty() ? "project" : name);
    mirror_directory(root, store->root());
    LOG4CPLUS_INFO(core_logger(), "Loaded project '" << store->name() << "' from " << root.string());
    return store;
}

} // namespace toolbridge::project
