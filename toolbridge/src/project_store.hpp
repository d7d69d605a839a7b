#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge::project {

class ProjectFolder;

class VersionControlError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * 项目中的文件
 * A file of the project store with its version control state.
 */
class ProjectFile {
public:
    ProjectFile(std::string name, std::string content_type, ProjectFolder* parent);

    const std::string& name() const { return name_; }
    const std::string& content_type() const { return content_type_; }
    std::string pathname() const;
    ProjectFolder* parent() const { return parent_; }

    bool is_program() const { return content_type_ == "Program"; }
    bool is_read_only() const { return read_only_; }
    bool is_versioned() const { return versioned_; }
    bool is_checked_out() const { return checked_out_; }
    bool modified_since_checkout() const { return modified_; }
    int version() const { return version_; }
    uint64_t size_bytes() const { return size_bytes_; }
    int64_t last_modified() const { return last_modified_ms_; }
    const std::vector<std::string>& history() const { return history_; }

    void set_read_only(bool read_only) { read_only_ = read_only; }
    void set_size_bytes(uint64_t size) { size_bytes_ = size; }
    void set_last_modified(int64_t epoch_ms) { last_modified_ms_ = epoch_ms; }

    bool can_add_to_repository() const;
    bool can_checkin() const;

    /// Puts a new file under version control as version 1.
    void add_to_version_control(const std::string& comment, bool keep_checked_out);
    /// Commits local changes as a new version.
    void checkin(const std::string& comment, bool keep_checked_out);
    void mark_modified();

private:
    std::string name_;
    std::string content_type_;
    ProjectFolder* parent_;

    bool read_only_ = false;
    bool versioned_ = false;
    bool checked_out_ = false;
    bool modified_ = false;
    int version_ = 0;
    uint64_t size_bytes_ = 0;
    int64_t last_modified_ms_ = 0;
    std::vector<std::string> history_;
};

class ProjectFolder {
public:
    ProjectFolder(std::string name, ProjectFolder* parent);

    const std::string& name() const { return name_; }
    std::string pathname() const;
    ProjectFolder* parent() const { return parent_; }

    ProjectFolder& add_folder(const std::string& name);
    ProjectFile& add_file(const std::string& name, const std::string& content_type);

    /// Children sorted by name.
    std::vector<ProjectFolder*> folders() const;
    std::vector<ProjectFile*> files() const;
    size_t child_count() const { return folders_.size() + files_.size(); }

    ProjectFolder* folder(const std::string& name) const;
    ProjectFile* file(const std::string& name) const;

private:
    std::string name_;
    ProjectFolder* parent_;
    std::vector<std::unique_ptr<ProjectFolder>> folders_;
    std::vector<std::unique_ptr<ProjectFile>> files_;
};

class ProjectStore {
public:
    explicit ProjectStore(std::string name);

    const std::string& name() const { return name_; }
    ProjectFolder& root() { return root_; }
    const ProjectFolder& root() const { return root_; }

    /// "/" or "" is the root; "/a/b" and "a/b" are equivalent.
    ProjectFolder* find_folder(const std::string& path);
    ProjectFile* find_file(const std::string& path);

private:
    std::string name_;
    ProjectFolder root_;
};

/**
 * 项目会话
 * The store plus the programs opened in it. Handlers lock mutex() while using it.
 */
class ProjectSession {
public:
    explicit ProjectSession(std::unique_ptr<ProjectStore> store);

    std::mutex& mutex() { return mutex_; }
    ProjectStore& store() { return *store_; }

    void open_program(ProjectFile& file);
    ProjectFile* current_program() const { return current_; }
    const std::vector<ProjectFile*>& open_programs() const { return open_programs_; }

private:
    std::mutex mutex_;
    std::unique_ptr<ProjectStore> store_;
    std::vector<ProjectFile*> open_programs_;
    ProjectFile* current_ = nullptr;
};

std::string content_type_for(const std::filesystem::path& path);

/// Mirrors a directory tree into a new store; throws std::filesystem::filesystem_error.
std::unique_ptr<ProjectStore> load_project_directory(const std::filesystem::path& root);

} // namespace toolbridge::project
