// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>

namespace quarry {

//! \brief Directory class acts as a wrapper around common functions and properties of a filesystem directory object
class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    // Not copyable nor movable
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    //! \brief Returns whether this Directory exists on filesystem
    bool exists() const;

    //! \brief Returns whether this Directory is empty
    bool is_empty() const;

    //! \brief Returns the std::filesystem::path of this Directory instance
    const std::filesystem::path& path() const;

    //! \brief Removes all contained files and subdirectories
    virtual void clear() const;

    //! \brief Creates the directory on filesystem should not exist
    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief TemporaryDirectory is a Directory which is automatically deleted on destructor of the instance.
//! The full path is the OS temporary path plus a unique random sub-path
class TemporaryDirectory final : public Directory {
  public:
    explicit TemporaryDirectory() : Directory(TemporaryDirectory::get_unique_temporary_path(), true) {}

    ~TemporaryDirectory() final {
        Directory::clear();
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    //! \brief Builds a temporary path from OS provided temporary storage location
    static std::filesystem::path get_unique_temporary_path();
    //! \brief Builds a temporary path from user provided temporary storage location
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);
};

//! \brief DataDirectory wraps the directory tree used by quarry as base storage path
//! <base_path>
//! ├───chaindata   <-- Where the index database is stored
//! └───logs        <-- Where log files are teed
class DataDirectory final : public Directory {
  public:
    explicit DataDirectory(const std::filesystem::path& base_path, bool create = false)
        : Directory(base_path, create),
          chaindata_(base_path / "chaindata", create),
          logs_(base_path / "logs", create) {}

    //! \brief Returns the default storage path: $XDG_DATA_HOME/quarry or $HOME/.local/share/quarry
    static std::filesystem::path get_default_storage_path();

    void deploy() {
        create();
        chaindata_.create();
        logs_.create();
    }

    const Directory& chaindata() const { return chaindata_; }
    const Directory& logs() const { return logs_; }

  private:
    Directory chaindata_;
    Directory logs_;
};

}  // namespace quarry
