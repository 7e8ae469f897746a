#pragma once

#include <string>

class TemporaryDirectory {
private:
    std::string path_; // absolute path with trailing '/'

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to end with "XXXXXX" (6 characters 'X')
    explicit TemporaryDirectory(const std::string& templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& td) noexcept
    : path_(std::move(td.path_)) {
        td.path_.clear();
    }

    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    // NOLINTNEXTLINE(performance-noexcept-move-constructor)
    TemporaryDirectory& operator=(TemporaryDirectory&& td);

    ~TemporaryDirectory();

    // Returns true if object holds a real temporary directory
    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
