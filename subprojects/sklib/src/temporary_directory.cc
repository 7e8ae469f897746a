#include <filesystem>
#include <sklib/debug.hh>
#include <sklib/temporary_directory.hh>
#include <stdlib.h>
#include <system_error>

TemporaryDirectory::TemporaryDirectory(const std::string& templ) {
    throw_assert(templ.size() >= 6 and templ.ends_with("XXXXXX"));

    std::string name = templ;
    // Create directory with permissions (mode: 0700/rwx------)
    if (mkdtemp(name.data()) == nullptr) {
        THROW("Cannot create temporary directory", errmsg());
    }

    path_ = std::filesystem::absolute(name).lexically_normal().string();
    if (path_.back() != '/') {
        path_ += '/';
    }
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (exists()) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            THROW("remove_all('", path_, "') failed: ", ec.message());
        }
    }

    path_ = std::exchange(td.path_, std::string{});
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists()) {
        std::error_code ec;
        // Cannot throw from the destructor
        std::filesystem::remove_all(path_, ec);
    }
}
