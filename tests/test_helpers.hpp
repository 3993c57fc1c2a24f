/// \file
/// Scratch directories and fake grader images for tests that touch the filesystem
#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/common/linux.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace batchgrader::test {

namespace fs = std::filesystem;

/// A fresh directory under the system temp dir, removed with everything in it on destruction
class TempDir : NonMovable
{
public:
    TempDir() {
        auto res = linux::mkdtemp((fs::temp_directory_path() / "batchgrader-test-XXXXXX").string());

        if (!res) {
            throw std::runtime_error("Could not create a temporary directory: " + res.error().message());
        }

        path_ = *res;
    }

    ~TempDir() {
        std::error_code err;
        fs::remove_all(path_, err);
    }

    const fs::path& path() const noexcept { return path_; }

    fs::path operator/(const fs::path& rhs) const { return path_ / rhs; }

private:
    fs::path path_;
};

inline fs::path write_file(const fs::path& path, std::string_view contents) {
    fs::create_directories(path.parent_path());

    std::ofstream out{path, std::ios::trunc};
    out << contents;

    if (!out) {
        throw std::runtime_error("Could not write " + path.string());
    }

    return path;
}

/// Writes an executable ``/bin/sh`` script. Invoked by a ProcessSandbox as
/// ``script <bundle dir> <submission> [--points]``, with the sandbox as its working directory.
inline fs::path write_script(const fs::path& path, std::string_view body) {
    write_file(path, "#!/bin/sh\n" + std::string{body} + "\n");
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);

    return path;
}

} // namespace batchgrader::test
