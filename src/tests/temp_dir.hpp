#pragma once

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unistd.h>

/** Temporary directory removed with its contents at the end of the scope. */
class TempDir
{
public:
    TempDir()
    {
        std::string templ = (std::filesystem::temp_directory_path() / "xfreeze-test-XXXXXX").string();
        if (!mkdtemp(templ.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path = templ;
    }
    ~TempDir() { std::filesystem::remove_all(path); }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] std::string file(const std::string &name) const { return (path / name).string(); }
    [[nodiscard]] bool exists(const std::string &name) const
    {
        return std::filesystem::exists(path / name);
    }

private:
    std::filesystem::path path;
};
