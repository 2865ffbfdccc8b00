#include "StagingFileSystem.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <arrow/buffer.h>
#include <arrow/filesystem/api.h>
#include <arrow/io/interfaces.h>

#include "../common/ArrowStatus.hpp"

namespace BulkBridge
{

    bool wildcard_match(std::string_view pattern, std::string_view name)
    {
        // Greedy match with single-star backtracking
        size_t p = 0, n = 0;
        size_t star = std::string_view::npos, resume = 0;
        while (n < name.size())
        {
            if (p < pattern.size() && pattern[p] == '*')
            {
                star = p++;
                resume = n;
            }
            else if (p < pattern.size() && pattern[p] == name[n])
            {
                ++p;
                ++n;
            }
            else if (star != std::string_view::npos)
            {
                p = star + 1;
                n = ++resume;
            }
            else
            {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*')
            ++p;
        return p == pattern.size();
    }

    std::string StagingFileSystem::join(std::string_view base, std::string_view name)
    {
        std::string out(base);
        if (!out.empty() && out.back() != '/')
            out.push_back('/');
        const size_t start = name.find_first_not_of('/');
        if (start != std::string_view::npos)
            out.append(name.substr(start));
        return out;
    }

    std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>
    StagingFileSystem::resolve(const std::string &location) const
    {
        std::string uri_or_path = location;
        if (location.find("://") == std::string::npos)
        {
            // Plain path: Arrow only accepts absolute local paths
            uri_or_path = std::filesystem::absolute(location).lexically_normal().string();
        }

        std::string path;
        BULKBRIDGE_ASSIGN_OR_THROW(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &path));
        return {std::move(fs), std::move(path)};
    }

    std::shared_ptr<arrow::io::OutputStream> StagingFileSystem::create(const std::string &location) const
    {
        auto [fs, path] = resolve(location);

        const auto slash = path.rfind('/');
        if (slash != std::string::npos && slash > 0)
            BULKBRIDGE_THROW_IF_NOT_OK(fs->CreateDir(path.substr(0, slash), /*recursive=*/true));

        BULKBRIDGE_ASSIGN_OR_THROW(auto stream, fs->OpenOutputStream(path));
        return stream;
    }

    std::shared_ptr<arrow::io::RandomAccessFile> StagingFileSystem::open(const std::string &location) const
    {
        auto [fs, path] = resolve(location);
        BULKBRIDGE_ASSIGN_OR_THROW(auto file, fs->OpenInputFile(path));
        return file;
    }

    std::string StagingFileSystem::read_all(const std::string &location) const
    {
        auto file = open(location);
        BULKBRIDGE_ASSIGN_OR_THROW(int64_t n, file->GetSize());
        BULKBRIDGE_ASSIGN_OR_THROW(auto buffer, file->ReadAt(0, n));
        BULKBRIDGE_THROW_IF_NOT_OK(file->Close());
        return buffer->ToString();
    }

    bool StagingFileSystem::exists(const std::string &location) const
    {
        auto [fs, path] = resolve(location);
        BULKBRIDGE_ASSIGN_OR_THROW(auto info, fs->GetFileInfo(path));
        return info.type() != arrow::fs::FileType::NotFound;
    }

    int64_t StagingFileSystem::size(const std::string &location) const
    {
        auto [fs, path] = resolve(location);
        BULKBRIDGE_ASSIGN_OR_THROW(auto info, fs->GetFileInfo(path));
        if (!info.IsFile())
            throw StagingError("[STAGING ERROR] Not a file: " + location);
        return info.size();
    }

    std::vector<std::string> StagingFileSystem::match(const std::string &pattern) const
    {
        const auto slash = pattern.rfind('/');
        const std::string dir = slash == std::string::npos ? "." : pattern.substr(0, slash);
        const std::string glob = slash == std::string::npos ? pattern : pattern.substr(slash + 1);

        auto [fs, dir_path] = resolve(dir);

        arrow::fs::FileSelector selector;
        selector.base_dir = dir_path;
        selector.allow_not_found = true;
        selector.recursive = false;

        BULKBRIDGE_ASSIGN_OR_THROW(auto infos, fs->GetFileInfo(selector));

        std::vector<std::string> matched;
        for (const auto &info : infos)
        {
            if (info.IsFile() && wildcard_match(glob, info.base_name()))
                matched.push_back(join(dir, info.base_name()));
        }
        std::sort(matched.begin(), matched.end());
        return matched;
    }

    bool StagingFileSystem::remove(const std::string &location) const
    {
        auto [fs, path] = resolve(location);
        BULKBRIDGE_ASSIGN_OR_THROW(auto info, fs->GetFileInfo(path));
        if (info.type() == arrow::fs::FileType::NotFound)
            return false;
        BULKBRIDGE_THROW_IF_NOT_OK(fs->DeleteFile(path));
        return true;
    }

    size_t StagingFileSystem::remove_quietly(const std::vector<std::string> &locations) const
    {
        size_t removed = 0;
        for (const auto &location : locations)
        {
            try
            {
                if (remove(location))
                    ++removed;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CLEANUP WARN] Failed to remove " << location << ": " << e.what() << "\n";
            }
        }
        return removed;
    }

} // namespace BulkBridge
