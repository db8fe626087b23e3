#include "LocalFile.h"
#include <system_error>

namespace DocsUpload {

    LocalFile LocalFile::snapshot(const fs::path& filePath) {
        LocalFile file;
        file.path = fs::absolute(filePath);

        std::string name = file.path.filename().string();
        auto dot = name.rfind('.');
        if (dot == std::string::npos) {
            file.baseName = name;
        } else {
            file.baseName = name.substr(0, dot);
            file.extension = to_lower(name.substr(dot + 1));
        }

        std::error_code ec;
        file.size = fs::file_size(file.path, ec);
        if (ec) {
            throw DocsUploadException("Could not read size of " + file.path.string() + ": " + ec.message());
        }
        return file;
    }

    std::vector<fs::path> LocalTree::listFiles(const fs::path& directory) {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(directory)) {
            if (!entry.is_directory()) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<fs::path> LocalTree::listFolders(const fs::path& directory) {
        std::vector<fs::path> folders;
        for (const auto& entry : fs::directory_iterator(directory)) {
            // linked directories are not followed; they can point back up the tree
            if (entry.is_directory() && !entry.is_symlink()) {
                folders.push_back(entry.path());
            }
        }
        std::sort(folders.begin(), folders.end());
        return folders;
    }

    int LocalTree::countFiles(const fs::path& directory, bool recursive) {
        int count = static_cast<int>(listFiles(directory).size());
        if (recursive) {
            for (const auto& folder : listFolders(directory)) {
                count += countFiles(folder, recursive);
            }
        }
        return count;
    }

    bool LocalTree::markReadOnly(const fs::path& directory) {
        std::error_code ec;
        fs::permissions(directory,
                        fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                        fs::perm_options::remove, ec);
        if (ec) {
            std::cerr << "WARNING: could not mark '" << directory.string() << "' read-only: " << ec.message() << std::endl;
            return false;
        }
        return true;
    }

    std::string LocalTree::folderName(const fs::path& directory) {
        fs::path p = directory;
        if (!p.has_filename()) p = p.parent_path(); // trailing separator
        return p.filename().string();
    }

} // namespace DocsUpload
