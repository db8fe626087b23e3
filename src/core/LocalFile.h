#pragma once

#include "Common.h"
#include <cstdint>

namespace DocsUpload {

    /**
     * @brief Snapshot of a local file taken when the walker reaches it.
     */
    struct LocalFile {
        fs::path path;          // absolute
        std::string baseName;   // name without the last extension
        std::string extension;  // lowercase, without the dot
        std::uintmax_t size = 0;

        /**
         * @brief Reads name and size of @p filePath from the filesystem.
         * @throws DocsUploadException if the file cannot be stat'ed.
         */
        static LocalFile snapshot(const fs::path& filePath);
    };

    /**
     * @brief Filesystem helpers for walking the local tree.
     */
    class LocalTree {
    public:
        /**
         * @brief Non-directory entries of @p directory, sorted by name.
         */
        static std::vector<fs::path> listFiles(const fs::path& directory);

        /**
         * @brief Sub-directories of @p directory, sorted by name. Symbolic
         * links to directories are left out.
         */
        static std::vector<fs::path> listFolders(const fs::path& directory);

        /**
         * @brief Counts the files the walker will visit.
         * @param recursive Whether files in sub-directories are included.
         */
        static int countFiles(const fs::path& directory, bool recursive);

        /**
         * @brief Removes write permission from @p directory.
         * @return false if the permissions could not be changed.
         */
        static bool markReadOnly(const fs::path& directory);

        static std::string folderName(const fs::path& directory);
    };

} // namespace DocsUpload
