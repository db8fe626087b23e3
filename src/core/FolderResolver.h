#pragma once

#include "Common.h"
#include "RemoteDocumentStore.h"

namespace DocsUpload {

    /**
     * @brief Maps slash-separated logical folder paths onto remote folder
     * handles, creating missing segments on the way.
     */
    class FolderResolver {
    public:
        FolderResolver(RemoteDocumentStore& store, LoggerCallback logger = nullptr);

        /**
         * @brief Resolves @p path ("A/B/C") against the account root.
         *
         * Empty segments are ignored. Each segment lists the current parent's
         * folders afresh and reuses a folder with the same title or creates one.
         * If a segment cannot be created the walk stops there.
         *
         * @return The handle of the last segment; the deepest resolved ancestor
         * if creation failed part way; std::nullopt (root) for an empty path.
         */
        FolderHandle resolveFolderPath(const std::string& path);

        /**
         * @brief Finds @p name among @p siblings (the listing of @p parent)
         * or creates it under @p parent.
         * @return The folder, or an error of kind CreationFailure.
         */
        RemoteResult<RemoteFolder> findOrCreate(const std::string& name,
                                                const FolderHandle& parent,
                                                const std::vector<RemoteFolder>& siblings);

        /**
         * @brief Lists the folders under @p parent; a failed listing is
         * logged and reported as empty.
         */
        std::vector<RemoteFolder> subFolders(const FolderHandle& parent);

        static std::vector<std::string> splitPath(const std::string& path);

    private:
        RemoteDocumentStore& m_store;
        LoggerCallback m_logger;

        void log(const std::string& message) const { emitLine(m_logger, message); }
    };

} // namespace DocsUpload
