#pragma once

#include "Common.h"
#include "ConflictResolver.h"
#include "FolderResolver.h"
#include "UploadRetrier.h"
#include "Definitions.h"

namespace DocsUpload {

    /**
     * @brief Options for one upload run, resolved by the command line layer.
     */
    struct UploadOptions {
        bool recursive = false;
        std::string remoteFolder;      // "A/B"; empty for the account root
        bool withoutFolders = false;   // do not mirror sub-directories remotely
        bool addAll = false;
        bool skipAll = false;
        bool replaceAll = false;
        bool disableRetries = false;
        bool markReadOnly = false;
        int uploadAttempts = Definitions::DEFAULT_UPLOAD_ATTEMPTS;
    };

    /**
     * @brief Mirrors a local directory tree into the remote store.
     *
     * Depth-first: the files of a folder are uploaded first, then (when
     * recursive) each sub-directory is mapped to a remote folder and walked.
     * Remote listings are fetched each time a folder is entered.
     */
    class Synchronizer {
    public:
        Synchronizer(RemoteDocumentStore& store, DecisionProvider& provider,
                     LoggerCallback logger = nullptr);

        /**
         * @brief Uploads @p rootPath (a directory or a single file).
         * @return Number of files uploaded.
         * @throws DocsUploadException if @p rootPath does not exist.
         */
        int upload(const fs::path& rootPath, const UploadOptions& options);

    private:
        struct WalkState {
            const UploadOptions& options;
            ConflictPolicy policy;
            int maxAttempts;
            int fileCount = 0;
            int totalFileCount = 0;
        };

        int uploadFolder(const fs::path& folder, const FolderHandle& remoteFolder, WalkState& state);

        UploadOutcome uploadFile(const fs::path& filePath, const FolderHandle& remoteFolder,
                                 const std::vector<RemoteDocument>& remoteDocs, WalkState& state);

        std::vector<RemoteDocument> documentsIn(const FolderHandle& remoteFolder);

        RemoteDocumentStore& m_store;
        FolderResolver m_resolver;
        ConflictResolver m_conflicts;
        UploadRetrier m_retrier;
        LoggerCallback m_logger;

        void log(const std::string& message) const { emitLine(m_logger, message); }
    };

} // namespace DocsUpload
