#include "Synchronizer.h"

namespace DocsUpload {

    Synchronizer::Synchronizer(RemoteDocumentStore& store, DecisionProvider& provider, LoggerCallback logger)
        : m_store(store),
          m_resolver(store, logger),
          m_conflicts(store, provider, logger),
          m_retrier(store, logger),
          m_logger(logger) {}

    int Synchronizer::upload(const fs::path& rootPath, const UploadOptions& options) {
        if (!fs::exists(rootPath)) {
            throw DocsUploadException("Specified path " + rootPath.string() + " doesn't exist");
        }

        WalkState state{options,
                        ConflictPolicy(options.addAll, options.skipAll, options.replaceAll),
                        options.disableRetries ? 1 : options.uploadAttempts};

        if (!fs::is_directory(rootPath)) {
            log("");
            log(fs::absolute(rootPath).string());
            FolderHandle target = m_resolver.resolveFolderPath(options.remoteFolder);
            UploadOutcome outcome = uploadFile(rootPath, target, documentsIn(target), state);
            log("");
            if (outcome == UploadOutcome::Uploaded) {
                log("The file has been uploaded");
                return 1;
            }
            log("The file has not been uploaded");
            return 0;
        }

        std::string message = "Uploading" + std::string(options.recursive ? " recursively" : "") +
                               " the folder " + rootPath.string();
        if (!options.remoteFolder.empty()) {
            message += " to " + options.remoteFolder;
        }
        log("");
        log(message);
        log("");

        try {
            state.totalFileCount = LocalTree::countFiles(rootPath, options.recursive);
        } catch (const fs::filesystem_error& e) {
            log(std::string(" - Could not count the files to upload: ") + e.what());
        }
        FolderHandle target = m_resolver.resolveFolderPath(options.remoteFolder);
        int uploaded = uploadFolder(rootPath, target, state);

        log("");
        log("Files uploaded: " + std::to_string(uploaded));
        return uploaded;
    }

    int Synchronizer::uploadFolder(const fs::path& folder, const FolderHandle& remoteFolder, WalkState& state) {
        if (state.options.markReadOnly) {
            LocalTree::markReadOnly(folder);
        }

        std::vector<fs::path> files;
        std::vector<fs::path> folders;
        try {
            files = LocalTree::listFiles(folder);
            folders = LocalTree::listFolders(folder);
        } catch (const fs::filesystem_error& e) {
            log(" - Skipped folder " + folder.string() + ": " + e.what());
            return 0;
        }

        std::vector<RemoteFolder> remoteSubFolders;
        if (state.options.recursive && !state.options.withoutFolders && !folders.empty()) {
            remoteSubFolders = m_resolver.subFolders(remoteFolder);
        }
        std::vector<RemoteDocument> remoteDocs = documentsIn(remoteFolder);

        int uploaded = 0;
        for (const auto& file : files) {
            state.fileCount++;
            log("[" + std::to_string(state.fileCount) + "/" + std::to_string(state.totalFileCount) + "] " +
                fs::absolute(file).string());
            if (uploadFile(file, remoteFolder, remoteDocs, state) == UploadOutcome::Uploaded) {
                uploaded++;
            }
        }

        if (!state.options.recursive) return uploaded;

        for (const auto& subFolder : folders) {
            FolderHandle target = remoteFolder;
            if (!state.options.withoutFolders) {
                auto resolved = m_resolver.findOrCreate(LocalTree::folderName(subFolder), remoteFolder, remoteSubFolders);
                if (resolved.ok()) {
                    target = *resolved.value;
                } else {
                    log(" - Skipped: failed to create the folder, files will be uploaded to the upper-level folder");
                    log(" - " + resolved.error.message);
                }
            }
            uploaded += uploadFolder(subFolder, target, state);
        }

        return uploaded;
    }

    UploadOutcome Synchronizer::uploadFile(const fs::path& filePath, const FolderHandle& remoteFolder,
                                           const std::vector<RemoteDocument>& remoteDocs, WalkState& state) {
        LocalFile file;
        try {
            file = LocalFile::snapshot(filePath);
        } catch (const DocsUploadException& e) {
            log(std::string(" - Skipped: ") + e.what());
            return UploadOutcome::SkippedPermanentError;
        }

        if (auto rejected = UploadRetrier::checkEligibility(file)) {
            log(" - Skipped: " + describeOutcome(*rejected));
            return *rejected;
        }

        if (m_conflicts.resolve(file, remoteDocs, state.policy) == ConflictDecision::Skip) {
            log(" - Skipped");
            return UploadOutcome::SkippedByPolicy;
        }

        return m_retrier.attemptUpload(file, remoteFolder, state.maxAttempts);
    }

    std::vector<RemoteDocument> Synchronizer::documentsIn(const FolderHandle& remoteFolder) {
        auto listing = m_store.listDocumentsAt(remoteFolder);
        if (!listing.ok()) {
            log(" - Could not list remote documents: " + listing.error.message);
            return {};
        }
        return *listing.value;
    }

} // namespace DocsUpload
