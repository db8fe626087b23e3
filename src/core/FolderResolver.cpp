#include "FolderResolver.h"
#include <sstream>

namespace DocsUpload {

    FolderResolver::FolderResolver(RemoteDocumentStore& store, LoggerCallback logger)
        : m_store(store), m_logger(std::move(logger)) {}

    std::vector<std::string> FolderResolver::splitPath(const std::string& path) {
        std::vector<std::string> segments;
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '/')) {
            if (!segment.empty()) segments.push_back(segment);
        }
        return segments;
    }

    std::vector<RemoteFolder> FolderResolver::subFolders(const FolderHandle& parent) {
        auto listing = m_store.listFoldersAt(parent);
        if (!listing.ok()) {
            log(" - Could not list remote folders: " + listing.error.message);
            return {};
        }
        return *listing.value;
    }

    RemoteResult<RemoteFolder> FolderResolver::findOrCreate(const std::string& name,
                                                           const FolderHandle& parent,
                                                           const std::vector<RemoteFolder>& siblings) {
        for (const auto& folder : siblings) {
            if (folder.title == name && folder.kind == DocumentKind::Folder) {
                return RemoteResult<RemoteFolder>::success(folder);
            }
        }

        auto created = m_store.createFolder(name, parent);
        if (!created.ok()) {
            return RemoteResult<RemoteFolder>::failure(RemoteErrorKind::CreationFailure, created.error.message);
        }
        return created;
    }

    FolderHandle FolderResolver::resolveFolderPath(const std::string& path) {
        FolderHandle current;
        for (const auto& segment : splitPath(path)) {
            auto resolved = findOrCreate(segment, current, subFolders(current));
            if (!resolved.ok()) {
                log(" - Failed to create the remote folder '" + segment + "': " + resolved.error.message);
                std::string target = current ? "'" + current->title + "'" : "the root folder";
                log(" - Files will be uploaded to " + target);
                return current;
            }
            current = *resolved.value;
        }
        return current;
    }

} // namespace DocsUpload
