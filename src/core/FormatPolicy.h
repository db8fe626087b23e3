#pragma once

#include "Common.h"
#include "LocalFile.h"
#include "RemoteDocumentStore.h"

namespace DocsUpload {

    /**
     * @brief Decides which local files are eligible for upload.
     *
     * Pure functions over the metadata captured in LocalFile; the extension
     * comparison is case-insensitive because LocalFile stores it lowercased.
     */
    class FormatPolicy {
    public:
        static bool isSupportedFormat(const LocalFile& file);

        /**
         * @brief Maps the file's extension to a document category.
         * @return DocumentKind::Other for unmapped extensions.
         */
        static DocumentKind classify(const LocalFile& file);

        /**
         * @brief True when no ceiling exists for the file's category or the
         * file does not exceed it.
         */
        static bool isWithinSizeLimit(const LocalFile& file);

        static DocumentKind kindFromCategory(const std::string& category);
    };

} // namespace DocsUpload
