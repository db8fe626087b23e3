#pragma once

#include "Common.h"
#include "LocalFile.h"
#include "RemoteDocumentStore.h"
#include <optional>

namespace DocsUpload {

    enum class UploadOutcome {
        Uploaded,
        SkippedUnsupportedFormat,
        SkippedOversize,
        SkippedByPolicy,
        SkippedAfterRetriesExhausted,
        SkippedPermanentError
    };

    std::string describeOutcome(UploadOutcome outcome);

    /**
     * @brief Transfers one file with a bounded number of immediate retries.
     */
    class UploadRetrier {
    public:
        UploadRetrier(RemoteDocumentStore& store, LoggerCallback logger = nullptr);

        /**
         * @brief Checks format and size without touching the network.
         * @return The skip outcome, or std::nullopt if the file is eligible.
         */
        static std::optional<UploadOutcome> checkEligibility(const LocalFile& file);

        /**
         * @brief Uploads @p file into @p targetFolder (root when empty).
         *
         * Permanent failures stop immediately; transient ones are retried
         * until @p maxAttempts calls have been made.
         */
        UploadOutcome attemptUpload(const LocalFile& file, const FolderHandle& targetFolder, int maxAttempts);

    private:
        RemoteDocumentStore& m_store;
        LoggerCallback m_logger;

        void log(const std::string& message) const { emitLine(m_logger, message); }
    };

} // namespace DocsUpload
