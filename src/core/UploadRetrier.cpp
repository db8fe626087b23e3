#include "UploadRetrier.h"
#include "FormatPolicy.h"

namespace DocsUpload {

    std::string describeOutcome(UploadOutcome outcome) {
        switch (outcome) {
            case UploadOutcome::Uploaded: return "uploaded";
            case UploadOutcome::SkippedUnsupportedFormat: return "the file format is not supported";
            case UploadOutcome::SkippedOversize: return "the file size exceeds the limit";
            case UploadOutcome::SkippedByPolicy: return "a document with the same name already exists";
            case UploadOutcome::SkippedAfterRetriesExhausted: return "all upload attempts failed";
            case UploadOutcome::SkippedPermanentError: return "the document was rejected";
        }
        return "unknown";
    }

    UploadRetrier::UploadRetrier(RemoteDocumentStore& store, LoggerCallback logger)
        : m_store(store), m_logger(std::move(logger)) {}

    std::optional<UploadOutcome> UploadRetrier::checkEligibility(const LocalFile& file) {
        if (!FormatPolicy::isSupportedFormat(file)) return UploadOutcome::SkippedUnsupportedFormat;
        if (!FormatPolicy::isWithinSizeLimit(file)) return UploadOutcome::SkippedOversize;
        return std::nullopt;
    }

    UploadOutcome UploadRetrier::attemptUpload(const LocalFile& file, const FolderHandle& targetFolder, int maxAttempts) {
        if (auto rejected = checkEligibility(file)) {
            log(" - Skipped: " + describeOutcome(*rejected));
            return *rejected;
        }

        if (maxAttempts < 1) maxAttempts = 1;
        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            auto result = m_store.uploadFile(file.path.string(), file.baseName, targetFolder);
            if (result.ok()) {
                return UploadOutcome::Uploaded;
            }

            if (result.error.kind == RemoteErrorKind::Permanent) {
                log(" - Skipped: " + result.error.message);
                return UploadOutcome::SkippedPermanentError;
            }

            log(" - Upload error: " + result.error.message);
            if (attempt < maxAttempts) {
                log(" - Another try...");
            }
        }

        log(" - Skipped");
        return UploadOutcome::SkippedAfterRetriesExhausted;
    }

} // namespace DocsUpload
