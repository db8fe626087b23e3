#include "FormatPolicy.h"
#include "Definitions.h"

namespace DocsUpload {

    bool FormatPolicy::isSupportedFormat(const LocalFile& file) {
        const auto& formats = Definitions::SUPPORTED_FORMATS;
        return std::find(formats.begin(), formats.end(), to_lower(file.extension)) != formats.end();
    }

    DocumentKind FormatPolicy::classify(const LocalFile& file) {
        auto it = Definitions::FORMAT_CATEGORIES.find(to_lower(file.extension));
        if (it == Definitions::FORMAT_CATEGORIES.end()) return DocumentKind::Other;
        return kindFromCategory(it->second);
    }

    bool FormatPolicy::isWithinSizeLimit(const LocalFile& file) {
        auto category = Definitions::FORMAT_CATEGORIES.find(to_lower(file.extension));
        if (category == Definitions::FORMAT_CATEGORIES.end()) return true;

        auto limit = Definitions::SIZE_LIMITS.find(category->second);
        if (limit == Definitions::SIZE_LIMITS.end()) return true;
        return file.size <= limit->second;
    }

    DocumentKind FormatPolicy::kindFromCategory(const std::string& category) {
        if (category == "document") return DocumentKind::Document;
        if (category == "spreadsheet") return DocumentKind::Spreadsheet;
        if (category == "presentation") return DocumentKind::Presentation;
        if (category == "pdf") return DocumentKind::Pdf;
        if (category == "folder") return DocumentKind::Folder;
        return DocumentKind::Other;
    }

} // namespace DocsUpload
