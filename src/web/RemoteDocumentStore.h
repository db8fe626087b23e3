#pragma once

#include <string>
#include <vector>
#include <optional>

namespace DocsUpload {

// Kind tag carried by remote entries and by classified local files.
enum class DocumentKind {
    Document,
    Spreadsheet,
    Presentation,
    Pdf,
    Folder,
    Other
};

struct RemoteFolder {
    std::string id;
    std::string title;
    DocumentKind kind = DocumentKind::Folder;
};

struct RemoteDocument {
    std::string id;
    std::string title;
    DocumentKind kind = DocumentKind::Other;
    std::string parentId; // empty for the root namespace
};

/**
 * @brief A remote folder target. std::nullopt designates the account root,
 * which is distinct from any real folder that lives at the root.
 */
using FolderHandle = std::optional<RemoteFolder>;

enum class RemoteErrorKind {
    None,
    Transient,
    Permanent,
    AuthFailure,
    CreationFailure
};

struct RemoteError {
    RemoteErrorKind kind = RemoteErrorKind::None;
    std::string message;

    bool failed() const { return kind != RemoteErrorKind::None; }

    static RemoteError make(RemoteErrorKind kind, const std::string& message) {
        return RemoteError{kind, message};
    }
};

/**
 * @brief Value-or-error returned by every remote call.
 */
template <typename T>
struct RemoteResult {
    std::optional<T> value;
    RemoteError error;

    bool ok() const { return value.has_value(); }

    static RemoteResult success(T v) {
        RemoteResult r;
        r.value = std::move(v);
        return r;
    }

    static RemoteResult failure(RemoteErrorKind kind, const std::string& message) {
        RemoteResult r;
        r.error = RemoteError::make(kind, message);
        return r;
    }
};

/**
 * @brief The operations the upload engine needs from a hosted document
 * store. Implementations block until the call completes.
 */
class RemoteDocumentStore {
public:
    virtual ~RemoteDocumentStore() = default;

    virtual RemoteError authenticate(const std::string& token) = 0;
    virtual RemoteError authenticate(const std::string& username, const std::string& password) = 0;

    /**
     * @brief Lists the folders directly under @p parent (root when empty).
     */
    virtual RemoteResult<std::vector<RemoteFolder>> listFoldersAt(const FolderHandle& parent) = 0;

    /**
     * @brief Lists the non-folder entries directly under @p parent.
     */
    virtual RemoteResult<std::vector<RemoteDocument>> listDocumentsAt(const FolderHandle& parent) = 0;

    virtual RemoteResult<RemoteFolder> createFolder(const std::string& name, const FolderHandle& parent) = 0;

    /**
     * @brief Uploads a local file as a new document titled @p displayName.
     * Fails with Permanent when the service rejects the content outright,
     * Transient otherwise.
     */
    virtual RemoteResult<RemoteDocument> uploadFile(const std::string& localPath,
                                                    const std::string& displayName,
                                                    const FolderHandle& parent) = 0;

    /**
     * @brief Moves a document to the trash.
     */
    virtual RemoteError deleteDocument(const std::string& id) = 0;
};

} // namespace DocsUpload
